#include "data/samplers/negative.h"

#include "reporting/logger.h"

UniformNegativeSampler::UniformNegativeSampler(int64_t num_entities, int num_negatives_per_positive, int max_retries) {
    if (num_entities <= 0) {
        throw InvalidConfigurationException(fmt::format("Negative sampler requires num_entities > 0, got {}", num_entities));
    }

    if (num_negatives_per_positive <= 0) {
        throw InvalidConfigurationException(fmt::format("negatives_per_positive must be > 0, got {}", num_negatives_per_positive));
    }

    if (max_retries < 0) {
        throw InvalidConfigurationException(fmt::format("max_sampling_retries must be >= 0, got {}", max_retries));
    }

    num_entities_ = num_entities;
    num_negatives_per_positive_ = num_negatives_per_positive;
    max_retries_ = max_retries;
}

TripleList UniformNegativeSampler::getNegatives(TripleList positives, at::Generator generator) {
    if (!positives.defined()) {
        throw UndefinedTensorException();
    }

    if (positives.dim() != 2 || positives.size(1) != 3) {
        throw TensorSizeMismatchException(positives, "Expected positive triples of shape (n, 3)");
    }

    // sampling happens on the cpu so results only depend on the generator
    auto device = positives.device();
    auto ind_opts = torch::TensorOptions().dtype(torch::kInt64);

    TripleList negatives = positives.to(torch::kCPU, torch::kInt64).repeat({num_negatives_per_positive_, 1});
    int64_t num_negatives = negatives.size(0);

    // column 0 corrupts the head, column 2 the tail
    Indices columns = torch::randint(0, 2, {num_negatives}, generator, ind_opts).mul_(2).unsqueeze(1);
    torch::Tensor original = negatives.gather(1, columns).squeeze(1);
    torch::Tensor replacement = torch::randint(0, num_entities_, {num_negatives}, generator, ind_opts);

    torch::Tensor collisions = replacement.eq(original);
    int retries = 0;
    while (retries < max_retries_ && collisions.any().item<bool>()) {
        int64_t num_collisions = collisions.sum().item<int64_t>();
        replacement.index_put_({collisions}, torch::randint(0, num_entities_, {num_collisions}, generator, ind_opts));
        collisions = replacement.eq(original);
        retries++;
    }

    if (collisions.any().item<bool>()) {
        SPDLOG_TRACE("Kept {} duplicate negatives after {} retries", collisions.sum().item<int64_t>(), max_retries_);
    }

    negatives.scatter_(1, columns, replacement.unsqueeze(1));
    return negatives.to(device);
}

torch::Tensor create_label_matrix(const LabelSets &label_sets, int64_t num_entities, torch::Device device) {
    if (num_entities <= 0) {
        throw InvalidConfigurationException(fmt::format("Label matrix requires num_entities > 0, got {}", num_entities));
    }

    std::vector<int64_t> rows;
    std::vector<int64_t> cols;
    for (int64_t i = 0; i < (int64_t)label_sets.size(); i++) {
        for (auto entity_id : label_sets[i]) {
            if (entity_id < 0 || entity_id >= num_entities) {
                throw IndexOutOfRangeException(fmt::format("Label entity id {} outside [0, {})", entity_id, num_entities));
            }
            rows.emplace_back(i);
            cols.emplace_back(entity_id);
        }
    }

    torch::Tensor labels = torch::zeros({(int64_t)label_sets.size(), num_entities}, torch::kFloat32);
    if (!rows.empty()) {
        auto ind_opts = torch::TensorOptions().dtype(torch::kInt64);
        labels.index_put_({torch::tensor(rows, ind_opts), torch::tensor(cols, ind_opts)}, 1.0);
    }

    return labels.to(device);
}

torch::Tensor apply_label_smoothing(torch::Tensor labels, float epsilon, int64_t num_entities) {
    if (!labels.defined()) {
        throw UndefinedTensorException();
    }

    if (epsilon < 0 || epsilon >= 1) {
        throw InvalidConfigurationException(fmt::format("label_smoothing_epsilon must lie in [0, 1), got {}", epsilon));
    }

    if (num_entities <= 1) {
        throw InvalidConfigurationException(fmt::format("Label smoothing requires more than one entity, got {}", num_entities));
    }

    if (labels.size(-1) != num_entities) {
        throw TensorSizeMismatchException(labels, fmt::format("Expected {} label columns", num_entities));
    }

    double off_value = (double)epsilon / (double)(num_entities - 1);
    return labels * (1.0 - epsilon) + (1.0 - labels) * off_value;
}
