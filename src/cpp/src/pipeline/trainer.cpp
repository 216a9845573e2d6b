#include "pipeline/trainer.h"

#include <cmath>

#include "common/util.h"
#include "reporting/logger.h"

std::string getTrainingStateName(TrainingState state) {
    switch (state) {
        case TrainingState::IDLE:
            return "Idle";
        case TrainingState::EPOCH_RUNNING:
            return "EpochRunning";
        case TrainingState::BATCH_RUNNING:
            return "BatchRunning";
        default:
            return "Unknown";
    }
}

TrainingLoop::TrainingLoop(shared_ptr<KGEModel> model, shared_ptr<Optimizer> optimizer, int64_t random_seed, torch::Device device, int logs_per_epoch)
    : device_(device) {
    if (model == nullptr) {
        throw UnexpectedNullPtrException("Training loop requires a model");
    }

    if (optimizer == nullptr) {
        throw UnexpectedNullPtrException("Training loop requires an optimizer");
    }

    model_ = model;
    optimizer_ = optimizer;
    generator_ = at::detail::createCPUGenerator(random_seed);
    state_ = TrainingState::IDLE;
    logs_per_epoch_ = logs_per_epoch;
}

std::tuple<shared_ptr<KGEModel>, std::vector<double>> TrainingLoop::train(shared_ptr<Instances> instances, int num_epochs, int batch_size,
                                                                           bool label_smoothing, float label_smoothing_epsilon) {
    if (num_epochs <= 0) {
        throw InvalidConfigurationException(fmt::format("num_epochs must be > 0, got {}", num_epochs));
    }

    if (batch_size <= 0) {
        throw InvalidConfigurationException(fmt::format("batch_size must be > 0, got {}", batch_size));
    }

    if (label_smoothing && (label_smoothing_epsilon < 0 || label_smoothing_epsilon >= 1)) {
        throw InvalidConfigurationException(fmt::format("label_smoothing_epsilon must lie in [0, 1), got {}", label_smoothing_epsilon));
    }

    if (instances == nullptr) {
        throw UnexpectedNullPtrException("Training instances undefined");
    }

    validateInstances(instances, label_smoothing);

    model_->to_device(device_);

    int64_t num_instances = instances->size();
    std::vector<double> losses;
    ProgressReporter progress_reporter(itemName(), num_instances, logs_per_epoch_);
    auto ind_opts = torch::TensorOptions().dtype(torch::kInt64);

    Timer timer = Timer();
    try {
        for (int epoch = 0; epoch < num_epochs; epoch++) {
            state_ = TrainingState::EPOCH_RUNNING;
            timer.start();
            SPDLOG_INFO("################ Starting training epoch {} ################", epoch + 1);

            Indices permutation = torch::randperm(num_instances, generator_, ind_opts);
            double loss_accumulator = 0;

            for (int64_t offset = 0; offset < num_instances; offset += batch_size) {
                state_ = TrainingState::BATCH_RUNNING;

                Indices batch_indices = permutation.narrow(0, offset, std::min<int64_t>(batch_size, num_instances - offset));
                int64_t current_batch_size = batch_indices.size(0);

                optimizer_->zero_grad();
                model_->reset_regularizer();

                torch::Tensor loss = forwardBatch(instances, batch_indices, label_smoothing, label_smoothing_epsilon);

                double loss_value = loss.item<double>();
                if (!std::isfinite(loss_value)) {
                    throw NANTensorException(fmt::format("Non-finite loss {} in epoch {} at offset {}", loss_value, epoch + 1, offset));
                }
                loss_accumulator += loss_value * current_batch_size;

                loss.backward();
                optimizer_->step();
                model_->apply_forward_constraint();

                progress_reporter.addResult(current_batch_size);
                state_ = TrainingState::EPOCH_RUNNING;
            }

            double epoch_loss = loss_accumulator / num_instances;
            losses.emplace_back(epoch_loss);
            progress_reporter.clear();
            timer.stop();

            SPDLOG_INFO("################ Finished training epoch {} ################", epoch + 1);
            int64_t epoch_time = timer.getDuration();
            SPDLOG_INFO("Epoch Loss: {:.6f}", epoch_loss);
            SPDLOG_INFO("Epoch Runtime: {}ms", epoch_time);
            SPDLOG_INFO("{} per Second: {}", itemName(), (double)num_instances / std::max<double>(epoch_time / 1000.0, 1e-3));
        }
    } catch (const std::exception &) {
        state_ = TrainingState::IDLE;
        throw;
    }

    state_ = TrainingState::IDLE;
    return std::forward_as_tuple(model_, losses);
}

OWATrainingLoop::OWATrainingLoop(shared_ptr<KGEModel> model, shared_ptr<Optimizer> optimizer, int64_t random_seed, torch::Device device,
                                 int num_negatives_per_positive, int max_sampling_retries, int logs_per_epoch)
    : TrainingLoop(model, optimizer, random_seed, device, logs_per_epoch) {
    negative_sampler_ = std::make_shared<UniformNegativeSampler>(model_->num_entities_, num_negatives_per_positive, max_sampling_retries);
    num_negatives_per_positive_ = num_negatives_per_positive;
}

void OWATrainingLoop::validateInstances(shared_ptr<Instances> instances, bool label_smoothing) {
    auto owa_instances = std::dynamic_pointer_cast<OWAInstances>(instances);
    if (owa_instances == nullptr) {
        throw InvalidConfigurationException("Open-world training requires OWAInstances");
    }

    if (owa_instances->size() == 0) {
        throw InvalidConfigurationException("No training triples");
    }

    if (label_smoothing) {
        SPDLOG_WARN("Label smoothing has no effect under the open-world assumption");
    }
}

torch::Tensor OWATrainingLoop::forwardBatch(shared_ptr<Instances> instances, Indices batch_indices, bool, float) {
    auto owa_instances = std::static_pointer_cast<OWAInstances>(instances);

    TripleList positives = owa_instances->triples_.index_select(0, batch_indices).to(device_);
    TripleList negatives = negative_sampler_->getNegatives(positives, generator_);

    torch::Tensor pos_scores = model_->score_hrt(positives);
    torch::Tensor neg_scores = model_->score_hrt(negatives);

    // negatives are laid out as num_negatives_per_positive consecutive copies of the batch
    if (num_negatives_per_positive_ > 1) {
        pos_scores = pos_scores.repeat({num_negatives_per_positive_, 1});
    }

    return model_->compute_ranking_loss(pos_scores, neg_scores);
}

CWATrainingLoop::CWATrainingLoop(shared_ptr<KGEModel> model, shared_ptr<Optimizer> optimizer, int64_t random_seed, torch::Device device,
                                 int logs_per_epoch)
    : TrainingLoop(model, optimizer, random_seed, device, logs_per_epoch) {
    if (model_->loss_function_->isPairwise()) {
        throw InvalidConfigurationException("Closed-world training requires a pointwise loss, not margin ranking");
    }
}

void CWATrainingLoop::validateInstances(shared_ptr<Instances> instances, bool label_smoothing) {
    auto cwa_instances = std::dynamic_pointer_cast<CWAInstances>(instances);
    if (cwa_instances == nullptr) {
        throw InvalidConfigurationException("Closed-world training requires CWAInstances");
    }

    if (cwa_instances->size() == 0) {
        throw InvalidConfigurationException("No training pairs");
    }

    if (label_smoothing && model_->num_entities_ <= 1) {
        throw InvalidConfigurationException("Label smoothing requires more than one entity");
    }
}

torch::Tensor CWATrainingLoop::forwardBatch(shared_ptr<Instances> instances, Indices batch_indices, bool label_smoothing, float label_smoothing_epsilon) {
    auto cwa_instances = std::static_pointer_cast<CWAInstances>(instances);

    PairList pairs = cwa_instances->pairs_.index_select(0, batch_indices).to(device_);

    LabelSets batch_label_sets;
    batch_label_sets.reserve(batch_indices.size(0));
    auto indices_accessor = batch_indices.accessor<int64_t, 1>();
    for (int64_t i = 0; i < batch_indices.size(0); i++) {
        batch_label_sets.emplace_back(cwa_instances->labels_[indices_accessor[i]]);
    }

    torch::Tensor labels = create_label_matrix(batch_label_sets, model_->num_entities_, device_);
    if (label_smoothing) {
        labels = apply_label_smoothing(labels, label_smoothing_epsilon, model_->num_entities_);
    }

    torch::Tensor scores = model_->score_t(pairs);
    return model_->compute_label_loss(scores, labels);
}
