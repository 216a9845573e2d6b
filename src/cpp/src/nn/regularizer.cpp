#include "nn/regularizer.h"

Regularizer::Regularizer(float weight, bool apply_only_once) {
    if (weight < 0) {
        throw InvalidConfigurationException(fmt::format("Regularizer weight must be >= 0, got {}", weight));
    }

    weight_ = weight;
    apply_only_once_ = apply_only_once;
    updated_ = false;
}

void Regularizer::update(std::vector<torch::Tensor> tensors) {
    if (apply_only_once_ && updated_) {
        return;
    }

    for (auto x : tensors) {
        torch::Tensor value = weight_ * penalty(x);
        if (term_.defined()) {
            term_ = term_ + value;
        } else {
            term_ = value;
        }
    }
    updated_ = true;
}

torch::Tensor Regularizer::popTerm() {
    torch::Tensor ret = term_;
    reset();

    if (!ret.defined()) {
        return torch::zeros({}, torch::kFloat32);
    }
    return ret;
}

void Regularizer::reset() {
    term_ = torch::Tensor();
    updated_ = false;
}

LpRegularizer::LpRegularizer(float weight, float p, bool normalize, bool apply_only_once) : Regularizer(weight, apply_only_once) {
    if (p <= 0) {
        throw InvalidConfigurationException(fmt::format("Regularizer norm p must be > 0, got {}", p));
    }

    p_ = p;
    normalize_ = normalize;
}

torch::Tensor LpRegularizer::penalty(torch::Tensor x) {
    torch::Tensor value = x.norm(p_, -1).mean();
    if (normalize_) {
        value = value / std::pow((double)x.size(-1), 1.0 / p_);
    }
    return value;
}

shared_ptr<RegularizerConfig> getDefaultRegularizerConfig(InteractionType interaction) {
    auto config = std::make_shared<RegularizerConfig>();

    if (interaction == InteractionType::DISTMULT) {
        config->type = RegularizerType::LP;
        config->weight = 0.1;
        config->p = 2.0;
        config->normalize = true;
    }
    return config;
}

shared_ptr<Regularizer> getRegularizer(shared_ptr<RegularizerConfig> config) {
    if (config == nullptr || config->type == RegularizerType::NONE) {
        return nullptr;
    }

    switch (config->type) {
        case RegularizerType::LP:
            return std::make_shared<LpRegularizer>(config->weight, config->p, config->normalize, config->apply_only_once);
        default:
            throw InvalidConfigurationException("Unsupported regularizer type");
    }
}
