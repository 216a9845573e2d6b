#include "nn/interactions.h"

torch::Tensor translation_operator(torch::Tensor h, torch::Tensor r) { return h + r; }

torch::Tensor hadamard_operator(torch::Tensor h, torch::Tensor r) { return h * r; }

torch::Tensor negative_lp_compare(torch::Tensor src, torch::Tensor dst, int p) {
    if (!src.defined() || !dst.defined()) {
        throw UndefinedTensorException();
    }
    return -(src - dst).norm(p, -1);
}

torch::Tensor dot_compare(torch::Tensor src, torch::Tensor dst) {
    if (!src.defined() || !dst.defined()) {
        throw UndefinedTensorException();
    }
    return (src * dst).sum(-1);
}

torch::Tensor transe_interaction(torch::Tensor h, torch::Tensor r, torch::Tensor t, int p) {
    return negative_lp_compare(translation_operator(h, r), t, p);
}

torch::Tensor distmult_interaction(torch::Tensor h, torch::Tensor r, torch::Tensor t) { return dot_compare(hadamard_operator(h, r), t); }

torch::Tensor interaction_function(InteractionType interaction, torch::Tensor h, torch::Tensor r, torch::Tensor t, int scoring_norm) {
    switch (interaction) {
        case InteractionType::TRANSE:
            return transe_interaction(h, r, t, scoring_norm);
        case InteractionType::DISTMULT:
            return distmult_interaction(h, r, t);
        default:
            throw InvalidConfigurationException("Unsupported interaction type");
    }
}
