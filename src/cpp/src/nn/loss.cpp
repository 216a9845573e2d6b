#include "nn/loss.h"

void checkScoreShapes(torch::Tensor first, torch::Tensor second) {
    if (!first.defined()) {
        throw UndefinedTensorException();
    }

    if (!second.defined()) {
        throw UndefinedTensorException();
    }

    if (first.sizes() != second.sizes()) {
        throw TensorSizeMismatchException(second, "Expected shape " + c10::str(first.sizes()));
    }
}

LossFunction::LossFunction(shared_ptr<LossOptions> options) {
    if (options == nullptr) {
        throw UnexpectedNullPtrException("Loss options");
    }
    reduction_type_ = options->loss_reduction;
}

torch::Tensor LossFunction::reduce(torch::Tensor loss) {
    if (reduction_type_ == LossReduction::MEAN) {
        return loss.mean();
    } else {
        return loss.sum();
    }
}

MarginRankingLoss::MarginRankingLoss(shared_ptr<RankingLossOptions> options) : LossFunction(options) {
    if (options->margin <= 0) {
        throw InvalidConfigurationException(fmt::format("Margin must be > 0, got {}", options->margin));
    }
    margin_ = options->margin;
}

torch::Tensor MarginRankingLoss::operator()(torch::Tensor pos_scores, torch::Tensor neg_scores) {
    checkScoreShapes(pos_scores, neg_scores);

    // target of 1: the first input should rank higher
    torch::nn::functional::MarginRankingLossFuncOptions options;
    if (reduction_type_ == LossReduction::MEAN) {
        options.reduction(torch::kMean);
    } else {
        options.reduction(torch::kSum);
    }
    options.margin(margin_);

    return torch::nn::functional::margin_ranking_loss(pos_scores, neg_scores, torch::ones_like(pos_scores), options);
}

torch::Tensor BCEAfterSigmoidLoss::operator()(torch::Tensor scores, torch::Tensor labels) {
    checkScoreShapes(scores, labels);

    torch::nn::functional::BinaryCrossEntropyFuncOptions options;
    if (reduction_type_ == LossReduction::MEAN) {
        options.reduction(torch::kMean);
    } else {
        options.reduction(torch::kSum);
    }

    return torch::nn::functional::binary_cross_entropy(scores.sigmoid(), labels.to(scores.dtype()), options);
}

torch::Tensor BCEWithLogitsLoss::operator()(torch::Tensor scores, torch::Tensor labels) {
    checkScoreShapes(scores, labels);

    torch::nn::functional::BinaryCrossEntropyWithLogitsFuncOptions options;
    if (reduction_type_ == LossReduction::MEAN) {
        options.reduction(torch::kMean);
    } else {
        options.reduction(torch::kSum);
    }

    return torch::nn::functional::binary_cross_entropy_with_logits(scores, labels.to(scores.dtype()), options);
}

torch::Tensor SoftPlusLoss::operator()(torch::Tensor scores, torch::Tensor labels) {
    checkScoreShapes(scores, labels);

    // map {0, 1} labels to {-1, 1}
    torch::Tensor signs = 2 * labels.to(scores.dtype()) - 1;
    return reduce(torch::nn::functional::softplus(-signs * scores));
}

shared_ptr<LossFunction> getLossFunction(shared_ptr<LossConfig> config) {
    if (config == nullptr) {
        throw UnexpectedNullPtrException("Loss config");
    }

    switch (config->type) {
        case LossFunctionType::RANKING: {
            auto ranking_options = std::dynamic_pointer_cast<RankingLossOptions>(config->options);
            if (ranking_options == nullptr) {
                throw UnexpectedNullPtrException("Ranking loss requires RankingLossOptions");
            }
            return std::make_shared<MarginRankingLoss>(ranking_options);
        }
        case LossFunctionType::BCE_AFTER_SIGMOID:
            return std::make_shared<BCEAfterSigmoidLoss>(config->options);
        case LossFunctionType::BCE_WITH_LOGITS:
            return std::make_shared<BCEWithLogitsLoss>(config->options);
        case LossFunctionType::SOFTPLUS:
            return std::make_shared<SoftPlusLoss>(config->options);
        default:
            throw InvalidConfigurationException("Unsupported loss function type");
    }
}
