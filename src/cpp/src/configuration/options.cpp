#include "configuration/options.h"

InteractionType getInteractionType(std::string string_val) {
    for (auto& c : string_val) c = toupper(c);

    if (string_val == "TRANSE") {
        return InteractionType::TRANSE;
    } else if (string_val == "DISTMULT") {
        return InteractionType::DISTMULT;
    } else {
        throw InvalidConfigurationException("Unrecognized interaction function string: " + string_val);
    }
}

std::string getInteractionName(InteractionType interaction) {
    switch (interaction) {
        case InteractionType::TRANSE:
            return "TransE";
        case InteractionType::DISTMULT:
            return "DistMult";
    }
    return "Unknown";
}

TrainingAssumption getTrainingAssumption(std::string string_val) {
    for (auto& c : string_val) c = toupper(c);

    if (string_val == "OWA" || string_val == "OPEN_WORLD") {
        return TrainingAssumption::OWA;
    } else if (string_val == "CWA" || string_val == "CLOSED_WORLD") {
        return TrainingAssumption::CWA;
    } else {
        throw InvalidConfigurationException("Unrecognized training assumption string: " + string_val);
    }
}

InitDistribution getInitDistribution(std::string string_val) {
    for (auto& c : string_val) c = toupper(c);

    if (string_val == "ZEROS") {
        return InitDistribution::ZEROS;
    } else if (string_val == "ONES") {
        return InitDistribution::ONES;
    } else if (string_val == "CONSTANT") {
        return InitDistribution::CONSTANT;
    } else if (string_val == "UNIFORM") {
        return InitDistribution::UNIFORM;
    } else if (string_val == "NORMAL") {
        return InitDistribution::NORMAL;
    } else if (string_val == "GLOROT_UNIFORM" || string_val == "XAVIER_UNIFORM") {
        return InitDistribution::GLOROT_UNIFORM;
    } else if (string_val == "GLOROT_NORMAL" || string_val == "XAVIER_NORMAL") {
        return InitDistribution::GLOROT_NORMAL;
    } else {
        throw InvalidConfigurationException("Unrecognized init distribution string: " + string_val);
    }
}

LossFunctionType getLossFunctionType(std::string string_val) {
    for (auto& c : string_val) c = toupper(c);

    if (string_val == "RANKING" || string_val == "MARGIN_RANKING") {
        return LossFunctionType::RANKING;
    } else if (string_val == "BCE_AFTER_SIGMOID") {
        return LossFunctionType::BCE_AFTER_SIGMOID;
    } else if (string_val == "BCE_WITH_LOGITS") {
        return LossFunctionType::BCE_WITH_LOGITS;
    } else if (string_val == "SOFTPLUS") {
        return LossFunctionType::SOFTPLUS;
    } else {
        throw InvalidConfigurationException("Unrecognized loss function type string: " + string_val);
    }
}

LossReduction getLossReduction(std::string string_val) {
    for (auto& c : string_val) c = toupper(c);

    if (string_val == "MEAN") {
        return LossReduction::MEAN;
    } else if (string_val == "SUM") {
        return LossReduction::SUM;
    } else {
        throw InvalidConfigurationException("Unrecognized loss reduction string: " + string_val);
    }
}

OptimizerType getOptimizerType(std::string string_val) {
    for (auto& c : string_val) c = toupper(c);

    if (string_val == "SGD") {
        return OptimizerType::SGD;
    } else if (string_val == "ADAM") {
        return OptimizerType::ADAM;
    } else if (string_val == "ADAGRAD") {
        return OptimizerType::ADAGRAD;
    } else {
        throw InvalidConfigurationException("Unrecognized optimizer string: " + string_val);
    }
}

RegularizerType getRegularizerType(std::string string_val) {
    for (auto& c : string_val) c = toupper(c);

    if (string_val == "NONE") {
        return RegularizerType::NONE;
    } else if (string_val == "LP" || string_val == "NORM") {
        return RegularizerType::LP;
    } else {
        throw InvalidConfigurationException("Unrecognized regularizer string: " + string_val);
    }
}

torch::DeviceType getDeviceType(std::string string_val) {
    for (auto& c : string_val) c = toupper(c);

    if (string_val == "CPU") {
        return torch::kCPU;
    } else if (string_val == "GPU" || string_val == "CUDA") {
        return torch::kCUDA;
    } else {
        throw InvalidConfigurationException("Unrecognized device string: " + string_val);
    }
}

spdlog::level::level_enum getLogLevel(std::string string_val) {
    for (auto& c : string_val) c = tolower(c);

    if (string_val == "error" || string_val == "e") {
        return spdlog::level::err;
    } else if (string_val == "warn" || string_val == "w") {
        return spdlog::level::warn;
    } else if (string_val == "info" || string_val == "i") {
        return spdlog::level::info;
    } else if (string_val == "debug" || string_val == "d") {
        return spdlog::level::debug;
    } else if (string_val == "trace" || string_val == "t") {
        return spdlog::level::trace;
    } else {
        throw InvalidConfigurationException("Unrecognized log level string: " + string_val);
    }
}
