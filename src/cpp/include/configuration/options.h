#ifndef KESTREL_OPTIONS_H
#define KESTREL_OPTIONS_H

#include "common/datatypes.h"
#include "reporting/logger.h"

// ENUM values
enum class InteractionType { TRANSE, DISTMULT };

InteractionType getInteractionType(std::string string_val);

std::string getInteractionName(InteractionType interaction);

enum class TrainingAssumption { OWA, CWA };

TrainingAssumption getTrainingAssumption(std::string string_val);

enum class InitDistribution { ZEROS, ONES, CONSTANT, UNIFORM, NORMAL, GLOROT_UNIFORM, GLOROT_NORMAL };

InitDistribution getInitDistribution(std::string string_val);

enum class LossFunctionType { RANKING, BCE_AFTER_SIGMOID, BCE_WITH_LOGITS, SOFTPLUS };

LossFunctionType getLossFunctionType(std::string string_val);

enum class LossReduction { MEAN, SUM };

LossReduction getLossReduction(std::string string_val);

enum class OptimizerType { SGD, ADAM, ADAGRAD };

OptimizerType getOptimizerType(std::string string_val);

enum class RegularizerType { NONE, LP };

RegularizerType getRegularizerType(std::string string_val);

torch::DeviceType getDeviceType(std::string string_val);

spdlog::level::level_enum getLogLevel(std::string string_val);

struct InitOptions {
    virtual ~InitOptions() = default;
};

struct ConstantInitOptions : InitOptions {
    float constant;
    ConstantInitOptions(){};
    ConstantInitOptions(float constant) : constant(constant){};
};

struct UniformInitOptions : InitOptions {
    float scale_factor;
    UniformInitOptions(){};
    UniformInitOptions(float scale_factor) : scale_factor(scale_factor){};
};

struct NormalInitOptions : InitOptions {
    float mean;
    float std;
    NormalInitOptions(){};
    NormalInitOptions(float mean, float std) : mean(mean), std(std){};
};

struct LossOptions {
    LossReduction loss_reduction = LossReduction::MEAN;

    virtual ~LossOptions() = default;
};

struct RankingLossOptions : LossOptions {
    float margin = 1.0;
};

struct OptimizerOptions {
    float learning_rate;

    virtual ~OptimizerOptions() = default;
};

struct AdagradOptions : OptimizerOptions {
    float eps = 1e-10;
    float init_value = 0;
    float lr_decay = 0;
    float weight_decay = 0;
};

struct AdamOptions : OptimizerOptions {
    bool amsgrad = false;
    float beta_1 = .9;
    float beta_2 = .999;
    float eps = 1e-8;
    float weight_decay = 0;
};

#endif  // KESTREL_OPTIONS_H
