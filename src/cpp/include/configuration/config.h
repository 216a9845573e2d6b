#ifndef KESTREL_CONFIG_H
#define KESTREL_CONFIG_H

#include "common/datatypes.h"
#include "constants.h"
#include "options.h"

using std::shared_ptr;

template <typename T>
struct OptInfo {
    T *var_ptr;
    T default_val;
    std::string s_section;
    std::string s_option;
    T range[2];
};

struct AllOptInfo {
    std::vector<OptInfo<std::string>> s_var_map;
    std::vector<OptInfo<int64_t>> i64_var_map;
    std::vector<OptInfo<int>> i_var_map;
    std::vector<OptInfo<float>> f_var_map;
    std::vector<OptInfo<bool>> b_var_map;
};

struct InitConfig {
    InitDistribution type;
    shared_ptr<InitOptions> options = nullptr;

    InitConfig(){};
    InitConfig(InitDistribution type, shared_ptr<InitOptions> options) : type(type), options(options){};
};

struct OptimizerConfig {
    OptimizerType type;
    shared_ptr<OptimizerOptions> options = nullptr;
};

struct LossConfig {
    LossFunctionType type;
    shared_ptr<LossOptions> options = nullptr;
};

struct RegularizerConfig {
    RegularizerType type = RegularizerType::NONE;
    float weight = 0.0;
    float p = 2.0;
    bool normalize = false;
    bool apply_only_once = false;
};

struct GeneralConfig {
    torch::DeviceType device = torch::kCPU;
    int64_t random_seed;
    string experiment_dir;
    spdlog::level::level_enum log_level = spdlog::level::info;
};

struct PathConfig {
    string train_triples;
    string test_triples;
};

struct ModelConfig {
    InteractionType interaction;
    int embedding_dim;
    int scoring_norm = 1;
    shared_ptr<InitConfig> entity_init = nullptr;
    shared_ptr<InitConfig> relation_init = nullptr;
    shared_ptr<RegularizerConfig> regularizer = nullptr;
    shared_ptr<LossConfig> loss = nullptr;
};

struct TrainingConfig {
    TrainingAssumption assumption;
    int num_epochs;
    int batch_size;
    shared_ptr<OptimizerConfig> optimizer = nullptr;
    int negatives_per_positive;
    int max_sampling_retries;
    bool label_smoothing;
    float label_smoothing_epsilon;
    int logs_per_epoch;
    bool save_model;
};

struct EvaluationConfig {
    bool enabled;
    int batch_size;
    bool filtered;
};

struct KestrelConfig {
    shared_ptr<GeneralConfig> general = nullptr;
    shared_ptr<PathConfig> path = nullptr;
    shared_ptr<ModelConfig> model = nullptr;
    shared_ptr<TrainingConfig> training = nullptr;
    shared_ptr<EvaluationConfig> evaluation = nullptr;
};

/**
  Parses the INI config file given as the first positional argument, then applies
  --section.option=value overrides from the remaining arguments.
  @return The parsed configuration, or nullptr if --help was requested
*/
shared_ptr<KestrelConfig> parseConfig(int argc, const char *const argv[]);

/** Parses a config file without command line overrides */
shared_ptr<KestrelConfig> loadConfig(string config_path);

void logConfig(shared_ptr<KestrelConfig> config);

#endif  // KESTREL_CONFIG_H
