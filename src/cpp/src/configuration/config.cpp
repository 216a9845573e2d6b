#include "configuration/config.h"

#include <INIReader.h>
#include <ini.h>

#include <ctime>
#include <cxxopts.hpp>
#include <iostream>
#include <limits>

#include "reporting/logger.h"

namespace {

// Raw values as they appear in the config file, before conversion into typed configs
struct RawOptions {
    string device;
    int64_t random_seed;
    string experiment_dir;
    string log_level;

    string train_triples;
    string test_triples;

    string interaction;
    int embedding_dim;
    int scoring_norm;
    string entity_init;
    string relation_init;
    float init_scale;

    string loss_type;
    string loss_reduction;
    float margin;

    string regularizer_type;
    float regularizer_weight;
    float regularizer_p;
    bool regularizer_normalize;
    bool regularizer_apply_only_once;

    string assumption;
    int num_epochs;
    int batch_size;
    string optimizer;
    float learning_rate;
    int negatives_per_positive;
    int max_sampling_retries;
    bool label_smoothing;
    float label_smoothing_epsilon;
    int logs_per_epoch;
    bool save_model;

    bool evaluation_enabled;
    int evaluation_batch_size;
    bool filtered;
};

// Map each option to: [default value] [section_name] [option_name] (optional)[valid_range]
AllOptInfo buildOptInfo(RawOptions &raw) {
    AllOptInfo opt_info;
    float FLOAT_MAX = std::numeric_limits<float>::max();

    // General options
    opt_info.s_var_map.push_back(OptInfo<std::string>{&raw.device, "CPU", "general", "device"});
    opt_info.i64_var_map.push_back(OptInfo<int64_t>{&raw.random_seed, (int64_t)time(0), "general", "random_seed", {0, INT64_MAX}});
    opt_info.s_var_map.push_back(OptInfo<std::string>{&raw.experiment_dir, "kestrel_output/", "general", "experiment_dir"});
    opt_info.s_var_map.push_back(OptInfo<std::string>{&raw.log_level, "info", "general", "log_level"});

    // Path options
    opt_info.s_var_map.push_back(OptInfo<std::string>{&raw.train_triples, "", "path", "train_triples"});
    opt_info.s_var_map.push_back(OptInfo<std::string>{&raw.test_triples, "", "path", "test_triples"});

    // Model options
    opt_info.s_var_map.push_back(OptInfo<std::string>{&raw.interaction, "TransE", "model", "interaction"});
    opt_info.i_var_map.push_back(OptInfo<int>{&raw.embedding_dim, 50, "model", "embedding_dim", {1, INT32_MAX}});
    opt_info.i_var_map.push_back(OptInfo<int>{&raw.scoring_norm, 1, "model", "scoring_norm", {1, INT32_MAX}});
    opt_info.s_var_map.push_back(OptInfo<std::string>{&raw.entity_init, "GLOROT_UNIFORM", "model", "entity_init"});
    opt_info.s_var_map.push_back(OptInfo<std::string>{&raw.relation_init, "GLOROT_UNIFORM", "model", "relation_init"});
    opt_info.f_var_map.push_back(OptInfo<float>{&raw.init_scale, .001, "model", "init_scale", {0, FLOAT_MAX}});

    // Loss options
    opt_info.s_var_map.push_back(OptInfo<std::string>{&raw.loss_type, "Ranking", "loss", "type"});
    opt_info.s_var_map.push_back(OptInfo<std::string>{&raw.loss_reduction, "Sum", "loss", "reduction"});
    opt_info.f_var_map.push_back(OptInfo<float>{&raw.margin, 1.0, "loss", "margin", {0, FLOAT_MAX}});

    // Regularizer options
    // Left empty when unset so the interaction picks its own default, "None" opts out explicitly
    opt_info.s_var_map.push_back(OptInfo<std::string>{&raw.regularizer_type, "", "regularizer", "type"});
    opt_info.f_var_map.push_back(OptInfo<float>{&raw.regularizer_weight, 0.0, "regularizer", "weight", {0, FLOAT_MAX}});
    opt_info.f_var_map.push_back(OptInfo<float>{&raw.regularizer_p, 2.0, "regularizer", "p", {0, FLOAT_MAX}});
    opt_info.b_var_map.push_back(OptInfo<bool>{&raw.regularizer_normalize, false, "regularizer", "normalize"});
    opt_info.b_var_map.push_back(OptInfo<bool>{&raw.regularizer_apply_only_once, false, "regularizer", "apply_only_once"});

    // Training options
    opt_info.s_var_map.push_back(OptInfo<std::string>{&raw.assumption, "OWA", "training", "assumption"});
    opt_info.i_var_map.push_back(OptInfo<int>{&raw.num_epochs, 10, "training", "num_epochs", {1, INT32_MAX}});
    opt_info.i_var_map.push_back(OptInfo<int>{&raw.batch_size, 128, "training", "batch_size", {1, INT32_MAX}});
    opt_info.s_var_map.push_back(OptInfo<std::string>{&raw.optimizer, "SGD", "training", "optimizer"});
    opt_info.f_var_map.push_back(OptInfo<float>{&raw.learning_rate, .01, "training", "learning_rate", {0, FLOAT_MAX}});
    opt_info.i_var_map.push_back(OptInfo<int>{&raw.negatives_per_positive, 1, "training", "negatives_per_positive", {1, INT32_MAX}});
    opt_info.i_var_map.push_back(OptInfo<int>{&raw.max_sampling_retries, 10, "training", "max_sampling_retries", {0, INT32_MAX}});
    opt_info.b_var_map.push_back(OptInfo<bool>{&raw.label_smoothing, false, "training", "label_smoothing"});
    opt_info.f_var_map.push_back(OptInfo<float>{&raw.label_smoothing_epsilon, .1, "training", "label_smoothing_epsilon", {0, 1}});
    opt_info.i_var_map.push_back(OptInfo<int>{&raw.logs_per_epoch, 10, "training", "logs_per_epoch", {1, INT32_MAX}});
    opt_info.b_var_map.push_back(OptInfo<bool>{&raw.save_model, false, "training", "save_model"});

    // Evaluation options
    opt_info.b_var_map.push_back(OptInfo<bool>{&raw.evaluation_enabled, false, "evaluation", "enabled"});
    opt_info.i_var_map.push_back(OptInfo<int>{&raw.evaluation_batch_size, 256, "evaluation", "batch_size", {1, INT32_MAX}});
    opt_info.b_var_map.push_back(OptInfo<bool>{&raw.filtered, true, "evaluation", "filtered"});

    return opt_info;
}

cxxopts::Options getCommandLineOptions() {
    cxxopts::Options cmd_options("kestrel_train", "Train knowledge graph embeddings");
    cmd_options.allow_unrecognised_options();
    cmd_options.positional_help("config_file [--section.option=value ...]");
    cmd_options.add_options()("config_file", "Configuration file", cxxopts::value<std::string>())("h,help", "Print help");
    return cmd_options;
}

string getConfigPath(int argc, const char *const argv[], cxxopts::Options cmd_options) {
    string config_path;
    try {
        cmd_options.parse_positional({"config_file"});
        auto result = cmd_options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << cmd_options.help() << std::endl;
            return "";
        }

        if (!result.count("config_file")) {
            std::cout << cmd_options.help() << std::endl;
            throw InvalidConfigurationException("Missing required positional argument: config_file");
        }

        config_path = result["config_file"].as<string>();

    } catch (const cxxopts::OptionException &e) {
        throw InvalidConfigurationException(fmt::format("Error parsing options: {}", e.what()));
    }
    return config_path;
}

bool isKnownOption(const AllOptInfo &opt_info, const std::string &section, const std::string &option_name) {
    auto matches = [&](const auto &var_map) {
        for (const auto &v : var_map) {
            if (section == v.s_section && option_name == v.s_option) {
                return true;
            }
        }
        return false;
    };

    return matches(opt_info.s_var_map) || matches(opt_info.i64_var_map) || matches(opt_info.i_var_map) || matches(opt_info.f_var_map) ||
           matches(opt_info.b_var_map);
}

struct UnknownKeys {
    const AllOptInfo *opt_info;
    std::vector<std::string> keys;
};

int collectUnknownKey(void *user, const char *section, const char *name, const char *) {
    auto unknown = static_cast<UnknownKeys *>(user);
    if (!isKnownOption(*unknown->opt_info, section, name)) {
        unknown->keys.emplace_back(fmt::format("{}.{}", section, name));
    }
    return 1;
}

// INIReader only answers lookups, so keys it would never be asked about are found with a second pass of the parser
void checkUnknownKeys(const AllOptInfo &opt_info, const string &config_path) {
    UnknownKeys unknown{&opt_info, {}};

    if (ini_parse(config_path.c_str(), collectUnknownKey, &unknown) != 0) {
        throw InvalidConfigurationException(fmt::format("Can't load {}", config_path));
    }

    if (!unknown.keys.empty()) {
        std::string key_list = unknown.keys[0];
        for (size_t i = 1; i < unknown.keys.size(); i++) {
            key_list += ", " + unknown.keys[i];
        }
        throw InvalidConfigurationException(fmt::format("Unknown option {} in {}", key_list, config_path));
    }
}

void assignOptions(AllOptInfo opt_info, string config_path) {
    INIReader reader(config_path);
    if (reader.ParseError() != 0) {
        throw InvalidConfigurationException(fmt::format("Can't load {}", config_path));
    }
    checkUnknownKeys(opt_info, config_path);

    // Assign values as config file values or defaults
    for (OptInfo<std::string> v : opt_info.s_var_map) {
        *(v.var_ptr) = reader.Get(v.s_section, v.s_option, v.default_val);
    }
    for (OptInfo<int64_t> v : opt_info.i64_var_map) {
        *(v.var_ptr) = (int64_t)(reader.GetInteger(v.s_section, v.s_option, v.default_val));
    }
    for (OptInfo<int> v : opt_info.i_var_map) {
        *(v.var_ptr) = reader.GetInteger(v.s_section, v.s_option, v.default_val);
    }
    for (OptInfo<float> v : opt_info.f_var_map) {
        *(v.var_ptr) = reader.GetReal(v.s_section, v.s_option, v.default_val);
    }
    for (OptInfo<bool> v : opt_info.b_var_map) {
        *(v.var_ptr) = reader.GetBoolean(v.s_section, v.s_option, v.default_val);
    }
}

// Applies a single --section.option=value override, returns false if no such option exists
bool applyOverride(AllOptInfo &opt_info, const std::string &section, const std::string &option_name, const std::string &value) {
    bool valid = false;

    for (OptInfo<std::string> v : opt_info.s_var_map) {
        if (section == v.s_section && option_name == v.s_option) {
            *(v.var_ptr) = value;
            valid = true;
        }
    }
    for (OptInfo<int64_t> v : opt_info.i64_var_map) {
        if (section == v.s_section && option_name == v.s_option) {
            *(v.var_ptr) = std::stoll(value);
            valid = true;
        }
    }
    for (OptInfo<int> v : opt_info.i_var_map) {
        if (section == v.s_section && option_name == v.s_option) {
            *(v.var_ptr) = std::stoi(value);
            valid = true;
        }
    }
    for (OptInfo<float> v : opt_info.f_var_map) {
        if (section == v.s_section && option_name == v.s_option) {
            *(v.var_ptr) = std::stof(value);
            valid = true;
        }
    }
    for (OptInfo<bool> v : opt_info.b_var_map) {
        if (section == v.s_section && option_name == v.s_option) {
            *(v.var_ptr) = (value == "true");
            valid = true;
        }
    }
    return valid;
}

void parseCommandLine(int argc, const char *const argv[], AllOptInfo opt_info, cxxopts::Options cmd_options) {
    std::vector<std::string> unmatched;
    try {
        cmd_options.parse_positional({"config_file"});
        auto result = cmd_options.parse(argc, argv);
        unmatched = result.unmatched();
    } catch (const cxxopts::OptionException &e) {
        throw InvalidConfigurationException(fmt::format("Error parsing options: {}", e.what()));
    }

    for (string opt : unmatched) {
        if (opt.substr(0, 2) != "--") {
            throw InvalidConfigurationException("Unable to parse command line argument: " + opt);
        }

        size_t section_end = opt.find(".");
        size_t option_end = opt.find("=");

        if (section_end == std::string::npos || option_end == std::string::npos || option_end < section_end) {
            throw InvalidConfigurationException("Expected --section.option=value, got: " + opt);
        }

        std::string section = opt.substr(2, section_end - 2);
        std::string option_name = opt.substr(section_end + 1, option_end - section_end - 1);
        std::string value = opt.substr(option_end + 1, opt.size() - option_end - 1);

        bool valid;
        try {
            valid = applyOverride(opt_info, section, option_name, value);
        } catch (const std::logic_error &) {
            throw InvalidConfigurationException(fmt::format("{}.{}: unable to parse value {}", section, option_name, value));
        }

        if (!valid) {
            throw InvalidConfigurationException(fmt::format("Unknown option {}.{}", section, option_name));
        }
    }
}

void validateNumericalOptions(AllOptInfo opt_info) {
    for (OptInfo<int64_t> v : opt_info.i64_var_map) {
        if (*(v.var_ptr) < v.range[0] || *(v.var_ptr) > v.range[1]) {
            throw InvalidConfigurationException(
                fmt::format("{}.{}: value {} out of range [{}, {}]", v.s_section, v.s_option, *(v.var_ptr), v.range[0], v.range[1]));
        }
    }
    for (OptInfo<int> v : opt_info.i_var_map) {
        if (*(v.var_ptr) < v.range[0] || *(v.var_ptr) > v.range[1]) {
            throw InvalidConfigurationException(
                fmt::format("{}.{}: value {} out of range [{}, {}]", v.s_section, v.s_option, *(v.var_ptr), v.range[0], v.range[1]));
        }
    }
    for (OptInfo<float> v : opt_info.f_var_map) {
        if (*(v.var_ptr) < v.range[0] || *(v.var_ptr) > v.range[1]) {
            throw InvalidConfigurationException(
                fmt::format("{}.{}: value {} out of range [{}, {}]", v.s_section, v.s_option, *(v.var_ptr), v.range[0], v.range[1]));
        }
    }
}

shared_ptr<InitConfig> makeInitConfig(string distribution, float scale) {
    auto init_config = std::make_shared<InitConfig>();
    init_config->type = getInitDistribution(distribution);

    if (init_config->type == InitDistribution::UNIFORM) {
        init_config->options = std::make_shared<UniformInitOptions>(scale);
    } else if (init_config->type == InitDistribution::NORMAL) {
        init_config->options = std::make_shared<NormalInitOptions>(0.0, scale);
    } else if (init_config->type == InitDistribution::CONSTANT) {
        init_config->options = std::make_shared<ConstantInitOptions>(scale);
    } else {
        init_config->options = std::make_shared<InitOptions>();
    }

    return init_config;
}

shared_ptr<KestrelConfig> buildConfig(const RawOptions &raw) {
    auto config = std::make_shared<KestrelConfig>();

    auto general = std::make_shared<GeneralConfig>();
    general->device = getDeviceType(raw.device);
    general->random_seed = raw.random_seed;
    general->experiment_dir = raw.experiment_dir;
    if (!general->experiment_dir.empty() && general->experiment_dir.back() != '/') {
        general->experiment_dir += "/";
    }
    general->log_level = getLogLevel(raw.log_level);
    config->general = general;

    auto path = std::make_shared<PathConfig>();
    path->train_triples = raw.train_triples;
    path->test_triples = raw.test_triples;
    config->path = path;

    auto model = std::make_shared<ModelConfig>();
    model->interaction = getInteractionType(raw.interaction);
    model->embedding_dim = raw.embedding_dim;
    model->scoring_norm = raw.scoring_norm;
    model->entity_init = makeInitConfig(raw.entity_init, raw.init_scale);
    model->relation_init = makeInitConfig(raw.relation_init, raw.init_scale);

    if (!raw.regularizer_type.empty()) {
        auto regularizer = std::make_shared<RegularizerConfig>();
        regularizer->type = getRegularizerType(raw.regularizer_type);
        regularizer->weight = raw.regularizer_weight;
        regularizer->p = raw.regularizer_p;
        regularizer->normalize = raw.regularizer_normalize;
        regularizer->apply_only_once = raw.regularizer_apply_only_once;
        model->regularizer = regularizer;
    }

    auto loss = std::make_shared<LossConfig>();
    loss->type = getLossFunctionType(raw.loss_type);
    if (loss->type == LossFunctionType::RANKING) {
        auto ranking_options = std::make_shared<RankingLossOptions>();
        ranking_options->margin = raw.margin;
        loss->options = ranking_options;
    } else {
        loss->options = std::make_shared<LossOptions>();
    }
    loss->options->loss_reduction = getLossReduction(raw.loss_reduction);
    model->loss = loss;
    config->model = model;

    auto training = std::make_shared<TrainingConfig>();
    training->assumption = getTrainingAssumption(raw.assumption);
    training->num_epochs = raw.num_epochs;
    training->batch_size = raw.batch_size;

    auto optimizer = std::make_shared<OptimizerConfig>();
    optimizer->type = getOptimizerType(raw.optimizer);
    if (optimizer->type == OptimizerType::ADAGRAD) {
        optimizer->options = std::make_shared<AdagradOptions>();
    } else if (optimizer->type == OptimizerType::ADAM) {
        optimizer->options = std::make_shared<AdamOptions>();
    } else {
        optimizer->options = std::make_shared<OptimizerOptions>();
    }
    optimizer->options->learning_rate = raw.learning_rate;
    training->optimizer = optimizer;

    training->negatives_per_positive = raw.negatives_per_positive;
    training->max_sampling_retries = raw.max_sampling_retries;
    training->label_smoothing = raw.label_smoothing;
    training->label_smoothing_epsilon = raw.label_smoothing_epsilon;
    if (training->label_smoothing_epsilon >= 1.0) {
        throw InvalidConfigurationException("training.label_smoothing_epsilon must lie in [0, 1)");
    }
    training->logs_per_epoch = raw.logs_per_epoch;
    training->save_model = raw.save_model;
    config->training = training;

    auto evaluation = std::make_shared<EvaluationConfig>();
    evaluation->enabled = raw.evaluation_enabled;
    evaluation->batch_size = raw.evaluation_batch_size;
    evaluation->filtered = raw.filtered;
    config->evaluation = evaluation;

    return config;
}

}  // namespace

shared_ptr<KestrelConfig> parseConfig(int argc, const char *const argv[]) {
    cxxopts::Options cmd_options = getCommandLineOptions();

    string config_path = getConfigPath(argc, argv, cmd_options);
    if (config_path.empty()) {
        return nullptr;
    }

    RawOptions raw;
    AllOptInfo opt_info = buildOptInfo(raw);

    assignOptions(opt_info, config_path);
    parseCommandLine(argc, argv, opt_info, cmd_options);
    validateNumericalOptions(opt_info);

    return buildConfig(raw);
}

shared_ptr<KestrelConfig> loadConfig(string config_path) {
    RawOptions raw;
    AllOptInfo opt_info = buildOptInfo(raw);

    assignOptions(opt_info, config_path);
    validateNumericalOptions(opt_info);

    return buildConfig(raw);
}

void logConfig(shared_ptr<KestrelConfig> config) {
    if (config == nullptr) {
        throw UnexpectedNullPtrException("Config is undefined");
    }

    SPDLOG_DEBUG("########## General Options ##########");
    SPDLOG_DEBUG("device: {}", config->general->device == torch::kCUDA ? "GPU" : "CPU");
    SPDLOG_DEBUG("random_seed: {}", config->general->random_seed);
    SPDLOG_DEBUG("experiment_dir: {}", config->general->experiment_dir);

    SPDLOG_DEBUG("########## Path Options ##########");
    SPDLOG_DEBUG("train_triples: {}", config->path->train_triples);
    SPDLOG_DEBUG("test_triples: {}", config->path->test_triples);

    SPDLOG_DEBUG("########## Model Options ##########");
    SPDLOG_DEBUG("interaction: {}", getInteractionName(config->model->interaction));
    SPDLOG_DEBUG("embedding_dim: {}", config->model->embedding_dim);
    SPDLOG_DEBUG("scoring_norm: {}", config->model->scoring_norm);
    if (config->model->regularizer != nullptr) {
        SPDLOG_DEBUG("regularizer weight: {} p: {} normalize: {}", config->model->regularizer->weight, config->model->regularizer->p,
                     config->model->regularizer->normalize);
    } else {
        SPDLOG_DEBUG("regularizer: interaction default");
    }

    SPDLOG_DEBUG("########## Training Options ##########");
    SPDLOG_DEBUG("assumption: {}", config->training->assumption == TrainingAssumption::OWA ? "OWA" : "CWA");
    SPDLOG_DEBUG("num_epochs: {}", config->training->num_epochs);
    SPDLOG_DEBUG("batch_size: {}", config->training->batch_size);
    SPDLOG_DEBUG("learning_rate: {}", config->training->optimizer->options->learning_rate);
    SPDLOG_DEBUG("negatives_per_positive: {}", config->training->negatives_per_positive);
    SPDLOG_DEBUG("label_smoothing: {} epsilon: {}", config->training->label_smoothing, config->training->label_smoothing_epsilon);

    SPDLOG_DEBUG("########## Evaluation Options ##########");
    SPDLOG_DEBUG("enabled: {}", config->evaluation->enabled);
    SPDLOG_DEBUG("batch_size: {}", config->evaluation->batch_size);
    SPDLOG_DEBUG("filtered: {}", config->evaluation->filtered);
}
