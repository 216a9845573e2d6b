#include "kestrel.h"

#include <fstream>

#include "common/util.h"
#include "data/triples.h"
#include "nn/optim.h"
#include "pipeline/evaluator.h"
#include "reporting/logger.h"

torch::Device resolveDevice(torch::DeviceType device_type) {
    if (device_type == torch::kCUDA && !torch::cuda::is_available()) {
        SPDLOG_WARN("CUDA is not available, falling back to CPU");
        return torch::Device(torch::kCPU);
    }
    return torch::Device(device_type);
}

shared_ptr<TrainingLoop> initTrainingLoop(shared_ptr<KestrelConfig> config, shared_ptr<KGEModel> model, torch::Device device) {
    shared_ptr<Optimizer> optimizer = getOptimizer(config->training->optimizer, model->getParamDict());

    shared_ptr<TrainingLoop> training_loop;
    if (config->training->assumption == TrainingAssumption::OWA) {
        training_loop = std::make_shared<OWATrainingLoop>(model, optimizer, config->general->random_seed, device, config->training->negatives_per_positive,
                                                          config->training->max_sampling_retries, config->training->logs_per_epoch);
    } else {
        training_loop = std::make_shared<CWATrainingLoop>(model, optimizer, config->general->random_seed, device, config->training->logs_per_epoch);
    }
    return training_loop;
}

void writeLosses(const std::vector<double> &losses, string path) {
    std::ofstream output_file(path);
    if (!output_file.is_open()) {
        throw KestrelRuntimeException("Unable to write losses file: " + path);
    }

    output_file << "epoch,loss\n";
    for (int64_t i = 0; i < (int64_t)losses.size(); i++) {
        output_file << i + 1 << "," << fmt::format("{:.8f}", losses[i]) << "\n";
    }
}

std::tuple<shared_ptr<KGEModel>, std::vector<double>> kestrel_train(shared_ptr<KestrelConfig> config) {
    if (config == nullptr) {
        throw UnexpectedNullPtrException("Config is undefined");
    }

    string experiment_dir = config->general->experiment_dir;
    createDir(experiment_dir + PathConstants::logs_directory);

    KestrelLogger kestrel_logger = KestrelLogger(experiment_dir);
    spdlog::set_default_logger(kestrel_logger.main_logger_);
    kestrel_logger.setConsoleLogLevel(config->general->log_level);

    logConfig(config);

    Timer initialization_timer = Timer();
    initialization_timer.start();
    SPDLOG_INFO("Start initialization");

    if (config->path->train_triples.empty()) {
        throw InvalidConfigurationException("path.train_triples is required");
    }

    // embedding initialization draws from the global generator, the training loop uses its own
    torch::manual_seed(config->general->random_seed);
    torch::Device device = resolveDevice(config->general->device);

    shared_ptr<TriplesFactory> train_factory = TriplesFactory::fromPath(config->path->train_triples);

    shared_ptr<KGEModel> model = initModelFromConfig(config->model, train_factory->num_entities_, train_factory->num_relations_, device);
    shared_ptr<TrainingLoop> training_loop = initTrainingLoop(config, model, device);

    shared_ptr<Instances> instances;
    if (config->training->assumption == TrainingAssumption::OWA) {
        instances = train_factory->createOWAInstances();
    } else {
        instances = train_factory->createCWAInstances();
    }

    initialization_timer.stop();
    SPDLOG_INFO("Initialization Complete: {}s", (double)initialization_timer.getDuration() / 1000);

    std::vector<double> losses;
    std::tie(model, losses) = training_loop->train(instances, config->training->num_epochs, config->training->batch_size,
                                                   config->training->label_smoothing, config->training->label_smoothing_epsilon);

    writeLosses(losses, experiment_dir + PathConstants::losses_file);

    if (config->training->save_model) {
        model->save(experiment_dir + PathConstants::model_file);
        train_factory->saveMappings(experiment_dir);
    }

    if (config->evaluation->enabled) {
        if (config->path->test_triples.empty()) {
            SPDLOG_WARN("Evaluation enabled but path.test_triples is not set, skipping");
        } else {
            shared_ptr<TriplesFactory> test_factory =
                TriplesFactory::fromPath(config->path->test_triples, train_factory->entity_to_id_, train_factory->relation_to_id_);

            LinkPredictionEvaluator evaluator(model, config->evaluation->batch_size, config->evaluation->filtered,
                                              {train_factory->triples_, test_factory->triples_});
            evaluator.evaluate(test_factory->triples_);
        }
    }

    spdlog::default_logger()->flush();
    return std::forward_as_tuple(model, losses);
}

int kestrel(int argc, const char *argv[]) {
    try {
        shared_ptr<KestrelConfig> config = parseConfig(argc, argv);
        if (config == nullptr) {
            return 0;
        }
        kestrel_train(config);
    } catch (const KestrelRuntimeException &e) {
        SPDLOG_ERROR("{}", e.what());
        return 1;
    }
    return 0;
}
