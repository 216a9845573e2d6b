#include <gtest/gtest.h>
#include <configuration/config.h>

#include "testing_util.h"

class ConfigTest : public ::testing::Test {
   protected:
    std::string default_config_ = std::string(KESTREL_TEST_DIRECTORY) + "/test_configs/default.ini";
    std::string cwa_config_ = std::string(KESTREL_TEST_DIRECTORY) + "/test_configs/cwa.ini";

    shared_ptr<KestrelConfig> parseArgs(std::vector<std::string> args) {
        std::vector<const char *> argv = {"kestrel_train"};
        for (auto &arg : args) {
            argv.emplace_back(arg.c_str());
        }
        return parseConfig((int)argv.size(), argv.data());
    }
};

TEST_F(ConfigTest, Defaults) {
    std::string path = writeTmpFile("minimal.ini", "[path]\ntrain_triples=train.tsv\n");
    auto config = loadConfig(path);

    ASSERT_EQ(config->general->device, torch::kCPU);
    ASSERT_EQ(config->general->experiment_dir, "kestrel_output/");
    ASSERT_EQ(config->path->train_triples, "train.tsv");
    ASSERT_EQ(config->path->test_triples, "");

    ASSERT_EQ(config->model->interaction, InteractionType::TRANSE);
    ASSERT_EQ(config->model->embedding_dim, 50);
    ASSERT_EQ(config->model->scoring_norm, 1);
    ASSERT_EQ(config->model->entity_init->type, InitDistribution::GLOROT_UNIFORM);
    // unset, the interaction chooses its own default
    ASSERT_EQ(config->model->regularizer, nullptr);

    ASSERT_EQ(config->model->loss->type, LossFunctionType::RANKING);
    ASSERT_EQ(config->model->loss->options->loss_reduction, LossReduction::SUM);
    ASSERT_FLOAT_EQ(std::dynamic_pointer_cast<RankingLossOptions>(config->model->loss->options)->margin, 1.0);

    ASSERT_EQ(config->training->assumption, TrainingAssumption::OWA);
    ASSERT_EQ(config->training->num_epochs, 10);
    ASSERT_EQ(config->training->batch_size, 128);
    ASSERT_EQ(config->training->optimizer->type, OptimizerType::SGD);
    ASSERT_FLOAT_EQ(config->training->optimizer->options->learning_rate, .01);
    ASSERT_EQ(config->training->negatives_per_positive, 1);
    ASSERT_EQ(config->training->max_sampling_retries, 10);
    ASSERT_FALSE(config->training->label_smoothing);
    ASSERT_FLOAT_EQ(config->training->label_smoothing_epsilon, .1);
    ASSERT_FALSE(config->training->save_model);

    ASSERT_FALSE(config->evaluation->enabled);
    ASSERT_TRUE(config->evaluation->filtered);
}

TEST_F(ConfigTest, LoadsTestConfigs) {
    auto config = loadConfig(default_config_);
    ASSERT_EQ(config->general->random_seed, 42);
    ASSERT_EQ(config->model->embedding_dim, 16);
    ASSERT_EQ(config->training->batch_size, 4);
    ASSERT_TRUE(config->training->save_model);

    config = loadConfig(cwa_config_);
    ASSERT_EQ(config->model->interaction, InteractionType::DISTMULT);
    ASSERT_EQ(config->model->loss->type, LossFunctionType::BCE_WITH_LOGITS);
    ASSERT_EQ(config->model->loss->options->loss_reduction, LossReduction::MEAN);
    ASSERT_EQ(config->model->regularizer->type, RegularizerType::LP);
    ASSERT_FLOAT_EQ(config->model->regularizer->weight, .01);
    ASSERT_TRUE(config->model->regularizer->normalize);
    ASSERT_EQ(config->training->assumption, TrainingAssumption::CWA);
    ASSERT_TRUE(config->training->label_smoothing);

    auto adagrad_options = std::dynamic_pointer_cast<AdagradOptions>(config->training->optimizer->options);
    ASSERT_NE(adagrad_options, nullptr);
    ASSERT_FLOAT_EQ(adagrad_options->learning_rate, .1);
}

TEST_F(ConfigTest, CommandLineOverrides) {
    auto config = parseArgs({default_config_, "--model.embedding_dim=8", "--training.assumption=CWA", "--loss.type=BCE_With_Logits",
                             "--training.label_smoothing=true", "--general.random_seed=3"});

    ASSERT_EQ(config->model->embedding_dim, 8);
    ASSERT_EQ(config->training->assumption, TrainingAssumption::CWA);
    ASSERT_EQ(config->model->loss->type, LossFunctionType::BCE_WITH_LOGITS);
    ASSERT_TRUE(config->training->label_smoothing);
    ASSERT_EQ(config->general->random_seed, 3);

    // untouched values come from the file
    ASSERT_EQ(config->training->batch_size, 4);
}

TEST_F(ConfigTest, InvalidOverridesThrow) {
    ASSERT_THROW(parseArgs({default_config_, "--model.nonexistent=3"}), InvalidConfigurationException);
    ASSERT_THROW(parseArgs({default_config_, "--model.embedding_dim"}), InvalidConfigurationException);
    ASSERT_THROW(parseArgs({default_config_, "--model.embedding_dim=abc"}), InvalidConfigurationException);
    ASSERT_THROW(parseArgs({default_config_, "--model.embedding_dim=0"}), InvalidConfigurationException);
    ASSERT_THROW(parseArgs({default_config_, "--training.num_epochs=-1"}), InvalidConfigurationException);
    ASSERT_THROW(parseArgs({default_config_, "--training.label_smoothing_epsilon=1.5"}), InvalidConfigurationException);
    ASSERT_THROW(parseArgs({default_config_, "--training.label_smoothing_epsilon=1.0"}), InvalidConfigurationException);
    ASSERT_THROW(parseArgs({default_config_, "--model.interaction=Foo"}), InvalidConfigurationException);
    ASSERT_THROW(parseArgs({default_config_, "--training.optimizer=RMSProp"}), InvalidConfigurationException);
}

TEST_F(ConfigTest, UnknownFileKeysThrow) {
    std::string misspelled = writeTmpFile("misspelled.ini", "[training]\nnum_epoch=100\n");
    ASSERT_THROW(loadConfig(misspelled), InvalidConfigurationException);

    std::string unknown_section = writeTmpFile("unknown_section.ini", "[path]\ntrain_triples=train.tsv\n\n[decoder]\ntype=TransE\n");
    ASSERT_THROW(parseArgs({unknown_section}), InvalidConfigurationException);

    std::string known = writeTmpFile("known.ini", "[training]\nnum_epochs=100\n");
    ASSERT_EQ(loadConfig(known)->training->num_epochs, 100);
}

TEST_F(ConfigTest, RegularizerCanBeDisabled) {
    std::string path = writeTmpFile("no_regularizer.ini", "[model]\ninteraction=DistMult\n\n[regularizer]\ntype=None\n");
    auto config = loadConfig(path);
    ASSERT_NE(config->model->regularizer, nullptr);
    ASSERT_EQ(config->model->regularizer->type, RegularizerType::NONE);

    config = parseArgs({default_config_, "--regularizer.type=None"});
    ASSERT_NE(config->model->regularizer, nullptr);
    ASSERT_EQ(config->model->regularizer->type, RegularizerType::NONE);
}

TEST_F(ConfigTest, MissingConfigFile) {
    ASSERT_THROW(loadConfig("/tmp/kestrel_missing_config.ini"), InvalidConfigurationException);
    ASSERT_THROW(parseArgs({}), InvalidConfigurationException);
}

TEST_F(ConfigTest, HelpReturnsNull) { ASSERT_EQ(parseArgs({"--help"}), nullptr); }

TEST(OptionsTest, EnumParsingIsCaseInsensitive) {
    ASSERT_EQ(getInteractionType("distmult"), InteractionType::DISTMULT);
    ASSERT_EQ(getTrainingAssumption("closed_world"), TrainingAssumption::CWA);
    ASSERT_EQ(getInitDistribution("xavier_uniform"), InitDistribution::GLOROT_UNIFORM);
    ASSERT_EQ(getLossReduction("mean"), LossReduction::MEAN);
    ASSERT_EQ(getOptimizerType("adam"), OptimizerType::ADAM);
    ASSERT_THROW(getLossFunctionType("hinge"), InvalidConfigurationException);
}
