#include <gtest/gtest.h>
#include <nn/optim.h>

class OptimizerTest : public ::testing::Test {
   protected:
    torch::Tensor param_;
    torch::OrderedDict<std::string, torch::Tensor> param_dict_;

    void SetUp() override {
        param_ = torch::tensor({1.0, -2.0}).requires_grad_();
        param_dict_.insert("weight", param_);
    }

    // gradient of sum(x) is one everywhere
    void backwardOnes() { param_.sum().backward(); }
};

TEST_F(OptimizerTest, SGDStep) {
    SGDOptimizer optimizer(param_dict_, .1);

    (param_ * param_).sum().backward();
    optimizer.step();

    ASSERT_TRUE(param_.allclose(torch::tensor({.8, -1.6})));
    ASSERT_EQ(optimizer.num_steps_, 1);
}

TEST_F(OptimizerTest, ZeroGradClearsGradients) {
    SGDOptimizer optimizer(param_dict_, .1);

    backwardOnes();
    ASSERT_TRUE(param_.grad().defined());
    optimizer.zero_grad();
    ASSERT_FALSE(param_.grad().defined());

    // stepping without gradients leaves the parameter alone
    optimizer.step();
    ASSERT_TRUE(param_.allclose(torch::tensor({1.0, -2.0})));
}

TEST_F(OptimizerTest, AdagradFirstStepIsLearningRate) {
    auto options = std::make_shared<AdagradOptions>();
    options->learning_rate = .1;
    AdagradOptimizer optimizer(param_dict_, options);

    backwardOnes();
    optimizer.step();
    ASSERT_TRUE(param_.allclose(torch::tensor({.9, -2.1}), 1e-5, 1e-6));

    // accumulated squares shrink the second step
    optimizer.zero_grad();
    backwardOnes();
    optimizer.step();
    ASSERT_TRUE(param_.allclose(torch::tensor({.9 - .1 / std::sqrt(2.0), -2.1 - .1 / std::sqrt(2.0)}), 1e-5, 1e-6));
}

TEST_F(OptimizerTest, AdamFirstStepIsLearningRate) {
    auto options = std::make_shared<AdamOptions>();
    options->learning_rate = .01;
    AdamOptimizer optimizer(param_dict_, options);

    backwardOnes();
    optimizer.step();
    ASSERT_TRUE(param_.allclose(torch::tensor({.99, -2.01}), 1e-5, 1e-6));

    optimizer.reset_state();
    ASSERT_EQ(optimizer.num_steps_, 0);
    ASSERT_TRUE(optimizer.state_dict_["weight"]["exp_avg"].eq(0).all().item<bool>());
}

TEST_F(OptimizerTest, InvalidArgumentsThrow) {
    ASSERT_THROW(SGDOptimizer(param_dict_, 0.0), InvalidConfigurationException);
    ASSERT_THROW(SGDOptimizer(torch::OrderedDict<std::string, torch::Tensor>(), .1), InvalidConfigurationException);
}

TEST_F(OptimizerTest, GetOptimizer) {
    auto config = std::make_shared<OptimizerConfig>();
    config->type = OptimizerType::SGD;
    config->options = std::make_shared<OptimizerOptions>();
    config->options->learning_rate = .5;

    auto optimizer = getOptimizer(config, param_dict_);
    ASSERT_NE(std::dynamic_pointer_cast<SGDOptimizer>(optimizer), nullptr);
    ASSERT_FLOAT_EQ(optimizer->learning_rate_, .5);

    config->type = OptimizerType::ADAM;
    ASSERT_THROW(getOptimizer(config, param_dict_), UnexpectedNullPtrException);

    auto adagrad_options = std::make_shared<AdagradOptions>();
    adagrad_options->learning_rate = .5;
    config->type = OptimizerType::ADAGRAD;
    config->options = adagrad_options;
    ASSERT_NE(std::dynamic_pointer_cast<AdagradOptimizer>(getOptimizer(config, param_dict_)), nullptr);
}
