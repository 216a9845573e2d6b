#include <gtest/gtest.h>
#include <nn/initialization.h>

#include "testing_util.h"

class InitializationTest : public ::testing::Test {
   protected:
    torch::TensorOptions float_options_ = torch::TensorOptions().dtype(torch::kFloat32);
    std::vector<int64_t> table_shape_ = {40, 10};
};

TEST_F(InitializationTest, ComputeFansFollowsTrailingDimensions) {
    int64_t fan_in;
    int64_t fan_out;

    std::tie(fan_in, fan_out) = compute_fans({});
    ASSERT_EQ(fan_in, 1);
    ASSERT_EQ(fan_out, 1);

    std::tie(fan_in, fan_out) = compute_fans({7});
    ASSERT_EQ(fan_in, 7);
    ASSERT_EQ(fan_out, 7);

    std::tie(fan_in, fan_out) = compute_fans({40, 10});
    ASSERT_EQ(fan_in, 40);
    ASSERT_EQ(fan_out, 10);

    std::tie(fan_in, fan_out) = compute_fans({2, 4, 6, 8});
    ASSERT_EQ(fan_in, 6);
    ASSERT_EQ(fan_out, 8);
}

TEST_F(InitializationTest, GlorotUniformStaysWithinLimit) {
    torch::Tensor tensor = glorot_uniform(table_shape_, {-1, -1}, float_options_);
    float limit = sqrt(6.0 / (40 + 10));
    ASSERT_EQ(tensor.sizes(), torch::IntArrayRef(table_shape_));
    ASSERT_TRUE((tensor.ge(-limit) & tensor.le(limit)).all().item<bool>());

    tensor = glorot_uniform(table_shape_, {100, 50}, float_options_);
    limit = sqrt(6.0 / (100 + 50));
    ASSERT_TRUE((tensor.ge(-limit) & tensor.le(limit)).all().item<bool>());
}

TEST_F(InitializationTest, NormalMatchesMoments) {
    torch::Tensor tensor = normal_init(-.5, 2.0, {500, 500}, float_options_);
    ASSERT_NEAR(tensor.mean().item<float>(), -.5, .1);
    ASSERT_NEAR(tensor.std().item<float>(), 2.0, .1);

    tensor = glorot_normal(table_shape_, {-1, -1}, float_options_);
    ASSERT_EQ(tensor.sizes(), torch::IntArrayRef(table_shape_));
}

TEST_F(InitializationTest, InitializeTensorDispatchesOnDistribution) {
    torch::Tensor tensor = initialize_tensor(getInitConfig(InitDistribution::ZEROS), table_shape_, float_options_);
    ASSERT_TRUE(tensor.eq(0).all().item<bool>());

    tensor = initialize_tensor(getInitConfig(InitDistribution::ONES), table_shape_, float_options_);
    ASSERT_TRUE(tensor.eq(1).all().item<bool>());

    tensor = initialize_tensor(getInitConfig(InitDistribution::CONSTANT, .25), table_shape_, float_options_);
    ASSERT_TRUE(tensor.eq(.25).all().item<bool>());

    tensor = initialize_tensor(getInitConfig(InitDistribution::UNIFORM, .1), table_shape_, float_options_);
    ASSERT_TRUE((tensor.ge(-.1) & tensor.le(.1)).all().item<bool>());

    tensor = initialize_tensor(getInitConfig(InitDistribution::NORMAL, 1.0), table_shape_, float_options_.dtype(torch::kFloat64));
    ASSERT_EQ(tensor.dtype(), torch::kFloat64);
    ASSERT_EQ(tensor.sizes(), torch::IntArrayRef(table_shape_));
}

TEST_F(InitializationTest, MissingOptionsThrow) {
    auto init_config = std::make_shared<InitConfig>(InitDistribution::UNIFORM, nullptr);
    ASSERT_THROW(initialize_tensor(init_config, table_shape_, float_options_), UnexpectedNullPtrException);

    init_config->type = InitDistribution::CONSTANT;
    init_config->options = std::make_shared<UniformInitOptions>(1.0);
    ASSERT_THROW(initialize_tensor(init_config, table_shape_, float_options_), UnexpectedNullPtrException);

    ASSERT_THROW(initialize_tensor(nullptr, table_shape_, float_options_), UnexpectedNullPtrException);
}
