#include <gtest/gtest.h>
#include <nn/regularizer.h>

#include <cmath>

TEST(LpRegularizerTest, TermIsWeightedMeanNorm) {
    LpRegularizer regularizer(.5, 2.0, false, false);
    torch::Tensor x = torch::tensor({{3.0, 4.0}, {0.0, 0.0}});

    ASSERT_FALSE(regularizer.hasTerm());
    regularizer.update({x});
    ASSERT_TRUE(regularizer.hasTerm());

    ASSERT_FLOAT_EQ(regularizer.popTerm().item<float>(), 1.25);
    ASSERT_FALSE(regularizer.hasTerm());
    ASSERT_FLOAT_EQ(regularizer.popTerm().item<float>(), 0.0);
}

TEST(LpRegularizerTest, NormalizeDividesByWidth) {
    LpRegularizer regularizer(1.0, 2.0, true, false);
    regularizer.update({torch::tensor({{3.0, 4.0}})});
    ASSERT_NEAR(regularizer.popTerm().item<float>(), 5.0 / std::sqrt(2.0), 1e-5);

    LpRegularizer l1_regularizer(1.0, 1.0, false, false);
    l1_regularizer.update({torch::tensor({{3.0, -4.0}})});
    ASSERT_FLOAT_EQ(l1_regularizer.popTerm().item<float>(), 7.0);
}

TEST(LpRegularizerTest, AccumulatesAcrossUpdates) {
    LpRegularizer regularizer(1.0, 2.0, false, false);
    torch::Tensor x = torch::tensor({{3.0, 4.0}});

    regularizer.update({x, x});
    regularizer.update({x});
    ASSERT_FLOAT_EQ(regularizer.popTerm().item<float>(), 15.0);
}

TEST(LpRegularizerTest, ApplyOnlyOnce) {
    LpRegularizer regularizer(1.0, 2.0, false, true);
    torch::Tensor x = torch::tensor({{3.0, 4.0}});

    regularizer.update({x});
    regularizer.update({x});
    ASSERT_FLOAT_EQ(regularizer.popTerm().item<float>(), 5.0);

    // popping the term starts a new step
    regularizer.update({x});
    ASSERT_FLOAT_EQ(regularizer.popTerm().item<float>(), 5.0);

    regularizer.update({x});
    regularizer.reset();
    ASSERT_FALSE(regularizer.hasTerm());
}

TEST(LpRegularizerTest, TermCarriesGradient) {
    LpRegularizer regularizer(2.0, 2.0, false, false);
    torch::Tensor x = torch::tensor({{3.0, 4.0}}).requires_grad_();

    regularizer.update({x});
    regularizer.popTerm().backward();
    ASSERT_TRUE(x.grad().allclose(torch::tensor({{1.2, 1.6}})));
}

TEST(LpRegularizerTest, InvalidArgumentsThrow) {
    ASSERT_THROW(LpRegularizer(-1.0, 2.0, false, false), InvalidConfigurationException);
    ASSERT_THROW(LpRegularizer(1.0, 0.0, false, false), InvalidConfigurationException);
}

TEST(LpRegularizerTest, GetRegularizer) {
    auto config = std::make_shared<RegularizerConfig>();
    ASSERT_EQ(getRegularizer(config), nullptr);
    ASSERT_EQ(getRegularizer(nullptr), nullptr);

    config->type = RegularizerType::LP;
    config->weight = .1;
    auto regularizer = getRegularizer(config);
    ASSERT_NE(regularizer, nullptr);
    ASSERT_FLOAT_EQ(regularizer->getWeight(), .1);
}

TEST(LpRegularizerTest, DefaultConfigPerInteraction) {
    auto distmult = getDefaultRegularizerConfig(InteractionType::DISTMULT);
    ASSERT_EQ(distmult->type, RegularizerType::LP);
    ASSERT_FLOAT_EQ(distmult->weight, .1);
    ASSERT_FLOAT_EQ(distmult->p, 2.0);
    ASSERT_TRUE(distmult->normalize);
    ASSERT_FALSE(distmult->apply_only_once);

    ASSERT_EQ(getRegularizer(getDefaultRegularizerConfig(InteractionType::TRANSE)), nullptr);
}
