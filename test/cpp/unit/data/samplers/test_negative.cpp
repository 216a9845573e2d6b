#include <ATen/CPUGeneratorImpl.h>
#include <gtest/gtest.h>
#include <data/samplers/negative.h>

class UniformNegativeSamplerTest : public ::testing::Test {
   protected:
    TripleList positives_ = torch::tensor(std::vector<int64_t>{0, 0, 1, 2, 1, 3, 4, 0, 2, 1, 1, 1}).view({4, 3});
};

TEST_F(UniformNegativeSamplerTest, OutputShape) {
    auto generator = at::detail::createCPUGenerator(0);

    UniformNegativeSampler sampler(100);
    ASSERT_EQ(sampler.getNegatives(positives_, generator).sizes(), torch::IntArrayRef({4, 3}));

    UniformNegativeSampler multi_sampler(100, 3);
    TripleList negatives = multi_sampler.getNegatives(positives_, generator);
    ASSERT_EQ(negatives.sizes(), torch::IntArrayRef({12, 3}));
    ASSERT_EQ(negatives.dtype(), torch::kInt64);
}

TEST_F(UniformNegativeSamplerTest, CorruptsExactlyOneEnd) {
    auto generator = at::detail::createCPUGenerator(1);
    int num_negatives = 5;

    UniformNegativeSampler sampler(1000, num_negatives);
    TripleList negatives = sampler.getNegatives(positives_, generator);
    TripleList expected = positives_.repeat({num_negatives, 1});

    ASSERT_TRUE(negatives.select(1, 1).equal(expected.select(1, 1)));

    torch::Tensor head_changed = negatives.select(1, 0).ne(expected.select(1, 0));
    torch::Tensor tail_changed = negatives.select(1, 2).ne(expected.select(1, 2));
    ASSERT_TRUE(head_changed.logical_xor(tail_changed).all().item<bool>());

    ASSERT_TRUE((negatives.select(1, 0).ge(0) & negatives.select(1, 0).lt(1000)).all().item<bool>());
    ASSERT_TRUE((negatives.select(1, 2).ge(0) & negatives.select(1, 2).lt(1000)).all().item<bool>());
}

TEST_F(UniformNegativeSamplerTest, BothEndsAreCorrupted) {
    auto generator = at::detail::createCPUGenerator(2);
    TripleList many_positives = torch::zeros({200, 3}, torch::kInt64);

    UniformNegativeSampler sampler(50);
    TripleList negatives = sampler.getNegatives(many_positives, generator);

    ASSERT_TRUE(negatives.select(1, 0).ne(0).any().item<bool>());
    ASSERT_TRUE(negatives.select(1, 2).ne(0).any().item<bool>());
}

TEST_F(UniformNegativeSamplerTest, SingleEntityKeepsDuplicates) {
    auto generator = at::detail::createCPUGenerator(3);
    TripleList single_entity = torch::zeros({3, 3}, torch::kInt64);

    UniformNegativeSampler sampler(1, 2, 5);
    TripleList negatives = sampler.getNegatives(single_entity, generator);
    ASSERT_TRUE(negatives.equal(torch::zeros({6, 3}, torch::kInt64)));
}

TEST_F(UniformNegativeSamplerTest, SameSeedSameNegatives) {
    UniformNegativeSampler sampler(100, 2);

    TripleList first = sampler.getNegatives(positives_, at::detail::createCPUGenerator(7));
    TripleList second = sampler.getNegatives(positives_, at::detail::createCPUGenerator(7));
    ASSERT_TRUE(first.equal(second));
}

TEST_F(UniformNegativeSamplerTest, InvalidArgumentsThrow) {
    ASSERT_THROW(UniformNegativeSampler(0), InvalidConfigurationException);
    ASSERT_THROW(UniformNegativeSampler(10, 0), InvalidConfigurationException);
    ASSERT_THROW(UniformNegativeSampler(10, 1, -1), InvalidConfigurationException);

    UniformNegativeSampler sampler(10);
    auto generator = at::detail::createCPUGenerator(0);
    ASSERT_THROW(sampler.getNegatives(torch::zeros({4, 2}, torch::kInt64), generator), TensorSizeMismatchException);
    ASSERT_THROW(sampler.getNegatives(torch::Tensor(), generator), UndefinedTensorException);
}

TEST(LabelMatrixTest, OnesAtCompletions) {
    LabelSets label_sets = {{1, 2}, {0}, {}};
    torch::Tensor labels = create_label_matrix(label_sets, 3);

    ASSERT_EQ(labels.sizes(), torch::IntArrayRef({3, 3}));
    ASSERT_TRUE(labels.equal(torch::tensor({{0.0, 1.0, 1.0}, {1.0, 0.0, 0.0}, {0.0, 0.0, 0.0}}, torch::kFloat32)));

    for (int64_t i = 0; i < (int64_t)label_sets.size(); i++) {
        ASSERT_EQ(labels[i].sum().item<float>(), (float)label_sets[i].size());
    }

    ASSERT_THROW(create_label_matrix({{3}}, 3), IndexOutOfRangeException);
    ASSERT_THROW(create_label_matrix({{-1}}, 3), IndexOutOfRangeException);
}

TEST(LabelSmoothingTest, MovesEpsilonOffTrueSlots) {
    torch::Tensor labels = create_label_matrix({{1, 2}}, 3);
    torch::Tensor smoothed = apply_label_smoothing(labels, .1, 3);

    std::vector<float> expected = {.05, .9, .9};
    float total = 0;
    for (int64_t j = 0; j < 3; j++) {
        ASSERT_NEAR(smoothed[0][j].item<float>(), expected[j], 1e-6);
        total += smoothed[0][j].item<float>();
    }
    ASSERT_NEAR(total, 1.85, 1e-5);

    ASSERT_TRUE(apply_label_smoothing(labels, 0.0, 3).equal(labels));
}

TEST(LabelSmoothingTest, InvalidArgumentsThrow) {
    torch::Tensor labels = torch::zeros({2, 3});

    ASSERT_THROW(apply_label_smoothing(labels, 1.0, 3), InvalidConfigurationException);
    ASSERT_THROW(apply_label_smoothing(labels, -.1, 3), InvalidConfigurationException);
    ASSERT_THROW(apply_label_smoothing(labels, .1, 1), InvalidConfigurationException);
    ASSERT_THROW(apply_label_smoothing(labels, .1, 4), TensorSizeMismatchException);
}
