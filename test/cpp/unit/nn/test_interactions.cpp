#include <gtest/gtest.h>
#include <nn/interactions.h>

TEST(InteractionsTest, TransEIsNegativeDistance) {
    torch::Tensor h = torch::tensor({1.0, 0.0});
    torch::Tensor r = torch::tensor({0.0, 1.0});

    torch::Tensor t = torch::tensor({1.0, 1.0});
    ASSERT_FLOAT_EQ(transe_interaction(h, r, t, 1).item<float>(), 0.0);

    t = torch::tensor({0.0, 0.0});
    ASSERT_FLOAT_EQ(transe_interaction(h, r, t, 1).item<float>(), -2.0);
    ASSERT_NEAR(transe_interaction(h, r, t, 2).item<float>(), -std::sqrt(2.0), 1e-6);

    ASSERT_FLOAT_EQ(interaction_function(InteractionType::TRANSE, h, r, t).item<float>(), -2.0);
}

TEST(InteractionsTest, DistMultIsTrilinearProduct) {
    torch::Tensor h = torch::tensor({1.0, 2.0});
    torch::Tensor r = torch::tensor({3.0, 4.0});
    torch::Tensor t = torch::tensor({5.0, 6.0});

    ASSERT_FLOAT_EQ(distmult_interaction(h, r, t).item<float>(), 63.0);
    ASSERT_FLOAT_EQ(interaction_function(InteractionType::DISTMULT, h, r, t).item<float>(), 63.0);
    ASSERT_FLOAT_EQ(distmult_interaction(h, r, t).item<float>(), distmult_interaction(t, r, h).item<float>());
}

TEST(InteractionsTest, Broadcasting) {
    torch::Tensor h = torch::randn({2, 1, 3});
    torch::Tensor r = torch::randn({2, 1, 3});
    torch::Tensor t = torch::randn({1, 4, 3});

    for (auto interaction : {InteractionType::TRANSE, InteractionType::DISTMULT}) {
        torch::Tensor scores = interaction_function(interaction, h, r, t);
        ASSERT_EQ(scores.sizes(), torch::IntArrayRef({2, 4}));

        torch::Tensor single = interaction_function(interaction, h[1][0], r[1][0], t[0][2]);
        ASSERT_NEAR(scores[1][2].item<float>(), single.item<float>(), 1e-5);
    }
}
