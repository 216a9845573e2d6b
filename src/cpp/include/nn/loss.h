#ifndef KESTREL_LOSS_H
#define KESTREL_LOSS_H

#include "common/datatypes.h"
#include "configuration/config.h"

/** Throws if either tensor is undefined or their shapes differ */
void checkScoreShapes(torch::Tensor first, torch::Tensor second);

// Loss Functions
/**
  Reduces scores to a scalar loss. Pairwise losses take (pos_scores, neg_scores), pointwise losses take
  (scores, labels) where labels lie in [0, 1].
*/
class LossFunction {
   protected:
    LossReduction reduction_type_;

    torch::Tensor reduce(torch::Tensor loss);

   public:
    LossFunction(shared_ptr<LossOptions> options);

    virtual ~LossFunction(){};

    virtual torch::Tensor operator()(torch::Tensor first, torch::Tensor second) = 0;

    /** True if the loss compares a positive score against a negative score */
    virtual bool isPairwise() { return false; }

    LossReduction getReduction() { return reduction_type_; }
};

/**
  reduce(max(0, margin - (pos - neg))). Zero once every positive beats its negative by the margin.
*/
class MarginRankingLoss : public LossFunction {
   private:
    float margin_;

   public:
    MarginRankingLoss(shared_ptr<RankingLossOptions> options);

    torch::Tensor operator()(torch::Tensor pos_scores, torch::Tensor neg_scores) override;

    bool isPairwise() override { return true; }

    float getMargin() { return margin_; }
};

class BCEAfterSigmoidLoss : public LossFunction {
   public:
    BCEAfterSigmoidLoss(shared_ptr<LossOptions> options) : LossFunction(options){};

    torch::Tensor operator()(torch::Tensor scores, torch::Tensor labels) override;
};

class BCEWithLogitsLoss : public LossFunction {
   public:
    BCEWithLogitsLoss(shared_ptr<LossOptions> options) : LossFunction(options){};

    torch::Tensor operator()(torch::Tensor scores, torch::Tensor labels) override;
};

class SoftPlusLoss : public LossFunction {
   public:
    SoftPlusLoss(shared_ptr<LossOptions> options) : LossFunction(options){};

    torch::Tensor operator()(torch::Tensor scores, torch::Tensor labels) override;
};

shared_ptr<LossFunction> getLossFunction(shared_ptr<LossConfig> config);

#endif  // KESTREL_LOSS_H
