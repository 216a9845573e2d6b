#ifndef KESTREL_REGULARIZER_H
#define KESTREL_REGULARIZER_H

#include "common/datatypes.h"
#include "configuration/config.h"

/**
  Accumulates a penalty over the embeddings touched by scoring calls. The term is read and cleared
  exactly once per training step through popTerm().
*/
class Regularizer {
   protected:
    float weight_;
    bool apply_only_once_;
    bool updated_;
    torch::Tensor term_;

    virtual torch::Tensor penalty(torch::Tensor x) = 0;

   public:
    Regularizer(float weight, bool apply_only_once);

    virtual ~Regularizer(){};

    /** Adds the weighted penalty for each tensor to the pending term */
    void update(std::vector<torch::Tensor> tensors);

    /** Returns the pending term and clears it. Zero if nothing was accumulated. */
    torch::Tensor popTerm();

    void reset();

    bool hasTerm() { return term_.defined(); }

    float getWeight() { return weight_; }
};

/**
  weight * mean(||x||_p) over the rows of x. With normalize set, the norm is divided by dim^(1/p) so the
  penalty does not grow with the embedding width.
*/
class LpRegularizer : public Regularizer {
   private:
    float p_;
    bool normalize_;

   protected:
    torch::Tensor penalty(torch::Tensor x) override;

   public:
    LpRegularizer(float weight, float p, bool normalize, bool apply_only_once);
};

/**
  Regularizer used when the config leaves it unset: DistMult gets an L2 penalty (weight 0.1, normalized)
  on its relation embeddings, TransE gets none.
*/
shared_ptr<RegularizerConfig> getDefaultRegularizerConfig(InteractionType interaction);

/** Returns nullptr for RegularizerType::NONE */
shared_ptr<Regularizer> getRegularizer(shared_ptr<RegularizerConfig> config);

#endif  // KESTREL_REGULARIZER_H
