#ifndef KESTREL_NEGATIVE_H
#define KESTREL_NEGATIVE_H

#include "common/datatypes.h"

/**
 * Produces corrupted triples for a batch of positive triples.
 */
class NegativeSampler {
   public:
    virtual ~NegativeSampler(){};

    /**
     * Get negative triples for the given positives.
     * @param positives Triples of shape (n, 3)
     * @param generator Random source owned by the caller
     * @return Negative triples of shape (n * num_negatives_per_positive, 3) on the device of positives
     */
    virtual TripleList getNegatives(TripleList positives, at::Generator generator) = 0;
};

/**
 * Replaces either the head or the tail of each positive (fair coin per row) with an entity drawn uniformly
 * from [0, num_entities). Draws equal to the replaced value are redrawn up to max_retries times, after which the
 * duplicate is kept. Relations are never corrupted.
 */
class UniformNegativeSampler : public NegativeSampler {
   public:
    int64_t num_entities_;
    int num_negatives_per_positive_;
    int max_retries_;

    UniformNegativeSampler(int64_t num_entities, int num_negatives_per_positive = 1, int max_retries = 10);

    TripleList getNegatives(TripleList positives, at::Generator generator) override;
};

/**
 * Dense multi-hot labels for closed-world training.
 * @param label_sets For each row, the entity ids completing it to a known triple
 * @return Float tensor of shape (label_sets.size(), num_entities) with ones at each completion
 */
torch::Tensor create_label_matrix(const LabelSets &label_sets, int64_t num_entities, torch::Device device = torch::kCPU);

/**
 * Moves epsilon of the mass off each true slot: true slots become 1 - epsilon, all others epsilon / (num_entities - 1).
 */
torch::Tensor apply_label_smoothing(torch::Tensor labels, float epsilon, int64_t num_entities);

#endif  // KESTREL_NEGATIVE_H
