#ifndef KESTREL_INTERACTIONS_H
#define KESTREL_INTERACTIONS_H

#include "common/datatypes.h"
#include "configuration/options.h"

// Relation operators: combine a head embedding with a relation embedding
torch::Tensor translation_operator(torch::Tensor h, torch::Tensor r);

torch::Tensor hadamard_operator(torch::Tensor h, torch::Tensor r);

// Comparators: reduce over the last dimension, higher is more plausible
torch::Tensor negative_lp_compare(torch::Tensor src, torch::Tensor dst, int p);

torch::Tensor dot_compare(torch::Tensor src, torch::Tensor dst);

/** -||h + r - t||_p */
torch::Tensor transe_interaction(torch::Tensor h, torch::Tensor r, torch::Tensor t, int p);

/** sum(h * r * t) */
torch::Tensor distmult_interaction(torch::Tensor h, torch::Tensor r, torch::Tensor t);

/**
  Scores broadcastable (..., d) head, relation and tail embeddings with the given interaction.
  @return Tensor of the broadcast shape without the last dimension
*/
torch::Tensor interaction_function(InteractionType interaction, torch::Tensor h, torch::Tensor r, torch::Tensor t, int scoring_norm = 1);

#endif  // KESTREL_INTERACTIONS_H
