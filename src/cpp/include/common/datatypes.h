#ifndef KESTREL_DATATYPES_H
#define KESTREL_DATATYPES_H

#include <array>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/exception.h"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"
#include "torch/torch.h"
#pragma GCC diagnostic pop

using std::map;
using std::shared_ptr;
using std::string;
using std::unique_ptr;

/** Typedefs */

/**
 * Tensor of triples with entity and relation indices. Shape (n, 3)
 * First column -> head_idx
 * Second column -> rel_idx
 * Third column -> tail_idx
 */
typedef torch::Tensor TripleList;

/**
 * Tensor of partially specified triples with one free slot. Shape (n, 2)
 * (head_idx, rel_idx) when scoring all tails, (rel_idx, tail_idx) when scoring all heads
 */
typedef torch::Tensor PairList;

/** 1D Tensor of indices. Shape (n) */
typedef torch::Tensor Indices;

/** A single fully specified triple (head_idx, rel_idx, tail_idx) */
typedef std::array<int64_t, 3> Triple;

/** For each closed-world pair, the ids of every entity completing it to a known triple */
typedef std::vector<std::vector<int64_t>> LabelSets;

#endif  // KESTREL_DATATYPES_H
