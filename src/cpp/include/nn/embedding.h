#ifndef KESTREL_EMBEDDING_H
#define KESTREL_EMBEDDING_H

#include "common/datatypes.h"
#include "configuration/config.h"

/**
  Dense lookup table mapping integer ids in [0, num_rows) to vectors of width embedding_dim.
  Row count and width are fixed at construction.
*/
class EmbeddingTable : public torch::nn::Module {
   public:
    std::string name_;
    int64_t num_rows_;
    int64_t embedding_dim_;
    shared_ptr<InitConfig> init_config_;
    torch::Tensor weight_;

    EmbeddingTable(std::string name, int64_t num_rows, int64_t embedding_dim, shared_ptr<InitConfig> init_config,
                   torch::TensorOptions tensor_options = torch::TensorOptions().dtype(torch::kFloat32));

    /**
      Gathers the rows for the given ids. Differentiable with respect to the table.
      @param ids Integer tensor of any shape
      @return Tensor of shape ids.sizes() + (embedding_dim)
    */
    torch::Tensor lookup(torch::Tensor ids);

    /** The full table, shape (num_rows, embedding_dim) */
    torch::Tensor all();

    /** Rescales every row to unit p-norm in place. No gradient flows through the rescale. */
    void normalize_(float p = 2.0);

    void reset();
};

#endif  // KESTREL_EMBEDDING_H
