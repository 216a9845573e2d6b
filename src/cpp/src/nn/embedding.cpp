#include "nn/embedding.h"

#include "common/util.h"
#include "nn/initialization.h"

EmbeddingTable::EmbeddingTable(std::string name, int64_t num_rows, int64_t embedding_dim, shared_ptr<InitConfig> init_config,
                               torch::TensorOptions tensor_options) {
    if (num_rows <= 0) {
        throw InvalidConfigurationException(fmt::format("{} table requires num_rows > 0, got {}", name, num_rows));
    }

    if (embedding_dim <= 0) {
        throw InvalidConfigurationException(fmt::format("{} table requires embedding_dim > 0, got {}", name, embedding_dim));
    }

    if (init_config == nullptr) {
        throw UnexpectedNullPtrException(name + " table requires an init config");
    }

    name_ = name;
    num_rows_ = num_rows;
    embedding_dim_ = embedding_dim;
    init_config_ = init_config;

    weight_ = register_parameter("weight", initialize_tensor(init_config_, {num_rows_, embedding_dim_}, tensor_options));
}

torch::Tensor EmbeddingTable::lookup(torch::Tensor ids) {
    assert_in_range(ids, 0, num_rows_, name_ + " id");

    std::vector<int64_t> out_shape = ids.sizes().vec();
    out_shape.emplace_back(embedding_dim_);

    torch::Tensor flat_ids = ids.to(weight_.device(), torch::kInt64).reshape({-1});
    return weight_.index_select(0, flat_ids).view(out_shape);
}

torch::Tensor EmbeddingTable::all() { return weight_; }

void EmbeddingTable::normalize_(float p) {
    torch::NoGradGuard no_grad;
    weight_.div_(weight_.norm(p, -1, true).clamp_min(1e-12));
}

void EmbeddingTable::reset() {
    torch::NoGradGuard no_grad;
    weight_.copy_(initialize_tensor(init_config_, {num_rows_, embedding_dim_}, weight_.options()));
}
