#include "nn/model.h"

#include "common/util.h"
#include "reporting/logger.h"

KGEModel::KGEModel(InteractionType interaction, shared_ptr<EmbeddingTable> entity_embeddings, shared_ptr<EmbeddingTable> relation_embeddings,
                   shared_ptr<LossFunction> loss_function, shared_ptr<Regularizer> regularizer, int scoring_norm)
    : device_(torch::kCPU) {
    if (entity_embeddings == nullptr || relation_embeddings == nullptr) {
        throw UnexpectedNullPtrException("Model requires entity and relation tables");
    }

    if (loss_function == nullptr) {
        throw UnexpectedNullPtrException("Model requires a loss function");
    }

    if (entity_embeddings->embedding_dim_ != relation_embeddings->embedding_dim_) {
        throw InvalidConfigurationException(fmt::format("Entity and relation embedding dimensions differ: {} vs {}", entity_embeddings->embedding_dim_,
                                                        relation_embeddings->embedding_dim_));
    }

    if (scoring_norm <= 0) {
        throw InvalidConfigurationException(fmt::format("Scoring norm must be > 0, got {}", scoring_norm));
    }

    interaction_ = interaction;
    scoring_norm_ = scoring_norm;
    num_entities_ = entity_embeddings->num_rows_;
    num_relations_ = relation_embeddings->num_rows_;
    embedding_dim_ = entity_embeddings->embedding_dim_;

    entity_embeddings_ = register_module<EmbeddingTable>("entity_embeddings", entity_embeddings);
    relation_embeddings_ = register_module<EmbeddingTable>("relation_embeddings", relation_embeddings);
    loss_function_ = loss_function;
    regularizer_ = regularizer;
    device_ = entity_embeddings_->weight_.device();
}

torch::Tensor KGEModel::compute_hrt(TripleList hrt) {
    if (!hrt.defined()) {
        throw UndefinedTensorException();
    }

    if (hrt.dim() != 2 || hrt.size(1) != 3) {
        throw TensorSizeMismatchException(hrt, "Expected triples of shape (n, 3)");
    }

    torch::Tensor h = entity_embeddings_->lookup(hrt.select(1, 0));
    torch::Tensor r = relation_embeddings_->lookup(hrt.select(1, 1));
    torch::Tensor t = entity_embeddings_->lookup(hrt.select(1, 2));

    regularize(h, r, t);

    return interaction_function(interaction_, h, r, t, scoring_norm_).view({-1, 1});
}

void KGEModel::regularize(torch::Tensor h, torch::Tensor r, torch::Tensor t) {
    if (regularizer_ == nullptr || !torch::GradMode::is_enabled()) {
        return;
    }

    // DistMult only penalizes the relation embeddings
    if (interaction_ == InteractionType::DISTMULT) {
        regularizer_->update({r});
    } else if (t.defined()) {
        regularizer_->update({h, r, t});
    } else {
        regularizer_->update({h, r});
    }
}

torch::Tensor KGEModel::score_hrt(TripleList hrt) { return compute_hrt(hrt); }

torch::Tensor KGEModel::score_t(PairList hr) {
    if (!hr.defined()) {
        throw UndefinedTensorException();
    }

    if (hr.dim() != 2 || hr.size(1) != 2) {
        throw TensorSizeMismatchException(hr, "Expected (head, relation) pairs of shape (n, 2)");
    }

    torch::Tensor h = entity_embeddings_->lookup(hr.select(1, 0)).unsqueeze(1);
    torch::Tensor r = relation_embeddings_->lookup(hr.select(1, 1)).unsqueeze(1);
    torch::Tensor t = entity_embeddings_->all().unsqueeze(0);

    regularize(h, r, torch::Tensor());

    return interaction_function(interaction_, h, r, t, scoring_norm_);
}

torch::Tensor KGEModel::score_h(PairList rt) {
    if (!rt.defined()) {
        throw UndefinedTensorException();
    }

    if (rt.dim() != 2 || rt.size(1) != 2) {
        throw TensorSizeMismatchException(rt, "Expected (relation, tail) pairs of shape (n, 2)");
    }

    torch::Tensor h = entity_embeddings_->all().unsqueeze(0);
    torch::Tensor r = relation_embeddings_->lookup(rt.select(1, 0)).unsqueeze(1);
    torch::Tensor t = entity_embeddings_->lookup(rt.select(1, 1)).unsqueeze(1);

    regularize(t, r, torch::Tensor());

    return interaction_function(interaction_, h, r, t, scoring_norm_);
}

float KGEModel::predict(Triple triple) {
    torch::NoGradGuard no_grad;

    auto options = torch::TensorOptions().dtype(torch::kInt64);
    TripleList hrt = torch::tensor(std::vector<int64_t>{triple[0], triple[1], triple[2]}, options).view({1, 3});

    return compute_hrt(hrt).item<float>();
}

void KGEModel::apply_forward_constraint() { entity_embeddings_->normalize_(2); }

torch::Tensor KGEModel::add_regularization_term(torch::Tensor loss) {
    if (regularizer_ == nullptr) {
        return loss;
    }
    return loss + regularizer_->popTerm().to(loss.device());
}

torch::Tensor KGEModel::compute_ranking_loss(torch::Tensor pos_scores, torch::Tensor neg_scores) {
    checkScoreShapes(pos_scores, neg_scores);

    torch::Tensor loss;
    if (loss_function_->isPairwise()) {
        loss = (*loss_function_)(pos_scores, neg_scores);
    } else {
        torch::Tensor scores = torch::cat({pos_scores, neg_scores});
        torch::Tensor labels = torch::cat({torch::ones_like(pos_scores), torch::zeros_like(neg_scores)});
        loss = (*loss_function_)(scores, labels);
    }

    return add_regularization_term(loss);
}

torch::Tensor KGEModel::compute_label_loss(torch::Tensor scores, torch::Tensor labels) {
    if (loss_function_->isPairwise()) {
        throw InvalidConfigurationException("Margin ranking loss requires paired negatives and cannot score label matrices");
    }

    return add_regularization_term((*loss_function_)(scores, labels));
}

void KGEModel::reset_regularizer() {
    if (regularizer_ != nullptr) {
        regularizer_->reset();
    }
}

void KGEModel::to_device(torch::Device device) {
    if (device_ == device) {
        return;
    }

    torch::nn::Module::to(device);
    device_ = device;
}

torch::OrderedDict<std::string, torch::Tensor> KGEModel::getParamDict() { return named_parameters(); }

void KGEModel::save(string path) {
    torch::serialize::OutputArchive model_archive;
    torch::nn::Module::save(model_archive);
    model_archive.save_to(path);

    SPDLOG_INFO("Saved model to {}", path);
}

namespace {

void checkArchivedShape(torch::serialize::InputArchive &model_archive, const std::string &table_name, torch::Tensor expected) {
    torch::serialize::InputArchive table_archive;
    torch::Tensor archived_weight;

    if (!model_archive.try_read(table_name, table_archive) || !table_archive.try_read("weight", archived_weight)) {
        throw KestrelRuntimeException(fmt::format("Model file has no {} table", table_name));
    }

    if (archived_weight.sizes() != expected.sizes()) {
        throw TensorSizeMismatchException(archived_weight, fmt::format("Archived {} do not match the model dimensions {}", table_name,
                                                                       c10::str(expected.sizes())));
    }
}

}  // namespace

void KGEModel::load(string path) {
    if (!fileExists(path)) {
        throw KestrelRuntimeException("Model file not found: " + path);
    }

    torch::serialize::InputArchive model_archive;
    model_archive.load_from(path, device_);

    // Module::load resizes parameters in place, so shapes are checked on copies read ahead of it
    checkArchivedShape(model_archive, "entity_embeddings", entity_embeddings_->weight_);
    checkArchivedShape(model_archive, "relation_embeddings", relation_embeddings_->weight_);

    torch::nn::Module::load(model_archive);
}

shared_ptr<KGEModel> initModelFromConfig(shared_ptr<ModelConfig> model_config, int64_t num_entities, int64_t num_relations, torch::Device device) {
    if (model_config == nullptr) {
        throw UnexpectedNullPtrException("Model config undefined");
    }

    if (model_config->entity_init == nullptr || model_config->relation_init == nullptr) {
        throw UnexpectedNullPtrException("Embedding init config undefined");
    }

    if (model_config->loss == nullptr) {
        throw UnexpectedNullPtrException("Loss config undefined");
    }

    if (model_config->embedding_dim <= 0) {
        throw InvalidConfigurationException(fmt::format("embedding_dim must be > 0, got {}", model_config->embedding_dim));
    }

    auto tensor_options = torch::TensorOptions().dtype(torch::kFloat32).device(device);

    auto entity_embeddings = std::make_shared<EmbeddingTable>("entity", num_entities, model_config->embedding_dim, model_config->entity_init, tensor_options);
    auto relation_embeddings =
        std::make_shared<EmbeddingTable>("relation", num_relations, model_config->embedding_dim, model_config->relation_init, tensor_options);

    if (model_config->relation_init->type == InitDistribution::GLOROT_UNIFORM) {
        relation_embeddings->normalize_(2);
    }

    shared_ptr<LossFunction> loss_function = getLossFunction(model_config->loss);
    shared_ptr<RegularizerConfig> regularizer_config = model_config->regularizer;
    if (regularizer_config == nullptr) {
        regularizer_config = getDefaultRegularizerConfig(model_config->interaction);
    }
    shared_ptr<Regularizer> regularizer = getRegularizer(regularizer_config);

    auto model = std::make_shared<KGEModel>(model_config->interaction, entity_embeddings, relation_embeddings, loss_function, regularizer,
                                            model_config->scoring_norm);

    SPDLOG_DEBUG("Initialized {} model: {} entities, {} relations, dim {}", getInteractionName(model_config->interaction), num_entities, num_relations,
                 model_config->embedding_dim);

    return model;
}
