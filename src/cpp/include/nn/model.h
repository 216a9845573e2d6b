#ifndef KESTREL_MODEL_H
#define KESTREL_MODEL_H

#include "configuration/config.h"
#include "nn/embedding.h"
#include "nn/interactions.h"
#include "nn/loss.h"
#include "nn/regularizer.h"

/**
  Knowledge graph embedding model. Owns the entity and relation tables and scores (head, relation, tail)
  combinations with the configured interaction. Scores are higher for more plausible triples.
*/
class KGEModel : public torch::nn::Module {
   private:
    torch::Tensor compute_hrt(TripleList hrt);

    void regularize(torch::Tensor h, torch::Tensor r, torch::Tensor t);

    torch::Tensor add_regularization_term(torch::Tensor loss);

   public:
    InteractionType interaction_;
    int scoring_norm_;
    int64_t num_entities_;
    int64_t num_relations_;
    int64_t embedding_dim_;

    shared_ptr<EmbeddingTable> entity_embeddings_;
    shared_ptr<EmbeddingTable> relation_embeddings_;
    shared_ptr<LossFunction> loss_function_;
    shared_ptr<Regularizer> regularizer_;

    torch::Device device_;

    /**
      Takes ownership of the given tables. Both tables must share the same embedding dimension.
    */
    KGEModel(InteractionType interaction, shared_ptr<EmbeddingTable> entity_embeddings, shared_ptr<EmbeddingTable> relation_embeddings,
             shared_ptr<LossFunction> loss_function, shared_ptr<Regularizer> regularizer = nullptr, int scoring_norm = 1);

    /**
      Scores fully specified triples.
      @param hrt Triples of shape (n, 3)
      @return Scores of shape (n, 1)
    */
    torch::Tensor score_hrt(TripleList hrt);

    /**
      Scores every entity as the tail of each (head, relation) pair.
      @param hr Pairs of shape (n, 2)
      @return Scores of shape (n, num_entities)
    */
    torch::Tensor score_t(PairList hr);

    /**
      Scores every entity as the head of each (relation, tail) pair.
      @param rt Pairs of shape (n, 2)
      @return Scores of shape (n, num_entities)
    */
    torch::Tensor score_h(PairList rt);

    /** Scores a single triple without recording gradients or regularization */
    float predict(Triple triple);

    /** Rescales entity rows to unit L2 norm. Called after every optimizer step. */
    void apply_forward_constraint();

    /** Loss for paired positive and negative scores plus the pending regularization term */
    torch::Tensor compute_ranking_loss(torch::Tensor pos_scores, torch::Tensor neg_scores);

    /** Loss for scores against labels in [0, 1] of the same shape plus the pending regularization term */
    torch::Tensor compute_label_loss(torch::Tensor scores, torch::Tensor labels);

    /** Discards any regularization accumulated since the last loss computation */
    void reset_regularizer();

    void to_device(torch::Device device);

    torch::OrderedDict<std::string, torch::Tensor> getParamDict();

    void save(string path);

    void load(string path);
};

/**
  Builds a model from config. Relation rows drawn from the default Glorot uniform initialization are
  rescaled to unit length.
*/
shared_ptr<KGEModel> initModelFromConfig(shared_ptr<ModelConfig> model_config, int64_t num_entities, int64_t num_relations,
                                         torch::Device device = torch::kCPU);

#endif  // KESTREL_MODEL_H
