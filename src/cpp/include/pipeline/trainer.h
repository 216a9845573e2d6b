#ifndef KESTREL_TRAINER_H
#define KESTREL_TRAINER_H

#include <ATen/CPUGeneratorImpl.h>

#include "data/samplers/negative.h"
#include "data/triples.h"
#include "nn/model.h"
#include "nn/optim.h"
#include "reporting/reporting.h"

enum class TrainingState { IDLE, EPOCH_RUNNING, BATCH_RUNNING };

std::string getTrainingStateName(TrainingState state);

/**
  Runs synchronous mini-batch training of a model. Each epoch shuffles the instances with a fresh permutation drawn
  from the loop's own generator, so two loops built with the same seed produce the same run.
  Every batch runs zero_grad -> forward -> backward -> step -> forward constraint, strictly in that order.
*/
class TrainingLoop {
   protected:
    shared_ptr<KGEModel> model_;
    shared_ptr<Optimizer> optimizer_;
    torch::Device device_;
    at::Generator generator_;
    TrainingState state_;
    int logs_per_epoch_;

    /** Throws if the instances cannot be trained on by this loop */
    virtual void validateInstances(shared_ptr<Instances> instances, bool label_smoothing) = 0;

    /**
      Builds the batch inputs for the selected rows and runs the forward pass.
      @return Scalar loss for the batch, including regularization
    */
    virtual torch::Tensor forwardBatch(shared_ptr<Instances> instances, Indices batch_indices, bool label_smoothing, float label_smoothing_epsilon) = 0;

    virtual std::string itemName() = 0;

   public:
    TrainingLoop(shared_ptr<KGEModel> model, shared_ptr<Optimizer> optimizer, int64_t random_seed, torch::Device device = torch::kCPU,
                 int logs_per_epoch = 10);

    virtual ~TrainingLoop(){};

    /**
      Trains the model for num_epochs over the given instances.
      @param label_smoothing Only used by closed-world training
      @param label_smoothing_epsilon Must lie in [0, 1) when label_smoothing is set
      @return The trained model and the loss of each epoch, weighted by batch size
    */
    std::tuple<shared_ptr<KGEModel>, std::vector<double>> train(shared_ptr<Instances> instances, int num_epochs, int batch_size,
                                                               bool label_smoothing = false, float label_smoothing_epsilon = 0.1);

    TrainingState getState() { return state_; }

    shared_ptr<KGEModel> getModel() { return model_; }
};

/**
  Open-world training: each positive triple is scored against uniformly corrupted negatives.
*/
class OWATrainingLoop : public TrainingLoop {
    shared_ptr<NegativeSampler> negative_sampler_;
    int num_negatives_per_positive_;

   protected:
    void validateInstances(shared_ptr<Instances> instances, bool label_smoothing) override;

    torch::Tensor forwardBatch(shared_ptr<Instances> instances, Indices batch_indices, bool label_smoothing, float label_smoothing_epsilon) override;

    std::string itemName() override { return "Triples"; }

   public:
    OWATrainingLoop(shared_ptr<KGEModel> model, shared_ptr<Optimizer> optimizer, int64_t random_seed, torch::Device device = torch::kCPU,
                    int num_negatives_per_positive = 1, int max_sampling_retries = 10, int logs_per_epoch = 10);
};

/**
  Closed-world training: every (head, relation) pair is scored against all entities and compared with its
  (optionally smoothed) multi-hot completion labels. Requires a pointwise loss.
*/
class CWATrainingLoop : public TrainingLoop {
   protected:
    void validateInstances(shared_ptr<Instances> instances, bool label_smoothing) override;

    torch::Tensor forwardBatch(shared_ptr<Instances> instances, Indices batch_indices, bool label_smoothing, float label_smoothing_epsilon) override;

    std::string itemName() override { return "Pairs"; }

   public:
    CWATrainingLoop(shared_ptr<KGEModel> model, shared_ptr<Optimizer> optimizer, int64_t random_seed, torch::Device device = torch::kCPU,
                    int logs_per_epoch = 10);
};

#endif  // KESTREL_TRAINER_H
