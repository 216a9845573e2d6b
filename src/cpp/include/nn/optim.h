#ifndef KESTREL_OPTIM_H
#define KESTREL_OPTIM_H

#include "common/datatypes.h"
#include "configuration/config.h"

/**
  Updates a fixed set of named parameters in place from their accumulated gradients.
  Every batch goes through zero_grad() -> backward -> step(), in that order.
*/
class Optimizer {
   protected:
    /** Applies one update to a single parameter. Called under NoGradGuard. */
    virtual void update(const std::string &key, torch::Tensor param, torch::Tensor param_grad) = 0;

   public:
    int64_t num_steps_;
    float learning_rate_;

    torch::OrderedDict<std::string, torch::OrderedDict<std::string, torch::Tensor>> state_dict_;
    torch::OrderedDict<std::string, torch::Tensor> param_dict_;

    Optimizer(torch::OrderedDict<std::string, torch::Tensor> param_dict, float learning_rate);

    virtual ~Optimizer(){};

    /** Drops the gradient of every parameter so the next backward pass starts from zero */
    void zero_grad();

    void step();

    virtual void reset_state() = 0;
};

class SGDOptimizer : public Optimizer {
   protected:
    void update(const std::string &key, torch::Tensor param, torch::Tensor param_grad) override;

   public:
    SGDOptimizer(torch::OrderedDict<std::string, torch::Tensor> param_dict, float learning_rate);

    void reset_state() override;
};

class AdagradOptimizer : public Optimizer {
   protected:
    void update(const std::string &key, torch::Tensor param, torch::Tensor param_grad) override;

   public:
    float eps_;
    float lr_decay_;
    float weight_decay_;
    float init_value_;

    AdagradOptimizer(torch::OrderedDict<std::string, torch::Tensor> param_dict, shared_ptr<AdagradOptions> options);

    void reset_state() override;
};

class AdamOptimizer : public Optimizer {
   protected:
    void update(const std::string &key, torch::Tensor param, torch::Tensor param_grad) override;

   public:
    float eps_;
    float beta_1_;
    float beta_2_;
    float weight_decay_;
    bool amsgrad_;

    AdamOptimizer(torch::OrderedDict<std::string, torch::Tensor> param_dict, shared_ptr<AdamOptions> options);

    void reset_state() override;
};

shared_ptr<Optimizer> getOptimizer(shared_ptr<OptimizerConfig> config, torch::OrderedDict<std::string, torch::Tensor> param_dict);

#endif  // KESTREL_OPTIM_H
