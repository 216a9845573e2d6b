#include "nn/optim.h"

Optimizer::Optimizer(torch::OrderedDict<std::string, torch::Tensor> param_dict, float learning_rate) {
    if (learning_rate <= 0) {
        throw InvalidConfigurationException(fmt::format("Learning rate must be > 0, got {}", learning_rate));
    }

    if (param_dict.is_empty()) {
        throw InvalidConfigurationException("Optimizer requires at least one parameter");
    }

    param_dict_ = param_dict;
    learning_rate_ = learning_rate;
    num_steps_ = 0;
}

void Optimizer::zero_grad() {
    auto param_items = param_dict_.items();
#pragma omp parallel for
    for (int64_t i = 0; i < (int64_t)param_items.size(); i++) {
        param_items[i].value().mutable_grad() = torch::Tensor();
    }
}

void Optimizer::step() {
    auto param_items = param_dict_.items();
#pragma omp parallel for
    for (int64_t i = 0; i < (int64_t)param_items.size(); i++) {
        torch::NoGradGuard no_grad;

        torch::Tensor param = param_items[i].value();
        torch::Tensor param_grad = param.grad();

        if (!param_grad.defined()) {
            continue;
        }

        update(param_items[i].key(), param, param_grad);
    }

    num_steps_++;
}

SGDOptimizer::SGDOptimizer(torch::OrderedDict<std::string, torch::Tensor> param_dict, float learning_rate) : Optimizer(param_dict, learning_rate) {
    reset_state();
}

void SGDOptimizer::reset_state() { num_steps_ = 0; }

void SGDOptimizer::update(const std::string &, torch::Tensor param, torch::Tensor param_grad) {
    param.data().add_(param_grad, -learning_rate_);
}

AdagradOptimizer::AdagradOptimizer(torch::OrderedDict<std::string, torch::Tensor> param_dict, shared_ptr<AdagradOptions> options)
    : Optimizer(param_dict, options->learning_rate) {
    eps_ = options->eps;
    lr_decay_ = options->lr_decay;
    weight_decay_ = options->weight_decay;
    init_value_ = options->init_value;

    reset_state();
}

void AdagradOptimizer::reset_state() {
    num_steps_ = 0;
    state_dict_ = torch::OrderedDict<std::string, torch::OrderedDict<std::string, torch::Tensor>>();

    for (auto itr = param_dict_.begin(); itr != param_dict_.end(); itr++) {
        torch::OrderedDict<std::string, torch::Tensor> param_state;
        param_state.insert("sum", torch::full_like(itr->value(), init_value_).detach());
        state_dict_.insert(itr->key(), param_state);
    }
}

void AdagradOptimizer::update(const std::string &key, torch::Tensor param, torch::Tensor param_grad) {
    torch::Tensor sum_state = state_dict_[key]["sum"];

    if (weight_decay_ != 0) {
        param_grad = param_grad.add(param, weight_decay_);
    }

    double learning_rate = learning_rate_;
    if (lr_decay_ != 0) {
        learning_rate = learning_rate / (1 + num_steps_ * lr_decay_);
    }

    sum_state.addcmul_(param_grad, param_grad, 1.0);
    param.data().addcdiv_(param_grad, sum_state.sqrt().add_(eps_), -learning_rate);
}

AdamOptimizer::AdamOptimizer(torch::OrderedDict<std::string, torch::Tensor> param_dict, shared_ptr<AdamOptions> options)
    : Optimizer(param_dict, options->learning_rate) {
    eps_ = options->eps;
    beta_1_ = options->beta_1;
    beta_2_ = options->beta_2;
    weight_decay_ = options->weight_decay;
    amsgrad_ = options->amsgrad;

    reset_state();
}

void AdamOptimizer::reset_state() {
    num_steps_ = 0;
    state_dict_ = torch::OrderedDict<std::string, torch::OrderedDict<std::string, torch::Tensor>>();

    for (auto itr = param_dict_.begin(); itr != param_dict_.end(); itr++) {
        torch::OrderedDict<std::string, torch::Tensor> param_state;
        param_state.insert("exp_avg", torch::zeros_like(itr->value()).detach());
        param_state.insert("exp_avg_sq", torch::zeros_like(itr->value()).detach());

        if (amsgrad_) {
            param_state.insert("max_exp_avg_sq", torch::zeros_like(itr->value()).detach());
        }

        state_dict_.insert(itr->key(), param_state);
    }
}

void AdamOptimizer::update(const std::string &key, torch::Tensor param, torch::Tensor param_grad) {
    torch::Tensor exp_avg_state = state_dict_[key]["exp_avg"];
    torch::Tensor exp_avg_sq_state = state_dict_[key]["exp_avg_sq"];

    double bias_correction1 = 1 - std::pow(beta_1_, num_steps_ + 1);
    double bias_correction2 = 1 - std::pow(beta_2_, num_steps_ + 1);

    if (weight_decay_ != 0) {
        param_grad = param_grad.add(param, weight_decay_);
    }

    exp_avg_state.mul_(beta_1_).add_(param_grad, 1 - beta_1_);
    exp_avg_sq_state.mul_(beta_2_).addcmul_(param_grad, param_grad, 1 - beta_2_);

    torch::Tensor second_moment = exp_avg_sq_state;
    if (amsgrad_) {
        torch::Tensor max_exp_avg_sq_state = state_dict_[key]["max_exp_avg_sq"];
        torch::max_out(max_exp_avg_sq_state, exp_avg_sq_state, max_exp_avg_sq_state);
        second_moment = max_exp_avg_sq_state;
    }

    torch::Tensor denom = (second_moment.sqrt() / std::sqrt(bias_correction2)).add_(eps_);
    param.data().addcdiv_(exp_avg_state, denom, -learning_rate_ / bias_correction1);
}

shared_ptr<Optimizer> getOptimizer(shared_ptr<OptimizerConfig> config, torch::OrderedDict<std::string, torch::Tensor> param_dict) {
    if (config == nullptr || config->options == nullptr) {
        throw UnexpectedNullPtrException("Optimizer config");
    }

    switch (config->type) {
        case OptimizerType::SGD:
            return std::make_shared<SGDOptimizer>(param_dict, config->options->learning_rate);
        case OptimizerType::ADAGRAD: {
            auto options = std::dynamic_pointer_cast<AdagradOptions>(config->options);
            if (options == nullptr) {
                throw UnexpectedNullPtrException("Adagrad optimizer requires AdagradOptions");
            }
            return std::make_shared<AdagradOptimizer>(param_dict, options);
        }
        case OptimizerType::ADAM: {
            auto options = std::dynamic_pointer_cast<AdamOptions>(config->options);
            if (options == nullptr) {
                throw UnexpectedNullPtrException("Adam optimizer requires AdamOptions");
            }
            return std::make_shared<AdamOptimizer>(param_dict, options);
        }
        default:
            throw InvalidConfigurationException("Unsupported optimizer type");
    }
}
