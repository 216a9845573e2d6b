#include "nn/initialization.h"

std::tuple<int64_t, int64_t> compute_fans(std::vector<int64_t> shape) {
    int64_t fan_in = 0;
    int64_t fan_out = 0;

    if (shape.size() < 1) {
        fan_in = fan_out = 1;
    } else if (shape.size() == 1) {
        fan_in = fan_out = shape[0];
    } else if (shape.size() == 2) {
        fan_in = shape[0];
        fan_out = shape[1];
    } else {
        fan_in = shape[shape.size() - 2];
        fan_out = shape[shape.size() - 1];
    }

    return std::forward_as_tuple(fan_in, fan_out);
}

torch::Tensor glorot_uniform(std::vector<int64_t> shape, std::tuple<int64_t, int64_t> fans, torch::TensorOptions options) {
    int64_t fan_in = std::get<0>(fans);
    int64_t fan_out = std::get<1>(fans);

    if (fan_in == -1 || fan_out == -1) {
        std::tie(fan_in, fan_out) = compute_fans(shape);
    }

    float limit = sqrt(6.0 / (fan_in + fan_out));
    torch::Tensor ret = torch::rand(shape, options);
    ret = 2 * limit * (ret - .5);

    return ret;
}

torch::Tensor glorot_normal(std::vector<int64_t> shape, std::tuple<int64_t, int64_t> fans, torch::TensorOptions options) {
    int64_t fan_in = std::get<0>(fans);
    int64_t fan_out = std::get<1>(fans);

    if (fan_in == -1 || fan_out == -1) {
        std::tie(fan_in, fan_out) = compute_fans(shape);
    }

    float std = sqrt(2.0 / (fan_in + fan_out));

    return torch::randn(shape, options).mul_(std);
}

torch::Tensor uniform_init(float scale_factor, std::vector<int64_t> shape, torch::TensorOptions options) {
    return (2 * torch::rand(shape, options) - 1).mul_(scale_factor);
}

torch::Tensor normal_init(float mean, float std, std::vector<int64_t> shape, torch::TensorOptions options) {
    return torch::randn(shape, options).mul_(std) + mean;
}

torch::Tensor constant_init(float constant, std::vector<int64_t> shape, torch::TensorOptions options) { return torch::ones(shape, options) * constant; }

torch::Tensor initialize_tensor(shared_ptr<InitConfig> init_config, std::vector<int64_t> shape, torch::TensorOptions tensor_options,
                                std::tuple<int64_t, int64_t> fans) {
    if (init_config == nullptr) {
        throw UnexpectedNullPtrException("Init config is undefined");
    }

    InitDistribution init_distribution = init_config->type;
    shared_ptr<InitOptions> init_options = init_config->options;

    torch::Tensor ret;

    switch (init_distribution) {
        case InitDistribution::GLOROT_NORMAL:
            ret = glorot_normal(shape, fans, tensor_options);
            break;
        case InitDistribution::GLOROT_UNIFORM:
            ret = glorot_uniform(shape, fans, tensor_options);
            break;
        case InitDistribution::UNIFORM: {
            auto uniform_options = std::dynamic_pointer_cast<UniformInitOptions>(init_options);
            if (uniform_options == nullptr) {
                throw UnexpectedNullPtrException("Uniform initialization requires UniformInitOptions");
            }
            ret = uniform_init(uniform_options->scale_factor, shape, tensor_options);
            break;
        }
        case InitDistribution::NORMAL: {
            auto normal_options = std::dynamic_pointer_cast<NormalInitOptions>(init_options);
            if (normal_options == nullptr) {
                throw UnexpectedNullPtrException("Normal initialization requires NormalInitOptions");
            }
            ret = normal_init(normal_options->mean, normal_options->std, shape, tensor_options);
            break;
        }
        case InitDistribution::ZEROS:
            ret = torch::zeros(shape, tensor_options);
            break;
        case InitDistribution::ONES:
            ret = torch::ones(shape, tensor_options);
            break;
        case InitDistribution::CONSTANT: {
            auto constant_options = std::dynamic_pointer_cast<ConstantInitOptions>(init_options);
            if (constant_options == nullptr) {
                throw UnexpectedNullPtrException("Constant initialization requires ConstantInitOptions");
            }
            ret = constant_init(constant_options->constant, shape, tensor_options);
            break;
        }
    }

    return ret;
}
