#ifndef TYCHE_OPTIMIZER_SGD_HPP
#define TYCHE_OPTIMIZER_SGD_HPP

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Tyche::Optimizer::Details {

    struct SGDOptions {
        double learning_rate{1e-2};
        double momentum{0.0};
        double dampening{0.0};
        double weight_decay{0.0};
        bool nesterov{false};
    };

    struct SGDDescriptor {
        SGDOptions options{};
    };

    inline torch::optim::SGDOptions to_torch_options(const SGDOptions& options) {
        if (options.nesterov && (options.momentum <= 0.0 || options.dampening != 0.0)) {
            throw std::invalid_argument("Nesterov momentum requires a positive momentum and zero dampening.");
        }
        return torch::optim::SGDOptions(options.learning_rate)
            .momentum(options.momentum)
            .dampening(options.dampening)
            .weight_decay(options.weight_decay)
            .nesterov(options.nesterov);
    }

    class SGD : public torch::optim::SGD {
    public:
        SGD(std::vector<torch::Tensor> params, const torch::optim::SGDOptions& options)
            : torch::optim::SGD(std::move(params), options) {}

        // Zeroed momentum buffers for groups that use momentum; plain SGD keeps no state.
        void ensure_state_initialized() {
            torch::NoGradGuard no_grad{};
            auto& buffers = this->state();

            for (const auto& group : this->param_groups()) {
                if (static_cast<const torch::optim::SGDOptions&>(group.options()).momentum() == 0.0) {
                    continue;
                }
                for (const auto& param : group.params()) {
                    if (!param.requires_grad() || buffers.count(param.unsafeGetTensorImpl()) != 0) {
                        continue;
                    }
                    auto entry = std::make_unique<torch::optim::SGDParamState>();
                    entry->momentum_buffer(torch::zeros_like(param));
                    buffers.insert({param.unsafeGetTensorImpl(), std::move(entry)});
                }
            }
        }
    };
}

#endif // TYCHE_OPTIMIZER_SGD_HPP
