#ifndef TYCHE_OPTIMIZER_ADAM_HPP
#define TYCHE_OPTIMIZER_ADAM_HPP
// Adam, the default optimizer of every inference run.

#include <memory>
#include <tuple>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Tyche::Optimizer::Details {

    struct AdamOptions {
        double learning_rate{1e-1};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{0.0};
        bool amsgrad{false};
    };

    struct AdamDescriptor {
        AdamOptions options{};
    };

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        return torch::optim::AdamOptions(options.learning_rate)
            .betas(std::make_tuple(options.beta1, options.beta2))
            .eps(options.eps)
            .weight_decay(options.weight_decay)
            .amsgrad(options.amsgrad);
    }

    class Adam : public torch::optim::Adam {
    public:
        Adam(std::vector<torch::Tensor> params, const torch::optim::AdamOptions& options)
            : torch::optim::Adam(std::move(params), options) {}

        // Zeroed first and second moments (and the running maximum under amsgrad)
        // for every parameter that has no state yet.
        void ensure_state_initialized() {
            torch::NoGradGuard no_grad{};
            auto& moments = this->state();

            for (const auto& group : this->param_groups()) {
                const bool amsgrad = static_cast<const torch::optim::AdamOptions&>(group.options()).amsgrad();
                for (const auto& param : group.params()) {
                    if (!param.requires_grad() || moments.count(param.unsafeGetTensorImpl()) != 0) {
                        continue;
                    }
                    auto entry = std::make_unique<torch::optim::AdamParamState>();
                    entry->step(0);
                    entry->exp_avg(torch::zeros_like(param));
                    entry->exp_avg_sq(torch::zeros_like(param));
                    if (amsgrad) {
                        entry->max_exp_avg_sq(torch::zeros_like(param));
                    }
                    moments.insert({param.unsafeGetTensorImpl(), std::move(entry)});
                }
            }
        }
    };

}

#endif // TYCHE_OPTIMIZER_ADAM_HPP
