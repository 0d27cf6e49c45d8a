#ifndef TYCHE_OPTIMIZER_REGISTRY_HPP
#define TYCHE_OPTIMIZER_REGISTRY_HPP

#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "details/adam.hpp"
#include "details/sgd.hpp"

namespace Tyche::Optimizer::Details {
    // An optimizer together with the hook that allocates its per-parameter state
    // up front, so that every parameter starts from a known zero state.
    struct Binding {
        std::unique_ptr<torch::optim::Optimizer> instance{};
        std::function<void(torch::optim::Optimizer&)> warmup{};

        Binding() = default;
        Binding(Binding&&) noexcept = default;
        Binding& operator=(Binding&&) noexcept = default;
        Binding(const Binding&) = delete;
        Binding& operator=(const Binding&) = delete;
    };

    template <class Concrete>
    Binding make_binding(std::unique_ptr<Concrete> optimizer) {
        Binding binding{};
        binding.instance = std::move(optimizer);
        binding.warmup = [](torch::optim::Optimizer& instance) {
            if (auto* concrete = dynamic_cast<Concrete*>(&instance)) {
                concrete->ensure_state_initialized();
            }
        };
        return binding;
    }

    template <class Descriptor>
    Binding build_optimizer(std::vector<torch::Tensor>, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported optimizer descriptor provided to build_optimizer.");
        return {};
    }

    inline Binding build_optimizer(std::vector<torch::Tensor> parameters, const SGDDescriptor& descriptor) {
        return make_binding(std::make_unique<SGD>(std::move(parameters), to_torch_options(descriptor.options)));
    }

    inline Binding build_optimizer(std::vector<torch::Tensor> parameters, const AdamDescriptor& descriptor) {
        return make_binding(std::make_unique<Adam>(std::move(parameters), to_torch_options(descriptor.options)));
    }
}

#endif // TYCHE_OPTIMIZER_REGISTRY_HPP
