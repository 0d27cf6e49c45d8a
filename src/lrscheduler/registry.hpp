#ifndef TYCHE_LRSCHEDULER_REGISTRY_HPP
#define TYCHE_LRSCHEDULER_REGISTRY_HPP

#include <memory>
#include <type_traits>

#include <torch/torch.h>

#include "details/exponentialdecay.hpp"

namespace Tyche::LrScheduler::Details {
    template <class Descriptor>
    std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer&, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported scheduler descriptor provided to build_scheduler.");
        return nullptr;
    }

    inline std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer& optimizer, const ExponentialDecayDescriptor& descriptor) {
        return std::make_unique<ExponentialDecayScheduler>(optimizer, descriptor.options);
    }
}

#endif // TYCHE_LRSCHEDULER_REGISTRY_HPP
