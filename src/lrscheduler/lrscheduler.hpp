#ifndef TYCHE_LRSCHEDULER_HPP
#define TYCHE_LRSCHEDULER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "details/exponentialdecay.hpp"
#include "registry.hpp"

namespace Tyche::LrScheduler {
    using ExponentialDecayOptions = Details::ExponentialDecayOptions;
    using ExponentialDecayDescriptor = Details::ExponentialDecayDescriptor;

    using Descriptor = std::variant<ExponentialDecayDescriptor>;

    [[nodiscard]] constexpr auto ExponentialDecay(const ExponentialDecayOptions& options = {}) noexcept
        -> ExponentialDecayDescriptor {
        return {options};
    }
}


#endif // TYCHE_LRSCHEDULER_HPP
