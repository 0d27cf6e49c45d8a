#ifndef TYCHE_OPTIMIZER_HPP
#define TYCHE_OPTIMIZER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "registry.hpp"

#include "details/adam.hpp"
#include "details/sgd.hpp"


namespace Tyche::Optimizer {
    using SGDOptions = Details::SGDOptions;
    using SGDDescriptor = Details::SGDDescriptor;

    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;

    using Descriptor = std::variant<SGDDescriptor, AdamDescriptor>;


    [[nodiscard]] inline constexpr auto SGD(const SGDOptions& options = {}) noexcept -> SGDDescriptor {
        return SGDDescriptor{.options = options};
    }

    [[nodiscard]] constexpr auto Adam(const AdamOptions& options = {}) noexcept -> AdamDescriptor {
        return AdamDescriptor{.options = options};
    }
}

#endif // TYCHE_OPTIMIZER_HPP
