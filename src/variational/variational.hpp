#ifndef TYCHE_VARIATIONAL_HPP
#define TYCHE_VARIATIONAL_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "details/bernoulli.hpp"
#include "details/common.hpp"
#include "details/family.hpp"
#include "details/normal.hpp"
#include "details/pointmass.hpp"
#include "registry.hpp"

namespace Tyche::Variational {
    using Kind = Details::Kind;
    using Layer = Details::Layer;
    using Family = Details::Family;
    using Descriptor = Details::Descriptor;

    using NormalOptions = Details::NormalOptions;
    using NormalDescriptor = Details::NormalDescriptor;
    using NormalLayer = Details::NormalLayer;

    using BernoulliOptions = Details::BernoulliOptions;
    using BernoulliDescriptor = Details::BernoulliDescriptor;
    using BernoulliLayer = Details::BernoulliLayer;

    using PointMassOptions = Details::PointMassOptions;
    using PointMassDescriptor = Details::PointMassDescriptor;
    using PointMassLayer = Details::PointMassLayer;

    [[nodiscard]] constexpr auto Normal(const NormalOptions& options = {}) noexcept -> NormalDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto Bernoulli(const BernoulliOptions& options = {}) noexcept -> BernoulliDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto PointMass(const PointMassOptions& options = {}) -> PointMassDescriptor {
        return {options};
    }
}

#endif // TYCHE_VARIATIONAL_HPP
