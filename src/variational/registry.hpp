#ifndef TYCHE_VARIATIONAL_REGISTRY_HPP
#define TYCHE_VARIATIONAL_REGISTRY_HPP

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "details/bernoulli.hpp"
#include "details/common.hpp"
#include "details/normal.hpp"
#include "details/pointmass.hpp"

namespace Tyche::Variational::Details {
    template <class Owner, class Descriptor>
    std::shared_ptr<Layer> build_layer(Owner&, const Descriptor&, std::size_t) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported layer descriptor provided to build_layer.");
        return nullptr;
    }

    template <class Owner>
    std::shared_ptr<Layer> build_layer(Owner& owner, const NormalDescriptor& descriptor, std::size_t index) {
        if (descriptor.options.num_vars <= 0) {
            throw std::invalid_argument("Normal layers require a positive number of latent variables.");
        }
        return owner.register_module("layer_" + std::to_string(index), std::make_shared<NormalLayer>(descriptor.options));
    }

    template <class Owner>
    std::shared_ptr<Layer> build_layer(Owner& owner, const BernoulliDescriptor& descriptor, std::size_t index) {
        if (descriptor.options.num_vars <= 0) {
            throw std::invalid_argument("Bernoulli layers require a positive number of latent variables.");
        }
        return owner.register_module("layer_" + std::to_string(index), std::make_shared<BernoulliLayer>(descriptor.options));
    }

    template <class Owner>
    std::shared_ptr<Layer> build_layer(Owner& owner, const PointMassDescriptor& descriptor, std::size_t index) {
        return owner.register_module("layer_" + std::to_string(index), std::make_shared<PointMassLayer>(descriptor.options));
    }
}

#endif // TYCHE_VARIATIONAL_REGISTRY_HPP
