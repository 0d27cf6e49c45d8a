#ifndef TYCHE_DATA_HPP
#define TYCHE_DATA_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <utility>

#include <torch/torch.h>

#include "details/source.hpp"

namespace Tyche::Data {
    using Source = Details::Source;
    using TensorSource = Details::TensorSource;

    [[nodiscard]] inline auto FromTensor(torch::Tensor data) -> std::shared_ptr<TensorSource> {
        return std::make_shared<TensorSource>(std::move(data));
    }

    [[nodiscard]] inline auto Empty() -> std::shared_ptr<TensorSource> {
        return std::make_shared<TensorSource>();
    }
}

#endif // TYCHE_DATA_HPP
