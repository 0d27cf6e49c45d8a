#ifndef TYCHE_NUMERIC_HESSIAN_HPP
#define TYCHE_NUMERIC_HESSIAN_HPP

#include <cstdint>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

namespace Tyche::Numeric::Details {
    // Dense Hessian of the scalar `output` w.r.t. the flattened concatenation of
    // `parameters`. Requires second-order support from autograd: the first
    // gradient is built with create_graph so each of its entries can be
    // differentiated again. Directions the output does not depend on yield zeros.
    inline torch::Tensor hessian(const torch::Tensor& output, const std::vector<torch::Tensor>& parameters) {
        if (output.numel() != 1) {
            throw std::invalid_argument("Hessian requires a scalar output.");
        }

        std::int64_t total = 0;
        for (const auto& parameter : parameters) {
            total += parameter.numel();
        }

        auto options = output.options().requires_grad(false);
        auto result = torch::zeros({total, total}, options);
        if (total == 0 || !output.requires_grad()) {
            return result;
        }

        auto first = torch::autograd::grad({output.reshape({})}, parameters, /*grad_outputs=*/{},
                                           /*retain_graph=*/true, /*create_graph=*/true, /*allow_unused=*/true);

        std::vector<torch::Tensor> flat;
        flat.reserve(first.size());
        for (std::size_t index = 0; index < first.size(); ++index) {
            if (first[index].defined()) {
                flat.push_back(first[index].reshape({-1}));
            } else {
                flat.push_back(torch::zeros({parameters[index].numel()}, options));
            }
        }
        const auto gradient = torch::cat(flat);

        for (std::int64_t row = 0; row < total; ++row) {
            const auto entry = gradient[row];
            if (!entry.requires_grad()) {
                continue;
            }
            auto second = torch::autograd::grad({entry}, parameters, {}, /*retain_graph=*/true,
                                                /*create_graph=*/false, /*allow_unused=*/true);
            std::int64_t offset = 0;
            for (std::size_t index = 0; index < second.size(); ++index) {
                const auto count = parameters[index].numel();
                if (second[index].defined()) {
                    result[row].narrow(0, offset, count).copy_(second[index].reshape({-1}));
                }
                offset += count;
            }
        }
        return result;
    }
}

#endif // TYCHE_NUMERIC_HESSIAN_HPP
