#ifndef TYCHE_NUMERIC_KL_HPP
#define TYCHE_NUMERIC_KL_HPP

#include <stdexcept>

#include <torch/torch.h>

namespace Tyche::Numeric::Details {
    // KL( N(loc_one, diag(scale_one^2)) || N(loc_two, diag(scale_two^2)) ), summed
    // over every element.
    inline torch::Tensor kl_multivariate_normal(const torch::Tensor& loc_one,
                                                const torch::Tensor& scale_one,
                                                const torch::Tensor& loc_two,
                                                const torch::Tensor& scale_two) {
        if (loc_one.sizes() != scale_one.sizes()) {
            throw std::invalid_argument("kl_multivariate_normal requires loc and scale of identical shape.");
        }

        const auto variance_one = scale_one.pow(2);
        const auto variance_two = scale_two.pow(2);
        const auto elementwise = torch::log(scale_two) - torch::log(scale_one)
                               + (variance_one + (loc_one - loc_two).pow(2)) / (2.0 * variance_two)
                               - 0.5;
        return elementwise.sum();
    }

    inline torch::Tensor kl_multivariate_normal(const torch::Tensor& loc, const torch::Tensor& scale) {
        // Closed form against N(0, I): -1/2 * sum(1 + log s^2 - m^2 - s^2).
        if (loc.sizes() != scale.sizes()) {
            throw std::invalid_argument("kl_multivariate_normal requires loc and scale of identical shape.");
        }
        return -0.5 * (1.0 + 2.0 * torch::log(scale) - loc.pow(2) - scale.pow(2)).sum();
    }
}

#endif // TYCHE_NUMERIC_KL_HPP
