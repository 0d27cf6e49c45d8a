#ifndef TYCHE_VARIATIONAL_POINTMASS_HPP
#define TYCHE_VARIATIONAL_POINTMASS_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "common.hpp"

namespace Tyche::Variational::Details {
    struct PointMassOptions {
        std::int64_t num_vars{0};
        std::optional<torch::Tensor> params{};
    };

    struct PointMassDescriptor {
        PointMassOptions options{};
    };

    // Degenerate distribution concentrated on `params`. Used for mode finding:
    // every draw is the point itself, so gradients reach the parameters directly.
    class PointMassLayer final : public Layer {
    public:
        explicit PointMassLayer(const PointMassOptions& options) : Layer(options.num_vars) {
            auto initial = torch::zeros({options.num_vars});
            if (options.params.has_value() && options.params->defined()) {
                if (options.params->numel() != options.num_vars) {
                    throw std::invalid_argument("PointMass expects " + std::to_string(options.num_vars) +
                                                " initial values, got " + std::to_string(options.params->numel()) + ".");
                }
                initial.copy_(options.params->detach().reshape({options.num_vars}));
            }
            params_ = register_parameter("params", initial);
        }

        [[nodiscard]] torch::Tensor params() const { return params_; }

        [[nodiscard]] torch::Tensor sample(Context&, std::int64_t n) override {
            return params_.unsqueeze(0).expand({n, num_vars()});
        }

        [[nodiscard]] torch::Tensor log_prob(const torch::Tensor& z) override {
            check_sample_shape(z);
            return torch::zeros({z.size(0)}, params_.options().requires_grad(false));
        }

        [[nodiscard]] torch::Tensor entropy() override {
            return torch::zeros({}, params_.options().requires_grad(false));
        }

        [[nodiscard]] bool is_reparam() const noexcept override { return true; }
        [[nodiscard]] Kind kind() const noexcept override { return Kind::PointMass; }

        void describe(std::ostream& stream) const override {
            stream << "PointMass(num_vars=" << num_vars() << ")\n"
                   << "    params: " << format_values(params_) << '\n';
        }

    private:
        torch::Tensor params_{};
    };
}

#endif // TYCHE_VARIATIONAL_POINTMASS_HPP
