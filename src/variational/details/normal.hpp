#ifndef TYCHE_VARIATIONAL_NORMAL_HPP
#define TYCHE_VARIATIONAL_NORMAL_HPP

#include <cstdint>
#include <ostream>

#include <torch/torch.h>

#include "common.hpp"

namespace Tyche::Variational::Details {
    struct NormalOptions {
        std::int64_t num_vars{1};
        double loc{0.0};
        double scale{1.0};
    };

    struct NormalDescriptor {
        NormalOptions options{};
    };

    // Fully factorized Gaussian. The scale is kept positive through
    // scale = softplus(scale_raw).
    class NormalLayer final : public Layer {
    public:
        explicit NormalLayer(const NormalOptions& options) : Layer(options.num_vars) {
            loc_ = register_parameter("loc", torch::full({options.num_vars}, options.loc));
            scale_raw_ = register_parameter("scale_raw", torch::full({options.num_vars}, inverse_softplus(options.scale)));
        }

        [[nodiscard]] torch::Tensor loc() const { return loc_; }
        [[nodiscard]] torch::Tensor scale() const { return torch::softplus(scale_raw_); }

        [[nodiscard]] torch::Tensor sample(Context& context, std::int64_t n) override {
            const auto eps = context.randn({n, num_vars()}, loc_.options().requires_grad(false));
            return loc_ + scale() * eps;
        }

        [[nodiscard]] torch::Tensor log_prob(const torch::Tensor& z) override {
            check_sample_shape(z);
            const auto sigma = scale();
            const auto standardized = (z - loc_) / sigma;
            const auto elementwise = -0.5 * kLogTwoPi - torch::log(sigma) - 0.5 * standardized.pow(2);
            return elementwise.sum(1);
        }

        [[nodiscard]] torch::Tensor entropy() override {
            return (0.5 * (kLogTwoPi + 1.0) + torch::log(scale())).sum();
        }

        [[nodiscard]] bool is_reparam() const noexcept override { return true; }
        [[nodiscard]] Kind kind() const noexcept override { return Kind::Normal; }

        void describe(std::ostream& stream) const override {
            stream << "Normal(num_vars=" << num_vars() << ")\n"
                   << "    loc  : " << format_values(loc_) << '\n'
                   << "    scale: " << format_values(scale()) << '\n';
        }

    private:
        torch::Tensor loc_{};
        torch::Tensor scale_raw_{};
    };
}

#endif // TYCHE_VARIATIONAL_NORMAL_HPP
