#ifndef TYCHE_VARIATIONAL_COMMON_HPP
#define TYCHE_VARIATIONAL_COMMON_HPP

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../core.hpp"

namespace Tyche::Variational::Details {
    enum class Kind { Normal, Bernoulli, PointMass };

    // One factor of a mean-field family over a contiguous block of `num_vars`
    // latent dimensions.
    class Layer : public torch::nn::Module {
    public:
        explicit Layer(std::int64_t num_vars) : num_vars_(num_vars) {
            if (num_vars < 0) {
                throw std::invalid_argument("Variational layers require a non-negative number of latent variables.");
            }
        }

        ~Layer() override = default;

        // [n, num_vars]
        [[nodiscard]] virtual torch::Tensor sample(Context& context, std::int64_t n) = 0;
        // [n]
        [[nodiscard]] virtual torch::Tensor log_prob(const torch::Tensor& z) = 0;
        [[nodiscard]] virtual torch::Tensor entropy() = 0;

        [[nodiscard]] virtual bool is_reparam() const noexcept = 0;
        [[nodiscard]] virtual Kind kind() const noexcept = 0;
        virtual void describe(std::ostream& stream) const = 0;

        [[nodiscard]] std::int64_t num_vars() const noexcept { return num_vars_; }

    protected:
        void check_sample_shape(const torch::Tensor& z) const {
            if (z.dim() != 2 || z.size(1) != num_vars_) {
                std::ostringstream message;
                message << "Expected latent block of shape [n, " << num_vars_ << "], got " << z.sizes() << '.';
                throw std::invalid_argument(message.str());
            }
        }

    private:
        std::int64_t num_vars_;
    };

    inline std::string format_values(const torch::Tensor& values, int precision = 4) {
        const auto flat = values.detach().to(torch::kCPU, torch::kDouble).reshape({-1});
        const auto accessor = flat.accessor<double, 1>();

        std::ostringstream stream;
        stream << std::fixed << std::setprecision(precision) << '[';
        for (std::int64_t i = 0; i < flat.size(0); ++i) {
            if (i > 0) {
                stream << ", ";
            }
            stream << accessor[i];
        }
        stream << ']';
        return stream.str();
    }

    inline constexpr double kLogTwoPi = 1.83787706640934548356;

    inline double inverse_softplus(double value) {
        if (!(value > 0.0)) {
            throw std::invalid_argument("Scale parameters must be strictly positive.");
        }
        return std::log(std::expm1(value));
    }
}

#endif // TYCHE_VARIATIONAL_COMMON_HPP
