#ifndef TYCHE_VARIATIONAL_BERNOULLI_HPP
#define TYCHE_VARIATIONAL_BERNOULLI_HPP

#include <cmath>
#include <cstdint>
#include <ostream>
#include <stdexcept>

#include <torch/torch.h>

#include "common.hpp"

namespace Tyche::Variational::Details {
    struct BernoulliOptions {
        std::int64_t num_vars{1};
        double probability{0.5};
    };

    struct BernoulliDescriptor {
        BernoulliOptions options{};
    };

    // Discrete factor; sampling is not differentiable, so families holding one
    // fall back to the score-function estimator.
    class BernoulliLayer final : public Layer {
    public:
        explicit BernoulliLayer(const BernoulliOptions& options) : Layer(options.num_vars) {
            if (!(options.probability > 0.0 && options.probability < 1.0)) {
                throw std::invalid_argument("Bernoulli probability must lie strictly within (0, 1).");
            }
            const double logit = std::log(options.probability / (1.0 - options.probability));
            logits_ = register_parameter("logits", torch::full({options.num_vars}, logit));
        }

        [[nodiscard]] torch::Tensor probability() const { return torch::sigmoid(logits_); }

        [[nodiscard]] torch::Tensor sample(Context& context, std::int64_t n) override {
            return context.bernoulli(probability().expand({n, num_vars()}));
        }

        [[nodiscard]] torch::Tensor log_prob(const torch::Tensor& z) override {
            check_sample_shape(z);
            const auto logits = logits_.expand_as(z);
            const auto elementwise = torch::binary_cross_entropy_with_logits(
                logits, z.to(logits.scalar_type()), /*weight=*/{}, /*pos_weight=*/{}, at::Reduction::None);
            return -elementwise.sum(1);
        }

        // H = p * softplus(-l) + (1 - p) * softplus(l)
        [[nodiscard]] torch::Tensor entropy() override {
            const auto p = probability();
            return (p * torch::softplus(-logits_) + (1.0 - p) * torch::softplus(logits_)).sum();
        }

        [[nodiscard]] bool is_reparam() const noexcept override { return false; }
        [[nodiscard]] Kind kind() const noexcept override { return Kind::Bernoulli; }

        void describe(std::ostream& stream) const override {
            stream << "Bernoulli(num_vars=" << num_vars() << ")\n"
                   << "    p    : " << format_values(probability()) << '\n';
        }

    private:
        torch::Tensor logits_{};
    };
}

#endif // TYCHE_VARIATIONAL_BERNOULLI_HPP
