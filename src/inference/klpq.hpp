#ifndef TYCHE_INFERENCE_KLPQ_HPP
#define TYCHE_INFERENCE_KLPQ_HPP
/*
 * Inclusive KL minimization, KL(p(z | x) || q(z; lambda)) (Cappe et al., 2008).
 * ---------------------------------------------------------------------------
 * With z_b ~ q and self-normalized importance weights
 *     w_b = p(x, z_b) / q(z_b),    w_norm_b = w_b / sum_c w_c
 * the gradient estimate is
 *     -1/B sum_b w_norm_b * d/dlambda log q(z_b; lambda).
 * Weights are normalized in the log domain.
 */

#include <torch/torch.h>

#include "../numeric/numeric.hpp"
#include "inference.hpp"

namespace Tyche {
    class KLpq : public VariationalInference {
    public:
        using VariationalInference::VariationalInference;

        // log_w - logsumexp(log_w): log of the self-normalized weights.
        [[nodiscard]] static torch::Tensor normalized_log_weights(const torch::Tensor& log_w) {
            return log_w - Numeric::log_sum_exp(log_w, 0, /*keepdim=*/true);
        }

        [[nodiscard]] torch::Tensor build_loss() override {
            const auto x = sample_data();
            const auto z = variational().sample(context(), options().n_minibatch).detach();
            set_samples(z);

            const auto q_log_prob = variational().log_prob(z);
            const auto log_w = model().log_prob(x, z) - q_log_prob.detach();
            const auto w_norm = torch::exp(normalized_log_weights(log_w));

            set_loss((w_norm * log_w).mean());
            return -(q_log_prob * w_norm.detach()).mean();
        }
    };
}

#endif // TYCHE_INFERENCE_KLPQ_HPP
