#ifndef TYCHE_MODEL_HPP
#define TYCHE_MODEL_HPP

#include <cstdint>
#include <optional>

#include <torch/torch.h>

namespace Tyche {
    // Probability model p(x, z).
    // ---------------------------------------------------------------------------
    //  - `z` has shape [n_samples, num_vars]; log densities come back with shape
    //    [n_samples], one entry per latent sample.
    //  - log_prob must be differentiable w.r.t. `z` for the reparameterization and
    //    MAP paths; the score-function path only evaluates it.
    //  - A model may own trainable parameters; they live under the "model" scope.
    class Model : public torch::nn::Module {
    public:
        ~Model() override = default;

        [[nodiscard]] virtual torch::Tensor log_prob(const torch::Tensor& x, const torch::Tensor& z) = 0;

        [[nodiscard]] virtual std::optional<std::int64_t> num_vars() const noexcept { return std::nullopt; }
    };

    // Model whose joint splits as log p(x, z) = log p(x | z) + log N(z; 0, I).
    // Deriving from it is what enables the analytic-KL objectives of MFVI;
    // log_prob must still return the full joint.
    class LikelihoodModel : public Model {
    public:
        [[nodiscard]] virtual torch::Tensor log_lik(const torch::Tensor& x, const torch::Tensor& z) = 0;
    };
}

#endif // TYCHE_MODEL_HPP
