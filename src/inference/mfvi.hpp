#ifndef TYCHE_INFERENCE_MFVI_HPP
#define TYCHE_INFERENCE_MFVI_HPP
/*
 * Black-box mean-field variational inference.
 * ---------------------------------------------------------------------------
 * Minimizes KL(q(z; lambda) || p(z | x)) by maximizing
 *     ELBO = E_q[ log p(x, z) - log q(z; lambda) ].
 *
 * The objective handed to autograd is chosen from a 2x2 table:
 *
 *                         GaussianMeanField        General
 *     Score               score + analytic KL      score
 *     Reparameterization  reparam + analytic KL    reparam
 *
 * GaussianMeanField means every layer of q is Normal and the model is a
 * LikelihoodModel, so that log p(x, z) = log p(x | z) + log N(z; 0, I) and the
 * KL term is taken in closed form (Kingma & Welling, 2014).
 */

#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>

#include <torch/torch.h>

#include "../numeric/numeric.hpp"
#include "inference.hpp"

namespace Tyche {
    enum class Estimator { Score, Reparameterization };
    enum class FamilyKind { GaussianMeanField, General };

    class MFVI : public VariationalInference {
    public:
        using VariationalInference::VariationalInference;

        [[nodiscard]] torch::Tensor build_loss() override {
            if (!estimator_.has_value() || !family_kind_.has_value()) {
                throw std::logic_error("MFVI has not been initialized.");
            }
            const auto builder = loss_table()[index(*estimator_)][index(*family_kind_)];
            return (this->*builder)();
        }

        [[nodiscard]] std::optional<Estimator> estimator() const noexcept { return estimator_; }
        [[nodiscard]] std::optional<FamilyKind> family_kind() const noexcept { return family_kind_; }

        // Score-function (REINFORCE) estimator (Paisley et al., 2012). Valid when
        // log p(x, z) is not differentiable in z: gradients only flow through
        // log q, weighted by the frozen per-sample objective.
        [[nodiscard]] torch::Tensor build_score_loss() {
            const auto x = sample_data();
            const auto z = variational().sample(context(), options().n_minibatch).detach();
            set_samples(z);

            const auto q_log_prob = variational().log_prob(z);
            const auto losses = model().log_prob(x, z) - q_log_prob.detach();
            set_loss(losses.mean());
            return -(q_log_prob * losses.detach()).mean();
        }

        // Pathwise estimator: z = g(eps; lambda) stays in the graph.
        [[nodiscard]] torch::Tensor build_reparam_loss() {
            const auto x = sample_data();
            const auto z = variational().sample(context(), options().n_minibatch);
            set_samples(z);

            const auto elbo = (model().log_prob(x, z) - variational().log_prob(z)).mean();
            set_loss(elbo);
            return -elbo;
        }

        // -ELBO = -(E_q[log p(x | z)] - KL(q || N(0, I))). Only the likelihood term
        // uses the score-function trick; the KL contributes exact gradients.
        [[nodiscard]] torch::Tensor build_score_loss_kl() {
            const auto x = sample_data();
            const auto z = variational().sample(context(), options().n_minibatch).detach();
            set_samples(z);

            const auto q_log_prob = variational().log_prob(z);
            const auto p_log_lik = likelihood_model().log_lik(x, z);
            const auto kl = Numeric::kl_multivariate_normal(variational().locs(), variational().scales());
            set_loss(p_log_lik.mean() - kl);
            return -((q_log_prob * p_log_lik.detach()).mean() - kl);
        }

        [[nodiscard]] torch::Tensor build_reparam_loss_kl() {
            const auto x = sample_data();
            const auto z = variational().sample(context(), options().n_minibatch);
            set_samples(z);

            const auto kl = Numeric::kl_multivariate_normal(variational().locs(), variational().scales());
            const auto elbo = likelihood_model().log_lik(x, z).mean() - kl;
            set_loss(elbo);
            return -elbo;
        }

    protected:
        void configure() override {
            const auto& requested = options().use_score_estimator;
            if (!requested.has_value()) {
                estimator_ = variational().is_reparam() ? Estimator::Reparameterization : Estimator::Score;
            } else if (*requested) {
                estimator_ = Estimator::Score;
            } else {
                if (!variational().is_reparam()) {
                    throw std::invalid_argument("Reparameterization gradients requested for a family that cannot be reparameterized.");
                }
                estimator_ = Estimator::Reparameterization;
            }

            const bool splits_likelihood = dynamic_cast<LikelihoodModel*>(&model()) != nullptr;
            family_kind_ = variational().is_normal() && splits_likelihood ? FamilyKind::GaussianMeanField
                                                                          : FamilyKind::General;
        }

    private:
        [[nodiscard]] LikelihoodModel& likelihood_model() const {
            auto* likelihood = dynamic_cast<LikelihoodModel*>(&model());
            if (likelihood == nullptr) {
                throw std::logic_error("Analytic-KL objectives require a LikelihoodModel.");
            }
            return *likelihood;
        }

        using Builder = torch::Tensor (MFVI::*)();
        using LossTable = std::array<std::array<Builder, 2>, 2>;

        static const LossTable& loss_table() {
            static const LossTable table{{
                {{&MFVI::build_score_loss_kl, &MFVI::build_score_loss}},
                {{&MFVI::build_reparam_loss_kl, &MFVI::build_reparam_loss}},
            }};
            return table;
        }

        static constexpr std::size_t index(Estimator estimator) noexcept {
            return estimator == Estimator::Score ? 0 : 1;
        }

        static constexpr std::size_t index(FamilyKind kind) noexcept {
            return kind == FamilyKind::GaussianMeanField ? 0 : 1;
        }

        std::optional<Estimator> estimator_{};
        std::optional<FamilyKind> family_kind_{};
    };
}

#endif // TYCHE_INFERENCE_MFVI_HPP
