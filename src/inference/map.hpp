#ifndef TYCHE_INFERENCE_MAP_HPP
#define TYCHE_INFERENCE_MAP_HPP
/*
 * Posterior-mode estimation.
 * ---------------------------------------------------------------------------
 *  - MAP solves min_z -log p(x, z) by gradient descent on a PointMass family
 *    sized after Model::num_vars() (empty when the model declares none).
 *  - Laplace runs the same optimization, then approximates the posterior by a
 *    Gaussian centred at the mode whose precision is the Hessian of the
 *    negative log joint w.r.t. the point-mass parameters only.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../numeric/numeric.hpp"
#include "inference.hpp"

namespace Tyche {
    class MAP : public VariationalInference {
    public:
        explicit MAP(std::shared_ptr<Model> model,
                     std::shared_ptr<Data::Source> data = Data::Empty(),
                     std::optional<torch::Tensor> params = std::nullopt)
            : VariationalInference(model, point_mass(model, std::move(params)), std::move(data)) {}

        [[nodiscard]] torch::Tensor build_loss() override {
            const auto x = sample_data();
            const auto z = variational().sample(context(), 1);
            set_samples(z);

            const auto log_joint = model().log_prob(x, z).sum();
            set_loss(log_joint);
            return -log_joint;
        }

        // Current point estimate, [num_vars].
        [[nodiscard]] torch::Tensor estimate() const {
            const auto& layers = variational().layers();
            return static_cast<const Variational::PointMassLayer&>(*layers.front()).params().detach();
        }

    private:
        static std::shared_ptr<Variational::Family> point_mass(const std::shared_ptr<Model>& model,
                                                               std::optional<torch::Tensor> params) {
            if (!model) {
                throw std::invalid_argument("Inference requires a probability model.");
            }
            auto family = std::make_shared<Variational::Family>();
            family->add(Variational::PointMass({.num_vars = model->num_vars().value_or(0), .params = std::move(params)}));
            return family;
        }
    };

    class Laplace : public MAP {
    public:
        explicit Laplace(std::shared_ptr<Model> model,
                         std::shared_ptr<Data::Source> data = Data::Empty(),
                         std::optional<torch::Tensor> params = std::nullopt)
            : MAP(require_latent_dimension(std::move(model)), std::move(data), std::move(params)) {}

        void finalize() override {
            const auto x = sample_data();
            const auto z = variational().sample(context(), 1);
            const auto parameters = trainable_parameters(std::string(kVariationalScope));

            const auto negative_log_joint = -model().log_prob(x, z).sum();
            precision_ = Numeric::hessian(negative_log_joint, parameters);

            if (auto* stream = context().stream()) {
                *stream << "Precision matrix:\n" << precision_ << '\n';
            }
        }

        [[nodiscard]] const torch::Tensor& precision() const {
            if (!precision_.defined()) {
                throw std::logic_error("Precision matrix is only available after finalize().");
            }
            return precision_;
        }

        [[nodiscard]] torch::Tensor covariance() const { return torch::inverse(precision()); }

    private:
        static std::shared_ptr<Model> require_latent_dimension(std::shared_ptr<Model> model) {
            if (model && !model->num_vars().has_value()) {
                throw std::invalid_argument("Laplace approximation requires a model that declares num_vars.");
            }
            return model;
        }

        torch::Tensor precision_{};
    };
}

#endif // TYCHE_INFERENCE_MAP_HPP
