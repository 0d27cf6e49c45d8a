#ifndef TYCHE_INFERENCE_HPP
#define TYCHE_INFERENCE_HPP
/*
 * Inference base classes.
 * ---------------------------------------------------------------------------
 *  - Inference binds a probability model to a data source. Both the model and
 *    the variational family are registered as submodules, so every trainable
 *    tensor has a qualified name under the "model" or "variational" scope.
 *  - VariationalInference implements the optimization protocol
 *        initialize -> (update, print_progress) x (n_iter + 1) -> finalize
 *    and leaves the objective to build_loss(). Execution is eager: every
 *    update() rebuilds the objective on a fresh latent sample and a fresh
 *    mini-batch, so no sample is ever reused across iterations.
 *  - One update() is one complete optimizer step (sample, backward, apply).
 *    Instances are not safe for concurrent use.
 */

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../core.hpp"
#include "../data/data.hpp"
#include "../lrscheduler/lrscheduler.hpp"
#include "../model/model.hpp"
#include "../optimizer/optimizer.hpp"
#include "../variational/variational.hpp"

namespace Tyche {
    struct OptimizerConfig {
        Optimizer::Descriptor optimizer{Optimizer::Adam()};
        std::optional<LrScheduler::Descriptor> scheduler{};
    };

    struct InferenceOptions {
        std::size_t n_iter{1000};
        std::optional<std::int64_t> n_data{};               // unset: full data
        std::optional<std::size_t> n_print{100};            // unset: no progress output
        std::optional<OptimizerConfig> optimizer{};         // unset: Adam(0.1) with 0.9 decay every 100 steps
        std::optional<std::string> scope{};                 // unset: every trainable parameter
        std::int64_t n_minibatch{1};                        // latent samples per step (MFVI, KLpq)
        std::optional<bool> use_score_estimator{};          // MFVI; unset: reparameterization when available
    };

    class Inference : public torch::nn::Module {
    public:
        Inference(std::shared_ptr<Model> model, std::shared_ptr<Data::Source> data)
            : data_(std::move(data)) {
            if (!model) {
                throw std::invalid_argument("Inference requires a probability model.");
            }
            if (!data_) {
                throw std::invalid_argument("Inference requires a data source; use Data::Empty() when there is none.");
            }
            model_ = register_module(std::string(kModelScope), std::move(model));
        }

        ~Inference() override = default;

        [[nodiscard]] Model& model() const noexcept { return *model_; }
        [[nodiscard]] Data::Source& data() const noexcept { return *data_; }

    private:
        std::shared_ptr<Model> model_{};
        std::shared_ptr<Data::Source> data_{};
    };

    class VariationalInference : public Inference {
    public:
        VariationalInference(std::shared_ptr<Model> model,
                             std::shared_ptr<Variational::Family> variational,
                             std::shared_ptr<Data::Source> data = Data::Empty())
            : Inference(std::move(model), std::move(data)) {
            if (!variational) {
                throw std::invalid_argument("Variational inference requires a variational family.");
            }
            variational_ = register_module(std::string(kVariationalScope), std::move(variational));
        }

        void run(Context& context, const InferenceOptions& options = {}) {
            initialize(context, options);
            for (std::size_t t = 0; t <= options_.n_iter; ++t) {
                const double loss = update();
                print_progress(t, loss);
            }
            finalize();
        }

        virtual void initialize(Context& context, const InferenceOptions& options = {}) {
            release();

            if (options.optimizer.has_value() && options.scope.has_value()) {
                throw std::invalid_argument("A custom optimizer with a parameter scope is not supported.");
            }
            if (options.n_data.has_value() && *options.n_data <= 0) {
                throw std::invalid_argument("n_data must be positive when set.");
            }
            if (options.n_print.has_value() && *options.n_print == 0) {
                throw std::invalid_argument("n_print must be positive when set.");
            }
            if (options.n_minibatch <= 0) {
                throw std::invalid_argument("n_minibatch must be positive.");
            }

            options_ = options;
            context_ = &context;
            this->to(context.device());

            try {
                configure();

                trainable_ = trainable_parameters(options_.scope);
                if (trainable_.empty()) {
                    throw std::logic_error("No trainable parameters found" +
                                           (options_.scope ? " under scope '" + *options_.scope + "'." : std::string{"."}));
                }

                auto config = options_.optimizer.value_or(default_optimizer());
                optimizer_ = std::visit(
                    [&](const auto& descriptor) { return Optimizer::Details::build_optimizer(trainable_, descriptor); },
                    config.optimizer);
                if (config.scheduler.has_value()) {
                    scheduler_ = std::visit(
                        [&](const auto& descriptor) { return LrScheduler::Details::build_scheduler(*optimizer_.instance, descriptor); },
                        *config.scheduler);
                }
                if (optimizer_.warmup) {
                    optimizer_.warmup(*optimizer_.instance);
                }
            } catch (...) {
                release();
                throw;
            }

            loss_ = torch::zeros({});
        }

        virtual double update() {
            if (!optimizer_.instance) {
                throw std::logic_error("Inference has not been initialized.");
            }

            this->zero_grad();
            auto objective = build_loss();
            if (objective.requires_grad()) {
                objective.backward();
            } else if (!all_trainable_empty()) {
                throw std::logic_error("Objective does not depend on any trainable parameter; "
                                       "log_prob must stay differentiable (no detach() or item()).");
            }
            optimizer_.instance->step();
            if (scheduler_) {
                scheduler_->step();
            }
            return loss_.item<double>();
        }

        virtual void print_progress(std::size_t t, double loss) {
            if (!options_.n_print.has_value() || t % *options_.n_print != 0) {
                return;
            }
            auto* stream = context_ != nullptr ? context_->stream() : nullptr;
            if (stream == nullptr) {
                return;
            }

            std::ostringstream line;
            line << "iter " << t << " loss " << std::fixed << std::setprecision(2) << loss << '\n'
                 << *variational_;
            *stream << line.str() << std::flush;
        }

        virtual void finalize() {}

        // Differentiable objective whose gradient is the stochastic gradient of the
        // inference criterion. Implementations also record the reportable loss.
        virtual torch::Tensor build_loss() {
            throw std::logic_error("build_loss is not implemented for this inference method.");
        }

        [[nodiscard]] Variational::Family& variational() const noexcept { return *variational_; }
        [[nodiscard]] const InferenceOptions& options() const noexcept { return options_; }
        [[nodiscard]] const torch::Tensor& loss() const noexcept { return loss_; }
        [[nodiscard]] const torch::Tensor& samples() const noexcept { return samples_; }
        [[nodiscard]] const std::vector<torch::Tensor>& trainable() const noexcept { return trainable_; }
        [[nodiscard]] bool initialized() const noexcept { return static_cast<bool>(optimizer_.instance); }

        [[nodiscard]] double learning_rate() const {
            if (!optimizer_.instance) {
                throw std::logic_error("Inference has not been initialized.");
            }
            return optimizer_.instance->param_groups().front().options().get_lr();
        }

        // Parameters that require gradients, optionally restricted to those whose
        // qualified name is `scope` or starts with `scope + "."`.
        [[nodiscard]] std::vector<torch::Tensor> trainable_parameters(const std::optional<std::string>& scope = std::nullopt) const {
            std::vector<torch::Tensor> parameters;
            for (const auto& item : this->named_parameters(/*recurse=*/true)) {
                if (!item.value().requires_grad()) {
                    continue;
                }
                if (scope.has_value()) {
                    const auto& name = item.key();
                    const bool exact = name == *scope;
                    const bool nested = name.size() > scope->size() && name.compare(0, scope->size(), *scope) == 0 &&
                                        name[scope->size()] == '.';
                    if (!exact && !nested) {
                        continue;
                    }
                }
                parameters.push_back(item.value());
            }
            return parameters;
        }

    protected:
        // Called by initialize() once the options and context are bound and before
        // the optimizer is built. Configuration errors thrown here abort initialize().
        virtual void configure() {}

        [[nodiscard]] Context& context() const {
            if (context_ == nullptr) {
                throw std::logic_error("Inference has not been initialized with an execution context.");
            }
            return *context_;
        }

        [[nodiscard]] torch::Tensor sample_data() const { return data().sample(context(), options_.n_data); }

        void set_loss(const torch::Tensor& loss) { loss_ = loss.detach(); }
        void set_samples(const torch::Tensor& samples) { samples_ = samples; }

    private:
        static OptimizerConfig default_optimizer() {
            return OptimizerConfig{
                .optimizer = Optimizer::Adam({.learning_rate = 0.1}),
                .scheduler = LrScheduler::ExponentialDecay({.step_size = 100, .gamma = 0.9, .staircase = true}),
            };
        }

        // Zero-size parameters (a model without latent variables under MAP) cannot
        // carry a gradient.
        [[nodiscard]] bool all_trainable_empty() const noexcept {
            for (const auto& parameter : trainable_) {
                if (parameter.numel() > 0) {
                    return false;
                }
            }
            return true;
        }

        void release() noexcept {
            scheduler_.reset();
            optimizer_ = Optimizer::Details::Binding{};
            trainable_.clear();
            context_ = nullptr;
        }

        std::shared_ptr<Variational::Family> variational_{};
        InferenceOptions options_{};
        Context* context_{nullptr};
        Optimizer::Details::Binding optimizer_{};
        std::unique_ptr<LrScheduler::Details::Scheduler> scheduler_{};
        std::vector<torch::Tensor> trainable_{};
        torch::Tensor loss_{};
        torch::Tensor samples_{};
    };
}

#endif // TYCHE_INFERENCE_HPP
