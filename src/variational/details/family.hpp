#ifndef TYCHE_VARIATIONAL_FAMILY_HPP
#define TYCHE_VARIATIONAL_FAMILY_HPP

#include <algorithm>
#include <cstdint>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../registry.hpp"
#include "bernoulli.hpp"
#include "common.hpp"
#include "normal.hpp"
#include "pointmass.hpp"

namespace Tyche::Variational::Details {
    using Descriptor = std::variant<NormalDescriptor, BernoulliDescriptor, PointMassDescriptor>;

    // Mean-field family q(z) = prod_k q_k(z_k). Layer k owns the columns
    // [offset_k, offset_k + num_vars_k) of every latent sample.
    class Family : public torch::nn::Module {
    public:
        Family() = default;

        Family& add(const Descriptor& descriptor) {
            const auto index = layers_.size();
            auto layer = std::visit(
                [&](const auto& concrete_descriptor) { return build_layer(*this, concrete_descriptor, index); },
                descriptor);
            num_vars_ += layer->num_vars();
            layers_.push_back(std::move(layer));
            return *this;
        }

        [[nodiscard]] torch::Tensor sample(Context& context, std::int64_t n = 1) {
            if (n <= 0) {
                throw std::invalid_argument("Number of variational samples must be positive.");
            }
            if (layers_.empty()) {
                return torch::zeros({n, 0}, torch::TensorOptions().device(context.device()));
            }

            std::vector<torch::Tensor> blocks;
            blocks.reserve(layers_.size());
            for (auto& layer : layers_) {
                blocks.push_back(layer->sample(context, n));
            }
            return blocks.size() == 1 ? blocks.front() : torch::cat(blocks, 1);
        }

        [[nodiscard]] torch::Tensor log_prob(const torch::Tensor& z) {
            if (z.dim() != 2 || z.size(1) != num_vars_) {
                std::ostringstream message;
                message << "Expected latent samples of shape [n, " << num_vars_ << "], got " << z.sizes() << '.';
                throw std::invalid_argument(message.str());
            }

            auto total = torch::zeros({z.size(0)}, z.options().requires_grad(false));
            std::int64_t offset = 0;
            for (auto& layer : layers_) {
                total = total + layer->log_prob(z.narrow(1, offset, layer->num_vars()));
                offset += layer->num_vars();
            }
            return total;
        }

        [[nodiscard]] torch::Tensor entropy() {
            auto total = torch::zeros({});
            for (auto& layer : layers_) {
                total = total + layer->entropy();
            }
            return total;
        }

        [[nodiscard]] bool is_reparam() const noexcept {
            return std::all_of(layers_.begin(), layers_.end(), [](const auto& layer) { return layer->is_reparam(); });
        }

        [[nodiscard]] bool is_normal() const noexcept {
            return !layers_.empty() &&
                   std::all_of(layers_.begin(), layers_.end(), [](const auto& layer) { return layer->kind() == Kind::Normal; });
        }

        // Per-layer Gaussian parameters stacked into one vector each; only
        // defined when every layer is Normal.
        [[nodiscard]] torch::Tensor locs() const { return stack_normal([](const NormalLayer& layer) { return layer.loc(); }); }
        [[nodiscard]] torch::Tensor scales() const { return stack_normal([](const NormalLayer& layer) { return layer.scale(); }); }

        [[nodiscard]] const std::vector<std::shared_ptr<Layer>>& layers() const noexcept { return layers_; }
        [[nodiscard]] std::int64_t num_vars() const noexcept { return num_vars_; }

        [[nodiscard]] std::string to_string() const {
            std::ostringstream stream;
            for (std::size_t index = 0; index < layers_.size(); ++index) {
                stream << "[#" << index << "] ";
                layers_[index]->describe(stream);
            }
            return stream.str();
        }

        friend std::ostream& operator<<(std::ostream& stream, const Family& family) {
            return stream << family.to_string();
        }

    private:
        template <class Getter>
        torch::Tensor stack_normal(Getter getter) const {
            if (!is_normal()) {
                throw std::logic_error("Gaussian parameters requested from a family with non-Normal layers.");
            }
            std::vector<torch::Tensor> parts;
            parts.reserve(layers_.size());
            for (const auto& layer : layers_) {
                parts.push_back(getter(static_cast<const NormalLayer&>(*layer)));
            }
            return torch::cat(parts);
        }

        std::vector<std::shared_ptr<Layer>> layers_{};
        std::int64_t num_vars_{0};
    };
}

#endif // TYCHE_VARIATIONAL_FAMILY_HPP
