#ifndef TYCHE_LRSCHEDULER_EXPONENTIALDECAY_HPP
#define TYCHE_LRSCHEDULER_EXPONENTIALDECAY_HPP
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>
// lr(step) = base_lr * gamma ^ (step / step_size), floored when staircase.
#include <torch/torch.h>

#include "common.hpp"

namespace Tyche::LrScheduler::Details {
    struct ExponentialDecayOptions {
        std::size_t step_size{100};
        double gamma{0.9};
        bool staircase{true};
    };

    struct ExponentialDecayDescriptor {
        ExponentialDecayOptions options{};
    };

    class ExponentialDecayScheduler final : public Scheduler {
    public:
        ExponentialDecayScheduler(torch::optim::Optimizer& optimizer, ExponentialDecayOptions options)
            : optimizer_(optimizer),
              options_(std::move(options)),
              base_lrs_(capture_base_lrs(optimizer)),
              step_count_(0) {
            if (options_.step_size == 0) {
                throw std::invalid_argument("ExponentialDecayScheduler requires step_size to be greater than zero.");
            }
            if (!(options_.gamma > 0.0) || options_.gamma > 1.0) {
                throw std::invalid_argument("ExponentialDecayScheduler gamma must be within (0, 1].");
            }

            apply(step_count_);
        }

        void step() override {
            if (step_count_ < std::numeric_limits<std::size_t>::max()) {
                ++step_count_;
            }
            apply(step_count_);
        }

        [[nodiscard]] std::size_t step_count() const noexcept override { return step_count_; }

    private:
        void apply(std::size_t step) {
            auto& param_groups = optimizer_.param_groups();
            if (base_lrs_.size() != param_groups.size()) {
                throw std::runtime_error("Optimizer param group count changed after scheduler creation.");
            }

            for (std::size_t index = 0; index < param_groups.size(); ++index) {
                param_groups[index].options().set_lr(compute_lr(base_lrs_[index], step));
            }
        }

        [[nodiscard]] double compute_lr(double base_lr, std::size_t step) const {
            double exponent = static_cast<double>(step) / static_cast<double>(options_.step_size);
            if (options_.staircase) {
                exponent = std::floor(exponent);
            }
            return base_lr * std::pow(options_.gamma, exponent);
        }

        torch::optim::Optimizer& optimizer_;
        ExponentialDecayOptions options_{};
        std::vector<double> base_lrs_{};
        std::size_t step_count_{};
    };
}

#endif // TYCHE_LRSCHEDULER_EXPONENTIALDECAY_HPP
