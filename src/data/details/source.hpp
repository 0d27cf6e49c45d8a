#ifndef TYCHE_DATA_SOURCE_HPP
#define TYCHE_DATA_SOURCE_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../core.hpp"

namespace Tyche::Data::Details {
    class Source {
    public:
        virtual ~Source() = default;

        // Mini-batch of `n` observations, or every observation when `n` is unset.
        [[nodiscard]] virtual torch::Tensor sample(Context& context, std::optional<std::int64_t> n) = 0;
    };

    // Tensor-backed source. Observations are rows (first dimension); mini-batches
    // walk through them in order and wrap around at the end.
    class TensorSource final : public Source {
    public:
        TensorSource() = default;

        explicit TensorSource(torch::Tensor data) : data_(std::move(data)) {
            if (data_.defined() && data_.dim() == 0) {
                data_ = data_.reshape({1});
            }
        }

        [[nodiscard]] torch::Tensor sample(Context& context, std::optional<std::int64_t> n) override {
            if (!data_.defined()) {
                return torch::empty({0}, torch::TensorOptions().device(context.device()));
            }
            if (!n.has_value()) {
                return data_.to(context.device());
            }

            const auto rows = data_.size(0);
            if (*n <= 0) {
                throw std::invalid_argument("Mini-batch size must be positive, got " + std::to_string(*n) + ".");
            }
            if (*n > rows) {
                throw std::invalid_argument("Mini-batch size " + std::to_string(*n) +
                                            " exceeds the number of observations (" + std::to_string(rows) + ").");
            }

            torch::Tensor batch;
            if (cursor_ + *n <= rows) {
                batch = data_.narrow(0, cursor_, *n);
            } else {
                const auto head = rows - cursor_;
                batch = torch::cat({data_.narrow(0, cursor_, head), data_.narrow(0, 0, *n - head)}, 0);
            }
            cursor_ = (cursor_ + *n) % rows;
            return batch.to(context.device());
        }

        [[nodiscard]] std::int64_t size() const noexcept { return data_.defined() ? data_.size(0) : 0; }
        [[nodiscard]] std::int64_t cursor() const noexcept { return cursor_; }
        [[nodiscard]] const torch::Tensor& tensor() const noexcept { return data_; }

    private:
        torch::Tensor data_{};
        std::int64_t cursor_{0};
    };
}

#endif // TYCHE_DATA_SOURCE_HPP
