#ifndef TYCHE_NUMERIC_LOGSUMEXP_HPP
#define TYCHE_NUMERIC_LOGSUMEXP_HPP

#include <cstdint>

#include <torch/torch.h>

namespace Tyche::Numeric::Details {
    // log(sum(exp(x))) along `dim`. An all -inf slice reduces to -inf rather than NaN.
    inline torch::Tensor log_sum_exp(const torch::Tensor& input, std::int64_t dim = -1, bool keepdim = false) {
        return torch::logsumexp(input, {dim}, keepdim);
    }
}

#endif // TYCHE_NUMERIC_LOGSUMEXP_HPP
