#ifndef TYCHE_NUMERIC_HPP
#define TYCHE_NUMERIC_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/hessian.hpp"
#include "details/kl.hpp"
#include "details/logsumexp.hpp"

namespace Tyche::Numeric {
    using Details::hessian;
    using Details::kl_multivariate_normal;
    using Details::log_sum_exp;
}

#endif // TYCHE_NUMERIC_HPP
