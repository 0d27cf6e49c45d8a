#include <catch2/catch.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../include/Tyche.h"

TEST_CASE("log_sum_exp matches the direct reduction on moderate values", "[numeric]") {
    const auto values = torch::tensor({0.5, -1.25, 2.0, 0.0}, torch::kFloat64);
    const auto expected = std::log(std::exp(0.5) + std::exp(-1.25) + std::exp(2.0) + std::exp(0.0));

    REQUIRE_THAT(Tyche::Numeric::log_sum_exp(values).item<double>(), Catch::Matchers::WithinAbs(expected, 1e-12));
}

TEST_CASE("log_sum_exp stays finite for extreme magnitudes", "[numeric]") {
    const auto large = torch::tensor({1000.0, 1000.0}, torch::kFloat64);
    REQUIRE(Tyche::Numeric::log_sum_exp(large).item<double>() == Approx(1000.0 + std::log(2.0)));

    const auto small = torch::tensor({-1000.0, -1001.0}, torch::kFloat64);
    REQUIRE(Tyche::Numeric::log_sum_exp(small).item<double>() == Approx(-1000.0 + std::log1p(std::exp(-1.0))));
}

TEST_CASE("log_sum_exp of an all -inf slice is -inf", "[numeric]") {
    const auto inf = std::numeric_limits<double>::infinity();
    const auto values = torch::tensor({-inf, -inf}, torch::kFloat64);
    const auto result = Tyche::Numeric::log_sum_exp(values).item<double>();

    REQUIRE(std::isinf(result));
    REQUIRE(result < 0.0);
}

TEST_CASE("log_sum_exp reduces along the requested dimension", "[numeric]") {
    const auto values = torch::randn({3, 4}, torch::kFloat64);
    const auto reduced = Tyche::Numeric::log_sum_exp(values, 1, /*keepdim=*/true);

    REQUIRE(reduced.sizes().vec() == std::vector<std::int64_t>{3, 1});
    REQUIRE(torch::allclose(reduced, torch::logsumexp(values, {1}, true)));
}

TEST_CASE("KL against the standard normal vanishes at the reference", "[numeric][kl]") {
    const auto loc = torch::zeros({3});
    const auto scale = torch::ones({3});

    REQUIRE(Tyche::Numeric::kl_multivariate_normal(loc, scale).item<double>() == Approx(0.0).margin(1e-7));
}

TEST_CASE("KL against the standard normal matches the closed form", "[numeric][kl]") {
    const auto loc = torch::tensor({1.0, -0.5}, torch::kFloat64);
    const auto scale = torch::tensor({0.5, 2.0}, torch::kFloat64);

    double expected = 0.0;
    for (const auto& [m, s] : {std::pair{1.0, 0.5}, std::pair{-0.5, 2.0}}) {
        expected += -std::log(s) + 0.5 * (s * s + m * m) - 0.5;
    }

    REQUIRE(Tyche::Numeric::kl_multivariate_normal(loc, scale).item<double>() == Approx(expected));

    const auto general = Tyche::Numeric::kl_multivariate_normal(loc, scale, torch::zeros_like(loc), torch::ones_like(scale));
    REQUIRE(general.item<double>() == Approx(expected));
}

TEST_CASE("KL is differentiable in its Gaussian parameters", "[numeric][kl]") {
    auto loc = torch::tensor({0.3}, torch::kFloat64).requires_grad_();
    auto scale = torch::tensor({1.5}, torch::kFloat64).requires_grad_();

    Tyche::Numeric::kl_multivariate_normal(loc, scale).backward();

    REQUIRE(loc.grad().item<double>() == Approx(0.3));
    REQUIRE(scale.grad().item<double>() == Approx(1.5 - 1.0 / 1.5));
}

TEST_CASE("KL rejects mismatched shapes", "[numeric][kl]") {
    REQUIRE_THROWS_AS(Tyche::Numeric::kl_multivariate_normal(torch::zeros({2}), torch::ones({3})), std::invalid_argument);
}

TEST_CASE("Hessian of a quadratic form recovers its matrix", "[numeric][hessian]") {
    const auto matrix = torch::tensor({{3.0, 1.0}, {1.0, 2.0}}, torch::kFloat64);
    auto first = torch::tensor({0.2}, torch::kFloat64).requires_grad_();
    auto second = torch::tensor({-0.7}, torch::kFloat64).requires_grad_();

    const auto point = torch::cat({first, second});
    const auto value = 0.5 * point.dot(matrix.matmul(point));
    const auto result = Tyche::Numeric::hessian(value, {first, second});

    REQUIRE(result.sizes().vec() == std::vector<std::int64_t>{2, 2});
    REQUIRE(torch::allclose(result, matrix));
}

TEST_CASE("Hessian leaves unused directions at zero", "[numeric][hessian]") {
    auto used = torch::tensor({1.5}, torch::kFloat64).requires_grad_();
    auto unused = torch::zeros({2}, torch::kFloat64).requires_grad_();

    const auto value = used.pow(3).sum();
    const auto result = Tyche::Numeric::hessian(value, {used, unused});

    REQUIRE(result.sizes().vec() == std::vector<std::int64_t>{3, 3});
    REQUIRE(result[0][0].item<double>() == Approx(9.0));
    REQUIRE(result.slice(0, 1).abs().sum().item<double>() == 0.0);
}

TEST_CASE("Hessian requires a scalar output", "[numeric][hessian]") {
    auto parameter = torch::ones({2}, torch::kFloat64).requires_grad_();
    REQUIRE_THROWS_AS(Tyche::Numeric::hessian(parameter * 2.0, {parameter}), std::invalid_argument);
}

TEST_CASE("log_sum_exp differentiates to the softmax", "[numeric]") {
    auto values = torch::tensor({0.1, 2.5, -1.0}, torch::kFloat64).requires_grad_();
    Tyche::Numeric::log_sum_exp(values).backward();

    REQUIRE(torch::allclose(values.grad(), torch::softmax(values.detach(), 0)));
}
