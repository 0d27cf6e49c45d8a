#include <catch2/catch.hpp>

#include <cmath>
#include <cstdint>
#include <memory>
#include <vector>

#include <torch/torch.h>

#include "../include/Tyche.h"
#include "models.hpp"

TEST_CASE("Normalized log weights exponentiate to a distribution", "[klpq][weights]") {
    const auto log_w = torch::tensor({-3.0, 0.5, 1.25, -0.75}, torch::kFloat64);
    const auto normalized = Tyche::KLpq::normalized_log_weights(log_w);

    REQUIRE(torch::exp(normalized).sum().item<double>() == Approx(1.0));
    REQUIRE(torch::allclose(normalized, torch::log_softmax(log_w, 0)));
}

TEST_CASE("Normalized log weights survive extreme magnitudes", "[klpq][weights]") {
    const auto log_w = torch::tensor({1000.0, -1000.0, 0.0}, torch::kFloat32);
    const auto weights = torch::exp(Tyche::KLpq::normalized_log_weights(log_w));

    REQUIRE(torch::isfinite(weights).all().item<bool>());
    REQUIRE(weights[0].item<double>() == Approx(1.0));
    REQUIRE(weights.sum().item<double>() == Approx(1.0));
}

TEST_CASE("KLpq reports a finite weighted loss", "[klpq]") {
    Tyche::Context context(Tyche::ContextOptions{.seed = 8, .stream = nullptr});
    Tyche::KLpq inference(std::make_shared<Tyche::Testing::GaussianMeanModel>(), Tyche::Testing::standard_normal(),
                          Tyche::Data::FromTensor(torch::full({10}, 5.0)));
    inference.initialize(context, {.n_minibatch = 20});

    const auto objective = inference.build_loss();
    REQUIRE(objective.requires_grad());
    REQUIRE(std::isfinite(inference.loss().item<double>()));
    REQUIRE(inference.samples().sizes().vec() == std::vector<std::int64_t>{20, 1});
    REQUIRE_FALSE(inference.samples().requires_grad());
}

TEST_CASE("KLpq moves the approximation towards the posterior mass", "[klpq][convergence]") {
    Tyche::Context context(Tyche::ContextOptions{.seed = 0, .stream = nullptr});
    auto family = Tyche::Testing::standard_normal();
    Tyche::KLpq inference(std::make_shared<Tyche::Testing::GaussianMeanModel>(), family,
                          Tyche::Data::FromTensor(torch::full({10}, 5.0)));

    inference.run(context, {.n_iter = 100, .n_print = std::nullopt, .n_minibatch = 100});

    REQUIRE(family->locs().item<double>() > 1.0);
}

TEST_CASE("KLpq accepts families that cannot be reparameterized", "[klpq]") {
    Tyche::Context context(Tyche::ContextOptions{.seed = 1, .stream = nullptr});
    auto family = std::make_shared<Tyche::Variational::Family>();
    family->add(Tyche::Variational::Bernoulli({.num_vars = 1, .probability = 0.5}));
    Tyche::KLpq inference(std::make_shared<Tyche::Testing::GaussianMeanModel>(), family,
                          Tyche::Data::FromTensor(torch::full({4}, 1.0)));

    REQUIRE_NOTHROW(inference.run(context, {.n_iter = 20, .n_print = std::nullopt, .n_minibatch = 10}));
}

TEST_CASE("KLpq gradients treat the normalized weights as constants", "[klpq][gradient]") {
    Tyche::Context context(Tyche::ContextOptions{.seed = 13, .stream = nullptr});
    auto family = std::make_shared<Tyche::Variational::Family>();
    family->add(Tyche::Variational::Normal({.num_vars = 1, .loc = 0.5, .scale = 1.2}));
    auto data = Tyche::Data::FromTensor(torch::full({3}, 1.0));
    Tyche::KLpq inference(std::make_shared<Tyche::Testing::GaussianMeanModel>(), family, data);
    inference.initialize(context, {.n_minibatch = 6});

    inference.zero_grad();
    inference.build_loss().backward();

    const auto parameters = family->named_parameters();
    const auto loc = parameters["layer_0.loc"];
    const auto scale_raw = parameters["layer_0.scale_raw"];

    torch::NoGradGuard no_grad;
    const auto z = inference.samples().to(torch::kFloat64).reshape({-1});
    const double m = 0.5;
    const double s = family->scales().item<double>();

    // log q(z) and log p(x, z) = -0.5 * sum_i (z - 1)^2 over three observations at 1.
    const auto log_q = -0.5 * Tyche::Variational::Details::kLogTwoPi - std::log(s) - 0.5 * ((z - m) / s).pow(2);
    const auto log_p = -1.5 * (z - 1.0).pow(2);
    const auto w = torch::softmax(log_p - log_q, 0);

    const double expected_loc = -(w * (z - m) / (s * s)).mean().item<double>();
    const double expected_scale = -(w * ((z - m).pow(2) / (s * s * s) - 1.0 / s)).mean().item<double>();
    const double expected_raw = expected_scale * torch::sigmoid(scale_raw).item<double>();

    REQUIRE(loc.grad().item<double>() == Approx(expected_loc).epsilon(1e-4).margin(1e-6));
    REQUIRE(scale_raw.grad().item<double>() == Approx(expected_raw).epsilon(1e-4).margin(1e-6));
}
