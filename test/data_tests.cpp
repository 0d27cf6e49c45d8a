#include <catch2/catch.hpp>

#include <cstdint>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "../include/Tyche.h"

TEST_CASE("An unset batch size returns every observation", "[data]") {
    Tyche::Context context(Tyche::ContextOptions{.stream = nullptr});
    auto source = Tyche::Data::FromTensor(torch::arange(6, torch::kFloat32));

    const auto batch = source->sample(context, std::nullopt);
    REQUIRE(batch.numel() == 6);
    REQUIRE(source->cursor() == 0);
}

TEST_CASE("Mini-batches walk the rows in order and wrap around", "[data]") {
    Tyche::Context context(Tyche::ContextOptions{.stream = nullptr});
    auto source = Tyche::Data::FromTensor(torch::arange(5, torch::kFloat32));

    const auto first = source->sample(context, 2);
    const auto second = source->sample(context, 2);
    const auto third = source->sample(context, 2);

    REQUIRE(torch::equal(first, torch::tensor({0.0f, 1.0f})));
    REQUIRE(torch::equal(second, torch::tensor({2.0f, 3.0f})));
    REQUIRE(torch::equal(third, torch::tensor({4.0f, 0.0f})));
    REQUIRE(source->cursor() == 1);
}

TEST_CASE("Mini-batches keep trailing dimensions", "[data]") {
    Tyche::Context context(Tyche::ContextOptions{.stream = nullptr});
    auto source = Tyche::Data::FromTensor(torch::zeros({4, 3}));

    REQUIRE(source->sample(context, 3).sizes().vec() == std::vector<std::int64_t>{3, 3});
}

TEST_CASE("Scalars are promoted to a single observation", "[data]") {
    Tyche::Context context(Tyche::ContextOptions{.stream = nullptr});
    auto source = Tyche::Data::FromTensor(torch::tensor(2.5));

    REQUIRE(source->size() == 1);
    REQUIRE(source->sample(context, 1).item<double>() == Approx(2.5));
}

TEST_CASE("An empty source yields an empty tensor", "[data]") {
    Tyche::Context context(Tyche::ContextOptions{.stream = nullptr});
    auto source = Tyche::Data::Empty();

    REQUIRE(source->size() == 0);
    REQUIRE(source->sample(context, std::nullopt).numel() == 0);
    REQUIRE(source->sample(context, 10).numel() == 0);
}

TEST_CASE("Invalid batch sizes are rejected", "[data]") {
    Tyche::Context context(Tyche::ContextOptions{.stream = nullptr});
    auto source = Tyche::Data::FromTensor(torch::zeros({3}));

    REQUIRE_THROWS_AS(source->sample(context, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(source->sample(context, 4), std::invalid_argument);
}
