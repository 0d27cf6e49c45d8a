#ifndef TYCHE_CORE_HPP
#define TYCHE_CORE_HPP
/*
 * Execution context shared by an inference run.
 * ---------------------------------------------------------------------------
 *  - One Context is created by the caller and handed to initialize()/run().
 *    Every collaborator that draws random numbers, places tensors or writes
 *    progress receives it explicitly; nothing in the library keeps hidden
 *    process-wide state.
 *  - Random draws go through `generator` so that two runs seeded identically
 *    reproduce the same trajectory.
 *  - `stream == nullptr` silences all output.
 */

#include <cstdint>
#include <iostream>
#include <ostream>
#include <string_view>

#include <torch/torch.h>
#include <ATen/CPUGeneratorImpl.h>

namespace Tyche {
    inline constexpr std::string_view kModelScope = "model";
    inline constexpr std::string_view kVariationalScope = "variational";

    struct ContextOptions {
        std::uint64_t seed{0};
        torch::Device device{torch::kCPU};
        std::ostream* stream{&std::cout};
    };

    class Context {
    public:
        Context() : Context(ContextOptions{}) {}

        explicit Context(const ContextOptions& options)
            : device_(options.device),
              generator_(at::detail::createCPUGenerator(options.seed)),
              stream_(options.stream),
              seed_(options.seed) {}

        [[nodiscard]] const torch::Device& device() const noexcept { return device_; }
        [[nodiscard]] at::Generator& generator() noexcept { return generator_; }
        [[nodiscard]] std::ostream* stream() const noexcept { return stream_; }
        [[nodiscard]] std::uint64_t seed() const noexcept { return seed_; }

        void set_stream(std::ostream* stream) noexcept { stream_ = stream; }

        void reseed(std::uint64_t seed) {
            seed_ = seed;
            generator_.set_current_seed(seed);
        }

        // Standard normal draws on the context device. Sampling happens on the CPU generator.
        [[nodiscard]] torch::Tensor randn(torch::IntArrayRef sizes, const torch::TensorOptions& options) {
            auto draw = torch::randn(sizes, generator_, options.device(torch::kCPU));
            return draw.to(device_);
        }

        [[nodiscard]] torch::Tensor bernoulli(const torch::Tensor& probabilities) {
            auto draw = torch::bernoulli(probabilities.detach().to(torch::kCPU), generator_);
            return draw.to(device_);
        }

    private:
        torch::Device device_;
        at::Generator generator_;
        std::ostream* stream_;
        std::uint64_t seed_;
    };
}

#endif // TYCHE_CORE_HPP
