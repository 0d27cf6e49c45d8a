#ifndef TYCHE_LRSCHEDULER_COMMON_HPP
#define TYCHE_LRSCHEDULER_COMMON_HPP

#include <cstddef>
#include <vector>

#include <torch/torch.h>

namespace Tyche::LrScheduler::Details {

    class Scheduler {
    public:
        virtual ~Scheduler() = default;
        virtual void step() = 0;
        [[nodiscard]] virtual std::size_t step_count() const noexcept = 0;
    };

    inline std::vector<double> capture_base_lrs(torch::optim::Optimizer& optimizer) {
        std::vector<double> base_lrs;
        base_lrs.reserve(optimizer.param_groups().size());
        for (auto& group : optimizer.param_groups()) {
            base_lrs.push_back(group.options().get_lr());
        }
        return base_lrs;
    }

}  // namespace Tyche::LrScheduler::Details

#endif // TYCHE_LRSCHEDULER_COMMON_HPP
