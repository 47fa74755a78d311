/**
 * @file exponential_backoff.hpp
 * @brief Doubling backoff capped at a maximum delay.
 */
#pragma once
#include "../interfaces/IBackoffStrategy.hpp"
#include <algorithm>

namespace framectl {

    /**
     * @class ExponentialBackoff
     * @brief base, 2*base, 4*base, ... never exceeding max.
     */
    class ExponentialBackoff : public IBackoffStrategy {
    public:
        ExponentialBackoff(std::chrono::milliseconds base, std::chrono::milliseconds max)
            : base_(base), max_(max) {}

        std::chrono::milliseconds nextDelay(uint32_t attempt) const override {
            if (attempt == 0) attempt = 1;
            uint32_t shift = std::min<uint32_t>(attempt - 1, 30);
            long long delay = (long long)base_.count() * (1LL << shift);
            delay = std::min(delay, (long long)max_.count());
            return std::chrono::milliseconds(delay);
        }

    private:
        std::chrono::milliseconds base_;
        std::chrono::milliseconds max_;
    };

}
