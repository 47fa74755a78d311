/**
 * @file IBackoffStrategy.hpp
 * @brief Interface for reconnect backoff curves.
 */
#pragma once
#include <chrono>
#include <cstdint>

namespace framectl {

    /**
     * @class IBackoffStrategy
     * @brief Maps a reconnect attempt number to the delay before that attempt.
     */
    class IBackoffStrategy {
    public:
        virtual ~IBackoffStrategy() = default;

        /**
         * @param attempt Reconnect attempt (starting from 1)
         * @return Duration to wait before the attempt
         */
        virtual std::chrono::milliseconds nextDelay(uint32_t attempt) const = 0;
    };

}
