#pragma once

#include <chrono>
#include <cstdint>

namespace simq::mqtt {

    // 32-bit millisecond tick. Deadlines wrap roughly every 49 days, so they
    // must only be compared through ticks_diff.
    using Ticks = uint32_t;

    inline Ticks ticks_add(Ticks base, uint32_t delta_ms) {
        return static_cast<Ticks>(base + delta_ms);
    }

    // Signed distance from `from` to `to`, correct across wraparound as long as
    // the two are less than 2^31 ms apart.
    inline int32_t ticks_diff(Ticks to, Ticks from) {
        return static_cast<int32_t>(static_cast<uint32_t>(to - from));
    }

    class Time {
    public:
        static uint64_t now_ms() {
            using namespace std::chrono;
            return duration_cast<milliseconds>(
                steady_clock::now().time_since_epoch()
                ).count();
        }
    };

    /// @brief Monotonic millisecond clock consumed by the client.
    class IClock {
    public:
        virtual ~IClock() = default;
        virtual uint64_t now_ms() const = 0;

        Ticks now_ticks() const {
            return static_cast<Ticks>(now_ms());
        }
    };

    class SteadyClock : public IClock {
    public:
        uint64_t now_ms() const override {
            return Time::now_ms();
        }
    };

    class Timer {
    private:
        std::chrono::steady_clock::time_point start_time_;

    public:
        Timer() : start_time_(std::chrono::steady_clock::now()) {}

        void reset() {
            start_time_ = std::chrono::steady_clock::now();
        }

        uint64_t elapsed_ms() const {
            auto now = std::chrono::steady_clock::now();
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                now - start_time_
                ).count();
        }

        bool has_expired(uint64_t timeout_ms) const {
            return elapsed_ms() >= timeout_ms;
        }
    };

}
