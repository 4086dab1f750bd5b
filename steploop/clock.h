#pragma once
#include <chrono>

namespace steploop {

    /**
     * Source of the monotonic "now" which decides when messages are due
     *
     * Loopers only ever read the clock. Virtual time is simulated by moving
     * scheduled messages closer to the current time instead.
     */
    class clock_source {
    protected:
        virtual ~clock_source() = default;

    public:
        using duration = std::chrono::milliseconds;

        /**
         * Returns milliseconds elapsed since an arbitrary fixed origin
         */
        virtual duration uptime() const = 0;
    };

    /**
     * Milliseconds of std::chrono::steady_clock, the default looper clock
     */
    class uptime_clock final : public clock_source {
    public:
        duration uptime() const override {
            return std::chrono::duration_cast<duration>(
                std::chrono::steady_clock::now().time_since_epoch());
        }

        static uptime_clock& instance() noexcept {
            static uptime_clock clock;
            return clock;
        }
    };

} // namespace steploop
