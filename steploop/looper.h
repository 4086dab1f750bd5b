#pragma once
#include <steploop/clock.h>
#include <steploop/looper_error.h>
#include <steploop/message_queue.h>
#include <chrono>

namespace steploop {

    /**
     * A looper owns the message queue of a single event-processing thread
     *
     * Messages are added to the queue by handlers bound to the looper. This
     * library does not run loopers on their own threads, they are driven by
     * a test_looper instead.
     */
    class looper {
    public:
        explicit looper(const clock_source& clock = uptime_clock::instance())
            : clock_(clock)
            , queue_(clock)
        {}

        looper(const looper&) = delete;
        looper& operator=(const looper&) = delete;

        message_queue& queue() noexcept {
            return queue_;
        }

        const message_queue& queue() const noexcept {
            return queue_;
        }

        const clock_source& clock() const noexcept {
            return clock_;
        }

        /**
         * Current time of the looper clock
         */
        std::chrono::milliseconds uptime() const {
            return clock_.uptime();
        }

    public:
        /**
         * Returns looper bound to the current thread, or throws an exception
         */
        static looper& current() {
            if (current_) {
                [[likely]]
                return *current_;
            }
            throw looper_error("current thread does not have a looper");
        }

        /**
         * Returns looper bound to the current thread, or nullptr
         */
        static looper* current_ptr() noexcept {
            return current_;
        }

        /**
         * Sets looper bound to the current thread
         */
        static void set_current_ptr(looper* l) noexcept {
            current_ = l;
        }

    private:
        const clock_source& clock_;
        message_queue queue_;

        static inline thread_local looper* current_{ nullptr };
    };

} // namespace steploop
