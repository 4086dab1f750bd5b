#pragma once
#include <chrono>
#include <functional>
#include <memory>

namespace steploop {

    class handler;
    class message_queue;

    /**
     * A unit of work scheduled to run on a looper at a point in time
     *
     * Messages are owned either by the message_queue they are linked into, or
     * by whoever removed them from the queue. A message without a target
     * handler is a sync barrier.
     */
    class message {
        friend class message_queue;

    public:
        using callback_type = std::function<void()>;

        message() = default;

        message(const message&) = delete;
        message& operator=(const message&) = delete;

        ~message() noexcept {
            // Avoid deep recursion when a long unlinked tail is dropped
            std::unique_ptr<message> tail = std::move(next_);
            while (tail) {
                tail = std::move(tail->next_);
            }
        }

        /**
         * Scheduled uptime of this message
         */
        std::chrono::milliseconds when() const noexcept {
            return when_;
        }

        /**
         * Changes scheduled uptime of a message
         *
         * Callers must not break the ascending order of a linked chain.
         */
        void set_when(std::chrono::milliseconds when) noexcept {
            when_ = when;
        }

        handler* target() const noexcept {
            return target_;
        }

        void set_target(handler* h) noexcept {
            target_ = h;
        }

        /**
         * Returns true when this message is a sync barrier
         */
        bool is_barrier() const noexcept {
            return target_ == nullptr;
        }

        /**
         * Async messages are not stalled by sync barriers
         */
        bool is_async() const noexcept {
            return async_;
        }

        void set_async(bool async) noexcept {
            async_ = async;
        }

        /**
         * Returns true after the message was enqueued or taken for dispatch
         */
        bool in_use() const noexcept {
            return in_use_;
        }

        void mark_in_use() noexcept {
            in_use_ = true;
        }

        /**
         * Returns the next message in the chain, or nullptr
         */
        message* next() const noexcept {
            return next_.get();
        }

    public:
        int what = 0;
        int arg1 = 0;
        int arg2 = 0;
        callback_type callback;

    private:
        std::unique_ptr<message> next_;
        std::chrono::milliseconds when_{ 0 };
        handler* target_{ nullptr };
        bool async_ = false;
        bool in_use_ = false;
    };

} // namespace steploop
