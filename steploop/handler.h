#pragma once
#include <steploop/looper.h>
#include <steploop/message.h>
#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <utility>

namespace steploop {

    /**
     * Handler sends messages to a looper and processes them when dispatched
     *
     * Subclasses override handle_message, or a callback is passed to the
     * constructor. Pending messages of a handler are removed from the queue
     * when the handler is destroyed.
     */
    class handler {
    public:
        using callback_type = std::function<bool(message&)>;

        /**
         * Binds a new handler to the current thread looper
         */
        handler()
            : handler(looper::current())
        {}

        /**
         * Binds a new handler to looper l, when async is true all messages
         * sent by this handler are marked as async.
         */
        explicit handler(looper& l, bool async = false)
            : looper_(l)
            , async_(async)
        {}

        handler(looper& l, callback_type callback, bool async = false)
            : looper_(l)
            , callback_(std::move(callback))
            , async_(async)
        {}

        handler(const handler&) = delete;
        handler& operator=(const handler&) = delete;

        virtual ~handler() {
            looper_.queue().remove_callbacks_and_messages(this);
        }

        looper& get_looper() const noexcept {
            return looper_;
        }

        /**
         * Processes a message, called by subclasses which don't use callbacks
         */
        virtual void handle_message(message& msg) {
            (void)msg;
        }

        /**
         * Dispatches a message to its callback, the handler callback or
         * handle_message, in that order.
         */
        void dispatch_message(message& msg) {
            if (msg.callback) {
                msg.callback();
                return;
            }
            if (callback_ && callback_(msg)) {
                return;
            }
            handle_message(msg);
        }

        /**
         * Returns a new message targeting this handler
         */
        std::unique_ptr<message> obtain_message(int what = 0, int arg1 = 0, int arg2 = 0) {
            auto msg = std::make_unique<message>();
            msg->set_target(this);
            msg->what = what;
            msg->arg1 = arg1;
            msg->arg2 = arg2;
            return msg;
        }

        void send_message(std::unique_ptr<message> msg) {
            send_message_delayed(std::move(msg), std::chrono::milliseconds::zero());
        }

        void send_empty_message(int what) {
            send_message(obtain_message(what));
        }

        void send_empty_message_delayed(int what, std::chrono::milliseconds delay) {
            send_message_delayed(obtain_message(what), delay);
        }

        /**
         * Sends msg to run after delay, negative delays are treated as zero
         * and delays past the end of time saturate at milliseconds::max().
         */
        void send_message_delayed(std::unique_ptr<message> msg, std::chrono::milliseconds delay) {
            delay = std::max(delay, std::chrono::milliseconds::zero());
            const auto now = looper_.uptime();
            const auto when = delay > std::chrono::milliseconds::max() - now
                ? std::chrono::milliseconds::max()
                : now + delay;
            send_message_at_time(std::move(msg), when);
        }

        /**
         * Sends msg to run at the absolute uptime `when`
         */
        void send_message_at_time(std::unique_ptr<message> msg, std::chrono::milliseconds when) {
            enqueue(std::move(msg), when);
        }

        /**
         * Sends msg to run before every other pending message
         */
        void send_message_at_front_of_queue(std::unique_ptr<message> msg) {
            enqueue(std::move(msg), std::chrono::milliseconds::zero());
        }

        void post(message::callback_type fn) {
            send_message(callback_message(std::move(fn)));
        }

        void post_delayed(message::callback_type fn, std::chrono::milliseconds delay) {
            send_message_delayed(callback_message(std::move(fn)), delay);
        }

        void post_at_time(message::callback_type fn, std::chrono::milliseconds when) {
            send_message_at_time(callback_message(std::move(fn)), when);
        }

        void post_at_front_of_queue(message::callback_type fn) {
            send_message_at_front_of_queue(callback_message(std::move(fn)));
        }

        bool has_messages(int what) const {
            return looper_.queue().has_messages(this, what);
        }

        void remove_messages(int what) {
            looper_.queue().remove_messages(this, what);
        }

        void remove_callbacks_and_messages() {
            looper_.queue().remove_callbacks_and_messages(this);
        }

    private:
        std::unique_ptr<message> callback_message(message::callback_type fn) {
            auto msg = obtain_message();
            msg->callback = std::move(fn);
            return msg;
        }

        void enqueue(std::unique_ptr<message> msg, std::chrono::milliseconds when) {
            if (msg) {
                msg->set_target(this);
                if (async_) {
                    msg->set_async(true);
                }
            }
            looper_.queue().enqueue(std::move(msg), when);
        }

    private:
        looper& looper_;
        callback_type callback_;
        const bool async_;
    };

} // namespace steploop
