#pragma once
#include <steploop/clock.h>
#include <steploop/looper_error.h>
#include <steploop/message.h>
#include <absl/base/internal/raw_logging.h>
#include <absl/base/thread_annotations.h>
#include <absl/synchronization/mutex.h>
#include <cassert>
#include <chrono>
#include <cstddef>
#include <memory>

namespace steploop {

    /**
     * A chain of pending messages ordered by their scheduled time
     *
     * Insertion and removal by handlers is thread-safe. Direct access to the
     * chain (head, unlink and message links) requires holding mutex().
     */
    class message_queue {
    public:
        explicit message_queue(const clock_source& clock) noexcept
            : clock_(clock)
        {}

        message_queue(const message_queue&) = delete;
        message_queue& operator=(const message_queue&) = delete;

        /**
         * Marks msg in use and inserts it into the chain at time `when`
         *
         * Messages with equal times keep their insertion order, except when
         * `when` is zero, which always inserts at the front of the queue.
         */
        void enqueue(std::unique_ptr<message> msg, std::chrono::milliseconds when) {
            if (!msg) {
                ABSL_RAW_LOG(ERROR, "cannot enqueue a null message");
                throw looper_error("cannot enqueue a null message");
            }
            if (when < std::chrono::milliseconds::zero()) {
                ABSL_RAW_LOG(ERROR, "message what=%d scheduled at negative time %lld ms",
                    msg->what, static_cast<long long>(when.count()));
                throw looper_error("message time must not be negative");
            }
            if (msg->is_barrier()) {
                ABSL_RAW_LOG(ERROR, "message what=%d has no target handler", msg->what);
                throw looper_error("message must have a target handler");
            }
            if (msg->in_use()) {
                ABSL_RAW_LOG(ERROR, "message what=%d is already in use", msg->what);
                throw looper_error("message is already in use");
            }
            msg->mark_in_use();
            msg->set_when(when);

            absl::MutexLock l(&mutex_);
            insert(std::move(msg));
        }

        /**
         * Posts a sync barrier at the current uptime and returns its token
         */
        int post_sync_barrier() {
            return post_sync_barrier(clock_.uptime());
        }

        /**
         * Posts a sync barrier at time `when` and returns its token
         *
         * Until the barrier is removed, synchronous messages after it are
         * stalled and only async messages may run.
         */
        int post_sync_barrier(std::chrono::milliseconds when) {
            if (when < std::chrono::milliseconds::zero()) {
                ABSL_RAW_LOG(ERROR, "sync barrier scheduled at negative time %lld ms",
                    static_cast<long long>(when.count()));
                throw looper_error("sync barrier time must not be negative");
            }
            auto barrier = std::make_unique<message>();
            barrier->mark_in_use();
            barrier->set_when(when);

            absl::MutexLock l(&mutex_);
            int token = next_barrier_token_++;
            barrier->arg1 = token;
            insert(std::move(barrier));
            return token;
        }

        /**
         * Removes a sync barrier previously returned by post_sync_barrier
         */
        void remove_sync_barrier(int token) {
            absl::MutexLock l(&mutex_);
            message* prev = nullptr;
            for (message* p = head_.get(); p; prev = p, p = p->next()) {
                if (p->is_barrier() && p->arg1 == token) {
                    unlink(prev, p);
                    return;
                }
            }
            ABSL_RAW_LOG(ERROR, "sync barrier token %d does not exist", token);
            throw looper_error("the specified sync barrier token has not been posted or has already been removed");
        }

        /**
         * Returns true if h has pending messages (not callbacks) with `what`
         */
        bool has_messages(const handler* h, int what) const {
            absl::MutexLock l(&mutex_);
            for (message* p = head_.get(); p; p = p->next()) {
                if (p->target() == h && p->what == what && !p->callback) {
                    return true;
                }
            }
            return false;
        }

        /**
         * Removes messages (not callbacks) of h with `what`
         */
        void remove_messages(const handler* h, int what) {
            remove_if([h, what](const message& m) {
                return m.target() == h && m.what == what && !m.callback;
            });
        }

        /**
         * Removes all messages and callbacks targeting h
         */
        void remove_callbacks_and_messages(const handler* h) {
            remove_if([h](const message& m) {
                return m.target() == h;
            });
        }

        size_t size() const {
            absl::MutexLock l(&mutex_);
            size_t count = 0;
            for (message* p = head_.get(); p; p = p->next()) {
                ++count;
            }
            return count;
        }

        bool empty() const {
            absl::MutexLock l(&mutex_);
            return !head_;
        }

    public:
        absl::Mutex& mutex() const ABSL_LOCK_RETURNED(mutex_) {
            return mutex_;
        }

        /**
         * Returns the first message in the chain
         */
        message* head() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
            return head_.get();
        }

        /**
         * Unlinks msg, which must immediately follow prev (or be the head
         * when prev is nullptr), and returns it with a cleared next link.
         */
        std::unique_ptr<message> unlink(message* prev, message* msg) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
            std::unique_ptr<message>& link = prev ? prev->next_ : head_;
            assert(link.get() == msg && "message does not follow prev");
            (void)msg;
            std::unique_ptr<message> result = std::move(link);
            link = std::move(result->next_);
            return result;
        }

    private:
        void insert(std::unique_ptr<message> msg) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
            const auto when = msg->when();
            std::unique_ptr<message>* link = &head_;
            if (when != std::chrono::milliseconds::zero()) {
                while (*link && (*link)->when() <= when) {
                    link = &(*link)->next_;
                }
            }
            msg->next_ = std::move(*link);
            *link = std::move(msg);
        }

        template<class Predicate>
        void remove_if(Predicate&& predicate) {
            // Removed messages are destroyed after the lock is released
            std::unique_ptr<message> removed;
            {
                absl::MutexLock l(&mutex_);
                message* prev = nullptr;
                message* p = head_.get();
                while (p) {
                    message* next = p->next();
                    if (predicate(*p)) {
                        auto m = unlink(prev, p);
                        m->next_ = std::move(removed);
                        removed = std::move(m);
                    } else {
                        prev = p;
                    }
                    p = next;
                }
            }
        }

    private:
        const clock_source& clock_;
        mutable absl::Mutex mutex_;
        std::unique_ptr<message> head_ ABSL_GUARDED_BY(mutex_);
        int next_barrier_token_ ABSL_GUARDED_BY(mutex_) = 0;
    };

} // namespace steploop
