#include <steploop/handler.h>
#include <steploop/test_looper.h>
#include <chrono>
#include <cstdio>
#include <functional>
#include <utility>

using namespace steploop;
using namespace std::chrono_literals;

/**
 * Retries a failing operation with exponential backoff on a looper
 */
class Retrier : public handler {
    enum { MSG_ATTEMPT = 1 };

public:
    Retrier(looper& l, std::function<bool()> operation)
        : handler(l)
        , operation(std::move(operation))
    {}

    void start() {
        send_empty_message(MSG_ATTEMPT);
    }

    int attempts() const {
        return attempts_;
    }

    bool succeeded() const {
        return succeeded_;
    }

    void handle_message(message& msg) override {
        if (msg.what != MSG_ATTEMPT) {
            return;
        }
        ++attempts_;
        if (operation()) {
            succeeded_ = true;
            return;
        }
        send_empty_message_delayed(MSG_ATTEMPT, backoff);
        backoff *= 2;
    }

private:
    std::function<bool()> operation;
    std::chrono::milliseconds backoff{ 100 };
    int attempts_ = 0;
    bool succeeded_ = false;
};

int main() {
    test_looper tl;
    int failures = 3;
    Retrier retrier(tl.get_looper(), [&]{ return failures-- <= 0; });

    retrier.start();
    tl.dispatch_all();

    // Each retry waits twice as long as the one before
    for (auto delay : { 100ms, 200ms, 400ms }) {
        tl.move_time_forward(delay - 1ms);
        size_t early = tl.dispatch_all();
        tl.move_time_forward(1ms);
        size_t due = tl.dispatch_all();
        std::printf("after %lldms: %zu early, %zu due, %d attempts\n",
            static_cast<long long>(delay.count()), early, due, retrier.attempts());
    }

    std::printf("succeeded: %s\n", retrier.succeeded() ? "yes" : "no");
    return retrier.succeeded() ? 0 : 1;
}
