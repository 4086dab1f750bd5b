#include <steploop/message_queue.h>
#include <gtest/gtest.h>

#include "test_common.h"
#include <steploop/handler.h>
#include <steploop/looper.h>

#include <memory>
#include <vector>

using namespace steploop;

namespace {

    std::vector<int> queued_whats(message_queue& queue) {
        absl::MutexLock l(&queue.mutex());
        std::vector<int> result;
        for (message* p = queue.head(); p; p = p->next()) {
            result.push_back(p->is_barrier() ? -1 : p->what);
        }
        return result;
    }

} // namespace

TEST(TestMessageQueue, InsertsInTimeOrder) {
    test_clock clock;
    looper l(clock);
    recording_handler h(l);

    h.send_empty_message_delayed(1, 100ms);
    h.send_empty_message_delayed(2, 50ms);
    h.send_empty_message_delayed(3, 200ms);
    h.send_empty_message_delayed(4, 50ms);
    h.send_empty_message_delayed(5, 100ms);

    // Equal times keep insertion order
    EXPECT_EQ(queued_whats(l.queue()), (std::vector<int>{ 2, 4, 1, 5, 3 }));
    EXPECT_EQ(l.queue().size(), 5u);
    EXPECT_FALSE(l.queue().empty());
}

TEST(TestMessageQueue, FrontOfQueue) {
    test_clock clock(10ms);
    looper l(clock);
    recording_handler h(l);

    h.send_empty_message(1);
    h.send_message_at_front_of_queue(h.obtain_message(2));
    h.send_message_at_front_of_queue(h.obtain_message(3));

    // Every front insertion goes before previous ones
    EXPECT_EQ(queued_whats(l.queue()), (std::vector<int>{ 3, 2, 1 }));
}

TEST(TestMessageQueue, EnqueueMarksInUse) {
    test_clock clock;
    looper l(clock);
    recording_handler h(l);

    auto msg = h.obtain_message(1);
    EXPECT_FALSE(msg->in_use());
    message* raw = msg.get();
    h.send_message(std::move(msg));
    absl::MutexLock lock(&l.queue().mutex());
    EXPECT_TRUE(raw->in_use());
    EXPECT_EQ(l.queue().head(), raw);
}

TEST(TestMessageQueue, RejectsInvalidMessages) {
    test_clock clock;
    looper l(clock);
    recording_handler h(l);

    EXPECT_THROW(l.queue().enqueue(nullptr, 0ms), looper_error);
    EXPECT_THROW(l.queue().enqueue(std::make_unique<message>(), 10ms), looper_error);

    auto msg = h.obtain_message(1);
    msg->mark_in_use();
    EXPECT_THROW(h.send_message(std::move(msg)), looper_error);
    EXPECT_TRUE(l.queue().empty());
}

TEST(TestMessageQueue, SyncBarrierTokens) {
    test_clock clock(5ms);
    looper l(clock);
    recording_handler h(l);

    h.send_message_at_time(h.obtain_message(1), 10ms);
    h.send_message_at_time(h.obtain_message(2), 20ms);

    // Barriers go after messages with the same or earlier time
    EXPECT_EQ(l.queue().post_sync_barrier(10ms), 0);
    EXPECT_EQ(l.queue().post_sync_barrier(), 1);
    EXPECT_EQ(queued_whats(l.queue()), (std::vector<int>{ -1, 1, -1, 2 }));

    {
        absl::MutexLock lock(&l.queue().mutex());
        message* head = l.queue().head();
        ASSERT_TRUE(head->is_barrier());
        EXPECT_EQ(head->arg1, 1);
        EXPECT_EQ(head->when(), 5ms);
        EXPECT_TRUE(head->in_use());
    }

    l.queue().remove_sync_barrier(0);
    EXPECT_EQ(queued_whats(l.queue()), (std::vector<int>{ -1, 1, 2 }));
    EXPECT_THROW(l.queue().remove_sync_barrier(0), looper_error);
    l.queue().remove_sync_barrier(1);
    EXPECT_EQ(queued_whats(l.queue()), (std::vector<int>{ 1, 2 }));
}

TEST(TestMessageQueue, RemoveMessages) {
    test_clock clock;
    looper l(clock);
    recording_handler a(l);
    recording_handler b(l);

    a.send_empty_message(1);
    b.send_empty_message(1);
    a.send_empty_message(2);
    a.post([]{});

    EXPECT_TRUE(a.has_messages(1));
    EXPECT_TRUE(a.has_messages(2));
    // Callbacks are not messages even though their what is zero
    EXPECT_FALSE(a.has_messages(0));

    a.remove_messages(1);
    EXPECT_FALSE(a.has_messages(1));
    EXPECT_TRUE(b.has_messages(1));
    EXPECT_EQ(l.queue().size(), 3u);

    a.remove_messages(0);
    EXPECT_EQ(l.queue().size(), 3u);

    a.remove_callbacks_and_messages();
    EXPECT_EQ(queued_whats(l.queue()), (std::vector<int>{ 1 }));
}

TEST(TestMessageQueue, HandlerDestructorRemovesMessages) {
    test_clock clock;
    looper l(clock);
    recording_handler a(l);
    {
        recording_handler b(l);
        b.send_empty_message(1);
        a.send_empty_message(2);
        b.post_delayed([]{}, 10ms);
        EXPECT_EQ(l.queue().size(), 3u);
    }
    EXPECT_EQ(queued_whats(l.queue()), (std::vector<int>{ 2 }));
}

TEST(TestMessageQueue, Unlink) {
    test_clock clock;
    looper l(clock);
    recording_handler h(l);

    h.send_empty_message_delayed(1, 1ms);
    h.send_empty_message_delayed(2, 2ms);
    h.send_empty_message_delayed(3, 3ms);

    absl::MutexLock lock(&l.queue().mutex());
    message* first = l.queue().head();
    message* second = first->next();
    auto removed = l.queue().unlink(first, second);
    ASSERT_EQ(removed.get(), second);
    EXPECT_EQ(removed->next(), nullptr);
    EXPECT_EQ(first->next()->what, 3);

    auto head = l.queue().unlink(nullptr, first);
    EXPECT_EQ(head->what, 1);
    EXPECT_EQ(head->next(), nullptr);
    EXPECT_EQ(l.queue().head()->what, 3);
}

TEST(TestMessageQueue, LongChainRemoval) {
    test_clock clock;
    looper l(clock);
    recording_handler h(l);
    for (int i = 0; i < 200000; ++i) {
        h.send_message_at_front_of_queue(h.obtain_message(i));
    }
    EXPECT_EQ(l.queue().size(), 200000u);
    h.remove_callbacks_and_messages();
    EXPECT_TRUE(l.queue().empty());
}

TEST(TestMessageQueue, RejectsNegativeTime) {
    test_clock clock;
    looper l(clock);
    recording_handler h(l);

    EXPECT_THROW(l.queue().enqueue(h.obtain_message(1), std::chrono::milliseconds::min()), looper_error);
    EXPECT_THROW(l.queue().post_sync_barrier(-1ms), looper_error);
    EXPECT_TRUE(l.queue().empty());
}
