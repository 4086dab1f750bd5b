#include <steploop/test_looper.h>
#include <steploop/handler.h>
#include <benchmark/benchmark.h>
#include <chrono>

using namespace steploop;

namespace {

    struct counting_handler : public handler {
        using handler::handler;

        void handle_message(message&) override {
            ++count;
        }

        size_t count = 0;
    };

} // namespace

static void BM_DispatchAll(benchmark::State& state) {
    test_looper tl;
    counting_handler h(tl.get_looper());
    const int n = static_cast<int>(state.range(0));
    for (auto _ : state) {
        state.PauseTiming();
        for (int i = 0; i < n; ++i) {
            h.send_message_at_front_of_queue(h.obtain_message(i));
        }
        state.ResumeTiming();
        benchmark::DoNotOptimize(tl.dispatch_all());
    }
    state.SetItemsProcessed(state.iterations() * n);
}

BENCHMARK(BM_DispatchAll)->Arg(1)->Arg(64)->Arg(4096);

static void BM_MoveTimeForward(benchmark::State& state) {
    test_looper tl;
    counting_handler h(tl.get_looper());
    const int n = static_cast<int>(state.range(0));
    for (int i = 0; i < n; ++i) {
        h.send_empty_message_delayed(i, std::chrono::hours(24) + std::chrono::milliseconds(i));
    }
    for (auto _ : state) {
        tl.move_time_forward(std::chrono::milliseconds(1));
    }
    state.SetItemsProcessed(state.iterations() * n);
}

BENCHMARK(BM_MoveTimeForward)->Arg(64)->Arg(4096);

static void BM_NextMessageBehindBarrier(benchmark::State& state) {
    test_looper tl;
    counting_handler sync_handler(tl.get_looper());
    counting_handler async_handler(tl.get_looper(), true);
    const int n = static_cast<int>(state.range(0));
    for (int i = 0; i < n; ++i) {
        sync_handler.send_message_at_front_of_queue(sync_handler.obtain_message(i));
    }
    tl.get_looper().queue().post_sync_barrier(std::chrono::milliseconds(0));
    for (auto _ : state) {
        // Async messages go after every stalled sync message
        async_handler.send_message(async_handler.obtain_message());
        auto msg = tl.next_message();
        benchmark::DoNotOptimize(msg.get());
    }
}

BENCHMARK(BM_NextMessageBehindBarrier)->Arg(1)->Arg(64)->Arg(1024);

int main(int argc, char** argv) {
    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}
