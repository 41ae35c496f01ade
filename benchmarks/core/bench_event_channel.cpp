/**
 * @file bench_event_channel.cpp
 * @brief Benchmarks for the run-to-observer event channel
 *
 * Measures queue throughput for log events and the cost of countdown
 * coalescing when a consumer falls behind.
 */

#include <benchmark/benchmark.h>

#include <kcenon/batch_transfer/core/countdown_waiter.h>
#include <kcenon/batch_transfer/core/event_channel.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

namespace kcenon::batch_transfer::benchmark {

namespace {

auto make_log(std::size_t index) -> batch_event {
    log_event entry;
    entry.kind = log_kind::upload_succeeded;
    entry.message = "[" + std::to_string(index) + "] OK: file.csv";
    return entry;
}

auto make_tick(std::uint32_t remaining) -> batch_event {
    return countdown_tick{countdown_phase::inter_file_delay, "Next upload in", remaining, 2};
}

}  // namespace

/**
 * @brief Push a batch of log events and pop them one by one
 */
static void BM_EventChannel_PushPop(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));

    for (auto _ : state) {
        event_channel channel;
        for (std::size_t i = 0; i < count; ++i) {
            channel.push(make_log(i));
        }
        while (auto event = channel.try_pop()) {
            ::benchmark::DoNotOptimize(event);
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Push consecutive ticks that collapse into one queued entry
 */
static void BM_EventChannel_TickCoalescing(::benchmark::State& state) {
    const auto count = static_cast<std::uint32_t>(state.range(0));

    for (auto _ : state) {
        event_channel channel;
        for (std::uint32_t i = count; i > 0; --i) {
            channel.push(make_tick(i));
        }
        ::benchmark::DoNotOptimize(channel.size());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Drain a queue of interleaved logs and ticks
 */
static void BM_EventChannel_Drain(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));

    for (auto _ : state) {
        state.PauseTiming();
        event_channel channel;
        for (std::size_t i = 0; i < count; ++i) {
            channel.push(make_log(i));
            channel.push(make_tick(static_cast<std::uint32_t>(i + 1)));
        }
        state.ResumeTiming();

        auto events = channel.drain();
        ::benchmark::DoNotOptimize(events);
    }

    state.SetItemsProcessed(static_cast<int64_t>(count * 2) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Producer thread pushes while the benchmark thread consumes
 */
static void BM_EventChannel_CrossThread(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));

    for (auto _ : state) {
        event_channel channel;
        std::thread producer([&channel, count] {
            for (std::size_t i = 0; i < count; ++i) {
                channel.push(make_log(i));
            }
            channel.close();
        });

        std::size_t received = 0;
        while (auto event = channel.pop(std::chrono::milliseconds(100))) {
            ++received;
        }
        producer.join();

        if (received != count) {
            state.SkipWithError("Lost events");
            return;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_FormatCountdown(::benchmark::State& state) {
    std::uint32_t seconds = 0;
    for (auto _ : state) {
        auto text = format_countdown(seconds);
        ::benchmark::DoNotOptimize(text);
        seconds = (seconds + 7) % 6000;
    }
}

BENCHMARK(BM_EventChannel_PushPop)->Arg(64)->Arg(1024)->Arg(16384);
BENCHMARK(BM_EventChannel_TickCoalescing)->Arg(60)->Arg(3600);
BENCHMARK(BM_EventChannel_Drain)->Arg(64)->Arg(1024);
BENCHMARK(BM_EventChannel_CrossThread)->Arg(1024)->Arg(16384)->UseRealTime();
BENCHMARK(BM_FormatCountdown);

}  // namespace kcenon::batch_transfer::benchmark

BENCHMARK_MAIN();
