// bench/throughput_latency.cpp
// AgentBox Performance Benchmarks
//
// Mailbox throughput, agent post throughput under producer contention,
// and PostAndReply round-trip latency.

#include <benchmark/benchmark.h>
#include <agentbox/agentbox.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>

// Throughput: raw mailbox, one producer, one consumer thread
// Measures messages per second for bounded and unbounded mailboxes
// (range 0 = capacity, 0 meaning unbounded)
static void BM_Mailbox_Throughput(benchmark::State& state) {
    agentbox::MailboxConfig config;
    if (state.range(0) > 0) {
        config.capacity = static_cast<size_t>(state.range(0));
    }
    agentbox::Mailbox<uint64_t> mailbox(config);

    // Consumer thread - runs until the mailbox is stopped
    std::thread consumer([&]() {
        while (true) {
            auto [result, value] = mailbox.Receive();
            if (result != agentbox::ReceiveResult::Success) {
                break;
            }
            benchmark::DoNotOptimize(*value);
        }
    });

    // Producer - benchmark loop
    uint64_t n = 0;
    for (auto _ : state) {
        if (mailbox.Post(n++) != agentbox::PostResult::Success) {
            state.SkipWithError("Post failed");
            break;
        }
    }

    mailbox.Stop();
    consumer.join();

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Mailbox_Throughput)
    ->Arg(0)
    ->Arg(64)
    ->Arg(1024)
    ->Unit(benchmark::kMicrosecond);

// Throughput: several benchmark threads posting into one agent
static void BM_Agent_PostContended(benchmark::State& state) {
    static agentbox::Agent<uint64_t>* agent = nullptr;

    if (state.thread_index() == 0) {
        agentbox::SetLogLevel(spdlog::level::warn);
        agentbox::AgentConfig config;
        config.name = "bench-sink";
        config.mailbox.capacity = 4096;
        agent = new agentbox::Agent<uint64_t>([](agentbox::Agent<uint64_t>& self) {
            while (true) {
                auto [result, value] = self.Receive();
                if (result != agentbox::ReceiveResult::Success) {
                    return;
                }
                benchmark::DoNotOptimize(*value);
            }
        }, config);
        agent->Start();
    }

    uint64_t n = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(agent->Post(n++));
    }
    state.SetItemsProcessed(state.iterations());

    if (state.thread_index() == 0) {
        agent->Stop();
        delete agent;
        agent = nullptr;
    }
}

BENCHMARK(BM_Agent_PostContended)
    ->Threads(1)
    ->Threads(2)
    ->Threads(4)
    ->Unit(benchmark::kMicrosecond);

struct Ping {
    uint64_t value;
    agentbox::ReplyChannel<uint64_t> reply;
};

// Latency: PostAndReply round trip through an echo agent
static void BM_Latency_PostAndReply(benchmark::State& state) {
    agentbox::SetLogLevel(spdlog::level::warn);

    agentbox::Agent<Ping> echo([](agentbox::Agent<Ping>& self) {
        while (true) {
            auto [result, ping] = self.Receive();
            if (result != agentbox::ReceiveResult::Success) {
                return;
            }
            ping->reply.Reply(ping->value);
        }
    });

    if (echo.Start() != agentbox::StartResult::Success) {
        state.SkipWithError("Failed to start echo agent");
        return;
    }

    uint64_t n = 0;
    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto [result, value] = echo.PostAndReply<uint64_t>(
            [&n](agentbox::ReplyChannel<uint64_t> reply) { return Ping{n++, std::move(reply)}; },
            agentbox::kNoTimeout);

        auto end = std::chrono::high_resolution_clock::now();

        if (result != agentbox::ReplyResult::Success) {
            state.SkipWithError("Reply failed");
            break;
        }
        benchmark::DoNotOptimize(value);

        auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
        state.SetIterationTime(elapsed.count() / 1e9);
    }

    echo.Stop();
}

BENCHMARK(BM_Latency_PostAndReply)
    ->UseManualTime()
    ->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();
