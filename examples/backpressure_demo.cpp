// examples/backpressure_demo.cpp
/**
 * @file backpressure_demo.cpp
 * @brief Demonstrates backpressure with a bounded mailbox
 *
 * This example shows:
 * - What happens when the mailbox fills up
 * - Producer handling QueueFull from TryPost()
 * - Different strategies: dropping, blocking with a timeout
 * - Monitoring mailbox saturation
 */

#include <agentbox/agentbox.hpp>
#include <iostream>
#include <thread>
#include <string>
#include <chrono>
#include <atomic>

int main() {
    std::cout << "=== AgentBox Backpressure Demo ===\n\n";

    agentbox::SetLogLevel(spdlog::level::warn);

    // SMALL mailbox to demonstrate saturation quickly
    agentbox::AgentConfig config;
    config.name = "slow-consumer";
    config.mailbox.capacity = 8;

    std::atomic<int> messages_received{0};

    // SLOW CONSUMER - simulates processing delay
    agentbox::Agent<int> consumer([&messages_received](agentbox::Agent<int>& self) {
        std::cout << "[Consumer] Started (SLOW - 50ms per message)\n\n";
        while (true) {
            auto [result, value] = self.Receive();
            if (result != agentbox::ReceiveResult::Success) {
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            messages_received.fetch_add(1);
        }
    }, config);

    if (consumer.Start() != agentbox::StartResult::Success) {
        std::cerr << "Failed to start consumer\n";
        return 1;
    }

    std::cout << "Mailbox created with capacity=" << *consumer.GetConfig().mailbox.capacity
              << " (small buffer)\n\n";

    // Strategy 1: Drop when full
    std::cout << "--- Strategy 1: TryPost and drop on QueueFull ---\n";
    int sent = 0;
    int dropped = 0;
    for (int i = 0; i < 30; ++i) {
        auto result = consumer.TryPost(i);
        if (result == agentbox::PostResult::Success) {
            ++sent;
        } else if (result == agentbox::PostResult::QueueFull) {
            ++dropped;
            std::cout << "[Producer] Message " << i << " dropped (pending: "
                      << consumer.PendingMessages() << ")\n";
        } else {
            std::cout << "[Producer] Unexpected: " << agentbox::ToString(result) << "\n";
            break;
        }
    }
    std::cout << "Sent " << sent << ", dropped " << dropped << "\n\n";

    // Strategy 2: Block, but give up after a deadline
    std::cout << "--- Strategy 2: Post with a 20ms timeout ---\n";
    int timed_out = 0;
    for (int i = 0; i < 10; ++i) {
        auto result = consumer.Post(100 + i, std::chrono::milliseconds(20));
        if (result == agentbox::PostResult::Timeout) {
            ++timed_out;
        }
    }
    std::cout << "Timed out " << timed_out << " of 10 posts\n\n";

    // Strategy 3: Block until space frees up
    std::cout << "--- Strategy 3: Post and wait ---\n";
    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 10; ++i) {
        if (consumer.Post(200 + i) != agentbox::PostResult::Success) {
            std::cout << "[Producer] Post failed\n";
            break;
        }
    }
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    std::cout << "All 10 posted after waiting " << waited.count() << "ms\n\n";

    // Let the consumer drain
    while (consumer.PendingMessages() > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    consumer.Stop();

    auto stats = consumer.GetStats();
    std::cout << "=== Results ===\n";
    std::cout << "  Received: " << messages_received.load() << "\n";
    std::cout << "  Posted: " << stats.mailbox.messages_posted << "\n";
    std::cout << "  Failed posts: " << stats.mailbox.failed_posts << "\n";

    std::cout << "\n=== Demo Complete ===\n";
    return 0;
}
