// examples/basic_usage.cpp
/**
 * @file basic_usage.cpp
 * @brief Simple demonstration of AgentBox core features
 *
 * This example shows:
 * - Creating an agent with a configuration
 * - Subscribing to body faults
 * - Starting the agent and handling the start result
 * - Posting messages from several threads
 * - Clean shutdown
 */

#include <agentbox/agentbox.hpp>
#include <iostream>
#include <thread>
#include <string>
#include <vector>
#include <chrono>

int main() {
    std::cout << "=== AgentBox Basic Usage Example ===\n\n";

    agentbox::InitLogger();

    // Step 1: Describe the agent
    // The name shows up in log lines; the mailbox is unbounded by default
    agentbox::AgentConfig config;
    config.name = "printer";

    // Step 2: Create the agent with its body
    // The body runs on the shared thread pool and drains the mailbox until
    // Receive() reports a failure
    agentbox::Agent<std::string> printer([](agentbox::Agent<std::string>& self) {
        std::cout << "[Agent] Started, waiting for messages...\n";

        int count = 0;
        while (true) {
            auto [result, message] = self.Receive();
            if (result != agentbox::ReceiveResult::Success) {
                std::cout << "[Agent] Receive returned "
                          << agentbox::ToString(result) << ", leaving\n";
                break;
            }
            std::cout << "[Agent] Message " << ++count << ": " << *message << "\n";
        }
    }, config);
    std::cout << "Step 1-2: Agent '" << printer.Name() << "' created\n";

    // Step 3: Observe faults escaping the body
    auto errors = printer.Errors().SubscribeScoped([](const std::exception_ptr& error) {
        std::cerr << "[Errors] " << agentbox::Describe(error) << "\n";
    });

    // Step 4: Start it
    auto started = printer.Start();
    if (started != agentbox::StartResult::Success) {
        std::cerr << "Error: could not start agent: " << agentbox::ToString(started) << "\n";
        return 1;
    }
    std::cout << "Step 3-4: Agent running\n\n";

    // Step 5: Post from two producer threads
    // Messages from one producer arrive in the order it posted them
    std::vector<std::thread> producers;
    for (int p = 0; p < 2; ++p) {
        producers.emplace_back([&printer, p]() {
            for (int i = 0; i < 5; ++i) {
                std::string message = "hello #" + std::to_string(i + 1)
                    + " from producer " + std::to_string(p);

                auto result = printer.Post(std::move(message));
                if (result != agentbox::PostResult::Success) {
                    std::cout << "[Producer " << p << "] Post failed: "
                              << agentbox::ToString(result) << "\n";
                    break;
                }

                // Small delay between messages for readability
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        });
    }

    for (auto& t : producers) {
        t.join();
    }

    // Let the agent drain what is left
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // Step 6: Stop
    // Stop() closes the mailbox and waits for the body to return
    std::cout << "\n=== Cleanup ===\n";
    printer.Stop();

    // Further posts are rejected
    std::cout << "Post after stop: "
              << agentbox::ToString(printer.Post("too late")) << "\n";

    // Display final statistics
    auto stats = printer.GetStats();
    std::cout << "\nAgent Statistics:\n";
    std::cout << "  Starts: " << stats.starts << "\n";
    std::cout << "  Messages posted: " << stats.mailbox.messages_posted << "\n";
    std::cout << "  Messages received: " << stats.mailbox.messages_received << "\n";
    std::cout << "  Failed posts: " << stats.mailbox.failed_posts << "\n";
    std::cout << "  Body faults: " << stats.body_faults << "\n";

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
