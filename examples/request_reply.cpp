// examples/request_reply.cpp
/**
 * @file request_reply.cpp
 * @brief Request/response over an agent with PostAndReply
 *
 * This example shows:
 * - Carrying a ReplyChannel inside the message
 * - Waiting for an answer with and without a timeout
 * - Cancelling every agent at once through a shared stop token
 */

#include <agentbox/agentbox.hpp>
#include <iostream>
#include <string>
#include <chrono>
#include <stop_token>
#include <thread>

namespace {

struct Question {
    std::string text;
    agentbox::ReplyChannel<std::string> reply;
};

void Answer(agentbox::Agent<Question>& self) {
    while (true) {
        auto [result, question] = self.Receive();
        if (result != agentbox::ReceiveResult::Success) {
            return;
        }

        if (question->text == "slow") {
            // Too slow for a short deadline
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        question->reply.Reply("you asked: " + question->text);
    }
}

} // namespace

int main() {
    std::cout << "=== AgentBox Request/Reply Example ===\n\n";

    std::stop_source shutdown;

    agentbox::AgentConfig config;
    config.name = "oracle";
    config.default_reply_timeout = std::chrono::seconds(1);

    auto started = agentbox::StartAgent<Question>(Answer, config, shutdown.get_token());
    if (started.first != agentbox::StartResult::Success) {
        std::cerr << "Failed to start: " << agentbox::ToString(started.first) << "\n";
        return 1;
    }
    auto& oracle = started.second;

    auto ask = [&oracle](const std::string& text, std::chrono::milliseconds timeout) {
        auto [result, answer] = oracle->PostAndReply<std::string>(
            [&text](agentbox::ReplyChannel<std::string> reply) {
                return Question{text, std::move(reply)};
            }, timeout);

        std::cout << "ask(\"" << text << "\") -> " << agentbox::ToString(result);
        if (answer) {
            std::cout << ": " << *answer;
        }
        std::cout << "\n";
    };

    ask("ping", oracle->GetDefaultReplyTimeout());
    ask("slow", std::chrono::milliseconds(50));
    ask("pong", agentbox::kNoTimeout);

    // Cancelling the shared token stops the agent; later requests are Cancelled
    shutdown.request_stop();
    ask("after shutdown", std::chrono::milliseconds(100));

    std::cout << "\nReplies timed out: " << oracle->GetStats().replies_timed_out << "\n";
    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
