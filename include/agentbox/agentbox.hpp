#pragma once

/**
 * @file agentbox.hpp
 * @brief AgentBox public API - single include for the entire library
 *
 * This is the main entry point for using AgentBox. Include this header
 * to access all public types and functions.
 *
 * @example
 * @code
 * #include <agentbox/agentbox.hpp>
 *
 * auto [result, agent] = agentbox::StartAgent<int>([](auto& self) {
 *     while (true) {
 *         auto [status, value] = self.Receive();
 *         if (status != agentbox::ReceiveResult::Success) {
 *             return;
 *         }
 *         // handle *value
 *     }
 * });
 * @endcode
 */

#include "agentbox/detail/config.hpp"
#include "agentbox/errors.hpp"
#include "agentbox/logger.hpp"
#include "agentbox/thread_pool.hpp"
#include "agentbox/mailbox.hpp"
#include "agentbox/event_stream.hpp"
#include "agentbox/reply_channel.hpp"
#include "agentbox/agent.hpp"
