#pragma once

/**
 * @file parley.hpp
 * @brief Main convenience header for Parley
 *
 * Include this single header to get access to all public Parley APIs.
 *
 * Parley is a header-only C++17 library that keeps multi-turn conversation
 * history on top of a stateless chat-completion API.
 *
 * Quick Start:
 * @code
 * #include <parley/parley.hpp>
 *
 * int main() {
 *     parley::Config config;
 *     config.default_model = "gpt-4o-mini";
 *
 *     auto client = parley::Client::create(config, std::make_shared<MyHttpService>());
 *     if (!client) {
 *         std::cerr << "Error: " << client.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     auto id = (*client)->setup(std::nullopt, "You are a helpful assistant.");
 *     auto handle = (*client)->ask(*id, "Hello!");
 *     auto response = handle.future.get();
 *
 *     if (response) {
 *         std::cout << "Assistant: " << response->content << std::endl;
 *     } else {
 *         std::cerr << "Error: " << response.error().to_string() << std::endl;
 *     }
 *
 *     return 0;
 * }
 * @endcode
 *
 * Key Components:
 * - parley::Client: Main entry point (setup, ask, ask_stream, get/delete)
 * - parley::Config: Model defaults, history bounds, error policy
 * - parley::ConversationId: Opaque 128-bit conversation identifier
 * - parley::Message: Conversation turns (System, User, Assistant)
 * - parley::Response: Assistant replies and streamed partials
 * - parley::Error: Structured error handling
 *
 * Thread Safety:
 * - Client owns a worker pool; every public method is thread-safe
 * - Asks on one conversation are serialized, different conversations run in parallel
 */

// Core types
#include "types.hpp"
#include "log.hpp"

// Public API
#include "client.hpp"
#include "response_stream.hpp"
#include "config_loader.hpp"

// Service interface (for custom transports and testing)
#include "service/ICompletionService.hpp"
#include "wire/chat_completion_codec.hpp"

// Engine components (optional, for advanced usage)
#include "engine/history_store.hpp"
#include "engine/history_trimmer.hpp"
#include "engine/request_builder.hpp"
#include "engine/response_assembler.hpp"
#include "engine/conversation_engine.hpp"

/**
 * @namespace parley
 * @brief Main namespace for Parley
 *
 * Internal implementation details are in nested namespaces:
 * - parley::service - Completion service interface
 * - parley::wire - JSON wire codec
 * - parley::engine - Internal engine components
 */
