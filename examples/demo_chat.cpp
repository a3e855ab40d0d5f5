/**
 * Parley Demo Chat Application
 *
 * Interactive CLI demonstrating the Parley conversation client. Replies come
 * from a local echo service that streams the user's words back, so the demo
 * runs without network access or an API key.
 *
 * Usage:
 *   ./demo_chat [options]
 *
 * Options:
 *   --config <path>          JSON configuration file
 *   --model <name>           Model name (default: gpt-3.5-turbo)
 *   --limit <int>            Messages kept per conversation (default: 10)
 *   --expiration <seconds>   Idle time before a conversation expires (default: 3600)
 *   --system <prompt>        System prompt
 *   --no-stream              Disable streaming
 *   --help                   Show this help message
 */

#include "parley/parley.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <optional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

// Global flag for Ctrl+C handling
std::atomic<bool> g_interrupted{false};

// ============================================================================
// Local Echo Service
// ============================================================================

/**
 * @brief Completion service that answers by echoing the last user message
 *
 * Streams one word at a time with a short delay so that cancellation and
 * streaming can be tried out interactively.
 */
class EchoCompletionService : public parley::service::ICompletionService {
public:
    parley::Expected<parley::Completion> complete(
        const parley::ChatRequest& request,
        const parley::CancellationToken& cancel
    ) override {
        std::string reply = make_reply(request);
        for (size_t i = 0; i < words(reply).size(); ++i) {
            if (cancel.is_cancelled()) {
                return tl::unexpected(parley::Error{parley::ErrorCode::RequestCancelled, "Request cancelled"});
            }
            std::this_thread::sleep_for(kWordDelay);
        }

        parley::Completion completion;
        completion.id = "echo-" + std::to_string(++counter_);
        completion.model = request.model;
        completion.created = std::chrono::system_clock::now();
        completion.content = reply;
        completion.finish_reason = "stop";
        completion.usage.prompt_tokens = count_words(request);
        completion.usage.completion_tokens = static_cast<int>(words(reply).size());
        completion.usage.total_tokens = completion.usage.prompt_tokens + completion.usage.completion_tokens;
        return completion;
    }

    parley::Expected<void> complete_stream(
        const parley::ChatRequest& request,
        const ChunkCallback& on_chunk,
        const parley::CancellationToken& cancel
    ) override {
        const std::string id = "echo-" + std::to_string(++counter_);
        const auto pieces = words(make_reply(request));

        for (size_t i = 0; i < pieces.size(); ++i) {
            if (cancel.is_cancelled()) {
                return tl::unexpected(parley::Error{parley::ErrorCode::RequestCancelled, "Request cancelled"});
            }
            std::this_thread::sleep_for(kWordDelay);

            auto chunk = parley::StreamChunk::delta(
                pieces[i],
                i + 1 == pieces.size() ? std::optional<std::string>("stop") : std::nullopt
            );
            chunk.id = id;
            chunk.model = request.model;
            if (!on_chunk(chunk)) {
                return {};
            }
        }
        on_chunk(parley::StreamChunk::end());
        return {};
    }

private:
    static constexpr std::chrono::milliseconds kWordDelay{60};

    static std::string make_reply(const parley::ChatRequest& request) {
        const std::string& last = request.messages.back().content;
        return "You said: \"" + last + "\" (turn " + std::to_string(request.messages.size()) +
               " of the conversation, model " + request.model + ")";
    }

    // Words keep their trailing space so the pieces concatenate to the reply
    static std::vector<std::string> words(const std::string& text) {
        std::vector<std::string> pieces;
        std::string current;
        for (char c : text) {
            current.push_back(c);
            if (c == ' ') {
                pieces.push_back(std::move(current));
                current.clear();
            }
        }
        if (!current.empty()) {
            pieces.push_back(std::move(current));
        }
        return pieces;
    }

    static int count_words(const parley::ChatRequest& request) {
        int total = 0;
        for (const auto& message : request.messages) {
            total += static_cast<int>(words(message.content).size());
        }
        return total;
    }

    std::atomic<int> counter_{0};
};

// ============================================================================
// CLI
// ============================================================================

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_interrupted = true;
    }
}

struct CLIArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> model;
    std::optional<int> limit;
    std::optional<int> expiration_seconds;
    std::string system_prompt = "You are a helpful assistant.";
    bool no_stream = false;
    bool help = false;
    bool bad_args = false;
};

void print_usage(const char* program_name) {
    std::cout << "Parley Demo Chat Application\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>          JSON configuration file\n";
    std::cout << "  --model <name>           Model name (default: gpt-3.5-turbo)\n";
    std::cout << "  --limit <int>            Messages kept per conversation (default: 10)\n";
    std::cout << "  --expiration <seconds>   Idle time before a conversation expires (default: 3600)\n";
    std::cout << "  --system <prompt>        System prompt\n";
    std::cout << "  --no-stream              Disable streaming\n";
    std::cout << "  --help                   Show this help message\n\n";
    std::cout << "Interactive Commands:\n";
    std::cout << "  /quit, /exit    Exit the application\n";
    std::cout << "  /new            Start a new conversation\n";
    std::cout << "  /history        Show the retained history\n";
    std::cout << "  /help           Show available commands\n";
    std::cout << "  Ctrl+C          Cancel the current reply\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help") {
                args.help = true;
                return args;
            }
            else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            }
            else if (arg == "--model" && i + 1 < argc) {
                args.model = argv[++i];
            }
            else if (arg == "--limit" && i + 1 < argc) {
                args.limit = std::stoi(argv[++i]);
            }
            else if (arg == "--expiration" && i + 1 < argc) {
                args.expiration_seconds = std::stoi(argv[++i]);
            }
            else if (arg == "--system" && i + 1 < argc) {
                args.system_prompt = argv[++i];
            }
            else if (arg == "--no-stream") {
                args.no_stream = true;
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                args.bad_args = true;
                return args;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << "\n";
            args.bad_args = true;
            return args;
        }
    }

    return args;
}

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

void print_metrics(const parley::Response& response, bool streamed) {
    std::cout << "\n";
    print_separator();
    std::cout << "  Tokens: " << response.usage.prompt_tokens << " prompt + "
              << response.usage.completion_tokens << " completion = "
              << response.usage.total_tokens << " total\n";
    std::cout << "  Latency: " << response.metrics.latency_ms.count() << " ms\n";
    if (streamed) {
        std::cout << "  Time to first delta: " << response.metrics.time_to_first_delta_ms.count() << " ms\n";
    }
    print_separator();
}

void print_welcome(const parley::Config& config, const std::string& system_prompt, bool streaming) {
    std::cout << "\n";
    print_separator();
    std::cout << "Parley Demo Chat\n";
    print_separator();
    std::cout << "Model: " << config.default_model << "\n";
    std::cout << "Message Limit: " << config.message_limit << "\n";
    std::cout << "Expiration: " << config.message_expiration.count() << " s\n";
    std::cout << "System Prompt: " << system_prompt << "\n";
    std::cout << "Streaming: " << (streaming ? "enabled" : "disabled") << "\n";
    print_separator();
    std::cout << "\nType your message and press Enter. Type '/quit' to exit.\n";
    std::cout << "Type '/help' for available commands.\n";
}

// Returns false when the reply was cancelled
bool run_stream(parley::Client& client, const parley::ConversationId& id, const std::string& line) {
    auto stream = client.ask_stream(id, line);
    std::optional<parley::Response> last;

    while (auto item = stream.next()) {
        if (g_interrupted) {
            stream.cancel();
        }
        if (!item->has_value()) {
            if ((*item).error().code == parley::ErrorCode::RequestCancelled) {
                std::cout << "\n[Reply cancelled]\n";
                return false;
            }
            std::cerr << "\nError: " << (*item).error().to_string() << "\n";
            return true;
        }
        std::cout << (*item)->content << std::flush;
        last = std::move(**item);
    }

    if (last) {
        print_metrics(*last, true);
    }
    return true;
}

bool run_ask(parley::Client& client, const parley::ConversationId& id, const std::string& line) {
    auto handle = client.ask(id, line);

    while (handle.future.wait_for(std::chrono::milliseconds(100)) == std::future_status::timeout) {
        if (g_interrupted) {
            client.cancel(handle.id);
        }
    }

    auto result = handle.future.get();
    if (!result) {
        if (result.error().code == parley::ErrorCode::RequestCancelled) {
            std::cout << "[Reply cancelled]\n";
            return false;
        }
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return true;
    }

    std::cout << result->content << "\n";
    print_metrics(*result, false);
    return true;
}

int main(int argc, char** argv) {
    CLIArgs args = parse_args(argc, argv);

    if (args.help || args.bad_args) {
        print_usage(argv[0]);
        return args.bad_args ? 1 : 0;
    }

    std::signal(SIGINT, signal_handler);

    // Build parley::Config from the file, then apply CLI overrides
    parley::Config config;
    if (args.config_path) {
        auto loaded = parley::load_config_file(*args.config_path);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().to_string() << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }
    if (args.model) {
        config.default_model = *args.model;
    }
    if (args.limit) {
        config.message_limit = *args.limit;
    }
    if (args.expiration_seconds) {
        config.message_expiration = std::chrono::seconds(*args.expiration_seconds);
    }

    auto client_result = parley::Client::create(config, std::make_shared<EchoCompletionService>());
    if (!client_result) {
        std::cerr << "Error: " << client_result.error().to_string() << "\n";
        return 1;
    }
    auto client = std::move(*client_result);

    auto conversation = client->setup(std::nullopt, args.system_prompt);
    if (!conversation) {
        std::cerr << "Error: " << conversation.error().to_string() << "\n";
        return 1;
    }
    parley::ConversationId id = *conversation;

    print_welcome(config, args.system_prompt, !args.no_stream);
    std::cout << "Conversation: " << id.to_string() << "\n";

    std::string line;
    while (true) {
        std::cout << "\nYou: ";
        std::cout.flush();

        if (!std::getline(std::cin, line)) {
            break;  // EOF or error
        }
        g_interrupted = false;

        // Trim whitespace
        line.erase(0, line.find_first_not_of(" \t\n\r"));
        line.erase(line.find_last_not_of(" \t\n\r") + 1);

        if (line.empty()) {
            continue;
        }

        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                std::cout << "Goodbye!\n";
                break;
            }
            else if (line == "/new") {
                client->delete_conversation(id);
                auto fresh = client->setup(std::nullopt, args.system_prompt);
                if (!fresh) {
                    std::cerr << "Error: " << fresh.error().to_string() << "\n";
                    continue;
                }
                id = *fresh;
                std::cout << "Started conversation " << id.to_string() << "\n";
                continue;
            }
            else if (line == "/history") {
                for (const auto& message : client->get_conversation(id)) {
                    std::cout << "  [" << parley::role_to_string(message.role) << "] " << message.content << "\n";
                }
                continue;
            }
            else if (line == "/help") {
                std::cout << "\nAvailable commands:\n";
                std::cout << "  /quit, /exit    Exit the application\n";
                std::cout << "  /new            Start a new conversation\n";
                std::cout << "  /history        Show the retained history\n";
                std::cout << "  /help           Show this help\n";
                continue;
            }
            else {
                std::cout << "Unknown command: " << line << "\n";
                std::cout << "Type '/help' for available commands.\n";
                continue;
            }
        }

        std::cout << "\nAssistant: ";
        std::cout.flush();

        if (args.no_stream) {
            run_ask(*client, id, line);
        } else {
            run_stream(*client, id, line);
        }
    }

    client->stop();
    std::cout << "\n";
    return 0;
}
