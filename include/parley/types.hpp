#pragma once

#include "log.hpp"
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>
#include <tl/expected.hpp>

namespace parley {

// ============================================================================
// Message Types
// ============================================================================

/**
 * @brief Message role in conversation flow
 */
enum class Role {
    System,     ///< Instructions that frame assistant behavior for the whole conversation
    User,       ///< Input from the end user
    Assistant   ///< Reply produced by the completion service
};

[[nodiscard]] inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "unknown";
}

inline std::optional<Role> role_from_string(std::string_view name) {
    if (name == "system") return Role::System;
    if (name == "user") return Role::User;
    if (name == "assistant") return Role::Assistant;
    return std::nullopt;
}

/**
 * @brief Single turn in a conversation
 *
 * Value type. The history store hands out copies, so a stored message is
 * never modified after it has been appended.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Message {
    Role role;                                         ///< Message role (system/user/assistant)
    std::string content;                               ///< Text content of the message
    std::chrono::system_clock::time_point timestamp;   ///< Wall-clock creation time

    // Factory methods
    static Message system(std::string content) {
        return Message{Role::System, std::move(content), std::chrono::system_clock::now()};
    }

    static Message user(std::string content) {
        return Message{Role::User, std::move(content), std::chrono::system_clock::now()};
    }

    static Message assistant(std::string content) {
        return Message{Role::Assistant, std::move(content), std::chrono::system_clock::now()};
    }

    // Equality for testing (timestamps are ignored)
    bool operator==(const Message& other) const {
        return role == other.role && content == other.content;
    }

    bool operator!=(const Message& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * - 100-199: Caller and configuration errors
 * - 200-299: Upstream completion service errors
 * - 300-399: Conversation cache errors
 * - 400-499: Runtime/request errors
 */
enum class ErrorCode {
    // Caller errors (100-199)
    InvalidArgument = 100,
    InvalidConversationId = 101,
    InvalidConfig = 102,

    // Upstream errors (200-299)
    UpstreamError = 200,
    UpstreamNetwork = 201,
    UpstreamAuthentication = 202,
    UpstreamRateLimited = 203,
    UpstreamServer = 204,
    UpstreamMalformedResponse = 205,
    StreamInterrupted = 206,

    // Cache errors (300-399)
    CacheStateError = 300,

    // Runtime errors (400-499)
    ClientNotRunning = 400,
    RequestCancelled = 401,
    QueueFull = 402,

    // Unknown
    Unknown = 999
};

/// True for every code reported by, or on behalf of, the completion service.
[[nodiscard]] inline bool is_upstream_error(ErrorCode code) {
    const int value = static_cast<int>(code);
    return value >= 200 && value < 300;
}

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type representing a library error. Used with tl::expected for
 * composable error handling without exceptions.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (upstream error type, HTTP status, ...)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message && context == other.context;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Conversation Identifier
// ============================================================================

/**
 * @brief Opaque 128-bit conversation identifier
 *
 * Generated ids are random version 4 UUIDs and therefore never nil. The
 * default-constructed (nil) id is treated as malformed by every operation
 * that accepts an id.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
class ConversationId {
public:
    ConversationId() : bytes_{} {}

    /**
     * @brief Create a fresh random identifier
     */
    static ConversationId generate() {
        thread_local std::mt19937_64 engine = [] {
            std::random_device device;
            std::seed_seq seed{device(), device(), device(), device()};
            return std::mt19937_64(seed);
        }();

        ConversationId id;
        const uint64_t high = engine();
        const uint64_t low = engine();
        for (size_t i = 0; i < 8; ++i) {
            id.bytes_[i] = static_cast<uint8_t>(high >> (56 - 8 * i));
            id.bytes_[8 + i] = static_cast<uint8_t>(low >> (56 - 8 * i));
        }
        id.bytes_[6] = static_cast<uint8_t>((id.bytes_[6] & 0x0F) | 0x40);  // version 4
        id.bytes_[8] = static_cast<uint8_t>((id.bytes_[8] & 0x3F) | 0x80);  // RFC 4122 variant
        return id;
    }

    /**
     * @brief Parse the canonical 8-4-4-4-12 hex form (case-insensitive)
     *
     * @return Expected<ConversationId> Parsed id, or InvalidConversationId for
     *         malformed text and for the nil id
     */
    static Expected<ConversationId> parse(std::string_view text) {
        if (text.size() != 36) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConversationId,
                "Conversation id must be 36 characters",
                std::string(text)
            });
        }

        ConversationId id;
        size_t byte_index = 0;
        for (size_t i = 0; i < text.size();) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (text[i] != '-') {
                    return tl::unexpected(Error{
                        ErrorCode::InvalidConversationId,
                        "Conversation id has a misplaced separator",
                        std::string(text)
                    });
                }
                ++i;
                continue;
            }
            const int hi = hex_value(text[i]);
            const int lo = hex_value(text[i + 1]);
            if (hi < 0 || lo < 0) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidConversationId,
                    "Conversation id contains a non-hex character",
                    std::string(text)
                });
            }
            id.bytes_[byte_index++] = static_cast<uint8_t>((hi << 4) | lo);
            i += 2;
        }

        if (id.is_nil()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConversationId,
                "Nil conversation id is not allowed"
            });
        }
        return id;
    }

    bool is_nil() const {
        for (uint8_t b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    std::string to_string() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes_.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out.push_back('-');
            }
            out.push_back(digits[bytes_[i] >> 4]);
            out.push_back(digits[bytes_[i] & 0x0F]);
        }
        return out;
    }

    const std::array<uint8_t, 16>& bytes() const { return bytes_; }

    bool operator==(const ConversationId& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const ConversationId& other) const { return bytes_ != other.bytes_; }
    bool operator<(const ConversationId& other) const { return bytes_ < other.bytes_; }

private:
    static int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
        return -1;
    }

    std::array<uint8_t, 16> bytes_;
};

// ============================================================================
// Generation Parameters
// ============================================================================

/**
 * @brief Overridable generation knobs sent with every completion request
 *
 * Every field is optional. Config::default_parameters supplies process-wide
 * values and a per-call override replaces them field by field; a field left
 * unset in both is omitted from the request so the upstream default applies.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct ChatParameters {
    std::optional<double> temperature;            ///< Sampling temperature (0.0 - 2.0)
    std::optional<double> top_p;                  ///< Nucleus sampling threshold
    std::optional<int> max_tokens;                ///< Upper bound on generated tokens
    std::optional<double> presence_penalty;       ///< Penalty for tokens already present
    std::optional<double> frequency_penalty;      ///< Penalty proportional to token frequency
    std::optional<std::vector<std::string>> stop; ///< Stop sequences
    std::optional<std::string> user;              ///< End-user identifier forwarded upstream

    bool operator==(const ChatParameters& other) const {
        return temperature == other.temperature &&
               top_p == other.top_p &&
               max_tokens == other.max_tokens &&
               presence_penalty == other.presence_penalty &&
               frequency_penalty == other.frequency_penalty &&
               stop == other.stop &&
               user == other.user;
    }

    bool operator!=(const ChatParameters& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Client Configuration
// ============================================================================

/**
 * @brief Complete configuration for Client initialization
 *
 * Value type. Validated by Client::create() and treated as an immutable
 * snapshot afterwards.
 *
 * @threadsafety Safe to copy and pass by value across threads (excluding callbacks)
 */
struct Config {
    // Upstream account (passed through to whoever owns the completion service)
    std::string api_key;                                     ///< API key for the completion service
    std::optional<std::string> organization;                 ///< Optional organization id

    // Request defaults
    std::string default_model = "gpt-3.5-turbo";             ///< Model used when a call does not name one
    ChatParameters default_parameters;                       ///< Defaults merged under per-call overrides

    // Conversation cache
    int message_limit = 10;                                  ///< Maximum retained messages per conversation (>= 1)
    std::chrono::seconds message_expiration = std::chrono::hours(1); ///< Idle time after which a conversation is dropped

    // Error policy
    bool throw_on_error = true;                              ///< false: upstream failures become degraded responses

    // Execution
    int worker_threads = 4;                                  ///< Threads servicing ask/ask_stream (>= 1)
    size_t request_queue_capacity = 0;                       ///< Maximum pending requests (0 = unlimited)

    // Logging
    LogLevel log_level = LogLevel::Warn;                     ///< Minimum level forwarded to the sink
    std::optional<LogCallback> on_log;                       ///< Custom sink (stderr when unset)

    // Validation
    Expected<void> validate() const {
        if (default_model.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "default_model cannot be empty"});
        }
        if (message_limit < 1) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "message_limit must be at least 1"});
        }
        if (message_expiration.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "message_expiration must be positive"});
        }
        if (message_expiration > max_message_expiration()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                "message_expiration is too large",
                "max_seconds=" + std::to_string(max_message_expiration().count())
            });
        }
        if (worker_threads < 1) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "worker_threads must be at least 1"});
        }
        return {};
    }

    /**
     * @brief Largest expiration the steady clock can represent
     */
    static constexpr std::chrono::seconds max_message_expiration() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::duration::max());
    }

    Logger make_logger() const {
        return Logger(log_level, on_log);
    }

    // Equality for testing (excluding callbacks)
    bool operator==(const Config& other) const {
        return api_key == other.api_key &&
               organization == other.organization &&
               default_model == other.default_model &&
               default_parameters == other.default_parameters &&
               message_limit == other.message_limit &&
               message_expiration == other.message_expiration &&
               throw_on_error == other.throw_on_error &&
               worker_threads == other.worker_threads &&
               request_queue_capacity == other.request_queue_capacity &&
               log_level == other.log_level;
    }

    bool operator!=(const Config& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Upstream Exchange Types
// ============================================================================

/**
 * @brief Fully resolved request handed to the completion service
 */
struct ChatRequest {
    std::string model;                 ///< Resolved model identifier
    std::vector<Message> messages;     ///< History followed by the new user turn
    ChatParameters parameters;         ///< Defaults merged with the per-call override
    bool stream = false;               ///< True when deltas are requested

    bool operator==(const ChatRequest& other) const {
        return model == other.model &&
               messages == other.messages &&
               parameters == other.parameters &&
               stream == other.stream;
    }

    bool operator!=(const ChatRequest& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Token usage as reported by the completion service
 *
 * Passed through untouched; the library never counts tokens itself.
 */
struct Usage {
    int prompt_tokens = 0;
    int completion_tokens = 0;
    int total_tokens = 0;

    bool operator==(const Usage& other) const {
        return prompt_tokens == other.prompt_tokens &&
               completion_tokens == other.completion_tokens &&
               total_tokens == other.total_tokens;
    }

    bool operator!=(const Usage& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Single-shot result of ICompletionService::complete()
 */
struct Completion {
    std::string id;                                     ///< Upstream completion id
    std::string model;                                  ///< Model that produced the reply
    std::chrono::system_clock::time_point created;      ///< Upstream creation time
    std::string content;                                ///< Assistant message text
    std::optional<std::string> finish_reason;           ///< "stop", "length", ...
    Usage usage;                                        ///< Upstream-reported usage
};

/**
 * @brief One item of a streamed completion
 *
 * A stream is a sequence of Delta chunks terminated by exactly one End
 * chunk. A stream that stops before End is incomplete.
 */
struct StreamChunk {
    enum class Kind {
        Delta,   ///< Incremental fragment of the assistant message
        End      ///< Explicit end-of-stream marker
    };

    Kind kind = Kind::Delta;
    std::string id;                                     ///< Upstream completion id
    std::string model;                                  ///< Model that produced the fragment
    std::string content;                                ///< Fragment text (may be empty)
    std::optional<std::string> finish_reason;           ///< Set on the last delta of a choice

    static StreamChunk delta(std::string content, std::optional<std::string> finish_reason = std::nullopt) {
        StreamChunk chunk;
        chunk.kind = Kind::Delta;
        chunk.content = std::move(content);
        chunk.finish_reason = std::move(finish_reason);
        return chunk;
    }

    static StreamChunk end() {
        StreamChunk chunk;
        chunk.kind = Kind::End;
        return chunk;
    }

    bool is_end() const { return kind == Kind::End; }

    bool operator==(const StreamChunk& other) const {
        return kind == other.kind &&
               id == other.id &&
               model == other.model &&
               content == other.content &&
               finish_reason == other.finish_reason;
    }

    bool operator!=(const StreamChunk& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Response Types
// ============================================================================

/**
 * @brief Timing measured by the engine for a single request
 */
struct Metrics {
    std::chrono::milliseconds latency_ms{0};             ///< Dispatch to completion
    std::chrono::milliseconds time_to_first_delta_ms{0}; ///< Dispatch to first streamed delta

    bool operator==(const Metrics& other) const {
        return latency_ms == other.latency_ms &&
               time_to_first_delta_ms == other.time_to_first_delta_ms;
    }

    bool operator!=(const Metrics& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Result of ask(), or one partial result of ask_stream()
 *
 * For a streamed partial, content holds only that delta's fragment. A
 * degraded response (Config::throw_on_error == false) has error set and
 * empty content.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Response {
    ConversationId conversation_id;                     ///< Conversation the turn belongs to
    std::string id;                                     ///< Upstream completion id
    std::string model;                                  ///< Model that produced the reply
    Role role = Role::Assistant;                        ///< Always Assistant for replies
    std::string content;                                ///< Message text or delta fragment
    std::optional<std::string> finish_reason;           ///< Upstream finish reason when known
    Usage usage;                                        ///< Upstream-reported usage
    Metrics metrics;                                    ///< Engine timing data
    std::chrono::system_clock::time_point created;      ///< Upstream creation time
    std::optional<Error> error;                         ///< Set only on degraded responses

    bool is_successful() const { return !error.has_value(); }

    bool operator==(const Response& other) const {
        return conversation_id == other.conversation_id &&
               id == other.id &&
               model == other.model &&
               role == other.role &&
               content == other.content &&
               finish_reason == other.finish_reason &&
               usage == other.usage &&
               metrics == other.metrics &&
               created == other.created &&
               error == other.error;
    }

    bool operator!=(const Response& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Request Types
// ============================================================================

/// Unique identifier for an ask()/ask_stream() call, used for cancellation.
using RequestId = uint64_t;

/**
 * @brief Shared cancellation flag threaded through every suspending call
 *
 * Copies observe the same flag. Cancelling is one-way.
 */
class CancellationToken {
public:
    CancellationToken()
        : flag_(std::make_shared<std::atomic<bool>>(false))
    {}

    void cancel() const {
        flag_->store(true, std::memory_order_release);
    }

    bool is_cancelled() const {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Handle returned from Client::ask()
 *
 * Carries the request id (for Client::cancel()), the resolved conversation
 * id and the future for the response.
 */
struct RequestHandle {
    RequestId id;                                 ///< Unique request identifier
    ConversationId conversation_id;               ///< Resolved (possibly generated) conversation id
    std::future<Expected<Response>> future;       ///< Future for the response

    // Move-only (std::future is not copyable)
    RequestHandle() : id(0) {}
    RequestHandle(RequestId id, ConversationId conversation_id, std::future<Expected<Response>> future)
        : id(id), conversation_id(conversation_id), future(std::move(future)) {}
    RequestHandle(RequestHandle&&) = default;
    RequestHandle& operator=(RequestHandle&&) = default;
    RequestHandle(const RequestHandle&) = delete;
    RequestHandle& operator=(const RequestHandle&) = delete;
};

} // namespace parley

namespace std {

template<>
struct hash<parley::ConversationId> {
    size_t operator()(const parley::ConversationId& id) const noexcept {
        uint64_t high = 0;
        uint64_t low = 0;
        std::memcpy(&high, id.bytes().data(), sizeof(high));
        std::memcpy(&low, id.bytes().data() + 8, sizeof(low));
        return std::hash<uint64_t>{}(high ^ (low * 0x9E3779B97F4A7C15ULL));
    }
};

} // namespace std
