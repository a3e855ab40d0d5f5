#pragma once

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace parley {
namespace wire {

/**
 * @brief Codec for the OpenAI-style chat-completion JSON format
 *
 * Translates ChatRequest into a request body and response bodies (whole or
 * server-sent-event lines) into Completion / StreamChunk. Transports
 * implementing service::ICompletionService share it so that status and error
 * mapping is identical everywhere.
 *
 * All methods are static and stateless.
 */
class ChatCompletionCodec {
public:
    // ========================================================================
    // Encoding
    // ========================================================================

    static nlohmann::json to_json(const ChatRequest& request) {
        nlohmann::json j;
        j["model"] = request.model;

        nlohmann::json messages = nlohmann::json::array();
        for (const auto& message : request.messages) {
            messages.push_back({
                {"role", role_to_string(message.role)},
                {"content", message.content}
            });
        }
        j["messages"] = std::move(messages);

        const ChatParameters& p = request.parameters;
        if (p.temperature) j["temperature"] = *p.temperature;
        if (p.top_p) j["top_p"] = *p.top_p;
        if (p.max_tokens) j["max_tokens"] = *p.max_tokens;
        if (p.presence_penalty) j["presence_penalty"] = *p.presence_penalty;
        if (p.frequency_penalty) j["frequency_penalty"] = *p.frequency_penalty;
        if (p.stop) j["stop"] = *p.stop;
        if (p.user) j["user"] = *p.user;

        if (request.stream) {
            j["stream"] = true;
        }
        return j;
    }

    static std::string encode_request(const ChatRequest& request) {
        return to_json(request).dump();
    }

    // ========================================================================
    // Decoding
    // ========================================================================

    /**
     * @brief Decode a single-shot response body
     *
     * @param body Response body of a successful HTTP exchange
     * @return Expected<Completion> Completion, UpstreamError if the body
     *         carries an error object, UpstreamMalformedResponse otherwise
     */
    static Expected<Completion> decode_completion(std::string_view body) {
        auto parsed = parse(body);
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        const nlohmann::json& j = *parsed;

        if (auto error = error_object(j)) {
            return tl::unexpected(*error);
        }

        try {
            const auto& choices = j.at("choices");
            if (!choices.is_array() || choices.empty()) {
                return tl::unexpected(Error{
                    ErrorCode::UpstreamMalformedResponse,
                    "Completion has no choices"
                });
            }

            const auto& choice = choices.front();
            Completion completion;
            completion.id = j.value("id", "");
            completion.model = j.value("model", "");
            completion.created = from_unix(j.value("created", int64_t{0}));

            const auto& message = choice.at("message");
            if (message.contains("content") && !message["content"].is_null()) {
                completion.content = message["content"].get<std::string>();
            }
            completion.finish_reason = optional_string(choice, "finish_reason");

            if (j.contains("usage") && j["usage"].is_object()) {
                const auto& usage = j["usage"];
                completion.usage.prompt_tokens = usage.value("prompt_tokens", 0);
                completion.usage.completion_tokens = usage.value("completion_tokens", 0);
                completion.usage.total_tokens = usage.value("total_tokens", 0);
            }
            return completion;
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::UpstreamMalformedResponse,
                "Malformed completion response",
                std::string(e.what())
            });
        }
    }

    /**
     * @brief Decode one server-sent-events line of a streamed response
     *
     * @return Expected<std::optional<StreamChunk>> A delta, the End marker for
     *         "data: [DONE]", nullopt for lines that carry no chunk (blank
     *         lines, comments, other fields, role-only deltas), or an error
     */
    static Expected<std::optional<StreamChunk>> decode_stream_line(std::string_view line) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty() || line.front() == ':') {
            return std::optional<StreamChunk>{};
        }

        constexpr std::string_view data_field = "data:";
        if (line.substr(0, data_field.size()) != data_field) {
            return std::optional<StreamChunk>{};
        }

        std::string_view payload = line.substr(data_field.size());
        if (!payload.empty() && payload.front() == ' ') {
            payload.remove_prefix(1);
        }
        if (payload == "[DONE]") {
            return std::optional<StreamChunk>{StreamChunk::end()};
        }

        auto parsed = parse(payload);
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        const nlohmann::json& j = *parsed;

        if (auto error = error_object(j)) {
            return tl::unexpected(*error);
        }

        try {
            const auto& choices = j.at("choices");
            if (!choices.is_array() || choices.empty()) {
                return std::optional<StreamChunk>{};
            }

            const auto& choice = choices.front();
            std::optional<std::string> content;
            if (choice.contains("delta") && choice["delta"].is_object()) {
                content = optional_string(choice["delta"], "content");
            }
            auto finish_reason = optional_string(choice, "finish_reason");

            if (!content && !finish_reason) {
                return std::optional<StreamChunk>{};
            }

            StreamChunk chunk = StreamChunk::delta(content.value_or(""), std::move(finish_reason));
            chunk.id = j.value("id", "");
            chunk.model = j.value("model", "");
            return std::optional<StreamChunk>{std::move(chunk)};
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::UpstreamMalformedResponse,
                "Malformed stream chunk",
                std::string(e.what())
            });
        }
    }

    /**
     * @brief Map a non-2xx HTTP status and its body to an Error
     *
     * 401/403 are authentication failures, 429 is rate limiting, 5xx are
     * server errors, anything else is a generic upstream error. The body's
     * error.message is used as the message when present.
     */
    static Error error_from_status(int status, std::string_view body) {
        ErrorCode code = ErrorCode::UpstreamError;
        if (status == 401 || status == 403) {
            code = ErrorCode::UpstreamAuthentication;
        } else if (status == 429) {
            code = ErrorCode::UpstreamRateLimited;
        } else if (status >= 500 && status < 600) {
            code = ErrorCode::UpstreamServer;
        }

        std::string message = "HTTP " + std::to_string(status);
        auto parsed = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object() &&
            parsed.contains("error") && parsed["error"].is_object()) {
            auto text = optional_string(parsed["error"], "message");
            if (text && !text->empty()) {
                message = *text;
            }
        }
        return Error{code, std::move(message), "status=" + std::to_string(status)};
    }

private:
    static Expected<nlohmann::json> parse(std::string_view text) {
        try {
            return nlohmann::json::parse(text.begin(), text.end());
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::UpstreamMalformedResponse,
                "JSON parse error",
                std::string(e.what())
            });
        }
    }

    static std::optional<Error> error_object(const nlohmann::json& j) {
        if (!j.is_object()) {
            return Error{ErrorCode::UpstreamMalformedResponse, "Response must be a JSON object"};
        }
        if (!j.contains("error") || j["error"].is_null()) {
            return std::nullopt;
        }

        const auto& err = j["error"];
        std::string message = "Upstream error";
        std::optional<std::string> type;
        if (err.is_object()) {
            if (auto text = optional_string(err, "message")) {
                message = *text;
            }
            type = optional_string(err, "type");
        } else if (err.is_string()) {
            message = err.get<std::string>();
        }
        return Error{ErrorCode::UpstreamError, std::move(message), std::move(type)};
    }

    static std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
        if (!j.contains(key) || !j[key].is_string()) {
            return std::nullopt;
        }
        return j[key].get<std::string>();
    }

    static std::chrono::system_clock::time_point from_unix(int64_t seconds) {
        return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
    }
};

} // namespace wire
} // namespace parley
