#pragma once

#include "../types.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parley {
namespace engine {

/**
 * @brief Composes outgoing ChatRequests from history and call arguments
 *
 * Holds the process-wide default model and parameters. build() never
 * touches the history store; the caller passes a snapshot.
 */
class RequestBuilder {
public:
    RequestBuilder(std::string default_model, ChatParameters default_parameters)
        : default_model_(std::move(default_model))
        , default_parameters_(std::move(default_parameters))
    {}

    /**
     * @brief Reject empty or whitespace-only message text
     */
    static Expected<void> validate_message(std::string_view message) {
        const bool blank = std::all_of(message.begin(), message.end(), [](char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        });
        if (blank) {
            return tl::unexpected(Error{ErrorCode::InvalidArgument, "Message text cannot be empty"});
        }
        return {};
    }

    /**
     * @brief Merge an override over defaults, field by field
     *
     * An engaged override field wins; otherwise the default (possibly unset)
     * is kept.
     */
    static ChatParameters merge_parameters(
        const ChatParameters& defaults,
        const std::optional<ChatParameters>& override_parameters
    ) {
        if (!override_parameters) {
            return defaults;
        }

        auto pick = [](const auto& preferred, const auto& fallback) {
            return preferred.has_value() ? preferred : fallback;
        };

        const ChatParameters& o = *override_parameters;
        ChatParameters merged;
        merged.temperature = pick(o.temperature, defaults.temperature);
        merged.top_p = pick(o.top_p, defaults.top_p);
        merged.max_tokens = pick(o.max_tokens, defaults.max_tokens);
        merged.presence_penalty = pick(o.presence_penalty, defaults.presence_penalty);
        merged.frequency_penalty = pick(o.frequency_penalty, defaults.frequency_penalty);
        merged.stop = pick(o.stop, defaults.stop);
        merged.user = pick(o.user, defaults.user);
        return merged;
    }

    /**
     * @brief Build a request for one new user turn
     *
     * @param history Current (non-expired) conversation messages
     * @param user_message New user message text
     * @param parameters Optional per-call parameter override
     * @param model Optional per-call model; the default model when unset or empty
     * @param stream Whether deltas are requested
     * @return Expected<ChatRequest> Request, or InvalidArgument for blank text
     */
    Expected<ChatRequest> build(
        const std::vector<Message>& history,
        const std::string& user_message,
        const std::optional<ChatParameters>& parameters = std::nullopt,
        const std::optional<std::string>& model = std::nullopt,
        bool stream = false
    ) const {
        if (auto valid = validate_message(user_message); !valid) {
            return tl::unexpected(valid.error());
        }

        ChatRequest request;
        request.model = (model && !model->empty()) ? *model : default_model_;
        if (request.model.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidArgument, "No model specified and no default model configured"});
        }

        request.messages.reserve(history.size() + 1);
        request.messages.insert(request.messages.end(), history.begin(), history.end());
        request.messages.push_back(Message::user(user_message));
        request.parameters = merge_parameters(default_parameters_, parameters);
        request.stream = stream;
        return request;
    }

    const std::string& default_model() const { return default_model_; }
    const ChatParameters& default_parameters() const { return default_parameters_; }

private:
    std::string default_model_;
    ChatParameters default_parameters_;
};

} // namespace engine
} // namespace parley
