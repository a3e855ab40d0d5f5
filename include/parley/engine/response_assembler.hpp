#pragma once

#include "../types.hpp"
#include "history_store.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace parley {
namespace engine {

namespace detail {

inline bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace detail

/**
 * @brief Turns upstream results into assistant turns and caller responses
 *
 * Single-shot: commit_completion() appends the assistant message to the
 * locked conversation and builds the Response.
 *
 * Streaming: one StreamAssembler per call. accept() is fed every chunk in
 * arrival order and returns the partial Response to emit; commit() writes
 * the accumulated message once the End marker has been seen.
 *
 * Blank assistant text is never written to history.
 */
class ResponseAssembler {
public:
    /**
     * @brief Commit a single-shot completion to history
     *
     * @param conversation Lock on the conversation the turn belongs to
     * @param completion Upstream result
     * @return Expected<Response> Response, or CacheStateError from the store
     */
    static Expected<Response> commit_completion(
        HistoryStore::ConversationLock& conversation,
        Completion completion
    ) {
        if (!detail::is_blank(completion.content)) {
            if (auto appended = conversation.append(Message::assistant(completion.content)); !appended) {
                return tl::unexpected(appended.error());
            }
        }

        Response response;
        response.conversation_id = conversation.id();
        response.id = std::move(completion.id);
        response.model = std::move(completion.model);
        response.role = Role::Assistant;
        response.content = std::move(completion.content);
        response.finish_reason = std::move(completion.finish_reason);
        response.usage = completion.usage;
        response.created = completion.created;
        return response;
    }

    /**
     * @brief Build a degraded response carrying an upstream error
     */
    static Response degraded(const ConversationId& conversation_id, Error error) {
        Response response;
        response.conversation_id = conversation_id;
        response.role = Role::Assistant;
        response.created = std::chrono::system_clock::now();
        response.error = std::move(error);
        return response;
    }
};

/**
 * @brief Accumulates one streamed completion
 *
 * Not thread-safe; owned by the worker processing the stream.
 */
class StreamAssembler {
public:
    explicit StreamAssembler(ConversationId conversation_id)
        : conversation_id_(conversation_id)
    {}

    /**
     * @brief Accept the next chunk
     *
     * @return std::optional<Response> Partial response for a delta; nullopt
     *         for the End marker and for anything arriving after it
     */
    std::optional<Response> accept(const StreamChunk& chunk) {
        if (ended_ || discarded_) {
            return std::nullopt;
        }
        if (chunk.is_end()) {
            ended_ = true;
            return std::nullopt;
        }

        buffer_ += chunk.content;
        ++delta_count_;
        if (!chunk.id.empty()) id_ = chunk.id;
        if (!chunk.model.empty()) model_ = chunk.model;
        if (chunk.finish_reason) finish_reason_ = chunk.finish_reason;

        Response partial;
        partial.conversation_id = conversation_id_;
        partial.id = chunk.id;
        partial.model = chunk.model;
        partial.role = Role::Assistant;
        partial.content = chunk.content;
        partial.finish_reason = chunk.finish_reason;
        partial.created = std::chrono::system_clock::now();
        return partial;
    }

    bool ended() const { return ended_; }
    bool committed() const { return committed_; }
    size_t delta_count() const { return delta_count_; }
    const std::string& buffer() const { return buffer_; }

    /**
     * @brief Write the assembled message to history, at most once
     *
     * @return Expected<bool> true if a message was written, false if it was
     *         already committed or blank; StreamInterrupted if End was never
     *         seen or the buffer was discarded
     */
    Expected<bool> commit(HistoryStore::ConversationLock& conversation) {
        if (discarded_ || !ended_) {
            return tl::unexpected(Error{
                ErrorCode::StreamInterrupted,
                "Stream ended before the end-of-stream marker",
                "deltas=" + std::to_string(delta_count_)
            });
        }
        if (committed_) {
            return false;
        }
        committed_ = true;

        if (detail::is_blank(buffer_)) {
            return false;
        }
        if (auto appended = conversation.append(Message::assistant(buffer_)); !appended) {
            return tl::unexpected(appended.error());
        }
        return true;
    }

    /**
     * @brief Drop the accumulated text; commit() will refuse afterwards
     */
    void discard() {
        discarded_ = true;
        buffer_.clear();
    }

    const std::string& id() const { return id_; }
    const std::string& model() const { return model_; }
    const std::optional<std::string>& finish_reason() const { return finish_reason_; }

private:
    ConversationId conversation_id_;
    std::string buffer_;
    std::string id_;
    std::string model_;
    std::optional<std::string> finish_reason_;
    size_t delta_count_ = 0;
    bool ended_ = false;
    bool committed_ = false;
    bool discarded_ = false;
};

} // namespace engine
} // namespace parley
