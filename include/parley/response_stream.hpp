#pragma once

#include "types.hpp"
#include "engine/blocking_queue.hpp"
#include <memory>
#include <optional>
#include <string>

namespace parley {

/**
 * @brief Caller side of Client::ask_stream()
 *
 * A finite, single-pass sequence of partial responses produced by one
 * upstream call. next() blocks until the next partial response is available
 * and returns nullopt once the stream is over. Errors arrive in-band as an
 * unexpected item, after which the sequence ends.
 *
 * By the time next() returns nullopt after a successful stream, the
 * assembled assistant message is already visible in the conversation.
 *
 * Dropping a stream before it ends cancels the underlying request, which
 * rolls the turn back.
 *
 * Move-only. Not restartable: call ask_stream() again for a new upstream call.
 */
class ResponseStream {
public:
    using Channel = engine::BlockingQueue<Expected<Response>>;

    ResponseStream() : id_(0) {}

    ResponseStream(RequestId id,
                   ConversationId conversation_id,
                   std::shared_ptr<Channel> channel,
                   CancellationToken cancel)
        : id_(id)
        , conversation_id_(conversation_id)
        , channel_(std::move(channel))
        , cancel_(std::move(cancel))
    {}

    ~ResponseStream() {
        if (channel_ && !finished_) {
            cancel_.cancel();
        }
    }

    ResponseStream(ResponseStream&& other) noexcept
        : id_(other.id_)
        , conversation_id_(other.conversation_id_)
        , channel_(std::move(other.channel_))
        , cancel_(other.cancel_)
        , finished_(other.finished_)
    {
        other.channel_.reset();
    }

    ResponseStream& operator=(ResponseStream&& other) noexcept {
        if (this != &other) {
            if (channel_ && !finished_) {
                cancel_.cancel();
            }
            id_ = other.id_;
            conversation_id_ = other.conversation_id_;
            channel_ = std::move(other.channel_);
            cancel_ = other.cancel_;
            finished_ = other.finished_;
            other.channel_.reset();
        }
        return *this;
    }

    ResponseStream(const ResponseStream&) = delete;
    ResponseStream& operator=(const ResponseStream&) = delete;

    /**
     * @brief Wait for the next partial response
     *
     * @return std::optional<Expected<Response>> Next item, nullopt at end of stream
     */
    std::optional<Expected<Response>> next() {
        if (!channel_ || finished_) {
            return std::nullopt;
        }
        auto item = channel_->pop();
        if (!item) {
            finished_ = true;
        }
        return item;
    }

    /**
     * @brief Drain the stream and concatenate all delta text
     *
     * @return Expected<std::string> Full assistant text, or the first error
     *         (including the error of a degraded response)
     */
    Expected<std::string> collect() {
        std::string text;
        while (auto item = next()) {
            if (!*item) {
                drain();
                return tl::unexpected(item->error());
            }
            if ((*item)->error) {
                drain();
                return tl::unexpected(*(*item)->error);
            }
            text += (*item)->content;
        }
        return text;
    }

    /**
     * @brief Cancel the underlying request
     *
     * Items already queued remain readable; the sequence then ends with a
     * RequestCancelled error unless the stream had already completed.
     */
    void cancel() { cancel_.cancel(); }

    RequestId id() const { return id_; }
    const ConversationId& conversation_id() const { return conversation_id_; }
    bool finished() const { return finished_; }

private:
    void drain() {
        while (next()) {
        }
    }

    RequestId id_;
    ConversationId conversation_id_;
    std::shared_ptr<Channel> channel_;
    CancellationToken cancel_;
    bool finished_ = false;
};

} // namespace parley
