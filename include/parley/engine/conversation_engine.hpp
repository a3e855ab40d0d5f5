#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include "../service/ICompletionService.hpp"
#include "blocking_queue.hpp"
#include "history_store.hpp"
#include "request_builder.hpp"
#include "response_assembler.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace parley {
namespace engine {

/**
 * @brief Internal request representation with metadata
 *
 * Built by the Client after argument validation and id resolution, carried
 * through the request queue to a worker.
 *
 * @note This type is internal to the engine and not part of the public API
 */
struct Request {
    RequestId id = 0;                                                ///< Unique request identifier
    ConversationId conversation_id;                                  ///< Resolved conversation id
    std::string message;                                             ///< User message text
    std::optional<ChatParameters> parameters;                        ///< Per-call parameter override
    std::optional<std::string> model;                                ///< Per-call model override
    std::chrono::steady_clock::time_point submitted_at;              ///< Timestamp for latency tracking
    CancellationToken cancel;                                        ///< Per-request cancellation flag
    std::shared_ptr<std::promise<Expected<Response>>> promise;       ///< Result slot for ask()
    std::shared_ptr<BlockingQueue<Expected<Response>>> stream;       ///< Output channel for ask_stream()

    Request() : submitted_at(std::chrono::steady_clock::now()) {}

    bool is_streaming() const { return static_cast<bool>(stream); }
};

/**
 * @brief Processes one ask or stream request end to end
 *
 * For a request on conversation C the engine:
 * - Locks C in the history store for the whole exchange
 * - Snapshots the history and builds the upstream request from it
 * - Appends the user turn (trimmed like any other append)
 * - Calls the completion service with the request's cancellation token
 * - Commits the assistant reply through the response assembler
 * - On failure or cancellation restores the snapshot, so the turn is
 *   either fully applied or not applied at all
 *
 * Upstream failures are returned as errors, or as degraded responses when
 * Config::throw_on_error is false. Argument errors and cancellation are
 * never degraded.
 *
 * Thread Safety: process_request()/process_stream() may run concurrently on
 * several workers; per-conversation serialization comes from the store.
 */
class ConversationEngine {
public:
    ConversationEngine(
        std::shared_ptr<service::ICompletionService> service,
        std::shared_ptr<HistoryStore> history,
        const Config& config
    )
        : service_(std::move(service))
        , history_(std::move(history))
        , builder_(config.default_model, config.default_parameters)
        , throw_on_error_(config.throw_on_error)
        , logger_(config.make_logger())
        , cancelled_(false)
    {}

    /**
     * @brief Process a single-shot request
     *
     * @param request The request to process
     * @return Expected<Response> Assistant reply, degraded response, or error
     */
    Expected<Response> process_request(const Request& request) {
        if (is_cancelled(request)) {
            return cancelled_error(request);
        }

        const auto start_time = std::chrono::steady_clock::now();

        auto conversation = history_->lock(request.conversation_id);
        std::vector<Message> snapshot = conversation.messages();

        auto built = builder_.build(snapshot, request.message, request.parameters, request.model, false);
        if (!built) {
            return tl::unexpected(built.error());
        }

        if (auto appended = conversation.append(Message::user(request.message)); !appended) {
            conversation.restore(std::move(snapshot));
            return tl::unexpected(appended.error());
        }

        if (is_cancelled(request)) {
            conversation.restore(std::move(snapshot));
            return cancelled_error(request);
        }

        auto completion = service_->complete(*built, request.cancel);

        if (is_cancelled(request)) {
            conversation.restore(std::move(snapshot));
            return cancelled_error(request);
        }

        if (!completion) {
            conversation.restore(std::move(snapshot));
            return fail(request, completion.error());
        }

        auto response = ResponseAssembler::commit_completion(conversation, std::move(*completion));
        if (!response) {
            return tl::unexpected(response.error());
        }

        response->metrics.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return response;
    }

    /**
     * @brief Process a streaming request
     *
     * Pushes one partial response per delta into request.stream as it
     * arrives, commits the assembled message on the End marker, then closes
     * the channel. Errors are pushed in-band before closing.
     */
    void process_stream(const Request& request) {
        auto& out = *request.stream;

        if (is_cancelled(request)) {
            out.push(cancelled_error(request));
            out.close();
            return;
        }

        const auto start_time = std::chrono::steady_clock::now();

        auto conversation = history_->lock(request.conversation_id);
        std::vector<Message> snapshot = conversation.messages();

        auto built = builder_.build(snapshot, request.message, request.parameters, request.model, true);
        if (!built) {
            out.push(tl::unexpected(built.error()));
            out.close();
            return;
        }

        if (auto appended = conversation.append(Message::user(request.message)); !appended) {
            conversation.restore(std::move(snapshot));
            out.push(tl::unexpected(appended.error()));
            out.close();
            return;
        }

        StreamAssembler assembler(request.conversation_id);
        bool first_delta_seen = false;
        std::chrono::milliseconds time_to_first_delta{0};

        auto on_chunk = [&](const StreamChunk& chunk) -> bool {
            if (is_cancelled(request)) {
                return false;
            }
            auto partial = assembler.accept(chunk);
            if (partial) {
                if (!first_delta_seen) {
                    first_delta_seen = true;
                    time_to_first_delta = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start_time);
                }
                partial->metrics.time_to_first_delta_ms = time_to_first_delta;
                partial->metrics.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start_time);
                out.push(std::move(*partial));
            }
            return !assembler.ended();
        };

        auto result = service_->complete_stream(*built, on_chunk, request.cancel);

        if (is_cancelled(request)) {
            assembler.discard();
            conversation.restore(std::move(snapshot));
            out.push(cancelled_error(request));
            out.close();
            return;
        }

        if (!result) {
            assembler.discard();
            conversation.restore(std::move(snapshot));
            out.push(fail(request, result.error()));
            out.close();
            return;
        }

        if (!assembler.ended()) {
            assembler.discard();
            conversation.restore(std::move(snapshot));
            out.push(fail(request, Error{
                ErrorCode::StreamInterrupted,
                "Completion stream ended without an end-of-stream marker",
                "deltas=" + std::to_string(assembler.delta_count())
            }));
            out.close();
            return;
        }

        auto committed = assembler.commit(conversation);
        if (!committed) {
            out.push(tl::unexpected(committed.error()));
        }
        out.close();
    }

    /**
     * @brief Cancel every request this engine processes from now on
     */
    void cancel() {
        cancelled_.store(true, std::memory_order_release);
    }

    bool is_cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    bool is_cancelled(const Request& request) const {
        return is_cancelled() || request.cancel.is_cancelled();
    }

    Expected<Response> cancelled_error(const Request& request) const {
        logger_.info("Request " + std::to_string(request.id) + " on conversation " +
                     request.conversation_id.to_string() + " cancelled");
        return tl::unexpected(Error{ErrorCode::RequestCancelled, "Request cancelled"});
    }

    /** @brief Apply the error policy to an upstream failure. */
    Expected<Response> fail(const Request& request, Error error) const {
        logger_.warn("Request " + std::to_string(request.id) + " on conversation " +
                     request.conversation_id.to_string() + " failed: " + error.to_string());

        if (!throw_on_error_ && is_upstream_error(error.code)) {
            return ResponseAssembler::degraded(request.conversation_id, std::move(error));
        }
        return tl::unexpected(std::move(error));
    }

    std::shared_ptr<service::ICompletionService> service_;
    std::shared_ptr<HistoryStore> history_;
    RequestBuilder builder_;
    bool throw_on_error_;
    Logger logger_;
    std::atomic<bool> cancelled_;
};

} // namespace engine
} // namespace parley
