#pragma once

#include "types.hpp"
#include "log.hpp"
#include "response_stream.hpp"
#include "service/ICompletionService.hpp"
#include "engine/blocking_queue.hpp"
#include "engine/history_store.hpp"
#include "engine/request_builder.hpp"
#include "engine/conversation_engine.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace parley {

/**
 * @brief Main entry point for Parley
 *
 * The Client keeps per-conversation history on top of a stateless
 * chat-completion service so callers can hold multi-turn dialogues. It owns
 * a pool of worker threads that process asks asynchronously.
 *
 * Key Features:
 * - Conversation setup with a system message
 * - Asynchronous ask with std::future
 * - Streamed ask returning a lazy ResponseStream
 * - Bounded, expiring history per conversation
 * - Per-request cancellation and graceful shutdown
 *
 * Thread Model:
 * - Calling Thread: calls ask()/ask_stream(), receives a handle immediately
 * - Worker Threads: lock the conversation, call the completion service,
 *   commit the reply
 * - Asks on the same conversation are serialized; asks on different
 *   conversations run in parallel up to Config::worker_threads
 *
 * Example Usage:
 * @code
 * Config config;
 * config.default_model = "gpt-4o-mini";
 * config.message_limit = 16;
 *
 * auto client_result = Client::create(config, std::make_shared<MyHttpService>(api_key));
 * if (!client_result) {
 *     std::cerr << "Failed to create client: " << client_result.error().to_string() << std::endl;
 *     return 1;
 * }
 *
 * auto client = std::move(*client_result);
 *
 * auto id = client->setup(std::nullopt, "You are a terse assistant.");
 * auto handle = client->ask(*id, "Hello!");
 * auto response = handle.future.get();
 * if (response) {
 *     std::cout << response->content << std::endl;
 * }
 * @endcode
 */
class Client {
public:
    /**
     * @brief Factory method to create a Client
     *
     * Validates configuration and starts the worker pool.
     *
     * @param config Client configuration
     * @param service Completion service the client talks to
     * @param time_source Optional steady-clock override for expiration (tests)
     * @return Expected<std::unique_ptr<Client>> Client or initialization error
     */
    static Expected<std::unique_ptr<Client>> create(
        const Config& config,
        std::shared_ptr<service::ICompletionService> service,
        engine::HistoryStore::TimeSource time_source = nullptr
    ) {
        if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }

        if (!service) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                "A completion service is required"
            });
        }

        return std::unique_ptr<Client>(new Client(config, std::move(service), std::move(time_source)));
    }

    /**
     * @brief Destructor - stops workers and waits for them
     */
    ~Client() {
        stop();
    }

    // Non-copyable and non-movable (worker threads capture `this`)
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) = delete;
    Client& operator=(Client&&) = delete;

    /**
     * @brief Create or reset a conversation with a system message
     *
     * Any existing history for the id is discarded. An ask already in flight
     * on the id is not waited for; its turn is dropped.
     *
     * @param id Conversation to reset; a fresh id is generated when omitted
     * @param system_message Instructions framing the whole conversation
     * @return Expected<ConversationId> The conversation id, or
     *         InvalidConversationId / InvalidArgument
     */
    Expected<ConversationId> setup(std::optional<ConversationId> id, const std::string& system_message) {
        auto resolved = resolve_id(id);
        if (!resolved) {
            return tl::unexpected(resolved.error());
        }
        if (auto valid = engine::RequestBuilder::validate_message(system_message); !valid) {
            return tl::unexpected(Error{ErrorCode::InvalidArgument, "System message cannot be empty"});
        }

        history_->reset(*resolved, Message::system(system_message));
        return *resolved;
    }

    /**
     * @brief Ask a question and get a handle for the reply
     *
     * Argument errors are reported immediately through the handle's future
     * and no upstream call is made.
     *
     * @param id Conversation to continue; a fresh one is started when omitted
     * @param message User message text
     * @param parameters Optional per-call override of the default parameters
     * @param model Optional per-call model
     * @return RequestHandle Handle with request id, conversation id and future
     */
    RequestHandle ask(
        std::optional<ConversationId> id,
        std::string message,
        std::optional<ChatParameters> parameters = std::nullopt,
        std::optional<std::string> model = std::nullopt
    ) {
        auto promise = std::make_shared<std::promise<Expected<Response>>>();
        std::future<Expected<Response>> future = promise->get_future();
        const RequestId request_id = next_request_id_.fetch_add(1, std::memory_order_relaxed);

        auto request = make_request(request_id, id, std::move(message), std::move(parameters), std::move(model));
        if (!request) {
            promise->set_value(tl::unexpected(request.error()));
            return RequestHandle{request_id, id.value_or(ConversationId{}), std::move(future)};
        }

        const ConversationId conversation_id = request->conversation_id;
        request->promise = promise;

        if (auto submitted = submit(std::move(*request)); !submitted) {
            promise->set_value(tl::unexpected(submitted.error()));
        }
        return RequestHandle{request_id, conversation_id, std::move(future)};
    }

    /**
     * @brief Ask a question and stream the reply
     *
     * Same id resolution and validation as ask(). Errors, including argument
     * errors, arrive in-band on the returned stream.
     *
     * @return ResponseStream Lazy sequence of partial responses
     */
    ResponseStream ask_stream(
        std::optional<ConversationId> id,
        std::string message,
        std::optional<ChatParameters> parameters = std::nullopt,
        std::optional<std::string> model = std::nullopt
    ) {
        auto channel = std::make_shared<ResponseStream::Channel>();
        const RequestId request_id = next_request_id_.fetch_add(1, std::memory_order_relaxed);

        auto request = make_request(request_id, id, std::move(message), std::move(parameters), std::move(model));
        if (!request) {
            channel->push(tl::unexpected(request.error()));
            channel->close();
            return ResponseStream(request_id, id.value_or(ConversationId{}), channel, CancellationToken{});
        }

        const ConversationId conversation_id = request->conversation_id;
        CancellationToken cancel = request->cancel;
        request->stream = channel;

        if (auto submitted = submit(std::move(*request)); !submitted) {
            channel->push(tl::unexpected(submitted.error()));
            channel->close();
        }
        return ResponseStream(request_id, conversation_id, std::move(channel), std::move(cancel));
    }

    /**
     * @brief Get a copy of a conversation's history
     *
     * Unknown, deleted, expired and malformed ids read as empty.
     */
    std::vector<Message> get_conversation(const ConversationId& id) const {
        if (id.is_nil()) {
            return {};
        }
        return history_->get(id);
    }

    /**
     * @brief Delete a conversation. No-op if absent or malformed.
     *
     * Returns without waiting for an ask in flight on the id; that ask's turn
     * is dropped.
     */
    void delete_conversation(const ConversationId& id) {
        if (id.is_nil()) {
            return;
        }
        history_->remove(id);
    }

    /**
     * @brief Cancel a specific ask or stream by request id
     *
     * A queued request is skipped when dequeued; an in-flight one is
     * abandoned at the next cancellation check and its turn rolled back.
     * Cancelling a completed or unknown request is a no-op.
     */
    void cancel(RequestId id) {
        std::lock_guard<std::mutex> lock(cancel_tokens_mutex_);
        auto it = cancel_tokens_.find(id);
        if (it != cancel_tokens_.end()) {
            it->second.cancel();
        }
    }

    /**
     * @brief Remove expired conversations now
     *
     * @return size_t Number of conversations removed
     */
    size_t purge_expired() {
        return history_->purge_expired();
    }

    /**
     * @brief Stop the client and wait for workers to finish
     *
     * Gracefully shuts down:
     * - Stops accepting new requests
     * - Cancels in-flight requests (their turns are rolled back)
     * - Fails still-queued requests with ClientNotRunning
     * - Joins the worker threads
     * - Can be called multiple times safely
     */
    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }

        request_queue_->close();
        engine_->cancel();
        {
            std::lock_guard<std::mutex> lock(cancel_tokens_mutex_);
            for (auto& entry : cancel_tokens_) {
                entry.second.cancel();
            }
        }

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    bool is_running() const {
        return running_.load(std::memory_order_acquire);
    }

    const Config& get_config() const {
        return config_;
    }

private:
    Client(const Config& config,
           std::shared_ptr<service::ICompletionService> service,
           engine::HistoryStore::TimeSource time_source)
        : config_(config)
        , logger_(config.make_logger())
        , history_(std::make_shared<engine::HistoryStore>(
            static_cast<size_t>(config.message_limit),
            config.message_expiration,
            logger_,
            std::move(time_source)
        ))
        , request_queue_(std::make_shared<engine::BlockingQueue<engine::Request>>(config.request_queue_capacity))
        , engine_(std::make_shared<engine::ConversationEngine>(std::move(service), history_, config))
        , running_(true)
    {
        workers_.reserve(static_cast<size_t>(config.worker_threads));
        for (int i = 0; i < config.worker_threads; ++i) {
            workers_.emplace_back([this]() {
                worker_loop();
            });
        }
    }

    Expected<ConversationId> resolve_id(const std::optional<ConversationId>& id) const {
        if (!id) {
            return ConversationId::generate();
        }
        if (id->is_nil()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConversationId,
                "Nil conversation id is not allowed"
            });
        }
        return *id;
    }

    Expected<engine::Request> make_request(
        RequestId request_id,
        const std::optional<ConversationId>& id,
        std::string message,
        std::optional<ChatParameters> parameters,
        std::optional<std::string> model
    ) const {
        auto resolved = resolve_id(id);
        if (!resolved) {
            return tl::unexpected(resolved.error());
        }
        if (auto valid = engine::RequestBuilder::validate_message(message); !valid) {
            return tl::unexpected(valid.error());
        }

        engine::Request request;
        request.id = request_id;
        request.conversation_id = *resolved;
        request.message = std::move(message);
        request.parameters = std::move(parameters);
        request.model = std::move(model);
        return request;
    }

    Expected<void> submit(engine::Request request) {
        const RequestId request_id = request.id;

        if (!running_.load(std::memory_order_acquire)) {
            return tl::unexpected(Error{ErrorCode::ClientNotRunning, "Client is not running"});
        }

        {
            std::lock_guard<std::mutex> lock(cancel_tokens_mutex_);
            cancel_tokens_.emplace(request_id, request.cancel);
        }

        if (!request_queue_->push(std::move(request))) {
            forget(request_id);
            if (!running_.load(std::memory_order_acquire)) {
                return tl::unexpected(Error{ErrorCode::ClientNotRunning, "Client is not running"});
            }
            return tl::unexpected(Error{
                ErrorCode::QueueFull,
                "Request queue is full",
                "capacity=" + std::to_string(config_.request_queue_capacity)
            });
        }
        return {};
    }

    void forget(RequestId id) {
        std::lock_guard<std::mutex> lock(cancel_tokens_mutex_);
        cancel_tokens_.erase(id);
    }

    /**
     * @brief Worker thread loop
     *
     * Processes requests until the queue is closed and drained. Requests
     * dequeued after stop() are failed with ClientNotRunning.
     */
    void worker_loop() {
        while (auto request = request_queue_->pop()) {
            if (!running_.load(std::memory_order_acquire)) {
                logger_.info("Dropping request " + std::to_string(request->id) + " queued before shutdown");
                reject(*request, Error{
                    ErrorCode::ClientNotRunning,
                    "Client stopped before request could be processed"
                });
            } else if (request->cancel.is_cancelled()) {
                reject(*request, Error{ErrorCode::RequestCancelled, "Request cancelled"});
            } else if (request->is_streaming()) {
                engine_->process_stream(*request);
            } else {
                auto result = engine_->process_request(*request);
                request->promise->set_value(std::move(result));
            }
            forget(request->id);
        }
    }

    static void reject(engine::Request& request, Error error) {
        if (request.is_streaming()) {
            request.stream->push(tl::unexpected(std::move(error)));
            request.stream->close();
        } else if (request.promise) {
            request.promise->set_value(tl::unexpected(std::move(error)));
        }
    }

    // Configuration
    Config config_;
    Logger logger_;

    // Components
    std::shared_ptr<engine::HistoryStore> history_;
    std::shared_ptr<engine::BlockingQueue<engine::Request>> request_queue_;
    std::shared_ptr<engine::ConversationEngine> engine_;

    // Threading
    std::vector<std::thread> workers_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> next_request_id_{1};

    // Per-request cancellation
    std::mutex cancel_tokens_mutex_;
    std::unordered_map<RequestId, CancellationToken> cancel_tokens_;
};

} // namespace parley
