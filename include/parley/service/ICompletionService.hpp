#pragma once

#include "../types.hpp"
#include <functional>

namespace parley {
namespace service {

/**
 * @brief Abstract interface to an upstream chat-completion service
 *
 * This interface is the only way the library reaches the network. It
 * abstracts HTTP transport, authentication and retry policy, and enables
 * dependency injection for testing.
 *
 * Design principles:
 * - Thread-safe: worker threads call it concurrently for different conversations
 * - Stateless with respect to conversations: every request carries its full history
 * - Blocking: calls return when the upstream exchange is over
 * - Cooperative cancellation: implementations poll the token while waiting
 *   and return RequestCancelled once it is set
 *
 * Failures are reported as Errors in the upstream range (UpstreamNetwork,
 * UpstreamAuthentication, UpstreamRateLimited, UpstreamServer,
 * UpstreamMalformedResponse or UpstreamError). wire::ChatCompletionCodec
 * maps HTTP statuses and error payloads onto these codes.
 */
class ICompletionService {
public:
    /**
     * @brief Receives one streamed chunk
     *
     * @return bool false asks the producer to stop early (the consumer was
     *         cancelled); the producer should then return without emitting End
     */
    using ChunkCallback = std::function<bool(const StreamChunk&)>;

    virtual ~ICompletionService() = default;

    /**
     * @brief Request a complete reply
     *
     * @param request Resolved request (model, messages, parameters)
     * @param cancel Cancellation token for this call
     * @return Expected<Completion> Assistant reply plus usage metadata, or an upstream error
     */
    virtual Expected<Completion> complete(const ChatRequest& request, const CancellationToken& cancel) = 0;

    /**
     * @brief Request a streamed reply
     *
     * Invokes on_chunk for every delta in arrival order and finally once with
     * StreamChunk::end(). Returns after End has been delivered, after the
     * callback returned false, or on failure.
     *
     * @param request Resolved request with stream == true
     * @param on_chunk Consumer of chunks (runs on the calling thread)
     * @param cancel Cancellation token for this call
     * @return Expected<void> Success, or the transport/upstream error that ended the stream
     */
    virtual Expected<void> complete_stream(
        const ChatRequest& request,
        const ChunkCallback& on_chunk,
        const CancellationToken& cancel
    ) = 0;
};

} // namespace service
} // namespace parley
