#pragma once

#include "../types.hpp"
#include <algorithm>
#include <vector>

namespace parley {
namespace engine {

/**
 * @brief Bounds the number of messages retained per conversation
 *
 * Policy: while the count exceeds the limit, the oldest message that is not
 * a system message is evicted. System messages are never evicted.
 *
 * When the limit is smaller than one plus the number of system messages,
 * every non-system message is evicted and the count stays above the limit by
 * the surplus of system messages. That overflow is accepted policy.
 *
 * Stateless apart from the limit; safe to share across threads. HistoryStore
 * takes one by shared pointer, so a different eviction policy can be
 * supplied by overriding trim().
 */
class HistoryTrimmer {
public:
    explicit HistoryTrimmer(size_t limit)
        : limit_(limit)
    {}

    virtual ~HistoryTrimmer() = default;

    size_t limit() const { return limit_; }

    /**
     * @brief Evict oldest non-system messages in place
     *
     * @param messages Conversation messages in chronological order
     * @return size_t Number of messages evicted
     */
    virtual size_t trim(std::vector<Message>& messages) const {
        if (messages.size() <= limit_) {
            return 0;
        }

        const size_t excess = messages.size() - limit_;
        size_t removed = 0;

        std::vector<Message> kept;
        kept.reserve(messages.size());
        for (auto& message : messages) {
            if (removed < excess && message.role != Role::System) {
                ++removed;
                continue;
            }
            kept.push_back(std::move(message));
        }
        messages = std::move(kept);
        return removed;
    }

    /**
     * @brief Check the post-trim invariant
     *
     * @return Expected<void> CacheStateError if the sequence holds more
     *         messages than the limit allows
     */
    virtual Expected<void> verify(const std::vector<Message>& messages) const {
        if (messages.size() <= limit_) {
            return {};
        }

        const auto system_count = static_cast<size_t>(std::count_if(
            messages.begin(), messages.end(),
            [](const Message& m) { return m.role == Role::System; }));

        if (system_count == messages.size()) {
            return {};  // Only system messages left: accepted overflow
        }

        return tl::unexpected(Error{
            ErrorCode::CacheStateError,
            "Conversation exceeds message limit after trimming",
            "count=" + std::to_string(messages.size()) +
            " limit=" + std::to_string(limit_) +
            " system=" + std::to_string(system_count)
        });
    }

private:
    size_t limit_;
};

} // namespace engine
} // namespace parley
