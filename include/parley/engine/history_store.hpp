#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include "history_trimmer.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace parley {
namespace engine {

/**
 * @brief In-memory conversation cache with per-conversation locking
 *
 * Responsibilities:
 * - Map conversation ids to ordered message sequences
 * - Bound each sequence through HistoryTrimmer
 * - Expire conversations idle for longer than the expiration window
 *   (sliding: every read or write refreshes the entry)
 * - Serialize turns within one conversation without making unrelated
 *   conversations contend
 *
 * Locking: each entry carries two mutexes.
 * - turn_mutex is held by a ConversationLock for a whole turn, including the
 *   upstream call. Only lock() waits on it.
 * - data_mutex guards messages, last_activity and the erased/epoch markers.
 *   It is only ever held for short copies and updates, so get(), reset()
 *   and remove() never wait for an upstream call.
 * map_mutex_ guards lookup, insertion and erasure of entry pointers. Lock
 * order is turn_mutex, data_mutex, map_mutex_; the sweep, which starts from
 * map_mutex_, only try_locks data_mutex. Whether a turn is in progress is
 * read from the in_turn flag, never by try-locking turn_mutex.
 *
 * reset() and remove() from outside a turn bump the entry's epoch. Writes
 * through a ConversationLock taken before that are dropped, so a turn in
 * flight never resurrects a deleted conversation or overwrites a new
 * system message.
 *
 * Thread Safety: Internally synchronized
 */
class HistoryStore {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

private:
    struct Entry {
        std::mutex turn_mutex;
        std::mutex data_mutex;
        std::vector<Message> messages;
        Clock::time_point last_activity;
        uint64_t epoch = 0;
        bool in_turn = false;  // A ConversationLock is alive
        bool erased = false;  // Removed from the map; a new lock() must not reuse it
    };

public:
    /**
     * @brief Exclusive turn on one conversation
     *
     * Obtained from HistoryStore::lock(). While alive, no other ConversationLock
     * can be taken on this conversation. Used by the engine to make a whole
     * ask (read history, append user turn, call upstream, append reply)
     * atomic with respect to other asks on the same id. Readers are not
     * blocked.
     */
    class ConversationLock {
    public:
        ConversationLock(ConversationLock&&) = default;

        ConversationLock& operator=(ConversationLock&& other) noexcept {
            if (this != &other) {
                release();
                store_ = other.store_;
                id_ = other.id_;
                entry_ = std::move(other.entry_);
                epoch_ = other.epoch_;
                turn_ = std::move(other.turn_);
            }
            return *this;
        }

        ~ConversationLock() {
            release();
        }

        ConversationLock(const ConversationLock&) = delete;
        ConversationLock& operator=(const ConversationLock&) = delete;

        const ConversationId& id() const { return id_; }

        /**
         * @brief Copy of the current messages
         */
        std::vector<Message> messages() const {
            std::lock_guard<std::mutex> data(entry_->data_mutex);
            return entry_->messages;
        }

        /**
         * @brief Append a message and trim
         *
         * @return Expected<void> CacheStateError if trimming broke the bound;
         *         the entry has been reset in that case
         */
        Expected<void> append(Message message) {
            return store_->append_locked(id_, *entry_, epoch_, std::move(message));
        }

        /**
         * @brief Replace the conversation with a single system message
         */
        void reset(Message system_message) {
            std::lock_guard<std::mutex> data(entry_->data_mutex);
            if (is_stale()) {
                return;
            }
            entry_->messages.clear();
            entry_->messages.push_back(std::move(system_message));
            entry_->last_activity = store_->now();
        }

        /**
         * @brief Put back a snapshot taken earlier under this same lock
         *
         * Used to roll back a turn that failed or was cancelled. Does nothing
         * if the conversation was reset or removed from outside meanwhile.
         */
        void restore(std::vector<Message> snapshot) {
            std::lock_guard<std::mutex> data(entry_->data_mutex);
            if (is_stale()) {
                return;
            }
            entry_->messages = std::move(snapshot);
            entry_->last_activity = store_->now();
        }

    private:
        friend class HistoryStore;

        ConversationLock(HistoryStore* store,
                         ConversationId id,
                         std::shared_ptr<Entry> entry,
                         uint64_t epoch,
                         std::unique_lock<std::mutex> turn)
            : store_(store)
            , id_(id)
            , entry_(std::move(entry))
            , epoch_(epoch)
            , turn_(std::move(turn))
        {}

        void release() {
            if (entry_) {
                std::lock_guard<std::mutex> data(entry_->data_mutex);
                entry_->in_turn = false;
            }
        }

        // NOTE: Must be called with entry_->data_mutex held.
        bool is_stale() const {
            return entry_->erased || entry_->epoch != epoch_;
        }

        HistoryStore* store_;
        ConversationId id_;
        std::shared_ptr<Entry> entry_;
        uint64_t epoch_;
        std::unique_lock<std::mutex> turn_;  // Declared last: released before entry_
    };

    /**
     * @brief Construct the store with the default trimming policy
     *
     * @param message_limit Maximum messages retained per conversation
     * @param expiration Idle time after which a conversation is dropped
     * @param logger Sink for sweep and invariant messages
     * @param time_source Optional clock override (tests); steady_clock::now by default
     */
    HistoryStore(
        size_t message_limit,
        Clock::duration expiration,
        Logger logger = Logger(),
        TimeSource time_source = nullptr
    )
        : HistoryStore(std::make_shared<HistoryTrimmer>(message_limit), expiration,
                       std::move(logger), std::move(time_source))
    {}

    /**
     * @brief Construct the store with a custom trimming policy
     */
    HistoryStore(
        std::shared_ptr<const HistoryTrimmer> trimmer,
        Clock::duration expiration,
        Logger logger = Logger(),
        TimeSource time_source = nullptr
    )
        : trimmer_(std::move(trimmer))
        , expiration_(expiration)
        , sweep_interval_(expiration)
        , logger_(std::move(logger))
        , time_source_(std::move(time_source))
    {
        last_sweep_ = now();
    }

    HistoryStore(const HistoryStore&) = delete;
    HistoryStore& operator=(const HistoryStore&) = delete;

    /**
     * @brief Get a copy of a conversation's messages
     *
     * Unknown, deleted and expired conversations read as empty. Expired
     * entries are purged here unless a turn is in progress on them. Never
     * fails and never waits for a turn in progress.
     */
    std::vector<Message> get(const ConversationId& id) {
        auto entry = find(id);
        if (!entry) {
            return {};
        }

        std::lock_guard<std::mutex> data(entry->data_mutex);
        if (entry->erased) {
            return {};
        }

        const auto current = now();
        if (!entry->in_turn && is_expired(*entry, current)) {
            erase_locked(id, entry);
            logger_.debug("Conversation " + id.to_string() + " expired on read");
            return {};
        }

        entry->last_activity = current;
        return entry->messages;
    }

    /**
     * @brief Append a message as a turn of its own, creating the conversation if needed
     */
    Expected<void> append(const ConversationId& id, Message message) {
        auto conversation = lock(id);
        return conversation.append(std::move(message));
    }

    /**
     * @brief Replace a conversation with a single system message (idempotent)
     *
     * Does not wait for a turn in progress; that turn's later writes are
     * dropped.
     */
    void reset(const ConversationId& id, Message system_message) {
        for (;;) {
            auto entry = find_or_create(id);
            std::lock_guard<std::mutex> data(entry->data_mutex);
            if (entry->erased) {
                continue;  // Removed concurrently; pick up the replacement
            }
            entry->messages.clear();
            entry->messages.push_back(std::move(system_message));
            entry->last_activity = now();
            ++entry->epoch;
            return;
        }
    }

    /**
     * @brief Delete a conversation. No-op if absent.
     *
     * Does not wait for a turn in progress; that turn's later writes are
     * dropped.
     */
    void remove(const ConversationId& id) {
        auto entry = find(id);
        if (!entry) {
            return;
        }

        std::lock_guard<std::mutex> data(entry->data_mutex);
        if (!entry->erased) {
            erase_locked(id, entry);
        }
    }

    /**
     * @brief Start an exclusive turn on a conversation, creating it if needed
     *
     * Waits for any turn already in progress on the same id. An expired
     * conversation is emptied before the lock is handed out. May run an
     * opportunistic expiration sweep first.
     */
    ConversationLock lock(const ConversationId& id) {
        maybe_sweep();

        for (;;) {
            auto entry = find_or_create(id);
            std::unique_lock<std::mutex> turn(entry->turn_mutex);

            uint64_t epoch = 0;
            {
                std::lock_guard<std::mutex> data(entry->data_mutex);
                if (entry->erased) {
                    continue;  // Removed while we waited; pick up the replacement
                }

                const auto current = now();
                if (is_expired(*entry, current)) {
                    entry->messages.clear();
                    logger_.debug("Conversation " + id.to_string() + " expired before reuse");
                }
                entry->last_activity = current;
                entry->in_turn = true;
                epoch = entry->epoch;
            }

            return ConversationLock(this, id, std::move(entry), epoch, std::move(turn));
        }
    }

    /**
     * @brief Remove every expired conversation that is not currently in use
     *
     * @return size_t Number of conversations removed
     */
    size_t purge_expired() {
        const auto current = now();
        size_t purged = 0;
        {
            std::lock_guard<std::mutex> map_guard(map_mutex_);
            for (auto it = entries_.begin(); it != entries_.end();) {
                auto entry = it->second;
                std::unique_lock<std::mutex> data(entry->data_mutex, std::try_to_lock);
                if (data.owns_lock() && !entry->in_turn && is_expired(*entry, current)) {
                    entry->erased = true;
                    entry->messages.clear();
                    it = entries_.erase(it);
                    ++purged;
                    continue;
                }
                ++it;
            }
        }

        if (purged > 0) {
            logger_.debug("Expiration sweep removed " + std::to_string(purged) + " conversation(s)");
        }
        return purged;
    }

    /**
     * @brief Number of physically present conversations (including expired
     *        ones not yet swept)
     */
    size_t size() const {
        std::lock_guard<std::mutex> guard(map_mutex_);
        return entries_.size();
    }

    size_t message_limit() const { return trimmer_->limit(); }

    Clock::duration expiration() const { return expiration_; }

    /**
     * @brief Set how often lock() triggers a sweep (defaults to the expiration window)
     */
    void set_sweep_interval(Clock::duration interval) {
        std::lock_guard<std::mutex> guard(map_mutex_);
        sweep_interval_ = interval;
    }

private:
    Clock::time_point now() const {
        return time_source_ ? time_source_() : Clock::now();
    }

    bool is_expired(const Entry& entry, Clock::time_point current) const {
        return current - entry.last_activity > expiration_;
    }

    std::shared_ptr<Entry> find(const ConversationId& id) const {
        std::lock_guard<std::mutex> guard(map_mutex_);
        auto it = entries_.find(id);
        return it == entries_.end() ? nullptr : it->second;
    }

    std::shared_ptr<Entry> find_or_create(const ConversationId& id) {
        std::lock_guard<std::mutex> guard(map_mutex_);
        auto& slot = entries_[id];
        if (!slot) {
            slot = std::make_shared<Entry>();
            slot->last_activity = now();
        }
        return slot;
    }

    /**
     * NOTE: Must be called with entry->data_mutex held.
     */
    void erase_locked(const ConversationId& id, const std::shared_ptr<Entry>& entry) {
        entry->erased = true;
        entry->messages.clear();

        std::lock_guard<std::mutex> guard(map_mutex_);
        auto it = entries_.find(id);
        if (it != entries_.end() && it->second == entry) {
            entries_.erase(it);
        }
    }

    /**
     * NOTE: Must be called with entry.turn_mutex held by the caller's ConversationLock.
     */
    Expected<void> append_locked(const ConversationId& id, Entry& entry, uint64_t epoch, Message message) {
        std::lock_guard<std::mutex> data(entry.data_mutex);
        if (entry.erased || entry.epoch != epoch) {
            logger_.debug("Conversation " + id.to_string() +
                          " was reset or removed during the turn; message dropped");
            return {};
        }

        entry.messages.push_back(std::move(message));
        entry.last_activity = now();

        trimmer_->trim(entry.messages);

        if (auto check = trimmer_->verify(entry.messages); !check) {
            logger_.error("Conversation " + id.to_string() +
                          " reset after cache invariant violation: " + check.error().to_string());
            entry.messages.clear();
            return tl::unexpected(check.error());
        }
        return {};
    }

    void maybe_sweep() {
        const auto current = now();
        {
            std::lock_guard<std::mutex> guard(map_mutex_);
            if (current - last_sweep_ < sweep_interval_) {
                return;
            }
            last_sweep_ = current;
        }
        purge_expired();
    }

    std::shared_ptr<const HistoryTrimmer> trimmer_;
    Clock::duration expiration_;
    Clock::duration sweep_interval_;
    Logger logger_;
    TimeSource time_source_;

    mutable std::mutex map_mutex_;
    std::unordered_map<ConversationId, std::shared_ptr<Entry>> entries_;
    Clock::time_point last_sweep_;
};

} // namespace engine
} // namespace parley
