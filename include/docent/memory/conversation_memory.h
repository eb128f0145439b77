#pragma once

#include <docent/metadata/records.h>

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace docent::memory {

struct MemoryConfig {
    size_t max_turns = 20;    // Turns kept per key
    size_t max_chars = 16000; // Total content characters kept per key
};

struct Turn {
    metadata::MessageRole role = metadata::MessageRole::User;
    std::string content;
};

/**
 * @brief Per-conversation turn history used as generation context
 *
 * Entries are keyed by a conversation's thread id (or an ad-hoc session key) and
 * truncated from the oldest end when a budget is exceeded. The newest turn is
 * always kept.
 */
class ConversationMemory {
public:
    explicit ConversationMemory(MemoryConfig config = {});

    void append(const std::string& key, metadata::MessageRole role, std::string content);

    /**
     * @brief All retained turns, oldest first; creates an empty entry on first use
     */
    std::vector<Turn> read(const std::string& key);

    /**
     * @brief The last `count` retained turns, oldest first
     */
    std::vector<Turn> recent(const std::string& key, size_t count);

    /**
     * @brief Populate an entry that does not exist yet; no-op otherwise
     * @return true if the entry was seeded
     */
    bool seedIfAbsent(const std::string& key, const std::vector<Turn>& turns);

    /**
     * @brief Remove an entry
     * @return true if it existed
     */
    bool destroy(const std::string& key);

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] const MemoryConfig& config() const { return config_; }

private:
    struct Entry {
        std::deque<Turn> turns;
        size_t chars = 0;
    };

    void enforceBudget(Entry& entry) const;

    MemoryConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace docent::memory
