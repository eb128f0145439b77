#include <docent/memory/conversation_memory.h>

#include <spdlog/spdlog.h>

namespace docent::memory {

ConversationMemory::ConversationMemory(MemoryConfig config) : config_(config) {
    if (config_.max_turns == 0) {
        config_.max_turns = MemoryConfig{}.max_turns;
    }
}

void ConversationMemory::append(const std::string& key, metadata::MessageRole role,
                                std::string content) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[key];
    entry.chars += content.size();
    entry.turns.push_back(Turn{role, std::move(content)});
    enforceBudget(entry);
}

std::vector<Turn> ConversationMemory::read(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& entry = entries_[key];
    return {entry.turns.begin(), entry.turns.end()};
}

std::vector<Turn> ConversationMemory::recent(const std::string& key, size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& entry = entries_[key];
    size_t skip = entry.turns.size() > count ? entry.turns.size() - count : 0;
    return {entry.turns.begin() + static_cast<std::ptrdiff_t>(skip), entry.turns.end()};
}

bool ConversationMemory::seedIfAbsent(const std::string& key, const std::vector<Turn>& turns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(key);
    if (!inserted) {
        return false;
    }
    for (const auto& turn : turns) {
        it->second.chars += turn.content.size();
        it->second.turns.push_back(turn);
    }
    enforceBudget(it->second);
    spdlog::debug("[Memory] seeded '{}' with {} turn(s)", key, it->second.turns.size());
    return true;
}

bool ConversationMemory::destroy(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

bool ConversationMemory::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(key) != entries_.end();
}

size_t ConversationMemory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ConversationMemory::enforceBudget(Entry& entry) const {
    while (entry.turns.size() > 1 &&
           (entry.turns.size() > config_.max_turns || entry.chars > config_.max_chars)) {
        entry.chars -= entry.turns.front().content.size();
        entry.turns.pop_front();
    }
}

} // namespace docent::memory
