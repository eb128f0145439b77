#include <docent/app/conversation_scheduler.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace docent::app {

ConversationScheduler::ConversationScheduler(size_t threads)
    : threads_(std::max<size_t>(threads, 1)), pool_(threads_) {
    spdlog::debug("[Scheduler] started with {} thread(s)", threads_);
}

ConversationScheduler::~ConversationScheduler() {
    shutdown();
}

void ConversationScheduler::forget(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    strands_.erase(key);
}

void ConversationScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        // Everything posted before this point is drained by join()
        stopped_ = true;
    }
    pool_.join();
    spdlog::debug("[Scheduler] stopped");
}

size_t ConversationScheduler::activeKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return strands_.size();
}

ConversationScheduler::Strand ConversationScheduler::strandLocked(const std::string& key) {
    auto it = strands_.find(key);
    if (it == strands_.end()) {
        it = strands_.emplace(key, boost::asio::make_strand(pool_.get_executor())).first;
    }
    return it->second;
}

} // namespace docent::app
