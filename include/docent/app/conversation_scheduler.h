#pragma once

#include <docent/core/types.h>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>

namespace docent::app {

/**
 * @brief Runs work on a shared pool, serialized per key
 *
 * Tasks submitted under the same key run one at a time in submission order; tasks
 * under different keys run concurrently.
 */
class ConversationScheduler {
public:
    using Strand = boost::asio::strand<boost::asio::thread_pool::executor_type>;

    explicit ConversationScheduler(size_t threads);
    ~ConversationScheduler();

    ConversationScheduler(const ConversationScheduler&) = delete;
    ConversationScheduler& operator=(const ConversationScheduler&) = delete;

    /**
     * @brief Queue func behind earlier work for key
     *
     * After shutdown() the returned future is already ready: it holds an InvalidState error
     * when the task returns a Result, and a std::runtime_error otherwise.
     */
    template <typename Func>
    auto submit(const std::string& key, Func&& func) -> std::future<std::invoke_result_t<Func>> {
        using R = std::invoke_result_t<Func>;
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return rejected<R>();
        }
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Func>(func));
        auto future = task->get_future();
        boost::asio::post(strandLocked(key), [task] { (*task)(); });
        return future;
    }

    /**
     * @brief Drop the strand of a key; queued tasks still run
     */
    void forget(const std::string& key);

    /**
     * @brief Wait for queued work and stop the pool
     */
    void shutdown();

    [[nodiscard]] size_t activeKeys() const;
    [[nodiscard]] size_t threads() const { return threads_; }

private:
    template <typename R> static std::future<R> rejected() {
        std::promise<R> promise;
        if constexpr (std::is_constructible_v<R, Error>) {
            promise.set_value(Error{ErrorCode::InvalidState, "Scheduler is shut down"});
        } else {
            promise.set_exception(
                std::make_exception_ptr(std::runtime_error("Scheduler is shut down")));
        }
        return promise.get_future();
    }

    // Caller holds mutex_
    Strand strandLocked(const std::string& key);

    size_t threads_;
    boost::asio::thread_pool pool_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Strand> strands_;
    bool stopped_ = false;
};

} // namespace docent::app
