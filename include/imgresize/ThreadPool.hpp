#ifndef IMGRESIZE_THREADPOOL_HPP
#define IMGRESIZE_THREADPOOL_HPP

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace imgresize {

/**
 * @brief A fixed-size thread pool used to fan independent resizes out
 *
 * Workers pull tasks from a single FIFO queue. The destructor stops accepting
 * work, drains every task already queued and joins the workers.
 *
 * Example usage:
 * @code
 *   ThreadPool pool(4);
 *   auto future = pool.submit([]() { return 42; });
 *   int result = future.get();  // Block until task completes
 * @endcode
 */
class ThreadPool {
public:
    /**
     * @brief Starts one worker thread running the given body
     *
     * Throws (typically std::system_error) when no thread can be created.
     */
    using ThreadFactory = std::function<std::thread(std::function<void()>)>;

    /**
     * @brief Construct thread pool with specified number of worker threads
     * @param num_threads Number of worker threads (default: hardware concurrency)
     * @throws std::invalid_argument if num_threads is 0
     */
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());

    /**
     * @brief Construct thread pool whose workers are started through spawn
     * @throws std::invalid_argument if num_threads is 0
     *
     * If spawn throws, the workers already started are stopped and joined
     * before the exception leaves the constructor.
     */
    ThreadPool(size_t num_threads, ThreadFactory spawn);

    /**
     * @brief Destructor - waits for all pending tasks to complete
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * @brief Submit a task for asynchronous execution
     *
     * @tparam F Callable type (function, lambda, functor)
     * @tparam Args Argument types for the callable
     * @param f Callable object to execute
     * @param args Arguments to pass to the callable
     * @return std::future<ReturnType> Future for retrieving the result
     * @throws std::runtime_error if pool is stopped
     *
     * Exceptions thrown by the task are stored in the returned future.
     */
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    size_t size() const noexcept { return workers_.size(); }

    /**
     * @brief Number of tasks queued but not yet picked up by a worker
     */
    size_t pending() const;

    bool is_stopped() const noexcept;

private:
    void worker_thread();
    void shutdown();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;

    bool stop_;
};

// Implementation (header-only for template support)

inline ThreadPool::ThreadPool(size_t num_threads)
    : ThreadPool(num_threads, [](std::function<void()> body) { return std::thread(std::move(body)); })
{
}

inline ThreadPool::ThreadPool(size_t num_threads, ThreadFactory spawn)
    : stop_(false)
{
    if (num_threads == 0) {
        throw std::invalid_argument("ThreadPool size must be greater than 0");
    }

    workers_.reserve(num_threads);
    try {
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.push_back(spawn([this] { worker_thread(); }));
        }
    } catch (...) {
        // Running workers wait on condition_; they must be joined before it is destroyed
        shutdown();
        throw;
    }
}

inline ThreadPool::~ThreadPool() {
    shutdown();
}

inline void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type>
{
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        if (stop_) {
            throw std::runtime_error("Cannot submit task to stopped ThreadPool");
        }

        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

inline size_t ThreadPool::pending() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

inline bool ThreadPool::is_stopped() const noexcept {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return stop_;
}

inline void ThreadPool::worker_thread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            // Drain the queue before exiting
            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        task();
    }
}

} // namespace imgresize

#endif // IMGRESIZE_THREADPOOL_HPP
