#ifndef PSA_UTILS_PARALLEL_HPP
#define PSA_UTILS_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Parallel execution utilities.
 *
 * A fixed-size thread pool plus an order-preserving parallel map, used to
 * parse and collect symbols from independent source files concurrently.
 */

#include <vector>
#include <future>
#include <thread>
#include <queue>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <exception>
#include <stdexcept>
#include <type_traits>

namespace psa::parallel {

    /**
     * Returns the number of hardware threads available.
     *
     * @return The number of threads, or 1 if detection fails.
     */
    inline unsigned int hardware_concurrency() noexcept {
        unsigned int n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }

    /**
     * A simple thread pool for parallel task execution.
     */
    class ThreadPool {
    public:
        /**
         * Creates a thread pool with the specified number of threads.
         *
         * @param num_threads Number of worker threads (0 = auto-detect).
         */
        explicit ThreadPool(unsigned int num_threads = 0)
            : stop_(false) {
            if (num_threads == 0) {
                num_threads = hardware_concurrency();
            }

            workers_.reserve(num_threads);
            for (unsigned int i = 0; i < num_threads; ++i) {
                workers_.emplace_back([this] {
                    worker_loop();
                });
            }
        }

        ~ThreadPool() {
            {
                std::unique_lock lock(queue_mutex_);
                stop_ = true;
            }
            condition_.notify_all();

            for (auto& worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * Submits a task to the thread pool.
         *
         * @param f The function to execute.
         * @param args Arguments to pass to the function.
         * @return A future for the result. Exceptions thrown by the task surface from `get()`.
         */
        template<typename F, typename... Args>
        auto submit(F&& f, Args&&... args)
            -> std::future<std::invoke_result_t<F, Args...>> {
            using return_type = std::invoke_result_t<F, Args...>;

            auto task = std::make_shared<std::packaged_task<return_type()>>(
                std::bind(std::forward<F>(f), std::forward<Args>(args)...)
            );

            std::future<return_type> result = task->get_future();

            {
                std::unique_lock lock(queue_mutex_);
                if (stop_) {
                    throw std::runtime_error("Cannot submit to stopped thread pool");
                }
                tasks_.emplace([task]() { (*task)(); });
            }

            condition_.notify_one();
            return result;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return workers_.size();
        }

    private:
        void worker_loop() {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, [this] {
                        return stop_ || !tasks_.empty();
                    });

                    if (stop_ && tasks_.empty()) {
                        return;
                    }

                    task = std::move(tasks_.front());
                    tasks_.pop();
                }

                task();
            }
        }

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_;
        bool stop_;
    };

    /**
     * Maps a function over a collection in parallel.
     *
     * Results come back in input order regardless of completion order. If a
     * task throws, the first exception is rethrown once all tasks are done.
     *
     * @param items The items to transform.
     * @param f The transformation function.
     * @param pool The thread pool to use.
     * @return Vector of transformed items.
     */
    template<typename T, typename F>
    auto map(const std::vector<T>& items, F&& f, ThreadPool& pool)
        -> std::vector<std::invoke_result_t<F, const T&>> {
        using ResultType = std::invoke_result_t<F, const T&>;

        std::vector<std::future<ResultType>> futures;
        futures.reserve(items.size());

        for (const auto& item : items) {
            futures.push_back(pool.submit([&f, &item]() {
                return f(item);
            }));
        }

        std::vector<ResultType> results;
        results.reserve(items.size());
        std::exception_ptr first_error;

        // Every task must finish before `items` and `f` go out of scope, even after a failure.
        for (auto& future : futures) {
            try {
                results.push_back(future.get());
            } catch (...) {
                if (!first_error) first_error = std::current_exception();
            }
        }

        if (first_error) {
            std::rethrow_exception(first_error);
        }

        return results;
    }

}  // namespace psa::parallel

#endif //PSA_UTILS_PARALLEL_HPP
