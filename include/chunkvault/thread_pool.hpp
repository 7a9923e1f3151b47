// include/chunkvault/thread_pool.hpp
#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>     // For std::future, std::packaged_task
#include <functional> // For std::function
#include <memory>
#include <stdexcept>  // For std::runtime_error
#include <string>

namespace ChunkVault
{
    namespace Concurrency
    {

        // Fixed-size worker pool. At most size() tasks run at once, which is what
        // bounds the number of in-flight fragment reads.
        class ThreadPool
        {
        public:
            ThreadPool(size_t num_threads, std::string name = "pool");
            ~ThreadPool();

            ThreadPool(const ThreadPool &) = delete;
            ThreadPool &operator=(const ThreadPool &) = delete;

            // Enqueue a task. The returned future carries its result or exception.
            template <class F, class... Args>
            auto enqueue(F &&f, Args &&...args)
                -> std::future<typename std::result_of<F(Args...)>::type>;

            size_t size() const { return workers.size(); }

        private:
            std::string name;
            std::vector<std::thread> workers;
            std::queue<std::function<void()>> tasks;

            std::mutex queue_mutex;
            std::condition_variable condition;
            bool stop_all; // Set once by the destructor

            void workerLoop();
        };

        template <class F, class... Args>
        auto ThreadPool::enqueue(F &&f, Args &&...args)
            -> std::future<typename std::result_of<F(Args...)>::type>
        {
            using return_type = typename std::result_of<F(Args...)>::type;

            auto task = std::make_shared<std::packaged_task<return_type()>>(
                std::bind(std::forward<F>(f), std::forward<Args>(args)...));

            std::future<return_type> res = task->get_future();
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                if (stop_all)
                    throw std::runtime_error("enqueue on stopped ThreadPool " + name);

                tasks.emplace([task]()
                              { (*task)(); });
            }
            condition.notify_one();
            return res;
        }

    } // namespace Concurrency
} // namespace ChunkVault
