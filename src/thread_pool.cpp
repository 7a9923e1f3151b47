// src/thread_pool.cpp
#include "chunkvault/thread_pool.hpp"
#include <iostream> // For logging

namespace ChunkVault
{
    namespace Concurrency
    {

        ThreadPool::ThreadPool(size_t num_threads, std::string name)
            : name(std::move(name)), stop_all(false)
        {
            if (num_threads == 0)
            {
                throw std::runtime_error("ThreadPool cannot be initialized with 0 threads.");
            }
            workers.reserve(num_threads);
            for (size_t i = 0; i < num_threads; ++i)
            {
                workers.emplace_back([this]
                                     { workerLoop(); });
            }
            std::cout << "ThreadPool '" << this->name << "' started with " << num_threads << " threads." << std::endl;
        }

        void ThreadPool::workerLoop()
        {
            for (;;)
            {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    condition.wait(lock, [this]
                                   { return stop_all || !tasks.empty(); });

                    // Drain the queue before exiting so no future is left unsatisfied
                    if (stop_all && tasks.empty())
                        return;

                    task = std::move(tasks.front());
                    tasks.pop();
                }
                task();
            }
        }

        ThreadPool::~ThreadPool()
        {
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                stop_all = true;
            }
            condition.notify_all();
            for (std::thread &worker : workers)
            {
                if (worker.joinable())
                {
                    worker.join();
                }
            }
            std::cout << "ThreadPool '" << name << "' stopped." << std::endl;
        }

    } // namespace Concurrency
} // namespace ChunkVault
