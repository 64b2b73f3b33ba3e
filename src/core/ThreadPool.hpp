#pragma once

/**
 * ThreadPool.hpp
 *
 * Thread pool used for transfers and for the serialized operation executor
 * of each namespace (a pool of one worker runs tasks strictly in order).
 */

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <stdexcept>
#include <string>

#include "Logger.hpp"

namespace downlink::core {

/**
 * ThreadPool - FIFO thread pool
 *
 * Features:
 * - Starts with a fixed worker count, can grow on demand
 * - Future-based results
 * - Graceful shutdown (pending tasks run before workers exit)
 */
class ThreadPool {
public:
    /**
     * Constructor
     * @param numThreads Initial number of worker threads
     * @param name Name used in log messages
     */
    ThreadPool(size_t numThreads, std::string name)
        : m_name(std::move(name)), m_stop(false) {
        ensureWorkers(numThreads);
    }

    /**
     * Destructor - runs the pending tasks, then joins all workers
     */
    ~ThreadPool() {
        shutdown();
    }

    // Disable copy and move
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * Submit a task for execution
     * @param f Function to execute
     * @param args Function arguments
     * @return Future for the result
     */
    template<class F, class... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>> {

        using ReturnType = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<ReturnType> result = task->get_future();

        {
            std::unique_lock<std::mutex> lock(m_queueMutex);

            if (m_stop) {
                throw std::runtime_error("Cannot submit to stopped ThreadPool " + m_name);
            }

            m_tasks.emplace([task]() { (*task)(); });
        }

        m_condition.notify_one();
        return result;
    }

    /**
     * Grow the pool to at least the given number of workers
     * @param numThreads Minimum worker count
     */
    void ensureWorkers(size_t numThreads) {
        std::unique_lock<std::mutex> lock(m_queueMutex);

        if (m_stop) {
            return;
        }

        while (m_workers.size() < numThreads) {
            m_workers.emplace_back([this] {
                workerLoop();
            });
        }
    }

    /**
     * Stop accepting tasks, drain the queue and join the workers.
     * Must not be called from one of this pool's workers.
     */
    void shutdown() {
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            if (m_stop && m_workers.empty()) {
                return;
            }
            m_stop = true;
        }

        m_condition.notify_all();

        std::vector<std::thread> workers;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            workers.swap(m_workers);
        }

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    /**
     * Check whether the calling thread is one of this pool's workers
     */
    bool isWorkerThread() const {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        for (const auto& worker : m_workers) {
            if (worker.get_id() == std::this_thread::get_id()) {
                return true;
            }
        }
        return false;
    }

private:
    /**
     * Worker thread loop
     */
    void workerLoop() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(m_queueMutex);

                m_condition.wait(lock, [this] {
                    return m_stop || !m_tasks.empty();
                });

                if (m_stop && m_tasks.empty()) {
                    return;
                }

                task = std::move(m_tasks.front());
                m_tasks.pop();
            }

            try {
                task();
            } catch (const std::exception& e) {
                Logger::instance().error("Unhandled exception in pool {}: {}", m_name, e.what());
            }
        }
    }

private:
    std::string m_name;
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;

    mutable std::mutex m_queueMutex;
    std::condition_variable m_condition;

    bool m_stop;
};

} // namespace downlink::core
