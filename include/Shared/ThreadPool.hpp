// =============================================================================
// BLOCKFORGE - THREAD POOL
// Fixed worker pool for running independent generation jobs
// =============================================================================
#pragma once

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace blockforge {

// =============================================================================
// THREAD POOL
// Jobs must not share mutable state; each build owns its grid and rules
// =============================================================================
class ThreadPool {
public:
    explicit ThreadPool(std::size_t num_threads = 0)
        : m_stop(false)
    {
        if (num_threads == 0) {
            const unsigned hw = std::thread::hardware_concurrency();
            num_threads = std::max(1u, hw > 1 ? hw - 1 : 1u);
        }

        m_workers.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            m_workers.emplace_back([this] { worker_loop(); });
        }
    }

    ~ThreadPool() {
        shutdown();
    }

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Submit a job and get a future for its result; exceptions land in the future.
    // After shutdown the returned future is invalid.
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using ReturnType = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stop) {
                return {};
            }
            m_tasks.emplace([task]() { (*task)(); });
        }

        m_condition.notify_one();
        return task->get_future();
    }

    // Get number of worker threads
    [[nodiscard]] std::size_t size() const noexcept {
        return m_workers.size();
    }

    // Wait for all queued jobs to complete
    void wait_idle() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_idle_condition.wait(lock, [this] {
            return m_tasks.empty() && m_active_tasks == 0;
        });
    }

    // Drains the queue, then joins the workers
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stop) return;
            m_stop = true;
        }

        m_condition.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        m_workers.clear();
    }

private:
    void worker_loop() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_condition.wait(lock, [this] {
                    return m_stop || !m_tasks.empty();
                });

                if (m_stop && m_tasks.empty()) {
                    return;
                }

                task = std::move(m_tasks.front());
                m_tasks.pop();
                ++m_active_tasks;
            }

            // Execute task outside lock
            task();

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                --m_active_tasks;
                if (m_tasks.empty() && m_active_tasks == 0) {
                    m_idle_condition.notify_all();
                }
            }
        }
    }

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::condition_variable m_idle_condition;

    std::size_t m_active_tasks = 0;
    bool m_stop;
};

} // namespace blockforge
