// =================================================================
// include/Fcc/ThreadPool.hpp
// =================================================================
// Header for the bounded worker pool used for file reads.

#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace Fcc {

/**
 * @brief Fixed-size pool of worker threads consuming a FIFO task queue
 *
 * The destructor drains queued tasks and joins every worker, unless
 * abandonWorkers() was called: then queued tasks are dropped and the
 * workers are detached. Worker state is shared, so a detached worker
 * stuck in a task can finish it after the pool is gone.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads) : m_state(std::make_shared<State>()), m_abandon(false) {
        if (num_threads == 0) {
            num_threads = 1;
        }
        for (size_t i = 0; i < num_threads; ++i) {
            std::shared_ptr<State> state = m_state;
            m_workers.emplace_back([state] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(state->queue_mutex);
                        state->condition.wait(lock, [&state] { return state->stop || !state->tasks.empty(); });

                        if (state->stop && state->tasks.empty()) {
                            return;
                        }

                        task = std::move(state->tasks.front());
                        state->tasks.pop();
                    }

                    task();
                }
            });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(m_state->queue_mutex);
            m_state->stop = true;
            if (m_abandon) {
                std::queue<std::function<void()>> dropped;
                m_state->tasks.swap(dropped);
            }
        }

        m_state->condition.notify_all();

        for (std::thread& worker : m_workers) {
            if (m_abandon) {
                worker.detach();
            } else {
                worker.join();
            }
        }
    }

    /**
     * @brief Do not wait for running tasks on destruction
     *
     * Tasks must own everything they touch once this is called.
     */
    void abandonWorkers() { m_abandon = true; }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args) -> std::future<typename std::result_of<F(Args...)>::type> {
        using return_type = typename std::result_of<F(Args...)>::type;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> res = task->get_future();
        {
            std::unique_lock<std::mutex> lock(m_state->queue_mutex);

            if (m_state->stop) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }

            m_state->tasks.emplace([task]() { (*task)(); });
        }

        m_state->condition.notify_one();
        return res;
    }

    size_t size() const { return m_workers.size(); }

    size_t queueSize() const {
        std::unique_lock<std::mutex> lock(m_state->queue_mutex);
        return m_state->tasks.size();
    }

    /**
     * @brief Hardware concurrency capped to a sane upper bound
     */
    static size_t defaultWorkerCount(size_t cap = 8) {
        size_t hw = std::thread::hardware_concurrency();
        if (hw == 0) {
            hw = 2;
        }
        return hw < cap ? hw : cap;
    }

private:
    struct State {
        std::queue<std::function<void()>> tasks;
        std::mutex queue_mutex;
        std::condition_variable condition;
        bool stop = false;
    };

    std::shared_ptr<State> m_state;
    std::vector<std::thread> m_workers;
    bool m_abandon;
};

} // namespace Fcc
