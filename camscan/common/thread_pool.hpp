/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file thread_pool.hpp
 * @brief Implementation of thread pool that uses async threads
 **/

#ifndef _CAMSCAN_THREAD_POOL_HPP_
#define _CAMSCAN_THREAD_POOL_HPP_

#include "common/async_thread.hpp"
#include "common/utils.hpp"

#include <queue>
#include <vector>
#include <atomic>

namespace camscan {

class ThreadPool final {
public:
    explicit ThreadPool(size_t num_worker_threads) :
        m_num_threads(num_worker_threads), m_pending_jobs(0), m_kill_threads(false)
    {
        for (size_t i = 0; i < num_worker_threads; i++) {
            m_threads.emplace_back(std::make_unique<AsyncThread<camscan_status>>("SCAN_WORKER",
            [this]() -> camscan_status {
                while(true) {
                    std::function<camscan_status()> func;
                    {
                        std::unique_lock<std::mutex> lock(m_mutex);
                        m_cv.wait(lock, [this](){ return (m_kill_threads || !m_queue.empty()); });
                        if (m_kill_threads && m_queue.empty()) {
                            return CAMSCAN_SUCCESS;
                        }
                        func = std::move(m_queue.front());
                        m_queue.pop();
                    }

                    camscan_status status = func();
                    if (CAMSCAN_SUCCESS != status) {
                        LOGGER__ERROR("thread pool job failed with status {}", status);
                    }

                    {
                        std::unique_lock<std::mutex> lock(m_mutex);
                        m_pending_jobs--;
                    }
                    m_idle_cv.notify_all();
               }
            }
        ));
        }
    }

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool(ThreadPool &&other) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool& operator=(ThreadPool &&) = delete;

    template<class F, class... Args>
    void add_job(F&& func, Args&&... args) {
        auto job = std::bind(std::forward<F>(func), std::forward<Args>(args)...);
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_kill_threads) {
                LOGGER__ERROR("Cannot add jobs after threadpool has been terminated");
                return;
            }
            m_queue.emplace(job);
            m_pending_jobs++;
        }
        m_cv.notify_one();
    }

    // Blocks until every job added so far has returned
    void wait_for_all()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_idle_cv.wait(lock, [this]() { return (0 == m_pending_jobs); });
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_kill_threads = true;
        }
        m_cv.notify_all();
        for (size_t i = 0; i < m_num_threads; i++) {
            AsyncThreadPtr<camscan_status> thread = std::move(m_threads[i]);
            thread->get();
        }
    }

private:
    size_t m_num_threads;
    std::vector<AsyncThreadPtr<camscan_status>> m_threads;
    std::queue<std::function<camscan_status()>> m_queue;
    size_t m_pending_jobs;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idle_cv;
    std::atomic<bool> m_kill_threads;
};

} /* namespace camscan */

#endif // _CAMSCAN_THREAD_POOL_HPP_
