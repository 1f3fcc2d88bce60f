#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <vector>
#include <functional>
#include <algorithm>

namespace docsync::engine {

    template <typename Job>
    class JobQueue {
    public:
        void push(Job job) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_queue.push(std::move(job));
            }
            m_cv.notify_one();
        }

        /**
         * @brief Blocks until a job is available. Returns false once the queue
         * is stopped and drained.
         */
        bool pop(Job& job) {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_queue.empty() || m_stop; });

            if (m_stop && m_queue.empty()) return false;

            job = std::move(m_queue.front());
            m_queue.pop();
            return true;
        }

        void stop() {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_stop = true;
            }
            m_cv.notify_all();
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }

    private:
        std::queue<Job> m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_stop = false;
    };

    /**
     * @brief Runs fn over every job on at most `workers` threads and waits.
     * fn must not throw; it reports failures through its own captures.
     */
    template <typename Job>
    void run_parallel(std::vector<Job> jobs, size_t workers, const std::function<void(Job&)>& fn) {
        if (jobs.empty()) return;
        workers = std::max<size_t>(1, std::min(workers, jobs.size()));

        if (workers == 1) {
            for (auto& job : jobs) fn(job);
            return;
        }

        JobQueue<Job> queue;
        for (auto& job : jobs) queue.push(std::move(job));
        queue.stop();

        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            threads.emplace_back([&queue, &fn]() {
                Job job;
                while (queue.pop(job)) {
                    fn(job);
                }
            });
        }
        for (auto& t : threads) t.join();
    }

}
