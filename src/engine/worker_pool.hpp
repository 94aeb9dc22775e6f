#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <thread>
#include <vector>

namespace parts::engine {

    template <typename T>
    class JobQueue {
    public:
        void push(T job) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_queue.push(std::move(job));
            }
            m_cv.notify_one();
        }

        bool pop(T& job) {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_queue.empty() || m_stop; });

            if (m_stop && m_queue.empty()) return false;

            job = std::move(m_queue.front());
            m_queue.pop();
            return true;
        }

        // Lets workers drain what is queued, then return false from pop().
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
        std::queue<T> m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_stop = false;
    };

    /**
     * @brief Fixed number of threads draining a job queue. Jobs must not throw.
     */
    class WorkerPool {
    public:
        using Job = std::function<void()>;

        explicit WorkerPool(size_t threads) {
            if (threads == 0) threads = 1;
            for (size_t i = 0; i < threads; ++i) {
                m_workers.emplace_back([this]() {
                    Job job;
                    while (m_queue.pop(job)) {
                        job();
                    }
                });
            }
        }

        ~WorkerPool() { wait(); }

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        void submit(Job job) { m_queue.push(std::move(job)); }

        /**
         * @brief Runs every submitted job to completion and joins the threads.
         */
        void wait() {
            m_queue.stop();
            for (auto& t : m_workers) {
                if (t.joinable()) t.join();
            }
        }

        /**
         * @brief Default pool size: hardware threads, at most 8.
         */
        static size_t default_size() {
            unsigned n = std::thread::hardware_concurrency();
            if (n == 0) n = 1;
            return n > 8 ? 8 : n;
        }

    private:
        JobQueue<Job> m_queue;
        std::vector<std::thread> m_workers;
    };

}
