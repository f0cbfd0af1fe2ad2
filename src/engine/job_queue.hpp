#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <filesystem>

namespace lectern::engine {

    /**
     * @brief Work queue of file paths feeding the ingestion workers.
     */
    class JobQueue {
    public:
        void push(const std::filesystem::path& path) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_queue.push(path);
            }
            m_cv.notify_one();
        }

        /**
         * @brief Blocks until a path is available.
         * @return false once the queue is stopped and drained.
         */
        bool pop(std::filesystem::path& path) {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_queue.empty() || m_stop; });

            if (m_stop && m_queue.empty()) return false;

            path = m_queue.front();
            m_queue.pop();
            return true;
        }

        /**
         * @brief No more pushes; workers drain what is left and exit.
         */
        void stop() {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_stop = true;
            }
            m_cv.notify_all();
        }

        /**
         * @brief Drops pending paths and returns how many were dropped.
         */
        size_t clear() {
            std::lock_guard<std::mutex> lock(m_mutex);
            size_t dropped = m_queue.size();
            std::queue<std::filesystem::path>().swap(m_queue);
            return dropped;
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }

    private:
        std::queue<std::filesystem::path> m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_stop = false;
    };

}
