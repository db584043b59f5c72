#pragma once

/**
 * ThreadPool.hpp
 * 
 * Fixed-size worker pool used by the concurrency scheduler.
 */

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <atomic>
#include <stdexcept>

namespace lockerfetch::core {

/**
 * ThreadPool - FIFO thread pool
 * 
 * Jobs run in submission order. Exceptions thrown by a job are stored in
 * its future. The destructor drains the queue and joins every worker.
 */
class ThreadPool {
public:
    /**
     * Constructor
     * @param numThreads Number of worker threads (0 = hardware concurrency)
     */
    explicit ThreadPool(size_t numThreads = 0) {
        if (numThreads == 0) {
            numThreads = std::thread::hardware_concurrency();
            if (numThreads == 0) numThreads = 4;
        }
        
        m_workers.reserve(numThreads);
        for (size_t i = 0; i < numThreads; ++i) {
            m_workers.emplace_back([this] { workerLoop(); });
        }
    }
    
    ~ThreadPool() {
        shutdown();
    }
    
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;
    
    /**
     * Submit a job for execution
     * @param f Callable to execute
     * @param args Arguments bound to the callable
     * @return Future for the result
     * @throws std::runtime_error after shutdown()
     */
    template<class F, class... Args>
    auto submit(F&& f, Args&&... args) 
        -> std::future<std::invoke_result_t<F, Args...>> {
        
        using ReturnType = std::invoke_result_t<F, Args...>;
        
        auto job = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );
        
        std::future<ReturnType> result = job->get_future();
        
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            if (m_stop) {
                throw std::runtime_error("Cannot submit to stopped ThreadPool");
            }
            m_jobs.emplace([job]() { (*job)(); });
        }
        
        m_condition.notify_one();
        return result;
    }
    
    size_t size() const {
        return m_workers.size();
    }
    
    size_t pendingJobs() const {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        return m_jobs.size();
    }
    
    size_t activeJobs() const {
        return m_activeJobs.load();
    }
    
    /**
     * Block until the queue is empty and no job is running
     */
    void waitAll() {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        m_idleCondition.wait(lock, [this] {
            return m_jobs.empty() && m_activeJobs == 0;
        });
    }
    
    /**
     * Finish queued jobs and join the workers; idempotent
     */
    void shutdown() {
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            if (m_stop && m_workers.empty()) return;
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
    void workerLoop() {
        while (true) {
            std::function<void()> job;
            
            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                m_condition.wait(lock, [this] {
                    return m_stop || !m_jobs.empty();
                });
                
                if (m_stop && m_jobs.empty()) {
                    return;
                }
                
                job = std::move(m_jobs.front());
                m_jobs.pop();
                ++m_activeJobs;
            }
            
            // packaged_task stores any exception in the job's future
            job();
            
            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                --m_activeJobs;
                if (m_jobs.empty() && m_activeJobs == 0) {
                    m_idleCondition.notify_all();
                }
            }
        }
    }

private:
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_jobs;
    
    mutable std::mutex m_queueMutex;
    std::condition_variable m_condition;
    std::condition_variable m_idleCondition;
    
    bool m_stop{false};
    std::atomic<size_t> m_activeJobs{0};
};

} // namespace lockerfetch::core
