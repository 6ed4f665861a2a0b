/**
 * @file TaskRunner.h
 * @brief One thread per background task, reaped as tasks finish
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace LanConnect {

/**
 * @class TaskRunner
 * @brief Runs each task on its own thread
 *
 * Threads of finished tasks are joined on the next launch(), so a long-running
 * process holds at most one thread per task still running plus those that
 * finished since the last launch.
 *
 * Thread Safety:
 * - launch() may be called from any thread, including a task
 * - joinAll() must not be called from a task
 */
class TaskRunner {
public:
    explicit TaskRunner(std::string name);
    ~TaskRunner();

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    /**
     * @brief Reap finished threads, then start task on a new one
     */
    void launch(std::function<void()> task);

    /**
     * @brief Wait for every task and join all threads
     */
    void joinAll();

    /// Tasks still running
    size_t runningCount() const;

    /// Threads not yet joined (running or finished but unreaped)
    size_t threadCount() const;

    /**
     * @brief Wait until no task is running
     * @return false on timeout
     */
    bool waitForIdle(uint32_t timeoutMs);

private:
    void reapFinished();

    std::string m_name;
    mutable std::mutex m_mutex;
    std::condition_variable m_idleCv;
    std::map<uint64_t, std::thread> m_threads;
    std::vector<uint64_t> m_finished;
    uint64_t m_nextId;
    size_t m_running;
};

} // namespace LanConnect
