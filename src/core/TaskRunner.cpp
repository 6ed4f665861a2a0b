/**
 * @file TaskRunner.cpp
 * @brief One thread per background task, reaped as tasks finish
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/TaskRunner.h"
#include "lanconnect/Debug.h"
#include <chrono>
#include <exception>
#include <utility>

namespace LanConnect {

TaskRunner::TaskRunner(std::string name)
    : m_name(std::move(name))
    , m_nextId(1)
    , m_running(0)
{
}

TaskRunner::~TaskRunner() {
    joinAll();
}

void TaskRunner::launch(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    reapFinished();

    const uint64_t taskId = m_nextId++;
    ++m_running;

    m_threads.emplace(taskId, std::thread([this, taskId, task]() {
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("[" << m_name << "] Task failed: " << e.what());
        }

        std::lock_guard<std::mutex> taskLock(m_mutex);
        m_finished.push_back(taskId);
        --m_running;
        m_idleCv.notify_all();
    }));
}

void TaskRunner::joinAll() {
    std::map<uint64_t, std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        threads.swap(m_threads);
    }

    for (auto& entry : threads) {
        if (entry.second.joinable()) {
            entry.second.join();
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_finished.clear();
}

size_t TaskRunner::runningCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

size_t TaskRunner::threadCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threads.size();
}

bool TaskRunner::waitForIdle(uint32_t timeoutMs) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCv.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                             [this]() { return m_running == 0; });
}

void TaskRunner::reapFinished() {
    for (uint64_t taskId : m_finished) {
        auto it = m_threads.find(taskId);
        if (it != m_threads.end()) {
            if (it->second.joinable()) {
                it->second.join();
            }
            m_threads.erase(it);
        }
    }
    m_finished.clear();
}

} // namespace LanConnect
