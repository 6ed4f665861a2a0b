/**
 * @file NetworkMonitor.h
 * @brief Detects local interface address changes
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace LanConnect {

/**
 * @class NetworkMonitor
 * @brief Polls the local IPv4 addresses and reports changes
 *
 * The callback fires on the monitor thread whenever the set of addresses
 * differs from the previous poll and at least one address is present
 * (network available). Joining a network therefore triggers it; losing
 * every interface does not.
 *
 * Thread Safety:
 * - start()/stop() must not race each other
 */
class NetworkMonitor {
public:
    using ChangeCallback = std::function<void()>;
    using AddressProvider = std::function<std::vector<std::string>()>;

    NetworkMonitor();
    ~NetworkMonitor();

    NetworkMonitor(const NetworkMonitor&) = delete;
    NetworkMonitor& operator=(const NetworkMonitor&) = delete;

    /**
     * @brief Take the initial snapshot and start polling
     * @param callback Invoked on each change while the network is available
     * @return false if already running
     */
    bool start(ChangeCallback callback);

    /**
     * @brief Stop polling and join the monitor thread
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    void setPollInterval(uint32_t intervalMs) { m_intervalMs = intervalMs; }

    /**
     * @brief Replace getifaddrs() as the address source (tests)
     */
    void setAddressProviderForTesting(AddressProvider provider);

    /**
     * @brief Sorted IPv4 addresses of all up, non-loopback interfaces
     */
    static std::vector<std::string> localIpv4Addresses();

private:
    void monitorThreadFunc();
    std::vector<std::string> snapshot() const;

    ChangeCallback m_callback;
    AddressProvider m_provider;
    std::vector<std::string> m_lastAddresses;
    uint32_t m_intervalMs;

    std::atomic<bool> m_running;
    std::atomic<bool> m_stopRequested;
    std::mutex m_waitMutex;
    std::condition_variable m_waitCv;
    std::thread m_thread;
};

} // namespace LanConnect
