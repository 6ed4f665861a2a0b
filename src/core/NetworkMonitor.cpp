/**
 * @file NetworkMonitor.cpp
 * @brief Detects local interface address changes
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/NetworkMonitor.h"
#include "lanconnect/Debug.h"
#include "lanconnect/NetUtils.h"
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <algorithm>
#include <chrono>

namespace LanConnect {

NetworkMonitor::NetworkMonitor()
    : m_intervalMs(NETWORK_MONITOR_INTERVAL_MS)
    , m_running(false)
    , m_stopRequested(false)
{
}

NetworkMonitor::~NetworkMonitor() {
    stop();
}

bool NetworkMonitor::start(ChangeCallback callback) {
    if (m_running.load()) {
        return false;
    }

    m_callback = std::move(callback);
    m_lastAddresses = snapshot();
    m_stopRequested = false;
    m_running = true;
    m_thread = std::thread(&NetworkMonitor::monitorThreadFunc, this);
    return true;
}

void NetworkMonitor::stop() {
    if (!m_running.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_waitMutex);
        m_stopRequested = true;
    }
    m_waitCv.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running = false;
}

void NetworkMonitor::setAddressProviderForTesting(AddressProvider provider) {
    m_provider = std::move(provider);
}

std::vector<std::string> NetworkMonitor::localIpv4Addresses() {
    std::vector<std::string> addresses;

    struct ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        return addresses;
    }

    for (struct ifaddrs* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) {
            continue;
        }
        addresses.push_back(addressToString(ifa->ifa_addr));
    }

    freeifaddrs(list);

    std::sort(addresses.begin(), addresses.end());
    addresses.erase(std::unique(addresses.begin(), addresses.end()), addresses.end());
    return addresses;
}

std::vector<std::string> NetworkMonitor::snapshot() const {
    return m_provider ? m_provider() : localIpv4Addresses();
}

void NetworkMonitor::monitorThreadFunc() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_waitMutex);
            m_waitCv.wait_for(lock, std::chrono::milliseconds(m_intervalMs),
                              [this]() { return m_stopRequested.load(); });
            if (m_stopRequested.load()) {
                break;
            }
        }

        std::vector<std::string> current = snapshot();
        if (current == m_lastAddresses) {
            continue;
        }

        LOG_INFO("[NetworkMonitor] Interface addresses changed (" << current.size()
                 << " IPv4 address(es))");
        m_lastAddresses = current;

        if (!current.empty() && m_callback) {
            try {
                m_callback();
            } catch (const std::exception& e) {
                LOG_ERROR("[NetworkMonitor] Change callback threw: " << e.what());
            }
        }
    }
}

} // namespace LanConnect
