/**
 * @file address_monitor.hpp
 * @brief Periodic check of the host's IPv4 addresses.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/net/network_adapter.hpp"
#include "sdcdisco/wsd/export.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace sdcdisco {
namespace wsd {

/**
 * @class AddressObserver
 * @brief Notified when a local address appears or disappears.
 */
class SDCDISCO_WSD_API AddressObserver {
public:
    virtual ~AddressObserver() = default;

    virtual void onAddressAdded(const std::string& address) = 0;
    virtual void onAddressRemoved(const std::string& address) = 0;
};

/**
 * @class AddressMonitor
 * @brief Background thread diffing the adapter list every interval.
 *
 * start() performs the first scan on the calling thread, so all
 * addresses present at that moment are reported before it returns.
 *
 * Usage:
 * @code
 * AddressMonitor monitor(observer, net::getNetworkAdapters, std::chrono::seconds(5));
 * monitor.start();
 * // ... run ...
 * monitor.stop();
 * @endcode
 */
class SDCDISCO_WSD_API AddressMonitor {
public:
    AddressMonitor(AddressObserver& observer, net::AdapterProvider provider,
                   std::chrono::milliseconds interval);
    ~AddressMonitor();

    // Non-copyable
    AddressMonitor(const AddressMonitor&) = delete;
    AddressMonitor& operator=(const AddressMonitor&) = delete;

    void start();

    /**
     * @brief Stop the thread. Known addresses are forgotten, nothing is reported.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Run one scan now and report the differences.
     */
    void checkNow();

    std::vector<std::string> knownAddresses() const;

private:
    AddressObserver& observer_;
    net::AdapterProvider provider_;
    std::chrono::milliseconds interval_;

    mutable std::mutex addressesMutex_;
    std::set<std::string> addresses_;

    std::mutex waitMutex_;
    std::condition_variable waitCv_;
    std::atomic<bool> running_{false};
    std::thread thread_;

    void run();
};

}  // namespace wsd
}  // namespace sdcdisco
