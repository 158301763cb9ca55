/**
 * @file address_monitor.cpp
 * @brief AddressMonitor implementation.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/wsd/address_monitor.hpp"
#include "sdcdisco/utils/logger.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <utility>

namespace sdcdisco {
namespace wsd {

AddressMonitor::AddressMonitor(AddressObserver& observer, net::AdapterProvider provider,
                               std::chrono::milliseconds interval)
    : observer_(observer)
    , provider_(std::move(provider))
    , interval_(interval)
{}

AddressMonitor::~AddressMonitor() {
    stop();
}

void AddressMonitor::start() {
    if (running_.exchange(true)) {
        return;
    }
    checkNow();
    thread_ = std::thread(&AddressMonitor::run, this);
    LOG_DEBUG("AddressMonitor", "Started, checking every {}ms", interval_.count());
}

void AddressMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    waitCv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(addressesMutex_);
    addresses_.clear();
    LOG_DEBUG("AddressMonitor", "Stopped");
}

void AddressMonitor::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(waitMutex_);
            if (waitCv_.wait_for(lock, interval_, [this]() { return !running_.load(); })) {
                return;
            }
        }
        checkNow();
    }
}

void AddressMonitor::checkNow() {
    std::set<std::string> current;
    for (const auto& adapter : provider_()) {
        if (adapter.ip != "0.0.0.0") {
            current.insert(adapter.ip);
        }
    }

    std::vector<std::string> disappeared;
    std::vector<std::string> appeared;
    {
        std::lock_guard<std::mutex> lock(addressesMutex_);
        std::set_difference(addresses_.begin(), addresses_.end(), current.begin(), current.end(),
                            std::back_inserter(disappeared));
        std::set_difference(current.begin(), current.end(), addresses_.begin(), addresses_.end(),
                            std::back_inserter(appeared));
        addresses_ = current;
    }

    for (const auto& address : disappeared) {
        LOG_INFO("AddressMonitor", "Address removed: {}", address);
        try {
            observer_.onAddressRemoved(address);
        } catch (const std::exception& e) {
            LOG_WARN("AddressMonitor", "Error handling removal of {}: {}", address, e.what());
        }
    }

    for (const auto& address : appeared) {
        LOG_INFO("AddressMonitor", "Address added: {}", address);
        try {
            observer_.onAddressAdded(address);
        } catch (const std::exception& e) {
            LOG_WARN("AddressMonitor", "Error handling new address {}: {}", address, e.what());
        }
    }
}

std::vector<std::string> AddressMonitor::knownAddresses() const {
    std::lock_guard<std::mutex> lock(addressesMutex_);
    return std::vector<std::string>(addresses_.begin(), addresses_.end());
}

}  // namespace wsd
}  // namespace sdcdisco
