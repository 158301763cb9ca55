/**
 * @file discovery.cpp
 * @brief Searches shared by all discovery engines.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/wsd/discovery.hpp"

namespace sdcdisco {
namespace wsd {

std::vector<QName> medicalDeviceTypes() {
    return {QName(ns::DPWS, "Device"), QName(ns::MDPWS, "MedicalDevice")};
}

std::vector<Service> Discovery::searchMedicalDeviceServices(const ScopeFilter& scopes,
                                                            std::chrono::milliseconds timeout,
                                                            std::chrono::milliseconds repeatProbeInterval) {
    return searchServices(medicalDeviceTypes(), scopes, timeout, repeatProbeInterval);
}

std::vector<Service> Discovery::searchMedicalDeviceServicesInLocation(const SdcLocation& location,
                                                                      std::chrono::milliseconds timeout) {
    return location.filterServicesInside(searchMedicalDeviceServices(std::nullopt, timeout,
                                                                     DEFAULT_PROBE_INTERVAL));
}

}  // namespace wsd
}  // namespace sdcdisco
