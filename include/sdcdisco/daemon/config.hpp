/**
 * @file config.hpp
 * @brief sdcdiscod daemon configuration and CLI parsing
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sdcdisco {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    // Adapter selection
    std::string adapter_mode = "all";           ///< "all", "blacklist", "whitelist", "single"
    std::vector<std::string> adapters;          ///< Regex patterns for blacklist/whitelist
    std::string adapter_name;                   ///< Adapter for "single" mode
    bool force_adapter = false;                 ///< Fail instead of falling back in "single" mode

    // Multicast discovery
    uint16_t mcast_port = 3702;
    int mcast_ttl = 15;

    // Discovery proxy
    std::string proxy_url;                      ///< Empty: multicast only
    std::string proxy_ca_file;                  ///< PEM trust store for https proxies
    bool search_udp = false;                    ///< Also search via multicast when a proxy is set

    // API server
    std::string bind_addr = "127.0.0.1";
    uint16_t api_port = 50061;

    std::string log_level = "INFO";
    bool help = false;
    bool error = false;                         ///< Set together with help on invalid input
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "sdcdiscod - WS-Discovery daemon for SDC devices\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Adapter Options:\n"
              << "  --adapter-mode <mode>   all, blacklist, whitelist or single (default: all)\n"
              << "  --adapters <list>       Comma separated address regexes for blacklist/whitelist\n"
              << "  --adapter-name <name>   Adapter used in single mode\n"
              << "  --force-adapter         Fail if the single-mode adapter is missing\n"
              << "\nDiscovery Options:\n"
              << "  --mcast-port <port>     WS-Discovery port (default: 3702)\n"
              << "  --mcast-ttl <ttl>       Multicast TTL (default: 15)\n"
              << "  --proxy-url <url>       http(s) URL of a discovery proxy\n"
              << "  --proxy-ca <file>       CA certificates (PEM) for an https proxy\n"
              << "  --search-udp            With a proxy, search via multicast as well\n"
              << "\nAPI Options:\n"
              << "  --bind <addr>           Bind address of the gRPC API (default: 127.0.0.1)\n"
              << "  --api-port <port>       gRPC API port (default: 50061)\n"
              << "  --log-level <level>     Log level: TRACE, DEBUG, INFO, WARN, ERROR, FATAL (default: INFO)\n"
              << "\n  --help                  Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --adapter-mode whitelist --adapters '10\\.,192\\.168\\.'\n"
              << "  " << program_name << " --proxy-url https://dp.local/discovery --proxy-ca ca.pem\n";
}

/**
 * @brief Split a comma separated list, dropping empty items.
 */
inline std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(',', start);
        if (end == std::string::npos) {
            end = value.size();
        }
        if (end > start) {
            items.push_back(value.substr(start, end - start));
        }
        start = end + 1;
    }
    return items;
}

/**
 * @brief Parse a port number.
 * @throws std::invalid_argument for values outside 1..65535
 */
inline uint16_t parsePort(const char* value) {
    int port = std::stoi(value);
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument(std::string("invalid port ") + value);
    }
    return static_cast<uint16_t>(port);
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Flags
        if (std::strcmp(arg, "--force-adapter") == 0) {
            config.force_adapter = true;
            continue;
        }
        if (std::strcmp(arg, "--search-udp") == 0) {
            config.search_udp = true;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.help = true;
            config.error = true;
            return config;
        }

        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--adapter-mode") == 0) {
                config.adapter_mode = value;
            } else if (std::strcmp(arg, "--adapters") == 0) {
                config.adapters = splitList(value);
            } else if (std::strcmp(arg, "--adapter-name") == 0) {
                config.adapter_name = value;
            } else if (std::strcmp(arg, "--mcast-port") == 0) {
                config.mcast_port = parsePort(value);
            } else if (std::strcmp(arg, "--mcast-ttl") == 0) {
                config.mcast_ttl = std::stoi(value);
            } else if (std::strcmp(arg, "--proxy-url") == 0) {
                config.proxy_url = value;
            } else if (std::strcmp(arg, "--proxy-ca") == 0) {
                config.proxy_ca_file = value;
            } else if (std::strcmp(arg, "--bind") == 0) {
                config.bind_addr = value;
            } else if (std::strcmp(arg, "--api-port") == 0) {
                config.api_port = parsePort(value);
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else {
                std::cerr << "Error: Unknown option " << arg << "\n";
                config.help = true;
                config.error = true;
                return config;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: Invalid value '" << value << "' for " << arg << ": " << e.what() << "\n";
            config.help = true;
            config.error = true;
            return config;
        }
    }

    if (config.adapter_mode != "all" && config.adapter_mode != "blacklist" && config.adapter_mode != "whitelist" &&
        config.adapter_mode != "single") {
        std::cerr << "Error: Unknown adapter mode " << config.adapter_mode << "\n";
        config.help = true;
        config.error = true;
    } else if (config.adapter_mode == "single" && config.adapter_name.empty() && config.force_adapter) {
        std::cerr << "Error: --force-adapter needs --adapter-name\n";
        config.help = true;
        config.error = true;
    }

    return config;
}

} // namespace daemon
} // namespace sdcdisco
