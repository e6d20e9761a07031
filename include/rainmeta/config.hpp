// ====================================================================================
// RAINMETA - Configuration
// ====================================================================================

#ifndef RAINMETA_CONFIG_HPP_
#define RAINMETA_CONFIG_HPP_

#include <string>
#include <vector>

#include "rainmeta/logging.hpp"

namespace rainmeta::v1 {

// Subgraph endpoints every store created with default subgraphs starts with.
const std::vector<std::string>& DefaultSubgraphs();

struct Config {
    struct Store {
        std::vector<std::string> subgraphs;
        bool include_default_subgraphs = true;
        size_t resolver_threads = 0;  // 0 = hardware concurrency
    } store;

    struct Logging {
        logging::LogLevel level = logging::LogLevel::INFO;
        std::string log_file;
        bool console_output = true;
    } logging;

    // RAINMETA_LOG_LEVEL, RAINMETA_LOG_FILE, RAINMETA_SUBGRAPHS (comma separated),
    // RAINMETA_NO_DEFAULT_SUBGRAPHS. Unset or unparsable variables keep the default.
    static Config FromEnvironment();
};

void ApplyLoggingConfig(const Config& config);

}  // namespace rainmeta::v1

#endif  // RAINMETA_CONFIG_HPP_
