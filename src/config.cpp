#include "rainmeta/config.hpp"

#include <cstdlib>
#include <sstream>

namespace rainmeta::v1 {

const std::vector<std::string>& DefaultSubgraphs() {
    static const std::vector<std::string> subgraphs = {
        "https://api.thegraph.com/subgraphs/name/rainlanguage/interpreter-registry-np",
        "https://api.thegraph.com/subgraphs/name/rainlanguage/interpreter-registry-np-eth",
        "https://api.thegraph.com/subgraphs/name/rainlanguage/interpreter-registry-np-matic",
    };
    return subgraphs;
}

Config Config::FromEnvironment() {
    Config config;
    if (const char* level = std::getenv("RAINMETA_LOG_LEVEL")) {
        if (auto parsed = logging::ParseLogLevel(level)) config.logging.level = *parsed;
    }
    if (const char* file = std::getenv("RAINMETA_LOG_FILE")) config.logging.log_file = file;
    if (const char* subgraphs = std::getenv("RAINMETA_SUBGRAPHS")) {
        std::istringstream stream(subgraphs);
        std::string url;
        while (std::getline(stream, url, ',')) {
            if (!url.empty()) config.store.subgraphs.push_back(url);
        }
    }
    if (const char* no_default = std::getenv("RAINMETA_NO_DEFAULT_SUBGRAPHS")) {
        const std::string value = no_default;
        config.store.include_default_subgraphs = !(value == "1" || value == "true");
    }
    return config;
}

void ApplyLoggingConfig(const Config& config) {
    auto& logger = logging::Logger::instance();
    logger.setLevel(config.logging.level);
    logger.setConsoleOutput(config.logging.console_output);
    if (!config.logging.log_file.empty() && !logger.setLogFile(config.logging.log_file)) {
        RAINMETA_LOG_WARN("config", "cannot open log file " + config.logging.log_file);
    }
}

}  // namespace rainmeta::v1
