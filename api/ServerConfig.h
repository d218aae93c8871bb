#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/Evaluator.h"
#include "../core/InstanceGenerator.h"

using json = nlohmann::json;

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    int threads = 0;                 // 0 = hardware concurrency
    std::string log_level = "info";  // debug, info, warning, error
    std::optional<std::uint32_t> seed; // unset = std::random_device

    GeneratorParams generator;
    EvaluatorOptions evaluator;
    std::size_t max_sessions = 10000; // 0 = unbounded

    // Throws ConfigurationError on the first invalid setting.
    void validate() const;
};

namespace ConfigLoader {

    // Overrides `cfg` with every known key present in `j`. Unknown keys are ignored.
    // Throws ConfigurationError on a value of the wrong type.
    void apply_json(ServerConfig& cfg, const nlohmann::json& j);

    // Reads and applies a JSON config file. Throws ConfigurationError if the
    // file cannot be opened or parsed.
    void load_file(ServerConfig& cfg, const std::string& path);

    /**
     * @brief Parses command-line flags. A --config file is applied first, then
     * every other flag overrides it, whatever the order on the command line.
     * @return false if --help was requested.
     * Throws ConfigurationError on unknown flags or bad values.
     */
    bool parse_args(ServerConfig& cfg, const std::vector<std::string>& args);

    std::string usage(const std::string& prog);

} // namespace ConfigLoader
