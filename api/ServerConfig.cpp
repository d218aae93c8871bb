#include "ServerConfig.h"

#include <cstdint>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

#include "../core/Errors.h"
#include "../heuristics/RandomSearch.h"

using namespace std;

void ServerConfig::validate() const {
    if (port < 1 || port > 65535) throw ConfigurationError("port must be between 1 and 65535");
    if (threads < 0) throw ConfigurationError("threads must not be negative");
    if (log_level != "debug" && log_level != "info" && log_level != "warning" && log_level != "error") {
        throw ConfigurationError("unknown log level '" + log_level + "'");
    }
    InstanceGenerator::validate(generator);
    RandomSearch::validate_budget(evaluator.random_search_budget);
    if (evaluator.max_selected < 1 || evaluator.max_selected > MAX_SELECTED_CITIES) {
        throw ConfigurationError("max_selected must be between 1 and " + to_string(MAX_SELECTED_CITIES));
    }
    if (evaluator.max_selected > generator.pool_size - 1) {
        throw ConfigurationError("max_selected cannot exceed pool_size - 1");
    }
}

namespace ConfigLoader {

void apply_json(ServerConfig& cfg, const json& j) {
    if (!j.is_object()) throw ConfigurationError("config must be a JSON object");
    try {
        if (j.contains("host")) cfg.host = j["host"].get<string>();
        if (j.contains("port")) cfg.port = j["port"].get<int>();
        if (j.contains("threads")) cfg.threads = j["threads"].get<int>();
        if (j.contains("log_level")) cfg.log_level = j["log_level"].get<string>();
        if (j.contains("seed") && !j["seed"].is_null()) cfg.seed = j["seed"].get<uint32_t>();

        if (j.contains("pool_size")) cfg.generator.pool_size = j["pool_size"].get<int>();
        if (j.contains("min_distance")) cfg.generator.min_distance = j["min_distance"].get<int>();
        if (j.contains("max_distance")) cfg.generator.max_distance = j["max_distance"].get<int>();

        if (j.contains("random_search_budget")) cfg.evaluator.random_search_budget = j["random_search_budget"].get<int>();
        if (j.contains("max_selected")) cfg.evaluator.max_selected = j["max_selected"].get<int>();
        if (j.contains("max_sessions")) cfg.max_sessions = j["max_sessions"].get<size_t>();
    } catch (const json::exception& e) {
        throw ConfigurationError(string("bad config value: ") + e.what());
    }
}

void load_file(ServerConfig& cfg, const string& path) {
    ifstream file(path);
    if (!file) throw ConfigurationError("Config file not found: " + path);
    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Error parsing config " + path + ": " + e.what());
    }
    apply_json(cfg, j);
}

static int to_int(const string& flag, const string& value) {
    try {
        size_t used = 0;
        int v = stoi(value, &used);
        if (used != value.size()) throw invalid_argument(value);
        return v;
    } catch (const exception&) {
        throw ConfigurationError("Invalid value for " + flag + ": '" + value + "'");
    }
}

// Full uint32_t range, same as the "seed" key in the config file.
static uint32_t to_seed(const string& flag, const string& value) {
    bool digits = !value.empty();
    for (char c : value) digits = digits && c >= '0' && c <= '9';
    try {
        if (!digits) throw invalid_argument(value);
        unsigned long long v = stoull(value);
        if (v > numeric_limits<uint32_t>::max()) throw out_of_range(value);
        return (uint32_t)v;
    } catch (const exception&) {
        throw ConfigurationError("Invalid value for " + flag + ": '" + value + "'");
    }
}

bool parse_args(ServerConfig& cfg, const vector<string>& args) {
    // --config first so that the other flags override the file
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) throw ConfigurationError("--config needs a path");
            load_file(cfg, args[i + 1]);
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const string& a = args[i];
        if (a == "--help" || a == "-h") return false;

        if (i + 1 >= args.size()) throw ConfigurationError("Missing value for " + a);
        const string& v = args[++i];

        if (a == "--config") { /* already applied */ }
        else if (a == "--host") cfg.host = v;
        else if (a == "--port") cfg.port = to_int(a, v);
        else if (a == "--threads") cfg.threads = to_int(a, v);
        else if (a == "--log-level") cfg.log_level = v;
        else if (a == "--seed") cfg.seed = to_seed(a, v);
        else if (a == "--pool-size") cfg.generator.pool_size = to_int(a, v);
        else if (a == "--min-distance") cfg.generator.min_distance = to_int(a, v);
        else if (a == "--max-distance") cfg.generator.max_distance = to_int(a, v);
        else if (a == "--budget") cfg.evaluator.random_search_budget = to_int(a, v);
        else if (a == "--max-selected") cfg.evaluator.max_selected = to_int(a, v);
        else if (a == "--max-sessions") {
            int n = to_int(a, v);
            if (n < 0) throw ConfigurationError("--max-sessions must not be negative");
            cfg.max_sessions = (size_t)n;
        }
        else throw ConfigurationError("Unknown flag: " + a);
    }
    return true;
}

string usage(const string& prog) {
    return "Usage: " + prog + " [options]\n"
           "  --config PATH         JSON config file\n"
           "  --host HOST           Bind address (default: 0.0.0.0)\n"
           "  --port PORT           Server port (default: 8080)\n"
           "  --threads N           Worker threads (default: hardware concurrency)\n"
           "  --log-level LEVEL     debug, info, warning or error (default: info)\n"
           "  --seed N              Fixed random seed (default: random device)\n"
           "  --pool-size N         Cities per round, 2..26 (default: 10)\n"
           "  --min-distance D      Smallest distance (default: 50)\n"
           "  --max-distance D      Largest distance (default: 100)\n"
           "  --budget N            Random search samples (default: 1000)\n"
           "  --max-selected N      Cities a player may visit, 1..8 (default: 8)\n"
           "  --max-sessions N      Rounds kept in memory, 0 = unbounded (default: 10000)\n";
}

} // namespace ConfigLoader
