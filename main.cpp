#include <algorithm>
#include <iostream>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <crow.h>
#include <nlohmann/json.hpp>

// Core engine
#include "core/Errors.h"
#include "core/Evaluator.h"
#include "core/InstanceGenerator.h"
#include "core/SessionStore.h"

// JSON surface and configuration
#include "api/JsonCodec.h"
#include "api/ServerConfig.h"

#include "utils/Timer.h"

using namespace std;

/**
 * @brief Hands every request its own generator. Only the seeding engine is
 * shared, behind a mutex, so no std::mt19937 is used by two threads at once.
 */
class SeedSource {
public:
    explicit SeedSource(uint32_t seed) : engine_(seed) {}

    mt19937 next() {
        lock_guard<mutex> lock(mutex_);
        return mt19937(engine_());
    }

private:
    mutex mutex_;
    mt19937 engine_;
};

static crow::response reply(int code, const json& body) {
    crow::response res(code, body.dump());
    res.set_header("Content-Type", "application/json");
    return res;
}

// Maps engine failures to HTTP status codes.
static crow::response reply_error(const exception& e) {
    int code = 500;
    if (dynamic_cast<const InvalidRouteError*>(&e) || dynamic_cast<const RequestError*>(&e)
        || dynamic_cast<const json::parse_error*>(&e)) {
        code = 400;
    } else if (dynamic_cast<const SessionNotFoundError*>(&e)) {
        code = 404;
    }
    if (code == 500) CROW_LOG_ERROR << "request failed: " << e.what();
    else CROW_LOG_WARNING << "rejected request (" << code << "): " << e.what();
    return reply(code, JsonCodec::error(e.what()));
}

static crow::LogLevel to_log_level(const string& s) {
    if (s == "debug") return crow::LogLevel::Debug;
    if (s == "warning") return crow::LogLevel::Warning;
    if (s == "error") return crow::LogLevel::Error;
    return crow::LogLevel::Info;
}

int main(int argc, char** argv) {
    ServerConfig cfg;
    try {
        vector<string> args(argv + 1, argv + argc);
        if (!ConfigLoader::parse_args(cfg, args)) {
            cout << ConfigLoader::usage(argv[0]);
            return 0;
        }
        cfg.validate();
    } catch (const ArenaError& e) {
        cerr << "Error: " << e.what() << "\n\n" << ConfigLoader::usage(argv[0]);
        return 1;
    }

    crow::SimpleApp app;
    app.loglevel(to_log_level(cfg.log_level));

    uint32_t seed = cfg.seed ? *cfg.seed : random_device{}();
    SeedSource seeds(seed);
    SessionStore store(cfg.max_sessions);
    Evaluator evaluator(cfg.evaluator);

    unsigned threads = cfg.threads > 0 ? (unsigned)cfg.threads : max(1u, thread::hardware_concurrency());
    CROW_LOG_INFO << "Traveling Salesman Arena on " << cfg.host << ":" << cfg.port
                  << " (" << threads << " threads, " << cfg.generator.pool_size << " cities, "
                  << cfg.generator.min_distance << "-" << cfg.generator.max_distance << " km, budget "
                  << cfg.evaluator.random_search_budget << ", seed " << (cfg.seed ? to_string(seed) : "random") << ")";

    CROW_ROUTE(app, "/health")([&store]() {
        return reply(200, {{"status", "healthy"}, {"sessions", store.size()}});
    });

    // NewInstance
    CROW_ROUTE(app, "/api/new-game").methods("POST"_method)([&](const crow::request&) {
        try {
            mt19937 rng = seeds.next();
            GeneratedInstance G = InstanceGenerator::generate(cfg.generator, rng);
            vector<string> cities = G.model.cities;
            SessionPtr S = store.create(move(G.model), G.home, move(cities));

            CROW_LOG_INFO << "new round " << S->id << ", home " << S->model.name_of(S->home);
            return reply(200, JsonCodec::new_game(*S, cfg.generator, cfg.evaluator.max_selected));
        } catch (const exception& e) {
            return reply_error(e);
        }
    });

    // Evaluate
    CROW_ROUTE(app, "/api/check-answer").methods("POST"_method)([&](const crow::request& req) {
        try {
            json body = json::parse(req.body);
            CheckAnswerRequest in = JsonCodec::parse_check_answer(body);
            SessionPtr S = store.get(in.session_id);

            mt19937 rng = seeds.next();
            Stopwatch sw;
            EvaluationReport R = evaluator.evaluate(*S, JsonCodec::full_route(in, *S), rng, in.player);

            const AlgorithmResult* exact = R.find("bruteforce");
            CROW_LOG_INFO << "round " << in.session_id << " checked for '" << in.player << "': "
                          << (R.user.route.size() - 2) << " cities, " << (R.correct ? "optimal" : "not optimal")
                          << ", exact solve " << (exact ? exact->elapsed_ms : 0.0) << " ms, total "
                          << sw.elapsed_ms() << " ms";
            return reply(200, JsonCodec::report(R));
        } catch (const exception& e) {
            return reply_error(e);
        }
    });

    CROW_ROUTE(app, "/api/complexity")([&evaluator]() {
        return reply(200, JsonCodec::complexity(evaluator.complexity_table()));
    });

    app.bindaddr(cfg.host).port((uint16_t)cfg.port).concurrency(threads).run();
    return 0;
}
