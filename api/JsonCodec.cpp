#include "JsonCodec.h"

#include <cctype>
#include <string>
#include <vector>

using namespace std;

namespace JsonCodec {

json new_game(const Session& S, const GeneratorParams& P, int max_selected) {
    return {
        {"sessionId", S.id},
        {"cities", S.cities},
        {"homeCity", S.model.name_of(S.home)},
        {"distanceMatrix", S.model.D},
        {"minDistance", P.min_distance},
        {"maxDistance", P.max_distance},
        {"maxSelected", max_selected}
    };
}

SessionId parse_session_id(const json& value) {
    if (value.is_number_unsigned()) return value.get<SessionId>();
    if (value.is_number_integer()) {
        long long v = value.get<long long>();
        // negative ids are never issued
        if (v < 0) throw SessionNotFoundError("Session " + to_string(v) + " not found. Start a new game.");
        return (SessionId)v;
    }
    if (value.is_string()) {
        const string& s = value.get_ref<const string&>();
        bool digits = !s.empty() && s.size() <= 19;
        for (char c : s) digits = digits && isdigit((unsigned char)c);
        if (!digits) throw SessionNotFoundError("Session '" + s + "' not found. Start a new game.");
        return stoull(s);
    }
    throw RequestError("sessionId must be a number");
}

static vector<string> read_city_list(const json& value, const char* field) {
    if (!value.is_array()) throw RequestError(string(field) + " must be an array of city names");
    vector<string> out;
    out.reserve(value.size());
    for (const auto& c : value) {
        if (!c.is_string()) throw RequestError(string(field) + " must be an array of city names");
        out.push_back(c.get<string>());
    }
    return out;
}

CheckAnswerRequest parse_check_answer(const json& body) {
    if (!body.is_object()) throw RequestError("Request body must be a JSON object");
    if (!body.contains("sessionId") || body["sessionId"].is_null()) {
        throw RequestError("sessionId is required. Start a new game first.");
    }

    CheckAnswerRequest req;
    req.session_id = parse_session_id(body["sessionId"]);

    if (body.contains("route")) {
        req.route = read_city_list(body["route"], "route");
    } else if (body.contains("routeBetween")) {
        req.route = read_city_list(body["routeBetween"], "routeBetween");
        req.between_only = true;
    } else {
        throw InvalidRouteError("Build a route by clicking on selected cities.");
    }

    if (body.contains("playerName")) {
        if (!body["playerName"].is_string()) throw RequestError("playerName must be a string");
        req.player = body["playerName"].get<string>();
    }
    return req;
}

vector<string> full_route(const CheckAnswerRequest& req, const Session& S) {
    if (!req.between_only) return req.route;
    const string& home = S.model.name_of(S.home);
    vector<string> r;
    r.reserve(req.route.size() + 2);
    r.push_back(home);
    r.insert(r.end(), req.route.begin(), req.route.end());
    r.push_back(home);
    return r;
}

json report(const EvaluationReport& R) {
    json algorithms = json::object();
    for (const auto& a : R.algorithms) {
        algorithms[a.name] = {
            {"route", a.route},
            {"distance", a.distance},
            {"durationMs", a.elapsed_ms}
        };
    }
    return {
        {"correct", R.correct},
        {"message", R.message},
        {"yourRoute", R.user.route},
        {"yourDistance", R.user.distance},
        {"yourDurationMs", R.user.elapsed_ms},
        {"optimalRoute", R.optimal.route},
        {"optimalDistance", R.optimal.distance},
        {"algorithms", algorithms}
    };
}

json complexity(const vector<pair<string, string>>& table) {
    json out = json::object();
    for (const auto& [name, text] : table) out[name] = text;
    return out;
}

json error(const string& message) {
    return {{"error", message}};
}

} // namespace JsonCodec
