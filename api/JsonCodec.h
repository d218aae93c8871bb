#pragma once

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/Errors.h"
#include "../core/Evaluator.h"
#include "../core/InstanceGenerator.h"
#include "../core/SessionStore.h"

using json = nlohmann::json;

// Request body that is not the expected JSON shape (HTTP 400).
struct RequestError : ArenaError {
    using ArenaError::ArenaError;
};

// Parsed body of POST /api/check-answer.
struct CheckAnswerRequest {
    SessionId session_id = 0;
    std::vector<std::string> route;  // as sent
    bool between_only = false;       // true when sent as "routeBetween" (home omitted)
    std::string player;
};

namespace JsonCodec {

    // { sessionId, cities, homeCity, distanceMatrix, minDistance, maxDistance, maxSelected }
    json new_game(const Session& S, const GeneratorParams& P, int max_selected);

    /**
     * @brief Reads { sessionId, route | routeBetween, playerName? }.
     * "route" is home-to-home inclusive and wins if both are present.
     * Throws RequestError on a malformed body, SessionNotFoundError on an id
     * that cannot name any session, InvalidRouteError if no route is given.
     */
    CheckAnswerRequest parse_check_answer(const json& body);

    // Accepts a non-negative integer or a string of digits.
    SessionId parse_session_id(const json& value);

    // Home-to-home route for the request, wrapping "routeBetween" with the home city.
    std::vector<std::string> full_route(const CheckAnswerRequest& req, const Session& S);

    // { correct, message, yourRoute, yourDistance, yourDurationMs, optimalRoute, optimalDistance, algorithms }
    json report(const EvaluationReport& R);

    json complexity(const std::vector<std::pair<std::string, std::string>>& table);

    json error(const std::string& message);

} // namespace JsonCodec
