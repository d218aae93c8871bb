#pragma once

#include <string>
#include <vector>

/**
 * @brief Basic types shared by the engine.
 * Cities are indices into the alphabet below; a route is a list of such indices.
 */

// City names, ordered. A model of N cities uses the first N letters.
inline const std::string CITY_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";

constexpr int DEFAULT_POOL_SIZE = 10;   // A..J
constexpr int MAX_SELECTED_CITIES = 8;  // 8! tours for the exact solver

using Route = std::vector<int>;
