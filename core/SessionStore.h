#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "DistanceModel.h"

using SessionId = std::uint64_t;

// One round: generated once, read-only afterwards.
struct Session {
    SessionId id = 0;
    DistanceModel model;
    int home = 0;
    std::vector<std::string> cities;
    std::chrono::steady_clock::time_point created_at;
};

using SessionPtr = std::shared_ptr<const Session>;

/**
 * @brief Thread-safe map from session id to round.
 *
 * Ids come from a counter starting at 1 and are never reused. create() hands
 * back the inserted session itself, so the caller keeps it even if a
 * concurrent create() evicts it right away. Readers hold shared handles, so
 * eviction never pulls a model out from under a running evaluation.
 *
 * With max_sessions > 0 the oldest session is evicted when the store is full.
 */
class SessionStore {
public:
    explicit SessionStore(std::size_t max_sessions = 0) : max_sessions_(max_sessions) {}

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    SessionPtr create(DistanceModel model, int home, std::vector<std::string> cities);

    // Throws SessionNotFoundError for ids never issued or already evicted.
    SessionPtr get(SessionId id) const;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<SessionId, SessionPtr> sessions_;
    std::deque<SessionId> order_; // creation order, oldest first
    SessionId next_id_ = 1;
    std::size_t max_sessions_;
};
