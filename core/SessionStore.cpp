#include "SessionStore.h"

#include <string>
#include <utility>

#include "Errors.h"

using namespace std;

SessionPtr SessionStore::create(DistanceModel model, int home, vector<string> cities) {
    auto s = make_shared<Session>();
    s->model = move(model);
    s->home = home;
    s->cities = move(cities);
    s->created_at = chrono::steady_clock::now();

    lock_guard<mutex> lock(mutex_);
    if (max_sessions_ > 0) {
        while (sessions_.size() >= max_sessions_ && !order_.empty()) {
            sessions_.erase(order_.front());
            order_.pop_front();
        }
    }
    s->id = next_id_++;
    SessionPtr S(move(s));
    sessions_.emplace(S->id, S);
    order_.push_back(S->id);
    return S;
}

SessionPtr SessionStore::get(SessionId id) const {
    lock_guard<mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        throw SessionNotFoundError("Session " + to_string(id) + " not found. Start a new game.");
    }
    return it->second;
}

size_t SessionStore::size() const {
    lock_guard<mutex> lock(mutex_);
    return sessions_.size();
}
