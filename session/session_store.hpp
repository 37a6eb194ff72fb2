#ifndef FACEFLAT_SESSION_SESSION_STORE_HPP
#define FACEFLAT_SESSION_SESSION_STORE_HPP

#include <kernel/kernel.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace faceflat {

struct SessionConfig {
    // Idle time after which a session is dropped
    int64_t ttl_seconds = 3600;

    // Inserting past this evicts the least recently used session
    size_t max_sessions = 64;
};

// One uploaded file's faces. Immutable once stored.
struct Session {
    std::string id;
    FaceSet faces;
};

// Sessions keyed by id. Safe to use from several request threads: readers
// share the lock and get their own reference to the immutable session.
class SessionStore {
public:
    using Clock = std::chrono::steady_clock;

    explicit SessionStore(const SessionConfig& config = SessionConfig{});

    // Stores the faces under a fresh id and returns it. Expired sessions
    // are dropped first.
    std::string insert(FaceSet faces, Clock::time_point now = Clock::now());

    // nullptr for an unknown or expired id. Refreshes the idle timer.
    std::shared_ptr<const Session> get(const std::string& id,
                                       Clock::time_point now = Clock::now()) const;

    bool remove(const std::string& id);

    // Drops every session idle for longer than the TTL; returns how many
    size_t evict_expired(Clock::time_point now = Clock::now());

    size_t size() const;

    const SessionConfig& config() const { return config_; }

private:
    struct Entry {
        Entry(std::shared_ptr<const Session> s, Clock::time_point t)
            : session(std::move(s)), last_access(t.time_since_epoch().count()) {}

        std::shared_ptr<const Session> session;
        mutable std::atomic<Clock::rep> last_access;
    };

    bool expired(const Entry& entry, Clock::time_point now) const;
    // Caller holds the unique lock
    size_t evict_expired_locked(Clock::time_point now);
    void evict_least_recent();
    std::string next_id();

    SessionConfig config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> sessions_;
    std::mt19937_64 rng_;
};

}  // namespace faceflat

#endif // FACEFLAT_SESSION_SESSION_STORE_HPP
