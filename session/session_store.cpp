#include "session_store.hpp"
#include <common/logging.hpp>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace faceflat {

SessionStore::SessionStore(const SessionConfig& config)
    : config_(config), rng_(std::random_device{}()) {}

bool SessionStore::expired(const Entry& entry, Clock::time_point now) const {
    Clock::time_point last{Clock::duration{entry.last_access.load()}};
    return now - last > std::chrono::seconds(config_.ttl_seconds);
}

std::string SessionStore::next_id() {
    // 128 random bits in the usual 8-4-4-4-12 layout
    uint64_t hi = rng_();
    uint64_t lo = rng_();
    std::ostringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << (hi >> 32) << "-"
       << std::setw(4) << ((hi >> 16) & 0xffff) << "-"
       << std::setw(4) << (hi & 0xffff) << "-"
       << std::setw(4) << (lo >> 48) << "-"
       << std::setw(12) << (lo & 0xffffffffffffULL);
    return ss.str();
}

void SessionStore::evict_least_recent() {
    auto oldest = sessions_.end();
    for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
        if (oldest == sessions_.end() ||
            it->second.last_access.load() < oldest->second.last_access.load()) {
            oldest = it;
        }
    }
    if (oldest != sessions_.end()) {
        logging::get_logger()->info("Session store full, evicting {}", oldest->first);
        sessions_.erase(oldest);
    }
}

std::string SessionStore::insert(FaceSet faces, Clock::time_point now) {
    std::unique_lock lock(mutex_);

    evict_expired_locked(now);
    if (config_.max_sessions > 0) {
        while (sessions_.size() >= config_.max_sessions) {
            evict_least_recent();
        }
    }

    std::string id = next_id();
    while (sessions_.count(id) > 0) {
        id = next_id();
    }

    auto session = std::make_shared<Session>();
    session->id = id;
    session->faces = std::move(faces);

    logging::get_logger()->info("Session {}: {} faces from {}", id, session->faces.size(),
                                session->faces.source_file);
    sessions_.try_emplace(id, std::move(session), now);
    return id;
}

std::shared_ptr<const Session> SessionStore::get(const std::string& id,
                                                 Clock::time_point now) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end() || expired(it->second, now)) {
        return nullptr;
    }
    it->second.last_access.store(now.time_since_epoch().count());
    return it->second.session;
}

bool SessionStore::remove(const std::string& id) {
    std::unique_lock lock(mutex_);
    return sessions_.erase(id) > 0;
}

size_t SessionStore::evict_expired(Clock::time_point now) {
    std::unique_lock lock(mutex_);
    return evict_expired_locked(now);
}

size_t SessionStore::evict_expired_locked(Clock::time_point now) {
    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (expired(it->second, now)) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        logging::get_logger()->info("Evicted {} expired session(s)", removed);
    }
    return removed;
}

size_t SessionStore::size() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

}  // namespace faceflat
