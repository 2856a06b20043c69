#include "posture/session/session_registry.hpp"

namespace posture {

SessionRegistry::EntryPtr SessionRegistry::create(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) return nullptr;

    auto entry = std::make_shared<Entry>(session_id);
    sessions_.emplace(session_id, entry);
    return entry;
}

SessionRegistry::EntryPtr SessionRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::pair<SessionRegistry::EntryPtr, bool> SessionRegistry::findOrCreate(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) return {it->second, false};

    auto entry = std::make_shared<Entry>(session_id);
    sessions_.emplace(session_id, entry);
    return {entry, true};
}

SessionRegistry::EntryPtr SessionRegistry::remove(const std::string& session_id, const EntryPtr& expected) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return nullptr;
    if (expected && it->second != expected) return nullptr;

    EntryPtr entry = std::move(it->second);
    sessions_.erase(it);
    return entry;
}

std::vector<SessionRegistry::EntryPtr> SessionRegistry::entries() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    std::vector<EntryPtr> out;
    out.reserve(sessions_.size());
    for (const auto& kv : sessions_) out.push_back(kv.second);
    return out;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return sessions_.size();
}

} // namespace posture
