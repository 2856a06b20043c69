#pragma once
// 活跃会话表: 请求路径与流式路径共享, 每个会话自带互斥锁

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "posture/session/posture_session.hpp"

namespace posture {

class SessionRegistry {
public:
    // one live session plus the lock that serializes every access to it
    struct Entry {
        explicit Entry(const std::string& id) : session(id) {}
        std::mutex     mutex;
        PostureSession session;
    };
    using EntryPtr = std::shared_ptr<Entry>;

    SessionRegistry() = default;
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // nullptr if the id is already live
    EntryPtr create(const std::string& session_id);

    // nullptr if unknown
    EntryPtr find(const std::string& session_id) const;

    // second = true when the session was created by this call
    std::pair<EntryPtr, bool> findOrCreate(const std::string& session_id);

    // detaches the entry; exactly one caller gets it back, the rest get nullptr.
    // With `expected` set, only that exact entry is removed (a newer session
    // reusing the id stays live).
    EntryPtr remove(const std::string& session_id, const EntryPtr& expected = nullptr);

    std::vector<EntryPtr> entries() const;
    std::size_t size() const;

    // runs fn(PostureSession&) under the session lock
    template <typename Fn>
    static auto withSession(const EntryPtr& entry, Fn&& fn) -> decltype(fn(entry->session)) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        return fn(entry->session);
    }

private:
    mutable std::mutex map_mutex_;
    std::unordered_map<std::string, EntryPtr> sessions_;
};

} // namespace posture
