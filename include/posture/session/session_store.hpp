#pragma once
// 会话持久化网关: 结束后的会话统计写入/查询/删除

#include <optional>
#include <string>
#include <vector>

#include "posture/db/DataTypes.h"

namespace posture {

// Failures are reported through return values, never thrown: an unsaved
// session still ends successfully for the caller.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual bool appendSession(const StoredSessionRecord& record) = 0;

    // oldest first
    virtual std::vector<StoredSessionRecord> getAllSessions() = 0;
    virtual std::vector<StoredSessionRecord> getRecentSessions(int limit) = 0;
    virtual std::optional<StoredSessionRecord> getSessionById(const std::string& session_id) = 0;

    // true if at least one row was removed
    virtual bool deleteSession(const std::string& session_id) = 0;
    virtual bool clearAllSessions() = 0;

    virtual StoreStatistics getStatistics() = 0;
};

} // namespace posture
