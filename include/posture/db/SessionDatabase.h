#ifndef POSTURE_SESSION_DATABASE_H
#define POSTURE_SESSION_DATABASE_H

#include <SQLiteCpp/SQLiteCpp.h>
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>

#include "DataTypes.h"
#include "posture/session/session_store.hpp"

// SQLite implementation of the session store
class SessionDatabase : public posture::SessionStore {
public:
    // ":memory:" gives a private in-memory database
    explicit SessionDatabase(const std::string& db_path = "out/posture_sessions.db");
    ~SessionDatabase() override = default;

    // Copying and assignment are prohibited
    SessionDatabase(const SessionDatabase&) = delete;
    SessionDatabase& operator=(const SessionDatabase&) = delete;

    // Database Initialization
    bool initialize();

    // Insert operation (numeric fields rounded to 2 decimals)
    bool appendSession(const StoredSessionRecord& record) override;

    // Query operation
    std::vector<StoredSessionRecord> getAllSessions() override;
    std::vector<StoredSessionRecord> getRecentSessions(int limit) override;
    std::optional<StoredSessionRecord> getSessionById(const std::string& session_id) override;
    StoreStatistics getStatistics() override;

    // Delete operation
    bool deleteSession(const std::string& session_id) override;
    bool clearAllSessions() override;

    // Utility method
    bool exec(const std::string& sql);
    const std::string& path() const { return db_path_; }

private:
    std::string db_path_;
    std::unique_ptr<SQLite::Database> database_;
    std::mutex db_mutex_;

    bool createTables();
    static StoredSessionRecord readRow(SQLite::Statement& query);
};

#endif // POSTURE_SESSION_DATABASE_H
