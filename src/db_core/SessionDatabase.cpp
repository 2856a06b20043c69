#include "posture/db/SessionDatabase.h"
#include "posture/db/DatabaseSchemas.h"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace {
const char* kSelectColumns =
    "SELECT timestamp, session_id, session_seconds, total_frames, good_frames, bad_frames, "
    "good_percent, bad_percent, average_score, longest_bad_secs FROM posture_sessions";
}

SessionDatabase::SessionDatabase(const std::string& db_path) : db_path_(db_path) {
    // make sure the parent directory exists for file databases
    if (db_path_ != ":memory:") {
        const auto parent = std::filesystem::path(db_path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                std::cerr << "[DB] Failed to create directory " << parent.string() << ": " << ec.message() << std::endl;
            }
        }
    }
    try {
        database_ = std::make_unique<SQLite::Database>(db_path_, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
        std::cout << "[DB] Database opened successfully: " << db_path_ << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Failed to open database: " << e.what() << std::endl;
        throw;
    }
}

bool SessionDatabase::initialize() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        bool success = createTables();
        if (success) {
            std::cout << "[DB] Database initialized successfully." << std::endl;
        }
        return success;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Database initialization failed: " << e.what() << std::endl;
        return false;
    }
}

// Create Table
bool SessionDatabase::createTables() {
    try {
        database_->exec(DatabaseSchemas::CREATE_POSTURE_SESSIONS_TABLE);
        database_->exec(DatabaseSchemas::CREATE_SESSION_ID_INDEX);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Table creation failed: " << e.what() << std::endl;
        return false;
    }
}

bool SessionDatabase::appendSession(const StoredSessionRecord& record) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_,
            "INSERT INTO posture_sessions (timestamp, session_id, session_seconds, total_frames, good_frames, "
            "bad_frames, good_percent, bad_percent, average_score, longest_bad_secs) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");

        query.bind(1, record.timestamp);
        query.bind(2, record.session_id);
        query.bind(3, roundTo2(record.session_seconds));
        query.bind(4, record.total_frames);
        query.bind(5, record.good_frames);
        query.bind(6, record.bad_frames);
        query.bind(7, roundTo2(record.good_percent));
        query.bind(8, roundTo2(record.bad_percent));
        query.bind(9, roundTo2(record.average_score));
        query.bind(10, roundTo2(record.longest_bad_secs));

        bool success = query.exec() == 1;
        if (success) {
            std::cout << "[DB] Session saved: " << record.session_id << std::endl;
        }
        return success;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Save session failed: " << e.what() << std::endl;
        return false;
    }
}

StoredSessionRecord SessionDatabase::readRow(SQLite::Statement& query) {
    StoredSessionRecord r;
    r.timestamp        = query.getColumn(0).getString();
    r.session_id       = query.getColumn(1).getString();
    r.session_seconds  = query.getColumn(2).getDouble();
    r.total_frames     = query.getColumn(3).getInt();
    r.good_frames      = query.getColumn(4).getInt();
    r.bad_frames       = query.getColumn(5).getInt();
    r.good_percent     = query.getColumn(6).getDouble();
    r.bad_percent      = query.getColumn(7).getDouble();
    r.average_score    = query.getColumn(8).getDouble();
    r.longest_bad_secs = query.getColumn(9).getDouble();
    return r;
}

std::vector<StoredSessionRecord> SessionDatabase::getAllSessions() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::vector<StoredSessionRecord> results;

    try {
        SQLite::Statement query(*database_, std::string(kSelectColumns) + " ORDER BY record_id ASC");
        while (query.executeStep()) {
            results.push_back(readRow(query));
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get all sessions failed: " << e.what() << std::endl;
    }
    return results;
}

// Most recent N rows, returned oldest first
std::vector<StoredSessionRecord> SessionDatabase::getRecentSessions(int limit) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::vector<StoredSessionRecord> results;
    if (limit <= 0) return results;

    try {
        SQLite::Statement query(*database_, std::string(kSelectColumns) + " ORDER BY record_id DESC LIMIT ?");
        query.bind(1, limit);
        while (query.executeStep()) {
            results.push_back(readRow(query));
        }
        std::reverse(results.begin(), results.end());
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get recent sessions failed: " << e.what() << std::endl;
    }
    return results;
}

std::optional<StoredSessionRecord> SessionDatabase::getSessionById(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, std::string(kSelectColumns) + " WHERE session_id = ? ORDER BY record_id ASC LIMIT 1");
        query.bind(1, session_id);
        if (query.executeStep()) {
            return readRow(query);
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get session failed: " << e.what() << std::endl;
    }
    return std::nullopt;
}

/* 汇总统计
*  each average only covers rows whose own field is numeric; non-numeric or
*  missing values drop out of that average but still count as a session
*/
StoreStatistics SessionDatabase::getStatistics() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    StoreStatistics stats;

    try {
        SQLite::Statement query(*database_, R"(
            SELECT COUNT(*),
                   SUM(CASE WHEN typeof(session_seconds) IN ('integer', 'real') THEN session_seconds END),
                   AVG(CASE WHEN typeof(good_percent)    IN ('integer', 'real') THEN good_percent END),
                   AVG(CASE WHEN typeof(bad_percent)     IN ('integer', 'real') THEN bad_percent END),
                   AVG(CASE WHEN typeof(average_score)   IN ('integer', 'real') THEN average_score END)
            FROM posture_sessions
        )");

        if (query.executeStep()) {
            stats.total_sessions         = query.getColumn(0).getInt();
            stats.total_duration_seconds = query.getColumn(1).isNull() ? 0.0 : roundTo2(query.getColumn(1).getDouble());
            stats.average_good_percent   = query.getColumn(2).isNull() ? 0.0 : roundTo2(query.getColumn(2).getDouble());
            stats.average_bad_percent    = query.getColumn(3).isNull() ? 0.0 : roundTo2(query.getColumn(3).getDouble());
            stats.average_score          = query.getColumn(4).isNull() ? 0.0 : roundTo2(query.getColumn(4).getDouble());
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get statistics failed: " << e.what() << std::endl;
    }
    return stats;
}

bool SessionDatabase::deleteSession(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, "DELETE FROM posture_sessions WHERE session_id = ?");
        query.bind(1, session_id);
        const int removed = query.exec();
        if (removed > 0) {
            std::cout << "[DB] Session deleted: " << session_id << std::endl;
        }
        return removed > 0;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Delete session failed: " << e.what() << std::endl;
        return false;
    }
}

bool SessionDatabase::clearAllSessions() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        database_->exec("DELETE FROM posture_sessions");
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Clear sessions failed: " << e.what() << std::endl;
        return false;
    }
}

bool SessionDatabase::exec(const std::string& sql) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        database_->exec(sql);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Execute SQL failed: " << e.what() << std::endl;
        std::cerr << "SQL: " << sql << std::endl;
        return false;
    }
}
