#ifndef POSTURE_DATABASE_SCHEMAS_H
#define POSTURE_DATABASE_SCHEMAS_H

#include <string>

namespace DatabaseSchemas {
    // finished posture sessions, append-only; record_id keeps insertion order
    const std::string CREATE_POSTURE_SESSIONS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS posture_sessions (
            record_id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL,
            session_id TEXT NOT NULL,
            session_seconds REAL,
            total_frames INTEGER,
            good_frames INTEGER,
            bad_frames INTEGER,
            good_percent REAL,
            bad_percent REAL,
            average_score REAL,
            longest_bad_secs REAL,
            created_time TEXT DEFAULT CURRENT_TIMESTAMP
        );
    )";

    const std::string CREATE_SESSION_ID_INDEX = R"(
        CREATE INDEX IF NOT EXISTS idx_posture_sessions_session_id
        ON posture_sessions(session_id);
    )";
} // namespace DatabaseSchemas

#endif // POSTURE_DATABASE_SCHEMAS_H
