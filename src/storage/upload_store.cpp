#include "uplift/storage/upload_store.hpp"
#include "uplift/core/logger.hpp"
#include "uplift/core/utils.hpp"
#include <sqlite3.h>

namespace uplift::storage {

using core::UploadError;
using core::UploadResult;
using core::utils::TimeUtils;

namespace {

constexpr const char* SESSION_COLUMNS = R"(
    session_id, source_path, file_name, content_type, total_bytes, chunk_bytes, total_parts,
    remote_upload_id, remote_path, status, network_type, requires_charging,
    requires_battery_not_low, requires_storage_not_low, auto_resume, auto_resume_delay_ms,
    max_retries, auto_paused, pause_reason, source_size, source_mtime, created_at, updated_at,
    error_message
)";

constexpr const char* PART_COLUMNS = R"(
    session_id, part_number, range_start, range_end, status, integrity_token,
    retry_count, last_attempt_at, content_digest
)";

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : stmt_(nullptr) {
        rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
    }

    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK; }
    sqlite3_stmt* get() const { return stmt_; }

    void bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bind(int index, int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }

    void bind(int index, const std::optional<std::string>& value) {
        if (value) {
            bind(index, *value);
        } else {
            sqlite3_bind_null(stmt_, index);
        }
    }

    void bind_null(int index) {
        sqlite3_bind_null(stmt_, index);
    }

    int step() { return sqlite3_step(stmt_); }

private:
    sqlite3_stmt* stmt_;
    int rc_;
};

std::string column_text(sqlite3_stmt* stmt, int column) {
    auto text = sqlite3_column_text(stmt, column);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int column) {
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_text(stmt, column);
}

std::string status_list(const std::vector<SessionStatus>& statuses) {
    std::vector<std::string> quoted;
    for (auto status : statuses) {
        quoted.push_back(std::string("'") + to_string(status) + "'");
    }
    return core::utils::StringUtils::join(quoted, ", ");
}

UploadResult read_session(sqlite3_stmt* stmt, UploadSession& session) {
    session.session_id = column_text(stmt, 0);
    session.source_path = column_text(stmt, 1);
    session.file_name = column_text(stmt, 2);
    session.content_type = column_text(stmt, 3);
    session.total_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
    session.chunk_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
    session.total_parts = static_cast<uint32_t>(sqlite3_column_int64(stmt, 6));
    session.remote_upload_id = column_text(stmt, 7);
    session.remote_path = column_text(stmt, 8);

    auto status_code = column_text(stmt, 9);
    auto status = session_status_from_string(status_code);
    if (!status) {
        return UploadResult(UploadError::PERSISTENCE,
                            "Unknown session status '" + status_code + "' for " + session.session_id);
    }
    session.status = *status;

    auto network_code = column_text(stmt, 10);
    auto network = transfer::network_type_from_string(network_code);
    if (!network) {
        return UploadResult(UploadError::PERSISTENCE,
                            "Unknown network constraint '" + network_code + "' for " + session.session_id);
    }
    session.constraints.network_type = *network;
    session.constraints.requires_charging = sqlite3_column_int(stmt, 11) != 0;
    session.constraints.requires_battery_not_low = sqlite3_column_int(stmt, 12) != 0;
    session.constraints.requires_storage_not_low = sqlite3_column_int(stmt, 13) != 0;
    session.constraints.auto_resume_when_satisfied = sqlite3_column_int(stmt, 14) != 0;
    session.constraints.auto_resume_delay = std::chrono::milliseconds(sqlite3_column_int64(stmt, 15));

    session.max_retries = sqlite3_column_int(stmt, 16);
    session.auto_paused = sqlite3_column_int(stmt, 17) != 0;
    session.pause_reason = column_text(stmt, 18);
    session.fingerprint.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 19));
    session.fingerprint.modified_ms = sqlite3_column_int64(stmt, 20);
    session.created_at = TimeUtils::from_epoch_ms(sqlite3_column_int64(stmt, 21));
    session.updated_at = TimeUtils::from_epoch_ms(sqlite3_column_int64(stmt, 22));
    session.error_message = column_optional_text(stmt, 23);

    return UploadResult();
}

UploadResult read_part(sqlite3_stmt* stmt, UploadPart& part) {
    part.session_id = column_text(stmt, 0);
    part.part_number = static_cast<uint32_t>(sqlite3_column_int64(stmt, 1));
    part.range.start = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
    part.range.end = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));

    auto status_code = column_text(stmt, 4);
    auto status = part_status_from_string(status_code);
    if (!status) {
        return UploadResult(UploadError::PERSISTENCE,
                            "Unknown part status '" + status_code + "' for part " +
                            std::to_string(part.part_number) + " of " + part.session_id);
    }
    part.status = *status;
    part.integrity_token = column_optional_text(stmt, 5);
    part.retry_count = static_cast<uint32_t>(sqlite3_column_int64(stmt, 6));

    if (sqlite3_column_type(stmt, 7) == SQLITE_NULL) {
        part.last_attempt_at.reset();
    } else {
        part.last_attempt_at = TimeUtils::from_epoch_ms(sqlite3_column_int64(stmt, 7));
    }
    part.content_digest = column_text(stmt, 8);

    return UploadResult();
}

}

UploadStore::UploadStore(const std::filesystem::path& database_path)
    : db_path_(database_path), db_(nullptr) {
}

UploadStore::~UploadStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool UploadStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_) {
        return true;
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int result = sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open upload database {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(result));
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    sqlite3_busy_timeout(db_, 5000);

    if (!execute("PRAGMA foreign_keys = ON;") || !create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // WAL is unavailable for in-memory databases; the default journal is fine there
    execute("PRAGMA journal_mode = WAL;");

    LOG_DEBUG("Upload database ready at {}", db_path_.string());
    return true;
}

bool UploadStore::create_tables() {
    const char* create_sessions_table = R"(
        CREATE TABLE IF NOT EXISTS upload_sessions (
            session_id TEXT PRIMARY KEY,
            source_path TEXT NOT NULL,
            file_name TEXT NOT NULL,
            content_type TEXT NOT NULL,
            total_bytes INTEGER NOT NULL,
            chunk_bytes INTEGER NOT NULL,
            total_parts INTEGER NOT NULL,
            remote_upload_id TEXT,
            remote_path TEXT,
            status TEXT NOT NULL,
            network_type TEXT NOT NULL,
            requires_charging INTEGER NOT NULL DEFAULT 0,
            requires_battery_not_low INTEGER NOT NULL DEFAULT 0,
            requires_storage_not_low INTEGER NOT NULL DEFAULT 0,
            auto_resume INTEGER NOT NULL DEFAULT 1,
            auto_resume_delay_ms INTEGER NOT NULL DEFAULT 2000,
            max_retries INTEGER NOT NULL,
            auto_paused INTEGER NOT NULL DEFAULT 0,
            pause_reason TEXT,
            source_size INTEGER NOT NULL,
            source_mtime INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            error_message TEXT
        );
    )";

    const char* create_parts_table = R"(
        CREATE TABLE IF NOT EXISTS upload_parts (
            session_id TEXT NOT NULL,
            part_number INTEGER NOT NULL,
            range_start INTEGER NOT NULL,
            range_end INTEGER NOT NULL,
            part_size INTEGER NOT NULL,
            status TEXT NOT NULL,
            integrity_token TEXT,
            uploaded_bytes INTEGER NOT NULL DEFAULT 0,
            retry_count INTEGER NOT NULL DEFAULT 0,
            last_attempt_at INTEGER,
            content_digest TEXT,
            updated_at INTEGER NOT NULL,
            PRIMARY KEY (session_id, part_number),
            FOREIGN KEY (session_id) REFERENCES upload_sessions(session_id) ON DELETE CASCADE
        );
    )";

    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_sessions_status ON upload_sessions(status);
        CREATE INDEX IF NOT EXISTS idx_sessions_source ON upload_sessions(source_path);
        CREATE INDEX IF NOT EXISTS idx_sessions_updated_at ON upload_sessions(updated_at);
        CREATE INDEX IF NOT EXISTS idx_parts_status ON upload_parts(session_id, status);
    )";

    return execute(create_sessions_table) && execute(create_parts_table) && execute(create_indexes);
}

bool UploadStore::execute(const char* sql) {
    char* error_msg = nullptr;

    int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("SQL error: {}", error_msg ? error_msg : sqlite3_errstr(result));
        sqlite3_free(error_msg);
        return false;
    }

    return true;
}

UploadResult UploadStore::error(const std::string& context) const {
    std::string detail = db_ ? sqlite3_errmsg(db_) : "database not open";
    LOG_ERROR("{}: {}", context, detail);
    return UploadResult(UploadError::PERSISTENCE, context + ": " + detail);
}

UploadResult UploadStore::check_open() const {
    if (!db_) {
        return UploadResult(UploadError::PERSISTENCE, "Upload database is not initialized");
    }
    return UploadResult();
}

UploadResult UploadStore::create_session(const UploadSession& session, const std::vector<UploadPart>& parts) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = check_open(); !open) return open;

    if (!execute("BEGIN IMMEDIATE;")) {
        return error("Failed to begin session transaction");
    }

    auto rollback = [this](const std::string& context) {
        auto result = error(context);
        execute("ROLLBACK;");
        return result;
    };

    {
        Statement stmt(db_, std::string("INSERT INTO upload_sessions (") + SESSION_COLUMNS +
                            ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        if (!stmt.ok()) {
            return rollback("Failed to prepare session insert");
        }

        const auto& constraints = session.constraints;
        stmt.bind(1, session.session_id);
        stmt.bind(2, session.source_path);
        stmt.bind(3, session.file_name);
        stmt.bind(4, session.content_type);
        stmt.bind(5, static_cast<int64_t>(session.total_bytes));
        stmt.bind(6, static_cast<int64_t>(session.chunk_bytes));
        stmt.bind(7, static_cast<int64_t>(session.total_parts));
        if (session.remote_upload_id.empty()) {
            stmt.bind_null(8);
            stmt.bind_null(9);
        } else {
            stmt.bind(8, session.remote_upload_id);
            stmt.bind(9, session.remote_path);
        }
        stmt.bind(10, std::string(to_string(session.status)));
        stmt.bind(11, std::string(transfer::to_string(constraints.network_type)));
        stmt.bind(12, static_cast<int64_t>(constraints.requires_charging));
        stmt.bind(13, static_cast<int64_t>(constraints.requires_battery_not_low));
        stmt.bind(14, static_cast<int64_t>(constraints.requires_storage_not_low));
        stmt.bind(15, static_cast<int64_t>(constraints.auto_resume_when_satisfied));
        stmt.bind(16, static_cast<int64_t>(constraints.auto_resume_delay.count()));
        stmt.bind(17, static_cast<int64_t>(session.max_retries));
        stmt.bind(18, static_cast<int64_t>(session.auto_paused));
        stmt.bind(19, session.pause_reason);
        stmt.bind(20, static_cast<int64_t>(session.fingerprint.size));
        stmt.bind(21, session.fingerprint.modified_ms);
        stmt.bind(22, TimeUtils::to_epoch_ms(session.created_at));
        stmt.bind(23, TimeUtils::to_epoch_ms(session.updated_at));
        stmt.bind(24, session.error_message);

        if (stmt.step() != SQLITE_DONE) {
            return rollback("Failed to insert session " + session.session_id);
        }
    }

    Statement part_stmt(db_, R"(
        INSERT INTO upload_parts (session_id, part_number, range_start, range_end, part_size, status,
                                  integrity_token, uploaded_bytes, retry_count, last_attempt_at,
                                  content_digest, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    if (!part_stmt.ok()) {
        return rollback("Failed to prepare part insert");
    }

    auto now_ms = TimeUtils::to_epoch_ms(TimeUtils::now());
    for (const auto& part : parts) {
        sqlite3_reset(part_stmt.get());
        sqlite3_clear_bindings(part_stmt.get());

        part_stmt.bind(1, part.session_id);
        part_stmt.bind(2, static_cast<int64_t>(part.part_number));
        part_stmt.bind(3, static_cast<int64_t>(part.range.start));
        part_stmt.bind(4, static_cast<int64_t>(part.range.end));
        part_stmt.bind(5, static_cast<int64_t>(part.range.size()));
        part_stmt.bind(6, std::string(to_string(part.status)));
        part_stmt.bind(7, part.integrity_token);
        part_stmt.bind(8, static_cast<int64_t>(part.uploaded_bytes()));
        part_stmt.bind(9, static_cast<int64_t>(part.retry_count));
        if (part.last_attempt_at) {
            part_stmt.bind(10, TimeUtils::to_epoch_ms(*part.last_attempt_at));
        } else {
            part_stmt.bind_null(10);
        }
        part_stmt.bind(11, part.content_digest);
        part_stmt.bind(12, now_ms);

        if (part_stmt.step() != SQLITE_DONE) {
            return rollback("Failed to insert part " + std::to_string(part.part_number) +
                            " of " + session.session_id);
        }
    }

    if (!execute("COMMIT;")) {
        return rollback("Failed to commit session " + session.session_id);
    }

    LOG_DEBUG("Stored session {} with {} parts", session.session_id, parts.size());
    return UploadResult();
}

UploadResult UploadStore::get_session(const std::string& session_id, UploadSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = check_open(); !open) return open;

    Statement stmt(db_, std::string("SELECT ") + SESSION_COLUMNS + " FROM upload_sessions WHERE session_id = ?");
    if (!stmt.ok()) {
        return error("Failed to prepare session lookup");
    }
    stmt.bind(1, session_id);

    int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return UploadResult(UploadError::NOT_FOUND, "Unknown session " + session_id);
    }
    if (rc != SQLITE_ROW) {
        return error("Failed to load session " + session_id);
    }

    return read_session(stmt.get(), session);
}

UploadResult UploadStore::get_parts(const std::string& session_id, std::vector<UploadPart>& parts) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = check_open(); !open) return open;

    Statement stmt(db_, std::string("SELECT ") + PART_COLUMNS +
                        " FROM upload_parts WHERE session_id = ? ORDER BY part_number");
    if (!stmt.ok()) {
        return error("Failed to prepare part lookup");
    }
    stmt.bind(1, session_id);

    parts.clear();
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        UploadPart part;
        auto result = read_part(stmt.get(), part);
        if (!result) {
            return result;
        }
        parts.push_back(std::move(part));
    }

    if (rc != SQLITE_DONE) {
        return error("Failed to load parts of " + session_id);
    }

    return UploadResult();
}

UploadResult UploadStore::status_mismatch(const std::string& session_id) {
    Statement stmt(db_, "SELECT status FROM upload_sessions WHERE session_id = ?");
    if (!stmt.ok()) {
        return error("Failed to prepare status lookup");
    }
    stmt.bind(1, session_id);

    int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return UploadResult(UploadError::NOT_FOUND, "Unknown session " + session_id);
    }
    if (rc != SQLITE_ROW) {
        return error("Failed to read status of " + session_id);
    }

    return UploadResult(UploadError::INVALID_STATE,
                        "Session " + session_id + " is " + column_text(stmt.get(), 0));
}

UploadResult UploadStore::transition_session(const std::string& session_id,
                                             const std::vector<SessionStatus>& expected,
                                             SessionStatus next,
                                             const std::optional<std::string>& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = check_open(); !open) return open;

    if (expected.empty()) {
        return UploadResult(UploadError::INVALID_STATE, "No source status given for transition");
    }

    // Leaving PAUSED always clears who paused it
    std::string sql = R"(
        UPDATE upload_sessions
        SET status = ?, updated_at = ?, error_message = COALESCE(?, error_message),
            auto_paused = CASE WHEN ? = 'PAUSED' THEN auto_paused ELSE 0 END,
            pause_reason = CASE WHEN ? = 'PAUSED' THEN pause_reason ELSE NULL END
        WHERE session_id = ? AND status IN ()" + status_list(expected) + ")";

    Statement stmt(db_, sql);
    if (!stmt.ok()) {
        return error("Failed to prepare session transition");
    }

    std::string next_code = to_string(next);
    stmt.bind(1, next_code);
    stmt.bind(2, TimeUtils::to_epoch_ms(TimeUtils::now()));
    stmt.bind(3, error_message);
    stmt.bind(4, next_code);
    stmt.bind(5, next_code);
    stmt.bind(6, session_id);

    if (stmt.step() != SQLITE_DONE) {
        return error("Failed to update status of " + session_id);
    }

    if (sqlite3_changes(db_) == 0) {
        return status_mismatch(session_id);
    }

    LOG_DEBUG("Session {} -> {}", session_id, next_code);
    return UploadResult();
}

UploadResult UploadStore::pause_session(const std::string& session_id, bool auto_paused, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = check_open(); !open) return open;

    Statement stmt(db_, R"(
        UPDATE upload_sessions
        SET status = 'PAUSED', auto_paused = ?, pause_reason = ?, updated_at = ?
        WHERE session_id = ? AND status = 'IN_PROGRESS'
    )");
    if (!stmt.ok()) {
        return error("Failed to prepare session pause");
    }

    stmt.bind(1, static_cast<int64_t>(auto_paused));
    stmt.bind(2, reason);
    stmt.bind(3, TimeUtils::to_epoch_ms(TimeUtils::now()));
    stmt.bind(4, session_id);

    if (stmt.step() != SQLITE_DONE) {
        return error("Failed to pause " + session_id);
    }

    if (sqlite3_changes(db_) == 0) {
        return status_mismatch(session_id);
    }

    LOG_DEBUG("Session {} -> PAUSED ({})", session_id, auto_paused ? "constraints" : "user");
    return UploadResult();
}

UploadResult UploadStore::set_pause_state(const std::string& session_id, bool auto_paused, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = check_open(); !open) return open;

    Statement stmt(db_, R"(
        UPDATE upload_sessions
        SET auto_paused = ?, pause_reason = ?, updated_at = ?
        WHERE session_id = ? AND status = 'PAUSED'
    )");
    if (!stmt.ok()) {
        return error("Failed to prepare pause update");
    }

    stmt.bind(1, static_cast<int64_t>(auto_paused));
    stmt.bind(2, reason);
    stmt.bind(3, TimeUtils::to_epoch_ms(TimeUtils::now()));
    stmt.bind(4, session_id);

    if (stmt.step() != SQLITE_DONE) {
        return error("Failed to update pause state of " + session_id);
    }

    if (sqlite3_changes(db_) == 0) {
        return status_mismatch(session_id);
    }

    return UploadResult();
}

UploadResult UploadStore::set_remote_upload(const std::string& session_id,
                                            const std::string& remote_upload_id,
                                            const std::string& remote_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = check_open(); !open) return open;

    if (remote_upload_id.empty()) {
        return UploadResult(UploadError::INVALID_STATE, "Remote upload id is empty");
    }

    Statement stmt(db_, R"(
        UPDATE upload_sessions
        SET remote_upload_id = ?, remote_path = ?, updated_at = ?
        WHERE session_id = ? AND (remote_upload_id IS NULL OR remote_upload_id = '' OR remote_upload_id = ?)
    )");
    if (!stmt.ok()) {
        return error("Failed to prepare remote upload update");
    }

    stmt.bind(1, remote_upload_id);
    stmt.bind(2, remote_path);
    stmt.bind(3, TimeUtils::to_epoch_ms(TimeUtils::now()));
    stmt.bind(4, session_id);
    stmt.bind(5, remote_upload_id);

    if (stmt.step() != SQLITE_DONE) {
        return error("Failed to record remote upload for " + session_id);
    }

    if (sqlite3_changes(db_) == 0) {
        auto mismatch = status_mismatch(session_id);
        if (mismatch.error == UploadError::NOT_FOUND) {
            return mismatch;
        }
        return UploadResult(UploadError::INVALID_STATE,
                            "Session " + session_id + " already has a different remote upload");
    }

    return UploadResult();
}

UploadResult UploadStore::update_constraints(const std::string& session_id,
                                             const transfer::UploadConstraints& constraints) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = check_open(); !open) return open;

    Statement stmt(db_, R"(
        UPDATE upload_sessions
        SET network_type = ?, requires_charging = ?, requires_battery_not_low = ?,
            requires_storage_not_low = ?, auto_resume = ?, auto_resume_delay_ms = ?, updated_at = ?
        WHERE session_id = ?
    )");
    if (!stmt.ok()) {
        return error("Failed to prepare constraint update");
    }

    stmt.bind(1, std::string(transfer::to_string(constraints.network_type)));
    stmt.bind(2, static_cast<int64_t>(constraints.requires_charging));
    stmt.bind(3, static_cast<int64_t>(constraints.requires_battery_not_low));
    stmt.bind(4, static_cast<int64_t>(constraints.requires_storage_not_low));
    stmt.bind(5, static_cast<int64_t>(constraints.auto_resume_when_satisfied));
    stmt.bind(6, static_cast<int64_t>(constraints.auto_resume_delay.count()));
    stmt.bind(7, TimeUtils::to_epoch_ms(TimeUtils::now()));
    stmt.bind(8, session_id);

    if (stmt.step() != SQLITE_DONE) {
        return error("Failed to update constraints of " + session_id);
    }

    if (sqlite3_changes(db_) == 0) {
        return UploadResult(UploadError::NOT_FOUND, "Unknown session " + session_id);
    }

    return UploadResult();
}

UploadResult UploadStore::load_sessions(const std::string& sql, const std::vector<std::string>& params,
                                        std::vector<UploadSession>& sessions) {
    if (auto open = check_open(); !open) return open;

    Statement stmt(db_, sql);
    if (!stmt.ok()) {
        return error("Failed to prepare session query");
    }

    for (size_t i = 0; i < params.size(); ++i) {
        stmt.bind(static_cast<int>(i + 1), params[i]);
    }

    sessions.clear();
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        UploadSession session;
        auto result = read_session(stmt.get(), session);
        if (!result) {
            return result;
        }
        sessions.push_back(std::move(session));
    }

    if (rc != SQLITE_DONE) {
        return error("Failed to query sessions");
    }

    return UploadResult();
}

UploadResult UploadStore::query_sessions_by_status(SessionStatus status, std::vector<UploadSession>& sessions) {
    return query_sessions_by_statuses({status}, sessions);
}

UploadResult UploadStore::query_sessions_by_statuses(const std::vector<SessionStatus>& statuses,
                                                     std::vector<UploadSession>& sessions) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (statuses.empty()) {
        sessions.clear();
        return UploadResult();
    }

    return load_sessions(std::string("SELECT ") + SESSION_COLUMNS + " FROM upload_sessions WHERE status IN (" +
                         status_list(statuses) + ") ORDER BY created_at",
                         {}, sessions);
}

UploadResult UploadStore::list_sessions(std::vector<UploadSession>& sessions) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_sessions(std::string("SELECT ") + SESSION_COLUMNS + " FROM upload_sessions ORDER BY created_at DESC",
                         {}, sessions);
}

UploadResult UploadStore::find_active_session_for_source(const std::string& source_path, UploadSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<UploadSession> sessions;
    auto result = load_sessions(std::string("SELECT ") + SESSION_COLUMNS + R"(
        FROM upload_sessions
        WHERE source_path = ? AND status IN ('PENDING', 'IN_PROGRESS', 'PAUSED')
        ORDER BY created_at DESC LIMIT 1
    )", {source_path}, sessions);
    if (!result) {
        return result;
    }

    if (sessions.empty()) {
        return UploadResult(UploadError::NOT_FOUND, "No active session for " + source_path);
    }

    session = std::move(sessions.front());
    return UploadResult();
}

UploadResult UploadStore::delete_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = check_open(); !open) return open;

    if (!execute("BEGIN IMMEDIATE;")) {
        return error("Failed to begin delete transaction");
    }

    Statement parts(db_, "DELETE FROM upload_parts WHERE session_id = ?");
    Statement session(db_, "DELETE FROM upload_sessions WHERE session_id = ?");
    if (!parts.ok() || !session.ok()) {
        auto result = error("Failed to prepare session delete");
        execute("ROLLBACK;");
        return result;
    }

    parts.bind(1, session_id);
    session.bind(1, session_id);

    if (parts.step() != SQLITE_DONE || session.step() != SQLITE_DONE) {
        auto result = error("Failed to delete session " + session_id);
        execute("ROLLBACK;");
        return result;
    }

    bool removed = sqlite3_changes(db_) > 0;
    if (!execute("COMMIT;")) {
        auto result = error("Failed to commit delete of " + session_id);
        execute("ROLLBACK;");
        return result;
    }

    if (!removed) {
        return UploadResult(UploadError::NOT_FOUND, "Unknown session " + session_id);
    }
    return UploadResult();
}

UploadResult UploadStore::delete_terminal_sessions_older_than(std::chrono::system_clock::time_point cutoff,
                                                              size_t& removed) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = check_open(); !open) return open;

    removed = 0;
    auto cutoff_ms = TimeUtils::to_epoch_ms(cutoff);

    if (!execute("BEGIN IMMEDIATE;")) {
        return error("Failed to begin cleanup transaction");
    }

    Statement parts(db_, R"(
        DELETE FROM upload_parts WHERE session_id IN (
            SELECT session_id FROM upload_sessions
            WHERE status IN ('COMPLETED', 'FAILED', 'ABORTED') AND updated_at < ?
        )
    )");
    Statement sessions(db_, R"(
        DELETE FROM upload_sessions
        WHERE status IN ('COMPLETED', 'FAILED', 'ABORTED') AND updated_at < ?
    )");
    if (!parts.ok() || !sessions.ok()) {
        auto result = error("Failed to prepare cleanup");
        execute("ROLLBACK;");
        return result;
    }

    parts.bind(1, cutoff_ms);
    sessions.bind(1, cutoff_ms);

    if (parts.step() != SQLITE_DONE) {
        auto result = error("Failed to delete old parts");
        execute("ROLLBACK;");
        return result;
    }

    if (sessions.step() != SQLITE_DONE) {
        auto result = error("Failed to delete old sessions");
        execute("ROLLBACK;");
        return result;
    }

    auto count = static_cast<size_t>(sqlite3_changes(db_));
    if (!execute("COMMIT;")) {
        auto result = error("Failed to commit cleanup");
        execute("ROLLBACK;");
        return result;
    }

    removed = count;
    return UploadResult();
}

UploadResult UploadStore::update_part_status(const std::string& session_id, uint32_t part_number,
                                             const PartUpdate& update, std::optional<PartStatus> expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = check_open(); !open) return open;

    bool uploaded = update.status == PartStatus::UPLOADED;
    if (uploaded && (!update.integrity_token || update.integrity_token->empty())) {
        return UploadResult(UploadError::INVALID_STATE,
                            "Part " + std::to_string(part_number) + " cannot be UPLOADED without an integrity token");
    }

    std::string sql = R"(
        UPDATE upload_parts
        SET status = ?, integrity_token = ?,
            uploaded_bytes = CASE WHEN ? = 'UPLOADED' THEN part_size ELSE 0 END,
            retry_count = COALESCE(?, retry_count),
            last_attempt_at = COALESCE(?, last_attempt_at),
            content_digest = COALESCE(?, content_digest),
            updated_at = ?
        WHERE session_id = ? AND part_number = ?)";
    if (expected) {
        sql += " AND status = ?";
    }

    Statement stmt(db_, sql);
    if (!stmt.ok()) {
        return error("Failed to prepare part update");
    }

    std::string status_code = to_string(update.status);
    stmt.bind(1, status_code);
    if (uploaded) {
        stmt.bind(2, *update.integrity_token);
    } else {
        stmt.bind_null(2);
    }
    stmt.bind(3, status_code);
    if (update.retry_count) {
        stmt.bind(4, static_cast<int64_t>(*update.retry_count));
    } else {
        stmt.bind_null(4);
    }
    if (update.last_attempt_at) {
        stmt.bind(5, TimeUtils::to_epoch_ms(*update.last_attempt_at));
    } else {
        stmt.bind_null(5);
    }
    stmt.bind(6, update.content_digest);
    stmt.bind(7, TimeUtils::to_epoch_ms(TimeUtils::now()));
    stmt.bind(8, session_id);
    stmt.bind(9, static_cast<int64_t>(part_number));
    if (expected) {
        stmt.bind(10, std::string(to_string(*expected)));
    }

    if (stmt.step() != SQLITE_DONE) {
        return error("Failed to update part " + std::to_string(part_number) + " of " + session_id);
    }

    if (sqlite3_changes(db_) == 0) {
        Statement lookup(db_, "SELECT status FROM upload_parts WHERE session_id = ? AND part_number = ?");
        if (!lookup.ok()) {
            return error("Failed to prepare part lookup");
        }
        lookup.bind(1, session_id);
        lookup.bind(2, static_cast<int64_t>(part_number));

        int rc = lookup.step();
        if (rc == SQLITE_ROW) {
            return UploadResult(UploadError::INVALID_STATE,
                                "Part " + std::to_string(part_number) + " of " + session_id + " is " +
                                column_text(lookup.get(), 0));
        }
        if (rc != SQLITE_DONE) {
            return error("Failed to look up part " + std::to_string(part_number));
        }
        return UploadResult(UploadError::NOT_FOUND,
                            "Unknown part " + std::to_string(part_number) + " of " + session_id);
    }

    LOG_TRACE("Part {} of {} -> {}", part_number, session_id, status_code);
    return UploadResult();
}

UploadResult UploadStore::count_uploaded_parts(const std::string& session_id, uint32_t& count) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = check_open(); !open) return open;

    Statement stmt(db_, "SELECT COUNT(*) FROM upload_parts WHERE session_id = ? AND status = 'UPLOADED'");
    if (!stmt.ok()) {
        return error("Failed to prepare uploaded part count");
    }
    stmt.bind(1, session_id);

    if (stmt.step() != SQLITE_ROW) {
        return error("Failed to count uploaded parts of " + session_id);
    }

    count = static_cast<uint32_t>(sqlite3_column_int64(stmt.get(), 0));
    return UploadResult();
}

UploadResult UploadStore::reset_stale_uploading_parts(const std::string& session_id,
                                                      std::chrono::system_clock::time_point cutoff,
                                                      size_t& reset) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = check_open(); !open) return open;

    Statement stmt(db_, R"(
        UPDATE upload_parts SET status = 'PENDING', integrity_token = NULL, uploaded_bytes = 0, updated_at = ?
        WHERE session_id = ? AND status = 'UPLOADING'
          AND (last_attempt_at IS NULL OR last_attempt_at < ?)
    )");
    if (!stmt.ok()) {
        return error("Failed to prepare stale part reset");
    }
    stmt.bind(1, TimeUtils::to_epoch_ms(TimeUtils::now()));
    stmt.bind(2, session_id);
    stmt.bind(3, TimeUtils::to_epoch_ms(cutoff));

    if (stmt.step() != SQLITE_DONE) {
        return error("Failed to reset stale parts of " + session_id);
    }

    reset = static_cast<size_t>(sqlite3_changes(db_));
    return UploadResult();
}

}
