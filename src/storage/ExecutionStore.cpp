#include "storage/ExecutionStore.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace drflow {
namespace storage {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

/**
 * Get current UTC timestamp in ISO 8601 format
 */
std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

/**
 * RAII wrapper for SQLite prepared statements
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_stmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare statement: " +
                                     std::string(sqlite3_errmsg(db)));
        }
    }

    ~Statement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindText(int index, const std::string& value) {
        sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bindInt64(int index, int64_t value) {
        sqlite3_bind_int64(m_stmt, index, value);
    }

    void bindOptionalText(int index, const std::string& value) {
        if (value.empty()) {
            sqlite3_bind_null(m_stmt, index);
        } else {
            bindText(index, value);
        }
    }

    bool step() {
        int result = sqlite3_step(m_stmt);
        if (result == SQLITE_ROW) return true;
        if (result == SQLITE_DONE) return false;
        throw std::runtime_error("Step failed: " +
                                 std::string(sqlite3_errmsg(sqlite3_db_handle(m_stmt))));
    }

    std::string getText(int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
        return text ? text : "";
    }

    int64_t getInt64(int col) {
        return sqlite3_column_int64(m_stmt, col);
    }

private:
    sqlite3_stmt* m_stmt;
};

const char* EXECUTION_COLUMNS =
    "id, workflow_name, status, current_state, input_json, payload_json, "
    "error, cause, timeout_ms, started_at, updated_at, finished_at";

ExecutionRecord readExecution(Statement& stmt) {
    return ExecutionRecord{
        .id = stmt.getText(0),
        .workflowName = stmt.getText(1),
        .status = stmt.getText(2),
        .currentState = stmt.getText(3),
        .inputJson = stmt.getText(4),
        .payloadJson = stmt.getText(5),
        .error = stmt.getText(6),
        .cause = stmt.getText(7),
        .timeoutMs = stmt.getInt64(8),
        .startedAt = stmt.getText(9),
        .updatedAt = stmt.getText(10),
        .finishedAt = stmt.getText(11),
        .history = {}
    };
}

} // anonymous namespace

// =============================================================================
// ExecutionStore::Impl
// =============================================================================

class ExecutionStore::Impl {
public:
    explicit Impl(const std::string& dbPath) : m_dbPath(dbPath), m_db(nullptr) {
        if (sqlite3_open(dbPath.c_str(), &m_db) != SQLITE_OK) {
            std::string error = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            if (m_db) sqlite3_close(m_db);
            throw std::runtime_error("Failed to open database: " + error);
        }

        // Enable foreign keys
        exec("PRAGMA foreign_keys = ON");

        // Create tables
        createTables();
    }

    ~Impl() {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    std::mutex& mutex() { return m_mutex; }

    void exec(const std::string& sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error("SQL error: " + error);
        }
    }

    void createTables() {
        exec(R"(
            CREATE TABLE IF NOT EXISTS workflows (
                name TEXT PRIMARY KEY,
                definition_json TEXT NOT NULL,
                created_at TEXT NOT NULL,
                updated_at TEXT NOT NULL
            )
        )");

        exec(R"(
            CREATE TABLE IF NOT EXISTS executions (
                id TEXT PRIMARY KEY,
                workflow_name TEXT NOT NULL,
                status TEXT NOT NULL,
                current_state TEXT,
                input_json TEXT NOT NULL,
                payload_json TEXT,
                error TEXT,
                cause TEXT,
                timeout_ms INTEGER NOT NULL,
                started_at TEXT NOT NULL,
                updated_at TEXT NOT NULL,
                finished_at TEXT
            )
        )");

        exec("CREATE INDEX IF NOT EXISTS idx_executions_workflow ON executions(workflow_name, started_at DESC)");
        exec("CREATE INDEX IF NOT EXISTS idx_executions_status ON executions(status)");

        exec(R"(
            CREATE TABLE IF NOT EXISTS execution_events (
                execution_id TEXT NOT NULL,
                sequence INTEGER NOT NULL,
                timestamp TEXT NOT NULL,
                state_name TEXT NOT NULL,
                kind TEXT NOT NULL,
                detail_json TEXT NOT NULL,
                PRIMARY KEY (execution_id, sequence),
                FOREIGN KEY (execution_id) REFERENCES executions(id) ON DELETE CASCADE
            )
        )");
    }

    // === Executions ===

    void createExecution(const ExecutionRecord& record) {
        Statement stmt(m_db,
            "INSERT INTO executions (id, workflow_name, status, current_state, input_json, payload_json, "
            "error, cause, timeout_ms, started_at, updated_at, finished_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");

        stmt.bindText(1, record.id);
        stmt.bindText(2, record.workflowName);
        stmt.bindText(3, record.status);
        stmt.bindText(4, record.currentState);
        stmt.bindText(5, record.inputJson);
        stmt.bindText(6, record.payloadJson);
        stmt.bindOptionalText(7, record.error);
        stmt.bindOptionalText(8, record.cause);
        stmt.bindInt64(9, record.timeoutMs);
        stmt.bindText(10, record.startedAt.empty() ? currentTimestamp() : record.startedAt);
        stmt.bindText(11, currentTimestamp());
        stmt.bindOptionalText(12, record.finishedAt);
        stmt.step();
    }

    void updateExecution(const ExecutionRecord& record) {
        Statement stmt(m_db,
            "UPDATE executions SET status = ?, current_state = ?, payload_json = ?, "
            "error = ?, cause = ?, updated_at = ?, finished_at = ? WHERE id = ?");

        stmt.bindText(1, record.status);
        stmt.bindText(2, record.currentState);
        stmt.bindText(3, record.payloadJson);
        stmt.bindOptionalText(4, record.error);
        stmt.bindOptionalText(5, record.cause);
        stmt.bindText(6, currentTimestamp());
        stmt.bindOptionalText(7, record.finishedAt);
        stmt.bindText(8, record.id);
        stmt.step();

        if (sqlite3_changes(m_db) == 0) {
            throw std::runtime_error("Execution not found: " + record.id);
        }
    }

    int64_t appendEvent(const std::string& executionId, const EventRecord& event) {
        int64_t sequence = 0;
        {
            Statement stmt(m_db,
                "SELECT COALESCE(MAX(sequence) + 1, 0) FROM execution_events WHERE execution_id = ?");
            stmt.bindText(1, executionId);
            if (stmt.step()) {
                sequence = stmt.getInt64(0);
            }
        }

        Statement stmt(m_db,
            "INSERT INTO execution_events (execution_id, sequence, timestamp, state_name, kind, detail_json) "
            "VALUES (?, ?, ?, ?, ?, ?)");
        stmt.bindText(1, executionId);
        stmt.bindInt64(2, sequence);
        stmt.bindText(3, event.timestamp.empty() ? currentTimestamp() : event.timestamp);
        stmt.bindText(4, event.stateName);
        stmt.bindText(5, event.kind);
        stmt.bindText(6, event.detailJson.empty() ? "{}" : event.detailJson);
        stmt.step();
        return sequence;
    }

    std::optional<ExecutionRecord> getExecution(const std::string& executionId) {
        Statement stmt(m_db,
            std::string("SELECT ") + EXECUTION_COLUMNS + " FROM executions WHERE id = ?");
        stmt.bindText(1, executionId);

        if (!stmt.step()) {
            return std::nullopt;
        }

        ExecutionRecord record = readExecution(stmt);
        record.history = getHistory(executionId);
        return record;
    }

    std::vector<EventRecord> getHistory(const std::string& executionId) {
        Statement stmt(m_db,
            "SELECT sequence, timestamp, state_name, kind, detail_json "
            "FROM execution_events WHERE execution_id = ? ORDER BY sequence");
        stmt.bindText(1, executionId);

        std::vector<EventRecord> result;
        while (stmt.step()) {
            result.push_back({
                .sequence = stmt.getInt64(0),
                .timestamp = stmt.getText(1),
                .stateName = stmt.getText(2),
                .kind = stmt.getText(3),
                .detailJson = stmt.getText(4)
            });
        }
        return result;
    }

    std::vector<ExecutionRecord> listExecutions(const std::string& workflowName) {
        std::string sql = std::string("SELECT ") + EXECUTION_COLUMNS + " FROM executions";
        if (!workflowName.empty()) {
            sql += " WHERE workflow_name = ?";
        }
        sql += " ORDER BY started_at DESC, rowid DESC";

        Statement stmt(m_db, sql);
        if (!workflowName.empty()) {
            stmt.bindText(1, workflowName);
        }

        std::vector<ExecutionRecord> result;
        while (stmt.step()) {
            result.push_back(readExecution(stmt));
        }
        return result;
    }

    std::vector<ExecutionRecord> listByStatus(const std::string& status) {
        Statement stmt(m_db,
            std::string("SELECT ") + EXECUTION_COLUMNS +
            " FROM executions WHERE status = ? ORDER BY started_at, rowid");
        stmt.bindText(1, status);

        std::vector<ExecutionRecord> result;
        while (stmt.step()) {
            result.push_back(readExecution(stmt));
        }
        return result;
    }

    void deleteExecution(const std::string& executionId) {
        Statement stmt(m_db, "DELETE FROM executions WHERE id = ?");
        stmt.bindText(1, executionId);
        stmt.step();
    }

    void cleanupOldExecutions(const std::string& workflowName, size_t keepCount) {
        // Get IDs of finished executions to delete (all except the N most recent)
        Statement selectStmt(m_db,
            "SELECT id FROM executions "
            "WHERE workflow_name = ? AND status != 'RUNNING' "
            "ORDER BY started_at DESC, rowid DESC "
            "LIMIT -1 OFFSET ?");

        selectStmt.bindText(1, workflowName);
        selectStmt.bindInt64(2, static_cast<int64_t>(keepCount));

        std::vector<std::string> toDelete;
        while (selectStmt.step()) {
            toDelete.push_back(selectStmt.getText(0));
        }

        // Delete them (cascade will delete events too)
        exec("BEGIN");
        try {
            for (const auto& id : toDelete) {
                deleteExecution(id);
            }
        } catch (const std::runtime_error&) {
            exec("ROLLBACK");
            throw;
        }
        exec("COMMIT");
    }

    // === Workflow definitions ===

    void saveWorkflow(const std::string& name, const std::string& definitionJson) {
        std::string now = currentTimestamp();
        Statement stmt(m_db,
            "INSERT INTO workflows (name, definition_json, created_at, updated_at) VALUES (?, ?, ?, ?) "
            "ON CONFLICT(name) DO UPDATE SET definition_json = excluded.definition_json, "
            "updated_at = excluded.updated_at");
        stmt.bindText(1, name);
        stmt.bindText(2, definitionJson);
        stmt.bindText(3, now);
        stmt.bindText(4, now);
        stmt.step();
    }

    std::vector<WorkflowRecord> loadWorkflows() {
        Statement stmt(m_db,
            "SELECT name, definition_json, created_at, updated_at FROM workflows ORDER BY name");

        std::vector<WorkflowRecord> result;
        while (stmt.step()) {
            result.push_back({
                .name = stmt.getText(0),
                .definitionJson = stmt.getText(1),
                .createdAt = stmt.getText(2),
                .updatedAt = stmt.getText(3)
            });
        }
        return result;
    }

    void deleteWorkflow(const std::string& name) {
        Statement stmt(m_db, "DELETE FROM workflows WHERE name = ?");
        stmt.bindText(1, name);
        stmt.step();
    }

    const std::string& getDbPath() const { return m_dbPath; }

private:
    std::string m_dbPath;
    sqlite3* m_db;
    std::mutex m_mutex;
};

// =============================================================================
// ExecutionStore (pImpl forwarding, serialized)
// =============================================================================

ExecutionStore::ExecutionStore(const std::string& dbPath)
    : m_impl(std::make_unique<Impl>(dbPath)) {}

ExecutionStore::~ExecutionStore() = default;

ExecutionStore::ExecutionStore(ExecutionStore&&) noexcept = default;
ExecutionStore& ExecutionStore::operator=(ExecutionStore&&) noexcept = default;

void ExecutionStore::createExecution(const ExecutionRecord& record) {
    std::lock_guard<std::mutex> lock(m_impl->mutex());
    m_impl->createExecution(record);
}

void ExecutionStore::updateExecution(const ExecutionRecord& record) {
    std::lock_guard<std::mutex> lock(m_impl->mutex());
    m_impl->updateExecution(record);
}

int64_t ExecutionStore::appendEvent(const std::string& executionId, const EventRecord& event) {
    std::lock_guard<std::mutex> lock(m_impl->mutex());
    return m_impl->appendEvent(executionId, event);
}

std::optional<ExecutionRecord> ExecutionStore::getExecution(const std::string& executionId) {
    std::lock_guard<std::mutex> lock(m_impl->mutex());
    return m_impl->getExecution(executionId);
}

std::vector<EventRecord> ExecutionStore::getHistory(const std::string& executionId) {
    std::lock_guard<std::mutex> lock(m_impl->mutex());
    return m_impl->getHistory(executionId);
}

std::vector<ExecutionRecord> ExecutionStore::listExecutions(const std::string& workflowName) {
    std::lock_guard<std::mutex> lock(m_impl->mutex());
    return m_impl->listExecutions(workflowName);
}

std::vector<ExecutionRecord> ExecutionStore::listByStatus(const std::string& status) {
    std::lock_guard<std::mutex> lock(m_impl->mutex());
    return m_impl->listByStatus(status);
}

void ExecutionStore::deleteExecution(const std::string& executionId) {
    std::lock_guard<std::mutex> lock(m_impl->mutex());
    m_impl->deleteExecution(executionId);
}

void ExecutionStore::cleanupOldExecutions(const std::string& workflowName, size_t keepCount) {
    std::lock_guard<std::mutex> lock(m_impl->mutex());
    m_impl->cleanupOldExecutions(workflowName, keepCount);
}

void ExecutionStore::saveWorkflow(const std::string& name, const std::string& definitionJson) {
    std::lock_guard<std::mutex> lock(m_impl->mutex());
    m_impl->saveWorkflow(name, definitionJson);
}

std::vector<WorkflowRecord> ExecutionStore::loadWorkflows() {
    std::lock_guard<std::mutex> lock(m_impl->mutex());
    return m_impl->loadWorkflows();
}

void ExecutionStore::deleteWorkflow(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_impl->mutex());
    m_impl->deleteWorkflow(name);
}

const std::string& ExecutionStore::getDbPath() const {
    return m_impl->getDbPath();
}

} // namespace storage
} // namespace drflow
