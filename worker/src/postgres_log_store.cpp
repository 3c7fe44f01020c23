
#include "postgres_log_store.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

PostgresLogStore::PostgresLogStore(const Config& config) : config_(config) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    connect();
}

PostgresLogStore::~PostgresLogStore() {
    if (conn_ && conn_->is_open()) {
        conn_->close();
    }
}

bool PostgresLogStore::connect() {
    try {
        conn_ = std::make_unique<pqxx::connection>(config_.pg_dsn);
        spdlog::info("Connected to log store database.");
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to log store database: {}", e.what());
        conn_.reset();
        return false;
    }
}

bool PostgresLogStore::ensure_connection() {
    if (conn_ && conn_->is_open()) {
        return true;
    }
    return connect();
}

bool PostgresLogStore::initialize_schema() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!ensure_connection()) {
        return false;
    }

    try {
        pqxx::work txn(*conn_);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS check_log (
                id BIGSERIAL PRIMARY KEY,
                stream_id TEXT NOT NULL,
                record JSONB NOT NULL,
                created_at TIMESTAMP WITH TIME ZONE NOT NULL DEFAULT NOW()
            )
        )");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_check_log_stream ON check_log(stream_id, id)");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS check_log_archive (
                archive_id TEXT PRIMARY KEY,
                stream_id TEXT NOT NULL,
                first_entry_id BIGINT NOT NULL,
                last_entry_id BIGINT NOT NULL,
                entry_count INTEGER NOT NULL,
                body TEXT NOT NULL,
                created_at TIMESTAMP WITH TIME ZONE NOT NULL DEFAULT NOW()
            )
        )");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_check_log_archive_stream ON check_log_archive(stream_id, last_entry_id)");

        txn.commit();
        spdlog::info("Log store schema ready");
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize log store schema: {}", e.what());
        return false;
    }
}

bool PostgresLogStore::check_health() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!ensure_connection()) {
        return false;
    }
    try {
        pqxx::nontransaction n(*conn_);
        n.exec("SELECT 1");
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Log store health check failed: {}", e.what());
        return false;
    }
}

Status PostgresLogStore::append(const std::string& stream_id, const std::string& record) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!ensure_connection()) {
        return Status::failure(ErrorKind::Log, "log store database is unreachable");
    }

    try {
        pqxx::work txn(*conn_);
        txn.exec_params(
            "INSERT INTO check_log (stream_id, record) VALUES ($1, $2::jsonb)",
            stream_id,
            record
        );
        txn.commit();
        return Status::success();
    } catch (const std::exception& e) {
        return Status::failure(ErrorKind::Log, e.what());
    }
}

Result<std::vector<std::string>> PostgresLogStore::list_active_streams() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!ensure_connection()) {
        return Result<std::vector<std::string>>::failure(ErrorKind::Log, "log store database is unreachable");
    }

    try {
        pqxx::nontransaction n(*conn_);
        pqxx::result rows = n.exec("SELECT DISTINCT stream_id FROM check_log ORDER BY stream_id");

        std::vector<std::string> streams;
        streams.reserve(rows.size());
        for (const auto& row : rows) {
            streams.push_back(row["stream_id"].as<std::string>());
        }
        return Result<std::vector<std::string>>::success(std::move(streams));
    } catch (const std::exception& e) {
        return Result<std::vector<std::string>>::failure(ErrorKind::Log, e.what());
    }
}

Status PostgresLogStore::compress(const std::string& stream_id, const std::string& archive_id) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!ensure_connection()) {
        return Status::failure(ErrorKind::Rotation, "log store database is unreachable");
    }

    try {
        pqxx::work txn(*conn_);
        pqxx::result inserted = txn.exec_params(
            "INSERT INTO check_log_archive "
            "(archive_id, stream_id, first_entry_id, last_entry_id, entry_count, body) "
            "SELECT $2, $1, MIN(id), MAX(id), COUNT(*), STRING_AGG(record::text, E'\\n' ORDER BY id) "
            "FROM check_log WHERE stream_id = $1 "
            "HAVING COUNT(*) > 0",
            stream_id,
            archive_id
        );

        if (inserted.affected_rows() == 0) {
            return Status::failure(ErrorKind::Rotation,
                                   fmt::format("stream {} has no records to archive", stream_id));
        }

        txn.commit();
        return Status::success();
    } catch (const std::exception& e) {
        return Status::failure(ErrorKind::Rotation, e.what());
    }
}

Status PostgresLogStore::truncate(const std::string& stream_id) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!ensure_connection()) {
        return Status::failure(ErrorKind::Rotation, "log store database is unreachable");
    }

    try {
        pqxx::work txn(*conn_);
        pqxx::result deleted = txn.exec_params(
            "DELETE FROM check_log WHERE stream_id = $1 AND id <= ("
            "SELECT last_entry_id FROM check_log_archive WHERE stream_id = $1 "
            "ORDER BY last_entry_id DESC LIMIT 1)",
            stream_id
        );
        txn.commit();

        spdlog::debug("Truncated {} records from log stream {}", deleted.affected_rows(), stream_id);
        return Status::success();
    } catch (const std::exception& e) {
        return Status::failure(ErrorKind::Rotation, e.what());
    }
}
