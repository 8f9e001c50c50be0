#include "utils/StateStore.hpp"

#include "utils/Log.hpp"

#include <filesystem>
#include <system_error>

namespace folio::storage
{

namespace
{

constexpr int kDatabaseBusyTimeoutMs = 5000;

std::string column_text(sqlite3_stmt *stmt, int index)
{
    auto *text =
        reinterpret_cast<char const *>(sqlite3_column_text(stmt, index));
    if (text == nullptr)
    {
        return {};
    }
    return std::string(text,
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt, index)));
}

} // namespace

Database::Database(std::filesystem::path path) : path_(std::move(path))
{
    if (path_.empty())
    {
        return;
    }
    auto parent = path_.parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            FOLIO_LOG_WARN("cannot create state directory {}: {}",
                           parent.string(), ec.message());
        }
    }
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        FOLIO_LOG_ERROR("failed to open state database {}: {}",
                        path_.string(), sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    sqlite3_busy_timeout(db_, kDatabaseBusyTimeoutMs);
    char *err_msg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                      &err_msg);
    if (rc != SQLITE_OK && err_msg != nullptr)
    {
        FOLIO_LOG_WARN("failed to enable WAL journal mode: {}", err_msg);
    }
    if (err_msg != nullptr)
    {
        sqlite3_free(err_msg);
    }
    if (!ensure_schema())
    {
        FOLIO_LOG_ERROR("state database {} has an unusable schema",
                        path_.string());
        for (auto &entry : stmt_cache_)
        {
            sqlite3_finalize(entry.second);
        }
        stmt_cache_.clear();
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Database::~Database()
{
    for (auto &entry : stmt_cache_)
    {
        if (entry.second != nullptr)
        {
            sqlite3_finalize(entry.second);
        }
    }
    stmt_cache_.clear();
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::ensure_schema()
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *kSchemaVersionSql =
        "CREATE TABLE IF NOT EXISTS schema_version ("
        "id INTEGER PRIMARY KEY CHECK(id = 1),"
        "version INTEGER NOT NULL);";
    if (!execute(kSchemaVersionSql))
    {
        return false;
    }
    return run_migrations();
}

bool Database::execute(std::string const &sql) const
{
    if (!db_)
    {
        return false;
    }
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        FOLIO_LOG_WARN("sqlite error: {}",
                       err_msg != nullptr ? err_msg : sqlite3_errstr(rc));
        if (err_msg != nullptr)
        {
            sqlite3_free(err_msg);
        }
        return false;
    }
    return true;
}

bool Database::run_migrations()
{
    if (!ensure_schema_version_row())
    {
        return false;
    }
    auto current = schema_version().value_or(0);
    struct Migration
    {
        int version;
        bool (Database::*apply)() const;
    };
    static constexpr Migration kMigrations[] = {
        {1, &Database::apply_migration_v1},
        {2, &Database::apply_migration_v2},
    };
    for (auto const &migration : kMigrations)
    {
        if (current >= migration.version)
        {
            continue;
        }
        if (!(this->*migration.apply)())
        {
            FOLIO_LOG_ERROR("schema migration v{} failed", migration.version);
            return false;
        }
        if (!set_schema_version(migration.version))
        {
            return false;
        }
        FOLIO_LOG_DEBUG("state database migrated to v{}", migration.version);
        current = migration.version;
    }
    return true;
}

bool Database::ensure_schema_version_row() const
{
    constexpr char const *sql =
        "INSERT OR IGNORE INTO schema_version (id, version) VALUES (1, 0);";
    return execute(sql);
}

std::optional<int> Database::schema_version() const
{
    if (!db_)
    {
        return std::nullopt;
    }
    constexpr char const *sql =
        "SELECT version FROM schema_version WHERE id = 1 LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    std::optional<int> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = static_cast<int>(sqlite3_column_int(stmt, 0));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return result;
}

bool Database::set_schema_version(int version) const
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql =
        "INSERT OR REPLACE INTO schema_version (id, version) VALUES (1, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int(stmt, 1, version);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

bool Database::apply_migration_v1() const
{
    constexpr char const *kDocumentsSql =
        "CREATE TABLE IF NOT EXISTS documents ("
        "key TEXT PRIMARY KEY,"
        "source_digest TEXT NOT NULL,"
        "artifact_digest TEXT NOT NULL,"
        "fingerprint TEXT NOT NULL,"
        "artifact_path TEXT,"
        "converted_at INTEGER NOT NULL DEFAULT 0);";
    return execute(kDocumentsSql);
}

bool Database::apply_migration_v2() const
{
    constexpr char const *kSettingsSql = "CREATE TABLE IF NOT EXISTS settings ("
                                         "key TEXT PRIMARY KEY,"
                                         "value TEXT NOT NULL);";
    return execute(kSettingsSql);
}

sqlite3_stmt *Database::prepare_cached(std::string const &sql) const
{
    if (!db_)
    {
        return nullptr;
    }
    auto it = stmt_cache_.find(sql);
    if (it != stmt_cache_.end())
    {
        if (it->second != nullptr)
        {
            sqlite3_reset(it->second);
            sqlite3_clear_bindings(it->second);
        }
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        FOLIO_LOG_WARN("sqlite prepare failed: {}", sqlite3_errmsg(db_));
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

std::optional<std::string> Database::get_setting(std::string const &key) const
{
    if (!db_)
    {
        return std::nullopt;
    }
    constexpr char const *sql =
        "SELECT value FROM settings WHERE key = ? LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<std::string> value;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        value = column_text(stmt, 0);
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return value;
}

bool Database::set_setting(std::string const &key, std::string const &value)
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql =
        "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

bool Database::remove_setting(std::string const &key)
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql = "DELETE FROM settings WHERE key = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

std::optional<DocumentRecord>
Database::get_document(std::string const &key) const
{
    if (!db_)
    {
        return std::nullopt;
    }
    constexpr char const *sql =
        "SELECT key, source_digest, artifact_digest, fingerprint, "
        "artifact_path, converted_at FROM documents WHERE key = ? LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<DocumentRecord> record;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW)
    {
        DocumentRecord entry;
        entry.key = column_text(stmt, 0);
        entry.source_digest = column_text(stmt, 1);
        entry.artifact_digest = column_text(stmt, 2);
        entry.fingerprint = column_text(stmt, 3);
        entry.artifact_path = column_text(stmt, 4);
        entry.converted_at =
            static_cast<std::int64_t>(sqlite3_column_int64(stmt, 5));
        record = std::move(entry);
    }
    else if (rc != SQLITE_DONE)
    {
        FOLIO_LOG_WARN("document lookup for {} failed: {}", key,
                       sqlite3_errmsg(db_));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return record;
}

bool Database::upsert_document(DocumentRecord const &record)
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql =
        "INSERT OR REPLACE INTO documents (key, source_digest, "
        "artifact_digest, fingerprint, artifact_path, converted_at) "
        "VALUES (?, ?, ?, ?, ?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, record.key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.source_digest.c_str(), -1,
                      SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.artifact_digest.c_str(), -1,
                      SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, record.fingerprint.c_str(), -1,
                      SQLITE_TRANSIENT);
    if (!record.artifact_path.empty())
    {
        sqlite3_bind_text(stmt, 5, record.artifact_path.c_str(), -1,
                          SQLITE_TRANSIENT);
    }
    else
    {
        sqlite3_bind_null(stmt, 5);
    }
    sqlite3_bind_int64(stmt, 6,
                       static_cast<sqlite3_int64>(record.converted_at));
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE)
    {
        FOLIO_LOG_WARN("document upsert for {} failed: {}", record.key,
                       sqlite3_errmsg(db_));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

std::optional<std::int64_t> Database::delete_all_documents()
{
    if (!db_)
    {
        return std::nullopt;
    }
    if (!execute("DELETE FROM documents;"))
    {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(sqlite3_changes(db_));
}

std::int64_t Database::document_count() const
{
    if (!db_)
    {
        return 0;
    }
    auto *stmt = prepare_cached("SELECT COUNT(*) FROM documents;");
    if (stmt == nullptr)
    {
        return 0;
    }
    std::int64_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        count = static_cast<std::int64_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_reset(stmt);
    return count;
}

} // namespace folio::storage
