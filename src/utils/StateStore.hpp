#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

#include <sqlite3.h>

namespace folio::storage {

// Last successful conversion of one source document.
struct DocumentRecord {
  std::string key;
  std::string source_digest;
  std::string artifact_digest;
  std::string fingerprint;
  std::string artifact_path;
  std::int64_t converted_at = 0;
};

class Database {
public:
  explicit Database(std::filesystem::path path);
  ~Database();

  Database(Database const &) = delete;
  Database &operator=(Database const &) = delete;

  bool is_valid() const noexcept { return db_ != nullptr; }
  std::filesystem::path const &path() const noexcept { return path_; }

  std::optional<std::string> get_setting(std::string const &key) const;
  bool set_setting(std::string const &key, std::string const &value);
  bool remove_setting(std::string const &key);

  std::optional<DocumentRecord> get_document(std::string const &key) const;
  bool upsert_document(DocumentRecord const &record);
  // Returns the number of rows removed, nullopt on failure.
  std::optional<std::int64_t> delete_all_documents();
  std::int64_t document_count() const;

private:
  bool ensure_schema();
  bool execute(std::string const &sql) const;
  bool run_migrations();
  bool ensure_schema_version_row() const;
  std::optional<int> schema_version() const;
  bool set_schema_version(int version) const;
  bool apply_migration_v1() const;
  bool apply_migration_v2() const;
  sqlite3_stmt *prepare_cached(std::string const &sql) const;

  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
};

} // namespace folio::storage
