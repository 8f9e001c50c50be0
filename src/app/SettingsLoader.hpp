#pragma once

#include "app/CommandLine.hpp"
#include "engine/ConversionSettings.hpp"
#include "utils/StateStore.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace folio::app
{

// Keys accepted by --set-default and read back from the settings table.
std::span<std::string_view const> persistable_keys() noexcept;
bool is_persistable_key(std::string_view key) noexcept;

// Builds ConversionSettings from, lowest first: built-in defaults, the
// settings table, FOLIO_* environment variables, command-line flags.
class SettingsLoader
{
  public:
    using EnvLookup =
        std::function<std::optional<std::string>(char const *name)>;

    SettingsLoader();
    explicit SettingsLoader(EnvLookup env);

    // --db-path, then FOLIO_DB_PATH, then <data root>/folio.db.
    std::filesystem::path resolve_db_path(CommandLineOptions const &cli) const;

    // `store` may be null. Returns nullopt with `error` set when a value is
    // invalid; nothing has been converted at that point.
    std::optional<folio::engine::ConversionSettings>
    load(CommandLineOptions const &cli, folio::storage::Database const *store,
         std::string &error) const;

    bool debug_requested(CommandLineOptions const &cli) const;

  private:
    EnvLookup env_;
};

// Validates and stores one default. Returns false with `error` set on an
// unknown key or a value the key cannot hold.
bool persist_default(folio::storage::Database &store, std::string const &key,
                     std::string const &value, std::string &error);

} // namespace folio::app
