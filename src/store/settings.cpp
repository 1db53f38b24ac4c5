#include "llmgate/store/settings.hpp"

#include "llmgate/core/logger.hpp"

namespace llmgate::store {

namespace setting_keys {

auto api_key(std::string_view provider_id) -> std::string {
    return std::string(kApiKeyPrefix) + std::string(provider_id);
}

auto base_url(std::string_view provider_id) -> std::string {
    return std::string(kBaseUrlPrefix) + std::string(provider_id);
}

auto use_coding_plan(std::string_view provider_id) -> std::string {
    return std::string(kCodingPlanPrefix) + std::string(provider_id);
}

auto use_international(std::string_view provider_id) -> std::string {
    return std::string(kInternationalPrefix) + std::string(provider_id);
}

auto oauth(std::string_view provider_id, std::string_view field) -> std::string {
    return std::string(provider_id) + "_oauth_" + std::string(field);
}

} // namespace setting_keys

SqliteSettingsStore::SqliteSettingsStore(const std::string& db_path)
    : db_(std::make_unique<SQLite::Database>(
          db_path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE)) {
    init_schema();
    LOG_INFO("Settings store opened at {}", db_path);
}

void SqliteSettingsStore::init_schema() {
    db_->exec(R"SQL(
        CREATE TABLE IF NOT EXISTS settings (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        )
    )SQL");
}

auto SqliteSettingsStore::get(std::string_view key)
    -> awaitable<Result<std::optional<std::string>>> {
    try {
        SQLite::Statement stmt(*db_, "SELECT value FROM settings WHERE key = ?");
        stmt.bind(1, std::string(key));
        if (!stmt.executeStep()) {
            co_return std::optional<std::string>{};
        }
        co_return std::optional<std::string>(stmt.getColumn(0).getString());
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to read setting {}: {}", key, e.what());
        co_return make_fail(
            make_error(ErrorCode::DatabaseError, "Failed to read setting", e.what()));
    }
}

auto SqliteSettingsStore::set(std::string_view key, std::string_view value)
    -> awaitable<Result<void>> {
    try {
        SQLite::Statement stmt(*db_,
            "INSERT INTO settings (key, value) VALUES (?, ?) "
            "ON CONFLICT(key) DO UPDATE SET value = excluded.value");
        stmt.bind(1, std::string(key));
        stmt.bind(2, std::string(value));
        stmt.exec();
        LOG_DEBUG("Saved setting {}", key);
        co_return ok_result();
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to save setting {}: {}", key, e.what());
        co_return make_fail(
            make_error(ErrorCode::DatabaseError, "Failed to save setting", e.what()));
    }
}

auto SqliteSettingsStore::remove(std::string_view key) -> awaitable<Result<void>> {
    try {
        SQLite::Statement stmt(*db_, "DELETE FROM settings WHERE key = ?");
        stmt.bind(1, std::string(key));
        stmt.exec();
        co_return ok_result();
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to remove setting {}: {}", key, e.what());
        co_return make_fail(
            make_error(ErrorCode::DatabaseError, "Failed to remove setting", e.what()));
    }
}

auto SqliteSettingsStore::get_batch(const std::vector<std::string>& keys)
    -> awaitable<Result<SettingsMap>> {
    SettingsMap values;
    try {
        SQLite::Statement stmt(*db_, "SELECT value FROM settings WHERE key = ?");
        for (const auto& key : keys) {
            stmt.bind(1, key);
            if (stmt.executeStep()) {
                values[key] = stmt.getColumn(0).getString();
            }
            stmt.reset();
        }
        co_return values;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to read settings batch: {}", e.what());
        co_return make_fail(
            make_error(ErrorCode::DatabaseError, "Failed to read settings", e.what()));
    }
}

auto SqliteSettingsStore::get_with_prefix(std::string_view prefix)
    -> awaitable<Result<SettingsMap>> {
    SettingsMap values;
    try {
        SQLite::Statement stmt(*db_,
            "SELECT key, value FROM settings WHERE substr(key, 1, ?) = ? ORDER BY key");
        stmt.bind(1, static_cast<int>(prefix.size()));
        stmt.bind(2, std::string(prefix));
        while (stmt.executeStep()) {
            values[stmt.getColumn(0).getString()] = stmt.getColumn(1).getString();
        }
        co_return values;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to read settings with prefix {}: {}", prefix, e.what());
        co_return make_fail(
            make_error(ErrorCode::DatabaseError, "Failed to read settings", e.what()));
    }
}

} // namespace llmgate::store
