#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <SQLiteCpp/SQLiteCpp.h>

#include "llmgate/core/error.hpp"

namespace llmgate::store {

using boost::asio::awaitable;

using SettingsMap = std::map<std::string, std::string>;

/// Key names used for provider settings.
namespace setting_keys {

inline constexpr std::string_view kApiKeyPrefix = "api_key_";
inline constexpr std::string_view kBaseUrlPrefix = "base_url_";
inline constexpr std::string_view kCodingPlanPrefix = "use_coding_plan_";
inline constexpr std::string_view kInternationalPrefix = "use_international_";
inline constexpr std::string_view kModelsConfigJson = "models_config_json";

auto api_key(std::string_view provider_id) -> std::string;
auto base_url(std::string_view provider_id) -> std::string;
auto use_coding_plan(std::string_view provider_id) -> std::string;
auto use_international(std::string_view provider_id) -> std::string;

/// "<provider>_oauth_<field>", e.g. "openai_oauth_access_token".
auto oauth(std::string_view provider_id, std::string_view field) -> std::string;

} // namespace setting_keys

/// Key/value settings persistence.
class SettingsStore {
public:
    virtual ~SettingsStore() = default;

    /// nullopt when the key is absent.
    virtual auto get(std::string_view key) -> awaitable<Result<std::optional<std::string>>> = 0;
    virtual auto set(std::string_view key, std::string_view value) -> awaitable<Result<void>> = 0;
    virtual auto remove(std::string_view key) -> awaitable<Result<void>> = 0;

    /// Values of the present keys among `keys`.
    virtual auto get_batch(const std::vector<std::string>& keys)
        -> awaitable<Result<SettingsMap>> = 0;

    /// Every setting whose key starts with `prefix`.
    virtual auto get_with_prefix(std::string_view prefix) -> awaitable<Result<SettingsMap>> = 0;
};

class SqliteSettingsStore : public SettingsStore {
public:
    /// Opens or creates the database; ":memory:" gives a private in-memory one.
    explicit SqliteSettingsStore(const std::string& db_path);

    auto get(std::string_view key) -> awaitable<Result<std::optional<std::string>>> override;
    auto set(std::string_view key, std::string_view value) -> awaitable<Result<void>> override;
    auto remove(std::string_view key) -> awaitable<Result<void>> override;
    auto get_batch(const std::vector<std::string>& keys) -> awaitable<Result<SettingsMap>> override;
    auto get_with_prefix(std::string_view prefix) -> awaitable<Result<SettingsMap>> override;

private:
    void init_schema();

    std::unique_ptr<SQLite::Database> db_;
};

} // namespace llmgate::store
