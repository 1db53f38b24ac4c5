#include <catch2/catch_test_macros.hpp>

#include "llmgate/store/custom_files.hpp"

#include "../test_helpers.hpp"

#include <fstream>

using namespace llmgate;
using namespace llmgate::store;
using llmgate::providers::CustomProviderConfig;
using llmgate::providers::ProtocolType;

namespace {

auto acme(std::string id = "custom-openai-acme") -> CustomProviderConfig {
    CustomProviderConfig c;
    c.id = std::move(id);
    c.name = "Acme";
    c.type = ProtocolType::OpenAiCompatible;
    c.base_url = "https://acme.test/v1";
    c.api_key = "sk-acme";
    return c;
}

void write_file(const std::filesystem::path& path, std::string_view text) {
    std::ofstream out(path);
    out << text;
}

} // anonymous namespace

TEST_CASE("CustomProviderFile missing file is an empty document", "[store][custom_files]") {
    test::TmpDir dir;
    CustomProviderFile file(dir.file("custom-providers.json"));

    auto doc = file.load();
    REQUIRE(doc.has_value());
    CHECK(doc->version == "1");
    CHECK(doc->providers.empty());

    auto enabled = file.list_enabled();
    REQUIRE(enabled.has_value());
    CHECK(enabled->empty());
}

TEST_CASE("CustomProviderFile add, update and remove", "[store][custom_files]") {
    test::TmpDir dir;
    CustomProviderFile file(dir.file("nested/custom-providers.json"));

    REQUIRE(file.add(acme()).has_value());
    CHECK(std::filesystem::exists(file.path()));

    auto dup = file.add(acme());
    REQUIRE_FALSE(dup.has_value());
    CHECK(dup.error().code() == ErrorCode::AlreadyExists);

    auto changed = acme("ignored");
    changed.base_url = "https://acme.test/v2";
    REQUIRE(file.update("custom-openai-acme", changed).has_value());

    auto doc = file.load();
    REQUIRE(doc.has_value());
    REQUIRE(doc->providers.size() == 1);
    const auto& stored = doc->providers.at("custom-openai-acme");
    CHECK(stored.id == "custom-openai-acme");
    CHECK(stored.base_url == "https://acme.test/v2");

    auto missing = file.update("custom-openai-nope", acme());
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == ErrorCode::NotFound);

    REQUIRE(file.remove("custom-openai-acme").has_value());
    auto gone = file.remove("custom-openai-acme");
    REQUIRE_FALSE(gone.has_value());
    CHECK(gone.error().code() == ErrorCode::NotFound);
}

TEST_CASE("CustomProviderFile lists only enabled entries", "[store][custom_files]") {
    test::TmpDir dir;
    CustomProviderFile file(dir.file("custom-providers.json"));

    auto disabled = acme("custom-openai-off");
    disabled.enabled = false;
    REQUIRE(file.add(acme("custom-openai-b")).has_value());
    REQUIRE(file.add(disabled).has_value());
    REQUIRE(file.add(acme("custom-openai-a")).has_value());

    auto enabled = file.list_enabled();
    REQUIRE(enabled.has_value());
    REQUIRE(enabled->size() == 2);
    CHECK((*enabled)[0].id == "custom-openai-a");
    CHECK((*enabled)[1].id == "custom-openai-b");
}

TEST_CASE("CustomProviderFile rejects malformed documents", "[store][custom_files]") {
    test::TmpDir dir;
    auto path = dir.file("custom-providers.json");

    write_file(path, "{ broken");
    auto invalid = CustomProviderFile(path).load();
    REQUIRE_FALSE(invalid.has_value());
    CHECK(invalid.error().code() == ErrorCode::SerializationError);

    write_file(path, "[]");
    auto array = CustomProviderFile(path).load();
    REQUIRE_FALSE(array.has_value());
    CHECK(array.error().code() == ErrorCode::SerializationError);
}

TEST_CASE("CustomModelFile add merges into existing entries", "[store][custom_files]") {
    test::TmpDir dir;
    CustomModelFile file(dir.file("custom-models.json"));

    models::ModelDescriptor first;
    first.name = "My Model";
    first.providers = {"groq", "openRouter"};
    first.provider_mappings = {{"openRouter", "me/my-model"}};
    REQUIRE(file.add("my-model", first).has_value());

    models::ModelDescriptor second;
    second.name = "Ignored";
    second.providers = {"openRouter", "ollama"};
    second.provider_mappings = {{"ollama", "my-model:7b"}};
    REQUIRE(file.add("my-model", second).has_value());

    auto config = file.load();
    REQUIRE(config.has_value());
    const auto& stored = config->models.at("my-model");
    CHECK(stored.name == "My Model");
    CHECK(stored.providers == std::vector<std::string>{"groq", "openRouter", "ollama"});
    CHECK(stored.provider_mappings.size() == 2);
    CHECK(stored.provider_mappings.at("ollama") == "my-model:7b");

    REQUIRE(file.remove("my-model").has_value());
    auto gone = file.remove("my-model");
    REQUIRE_FALSE(gone.has_value());
    CHECK(gone.error().code() == ErrorCode::NotFound);
}
