#include <catch2/catch_test_macros.hpp>

#include "llmgate/core/config.hpp"

#include <cstdlib>

using namespace llmgate;

TEST_CASE("Config ${VAR} resolution", "[core][config]") {
    SECTION("Resolves existing env var") {
        setenv("LLMGATE_TEST_VAR", "hello_world", 1);
        CHECK(resolve_env_refs("prefix_${LLMGATE_TEST_VAR}_suffix") ==
              "prefix_hello_world_suffix");
    }

    SECTION("Preserves unresolved vars") {
        CHECK(resolve_env_refs("value=${LLMGATE_NONEXISTENT_12345}") ==
              "value=${LLMGATE_NONEXISTENT_12345}");
    }

    SECTION("Handles multiple refs") {
        setenv("LLMGATE_TEST_A", "aaa", 1);
        setenv("LLMGATE_TEST_B", "bbb", 1);
        CHECK(resolve_env_refs("${LLMGATE_TEST_A}:${LLMGATE_TEST_B}") == "aaa:bbb");
    }

    SECTION("Empty input") {
        CHECK(resolve_env_refs("").empty());
    }
}

TEST_CASE("Config $${VAR} escaping", "[core][config]") {
    CHECK(resolve_env_refs("value=$${LITERAL}") == "value=${LITERAL}");

    setenv("LLMGATE_TEST_REAL", "resolved", 1);
    CHECK(resolve_env_refs("$${ESCAPED} and ${LLMGATE_TEST_REAL}") ==
          "${ESCAPED} and resolved");
}
