#include <catch2/catch_test_macros.hpp>
#include <optional>
#include <string>
#include <cstdlib>
#include "sindex/core/platform_utils.hpp"

using sindex::core::safe_getenv;
using sindex::core::env_flag_enabled;

static void set_env_var(const char* name, const char* value) {
#if defined(_WIN32)
    _putenv_s(name, value ? value : "");
#else
    if (value) setenv(name, value, 1); else unsetenv(name);
#endif
}

static void unset_env_var(const char* name) {
#if defined(_WIN32)
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

TEST_CASE("safe_getenv returns nullopt when unset", "[platform][env]") {
    const char* key = "SINDEX_TEST_SAFE_GETENV_UNSET";
    unset_env_var(key);
    auto v = safe_getenv(key);
    REQUIRE_FALSE(v.has_value());
}

TEST_CASE("safe_getenv returns value when set", "[platform][env]") {
    const char* key = "SINDEX_TEST_SAFE_GETENV_VALUE";
    set_env_var(key, "hello_world");
    auto v = safe_getenv(key);
    REQUIRE(v.has_value());
    REQUIRE(*v == std::string("hello_world"));
    unset_env_var(key);
}

TEST_CASE("safe_getenv rejects null and empty names", "[platform][env]") {
    REQUIRE_FALSE(safe_getenv(nullptr).has_value());
    REQUIRE_FALSE(safe_getenv("").has_value());
}

TEST_CASE("env_flag_enabled treats unset, empty and 0-prefixed as off", "[platform][env]") {
    const char* key = "SINDEX_TEST_ENV_FLAG";
    unset_env_var(key);
    REQUIRE_FALSE(env_flag_enabled(key));
#if !defined(_WIN32)
    set_env_var(key, "");
    REQUIRE_FALSE(env_flag_enabled(key));
#endif
    set_env_var(key, "0");
    REQUIRE_FALSE(env_flag_enabled(key));
    set_env_var(key, "1");
    REQUIRE(env_flag_enabled(key));
    set_env_var(key, "yes");
    REQUIRE(env_flag_enabled(key));
    unset_env_var(key);
}
