#include <catch2/catch_test_macros.hpp>
#include <optional>
#include <string>
#include "logvault/core/platform_utils.hpp"

#include <cstdlib>

using logvault::core::safe_getenv;

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
    const char* key = "LOGVAULT_TEST_SAFE_GETENV_UNSET";
    unset_env_var(key);
    REQUIRE_FALSE(safe_getenv(key).has_value());
    REQUIRE_FALSE(safe_getenv(nullptr).has_value());
    REQUIRE_FALSE(safe_getenv("").has_value());
}

TEST_CASE("safe_getenv returns value when set", "[platform][env]") {
    const char* key = "LOGVAULT_TEST_SAFE_GETENV_VALUE";
    set_env_var(key, "hello_world");
    auto v = safe_getenv(key);
    REQUIRE(v.has_value());
    REQUIRE(*v == std::string("hello_world"));
    unset_env_var(key);
}

TEST_CASE("env_flag treats leading zero and empty as off", "[platform][env]") {
    using logvault::core::env_flag;
    const char* key = "LOGVAULT_TEST_ENV_FLAG";
    unset_env_var(key);
    REQUIRE_FALSE(env_flag(key));
    set_env_var(key, "0");
    REQUIRE_FALSE(env_flag(key));
    set_env_var(key, "1");
    REQUIRE(env_flag(key));
    set_env_var(key, "yes");
    REQUIRE(env_flag(key));
    unset_env_var(key);
}

TEST_CASE("env_u64 parses plain decimals only", "[platform][env]") {
    using logvault::core::env_u64;
    const char* key = "LOGVAULT_TEST_ENV_U64";
    set_env_var(key, "4096");
    REQUIRE(env_u64(key) == std::optional<std::uint64_t>{4096});
    set_env_var(key, "12kb");
    REQUIRE_FALSE(env_u64(key).has_value());
    set_env_var(key, "-5");
    REQUIRE_FALSE(env_u64(key).has_value());
    unset_env_var(key);
    REQUIRE_FALSE(env_u64(key).has_value());
}
