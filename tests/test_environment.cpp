#include <catch2/catch.hpp>
#include <confbind/environment.hpp>
#include <cstdlib>

using namespace confbind;

TEST_CASE("MapEnvironment lookup of set and unset keys", "[environment]") {
    MapEnvironment env{{"HOST", "def"}, {"EMPTY", ""}};
    REQUIRE(env.lookup("HOST") == std::optional<std::string>("def"));
    REQUIRE(env.lookup("EMPTY") == std::optional<std::string>(""));
    REQUIRE_FALSE(env.lookup("PORT").has_value());
}

TEST_CASE("MapEnvironment set and unset", "[environment]") {
    MapEnvironment env;
    env.set("PORT", "7000");
    REQUIRE(env.lookup("PORT") == std::optional<std::string>("7000"));
    env.set("PORT", "7001");
    REQUIRE(env.lookup("PORT") == std::optional<std::string>("7001"));
    env.unset("PORT");
    REQUIRE_FALSE(env.lookup("PORT").has_value());
}

TEST_CASE("ProcessEnvironment reads the process environment", "[environment]") {
    const char* old = std::getenv("CONFBIND_TEST_VAR");
    setenv("CONFBIND_TEST_VAR", "abc", 1);

    REQUIRE(process_environment().lookup("CONFBIND_TEST_VAR") == std::optional<std::string>("abc"));

    unsetenv("CONFBIND_TEST_VAR");
    REQUIRE_FALSE(process_environment().lookup("CONFBIND_TEST_VAR").has_value());
    REQUIRE_FALSE(process_environment().lookup("").has_value());

    if (old) setenv("CONFBIND_TEST_VAR", old, 1);
}
