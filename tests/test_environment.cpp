#include <catch2/catch_test_macros.hpp>
#include <meridian/environment.h>
#include <fstream>
#include <cstdlib>

using namespace meridian;

TEST_CASE("Environment: .env Loading", "[env]") {
    std::string test_file = "meridian_test.env";

    std::ofstream out(test_file);
    out << "MERIDIAN_T_KEY1=VALUE1\n";
    out << "  MERIDIAN_T_KEY2 = VALUE2  \r\n";
    out << "# MERIDIAN_T_COMMENT=BLAH\n";
    out << "MERIDIAN_T_KEY3=\"QUOTED VALUE\"\n";
    out << "export MERIDIAN_T_KEY4='single'\n";
    out << "MERIDIAN_T_KEY5=plain # trailing note\n";
    out << "MERIDIAN_T_KEY6=\"line1\\nline2\"\n";
    out << "not a pair\n";
    out.close();

    SECTION("Loading and Parsing") {
        REQUIRE(load_env(test_file) == true);

        CHECK(std::string(std::getenv("MERIDIAN_T_KEY1")) == "VALUE1");
        CHECK(std::string(std::getenv("MERIDIAN_T_KEY2")) == "VALUE2");
        CHECK(std::getenv("MERIDIAN_T_COMMENT") == nullptr);
        CHECK(std::string(std::getenv("MERIDIAN_T_KEY3")) == "QUOTED VALUE");
        CHECK(std::string(std::getenv("MERIDIAN_T_KEY4")) == "single");
        CHECK(std::string(std::getenv("MERIDIAN_T_KEY5")) == "plain");
        CHECK(std::string(std::getenv("MERIDIAN_T_KEY6")) == "line1\nline2");
    }

    SECTION("Existing variables win unless overwrite is set") {
        setenv("MERIDIAN_T_KEY1", "kept", 1);
        REQUIRE(load_env(test_file));
        CHECK(std::string(std::getenv("MERIDIAN_T_KEY1")) == "kept");

        REQUIRE(load_env(test_file, true));
        CHECK(std::string(std::getenv("MERIDIAN_T_KEY1")) == "VALUE1");
    }

    SECTION("Non-existent file") {
        CHECK(load_env("missing.env") == false);
    }

    std::remove(test_file.c_str());
}

TEST_CASE("Environment: Typed access", "[env]") {
    setenv("MERIDIAN_T_INT", "42", 1);
    setenv("MERIDIAN_T_BIG", "1700000000000", 1);
    setenv("MERIDIAN_T_BOOL", "yes", 1);
    setenv("MERIDIAN_T_BAD", "12abc", 1);

    CHECK(env<int>("MERIDIAN_T_INT") == 42);
    CHECK(env<int64_t>("MERIDIAN_T_BIG") == 1700000000000LL);
    CHECK(env<bool>("MERIDIAN_T_BOOL") == true);
    CHECK(env<std::string>("MERIDIAN_T_UNSET", std::string("fallback")) == "fallback");
    CHECK(env<int>("MERIDIAN_T_UNSET", 7) == 7);

    CHECK_THROWS_AS(env<int>("MERIDIAN_T_BAD"), ConfigError);
    CHECK_THROWS_AS(env<bool>("MERIDIAN_T_INT"), ConfigError);
    CHECK_THROWS_AS(env<std::string>("MERIDIAN_T_UNSET"), ConfigError);

    unsetenv("MERIDIAN_T_INT");
    unsetenv("MERIDIAN_T_BIG");
    unsetenv("MERIDIAN_T_BOOL");
    unsetenv("MERIDIAN_T_BAD");
}
