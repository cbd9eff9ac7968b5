#include <catch2/catch_test_macros.hpp>

#include <shdbg/env/environment.hpp>

#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

using namespace shdbg::env;

namespace environment_tests {

using Entries = std::vector<std::string_view>;

TEST_CASE("Variables are sorted by name", "[env]") {
    const Environment env{Entries{"TERM=xterm", "HOME=/home/user", "EDITOR=vi"}};

    REQUIRE(env.Size() == 3);
    CHECK(env.Variables()[0] == Variable{"EDITOR", "vi"});
    CHECK(env.Variables()[1] == Variable{"HOME", "/home/user"});
    CHECK(env.Variables()[2] == Variable{"TERM", "xterm"});
}

TEST_CASE("Values keep everything after the first equals sign", "[env]") {
    const Environment env{Entries{"OPTS=a=b=c", "EMPTY="}};

    REQUIRE(env.Find("OPTS") != nullptr);
    CHECK(env.Find("OPTS")->value == "a=b=c");
    REQUIRE(env.Find("EMPTY") != nullptr);
    CHECK(env.Find("EMPTY")->value.empty());
}

TEST_CASE("Entries without a name are ignored", "[env]") {
    const Environment env{Entries{"noequals", "=value", "", "OK=1"}};

    REQUIRE(env.Size() == 1);
    CHECK(env.Variables()[0].name == "OK");
}

TEST_CASE("Later duplicates win", "[env]") {
    const Environment env{Entries{"X=1", "Y=2", "X=3"}};

    REQUIRE(env.Size() == 2);
    REQUIRE(env.Find("X") != nullptr);
    CHECK(env.Find("X")->value == "3");
}

TEST_CASE("Find returns null for unknown names", "[env]") {
    const Environment env{Entries{"A=1", "C=3"}};

    CHECK(env.Find("B") == nullptr);
    CHECK(env.Find("") == nullptr);
    CHECK(env.Find("AA") == nullptr);
    CHECK(Environment{}.IsEmpty());
}

TEST_CASE("Capture reads the process environment", "[env]") {
    REQUIRE(setenv("SHDBG_ENVIRONMENT_TEST", "captured", 1) == 0);

    const Environment env = Environment::Capture();
    const Variable *var = env.Find("SHDBG_ENVIRONMENT_TEST");
    REQUIRE(var != nullptr);
    CHECK(var->value == "captured");

    unsetenv("SHDBG_ENVIRONMENT_TEST");
}

TEST_CASE("Split values keep empty segments", "[env]") {
    CHECK(SplitValue("/bin:/usr/bin") == std::vector<std::string>{"/bin", "/usr/bin"});
    CHECK(SplitValue("/bin::/usr/bin:") == std::vector<std::string>{"/bin", "", "/usr/bin", ""});
    CHECK(SplitValue("single") == std::vector<std::string>{"single"});
    CHECK(SplitValue("") == std::vector<std::string>{""});
}

} // namespace environment_tests
