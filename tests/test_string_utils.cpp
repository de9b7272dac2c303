#include <catch2/catch.hpp>
#include "string_utils.hpp"

using namespace instman;

TEST_CASE("trim and to_lower", "[strings]") {
    CHECK(trim("  a b \t\n") == "a b");
    CHECK(trim("   ").empty());
    CHECK(trim("").empty());
    CHECK(to_lower("MiXeD-Case") == "mixed-case");
}

TEST_CASE("split_args", "[strings]") {
    CHECK(split_args("").empty());
    CHECK(split_args("   ").empty());
    CHECK(split_args("--a  --b=1\t--c") == std::vector<std::string>{"--a", "--b=1", "--c"});
    CHECK(split_args("--name \"two words\" x") == std::vector<std::string>{"--name", "two words", "x"});
    CHECK(split_args("--empty \"\"") == std::vector<std::string>{"--empty", ""});
}

TEST_CASE("join_args quotes words with spaces", "[strings]") {
    const std::vector<std::string> args{"--name", "two words", "x"};
    CHECK(join_args(args) == "--name \"two words\" x");
    CHECK(split_args(join_args(args)) == args);
}
