#include <catch2/catch_test_macros.hpp>

#include "delguard/infra/shell_lexer.hpp"

using namespace delguard::infra;
using Tokens = std::vector<std::string>;

// ---------------------------------------------------------------------------
// split_posix
// ---------------------------------------------------------------------------

TEST_CASE("Whitespace separates words", "[infra][shell_lexer]") {
    auto tokens = split_posix("rm  -rf\tbuild\n");
    REQUIRE(tokens.has_value());
    CHECK(*tokens == Tokens{"rm", "-rf", "build"});
}

TEST_CASE("Quotes group words", "[infra][shell_lexer]") {
    SECTION("single quotes are literal") {
        auto tokens = split_posix(R"(rm 'my file.txt' 'a\b')");
        REQUIRE(tokens.has_value());
        CHECK(*tokens == Tokens{"rm", "my file.txt", R"(a\b)"});
    }

    SECTION("double quotes escape only quote and backslash") {
        auto tokens = split_posix(R"(rm "a \"b\" \\ \n")");
        REQUIRE(tokens.has_value());
        CHECK(*tokens == Tokens{"rm", R"(a "b" \ \n)"});
    }

    SECTION("adjacent quoted and bare parts join") {
        auto tokens = split_posix(R"(rm pre'mid'"post")");
        REQUIRE(tokens.has_value());
        CHECK(*tokens == Tokens{"rm", "premidpost"});
    }

    SECTION("empty quotes make an empty word") {
        auto tokens = split_posix("rm ''");
        REQUIRE(tokens.has_value());
        CHECK(*tokens == Tokens{"rm", ""});
    }
}

TEST_CASE("Backslash escapes outside quotes", "[infra][shell_lexer]") {
    auto tokens = split_posix(R"(rm my\ file.txt)");
    REQUIRE(tokens.has_value());
    CHECK(*tokens == Tokens{"rm", "my file.txt"});
}

TEST_CASE("Shell operators stay attached", "[infra][shell_lexer]") {
    auto tokens = split_posix("rm a.txt; rm b.txt && ls");
    REQUIRE(tokens.has_value());
    CHECK(*tokens == Tokens{"rm", "a.txt;", "rm", "b.txt", "&&", "ls"});
}

TEST_CASE("Malformed input is an error", "[infra][shell_lexer]") {
    SECTION("unterminated single quote") {
        auto tokens = split_posix("rm 'oops");
        REQUIRE_FALSE(tokens.has_value());
        CHECK(tokens.error().code() == delguard::ErrorCode::InvalidArgument);
        CHECK(tokens.error().message() == "No closing quotation");
    }

    SECTION("unterminated double quote") {
        CHECK_FALSE(split_posix(R"(rm "oops)").has_value());
    }

    SECTION("trailing backslash") {
        auto tokens = split_posix("rm oops\\");
        REQUIRE_FALSE(tokens.has_value());
        CHECK(tokens.error().message() == "No escaped character");
    }
}

// ---------------------------------------------------------------------------
// split_permissive / split_command
// ---------------------------------------------------------------------------

TEST_CASE("Permissive splitting never fails", "[infra][shell_lexer]") {
    CHECK(split_permissive("rm 'oops") == Tokens{"rm", "'oops"});
    CHECK(split_permissive(R"(rm "a b" c)") == Tokens{"rm", R"("a b")", "c"});
    CHECK(split_permissive(R"(rm a\b)") == Tokens{"rm", R"(a\b)"});
    CHECK(split_permissive("   ").empty());
}

TEST_CASE("split_command falls back on malformed quoting", "[infra][shell_lexer]") {
    CHECK(split_command("rm 'a b'") == Tokens{"rm", "a b"});
    CHECK(split_command("rm it's") == Tokens{"rm", "it's"});
}
