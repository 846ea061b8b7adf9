#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "delguard/guard/extractor.hpp"
#include "delguard/infra/paths.hpp"

namespace fs = std::filesystem;
using namespace delguard::guard;
using Paths = std::vector<fs::path>;

// ---------------------------------------------------------------------------
// Argument collection
// ---------------------------------------------------------------------------

TEST_CASE("Relative targets resolve against cwd", "[guard][extractor]") {
    CHECK(extract_targets("rm -rf ./build", "/repo") == Paths{"/repo/build"});
    CHECK(extract_targets("rm ../other/file", "/repo/sub") == Paths{"/repo/other/file"});
    CHECK(extract_targets("rm /abs/path.txt", "/repo") == Paths{"/abs/path.txt"});
}

TEST_CASE("Only the first command's arguments are collected", "[guard][extractor]") {
    SECTION("semicolon attached to an argument") {
        CHECK(extract_targets("rm file1.txt file2.txt; rm file3.txt", "/repo") ==
              Paths{"/repo/file1.txt", "/repo/file2.txt"});
    }

    SECTION("standalone operators") {
        CHECK(extract_targets("rm a && rm b", "/repo") == Paths{"/repo/a"});
        CHECK(extract_targets("rm a || echo failed", "/repo") == Paths{"/repo/a"});
        CHECK(extract_targets("rm a | tee log", "/repo") == Paths{"/repo/a"});
        CHECK(extract_targets("rm a & wait", "/repo") == Paths{"/repo/a"});
        CHECK(extract_targets("rm a ; rm b", "/repo") == Paths{"/repo/a"});
    }

    SECTION("a verb that ends its command has no targets") {
        CHECK(extract_targets("rm; rm foo", "/repo").empty());
    }
}

TEST_CASE("extract_segments returns every deleting command", "[guard][extractor]") {
    using Segments = std::vector<Paths>;

    CHECK(extract_segments("rm file1.txt file2.txt; rm file3.txt", "/repo") ==
          Segments{{"/repo/file1.txt", "/repo/file2.txt"}, {"/repo/file3.txt"}});
    CHECK(extract_segments("rm a.txt && rm -rf /etc/x", "/repo") ==
          Segments{{"/repo/a.txt"}, {"/etc/x"}});
    CHECK(extract_segments("echo a | tee log", "/repo").empty());

    SECTION("a verb with no arguments keeps an empty entry") {
        CHECK(extract_segments("rm; rm foo", "/repo") == Segments{{}, {"/repo/foo"}});
    }

    SECTION("verbs after a directory change have no targets") {
        CHECK(extract_segments("rm a; cd /tmp && rm b", "/repo") ==
              Segments{{"/repo/a"}, {}});
    }

    SECTION("an exec clause is its own entry") {
        CHECK(extract_segments("find . -exec rm {} + ; rm /etc/x", "/repo") ==
              Segments{{}, {"/etc/x"}});
    }
}

TEST_CASE("Tokens before the verb are skipped", "[guard][extractor]") {
    CHECK(extract_targets("sudo rm -f x", "/repo") == Paths{"/repo/x"});
    CHECK(extract_targets("echo start && rm a", "/repo") == Paths{"/repo/a"});
    CHECK(extract_targets("ls; rm a", "/repo") == Paths{"/repo/a"});
    CHECK(extract_targets("/bin/rm a", "/repo") == Paths{"/repo/a"});
}

TEST_CASE("A directory change before the verb yields nothing", "[guard][extractor]") {
    CHECK(extract_targets("cd /elsewhere && rm -rf build", "/repo").empty());
    CHECK(extract_targets("pushd sub; rm a", "/repo").empty());
}

TEST_CASE("Flags are not targets", "[guard][extractor]") {
    SECTION("short and long flags") {
        CHECK(extract_targets("rm -r -f --verbose dir", "/repo") == Paths{"/repo/dir"});
    }

    SECTION("double dash ends flag parsing") {
        CHECK(extract_targets("rm -- -weird-name", "/repo") == Paths{"/repo/-weird-name"});
    }

    SECTION("target directory flag consumes its value") {
        CHECK(extract_targets("rm -t skipped real", "/repo") == Paths{"/repo/real"});
    }

    SECTION("find placeholder is ignored") {
        CHECK(extract_targets(R"(find . -exec rm {} \;)", "/repo").empty());
    }

    SECTION("plus ends the exec clause") {
        CHECK(extract_targets("find /etc -name '*.conf' -exec rm -f {} +", "/repo").empty());
        CHECK(extract_targets("find . -exec rm {} + -print", "/repo").empty());
    }

    SECTION("a literal plus is still a target outside an exec clause") {
        CHECK(extract_targets("rm +", "/repo") == Paths{"/repo/+"});
    }

    SECTION("verb without arguments") {
        CHECK(extract_targets("rm", "/repo").empty());
        CHECK(extract_targets("rm -rf", "/repo").empty());
    }
}

TEST_CASE("Quoting is honoured", "[guard][extractor]") {
    CHECK(extract_targets("rm 'my file.txt'", "/repo") == Paths{"/repo/my file.txt"});
    CHECK(extract_targets(R"(rm "a b" c)", "/repo") == Paths{"/repo/a b", "/repo/c"});
}

TEST_CASE("Home and environment references are expanded", "[guard][extractor]") {
    ::setenv("DELGUARD_TEST_DIR", "/srv/data", 1);

    auto home = delguard::infra::home_dir();
    CHECK(extract_targets("rm ~/notes.txt", "/repo") ==
          Paths{delguard::infra::resolve_path(home / "notes.txt")});
    CHECK(extract_targets("rm $DELGUARD_TEST_DIR/a", "/repo") == Paths{"/srv/data/a"});
    CHECK(extract_targets("rm ${DELGUARD_TEST_DIR}/b", "/repo") == Paths{"/srv/data/b"});

    ::unsetenv("DELGUARD_TEST_DIR");
}

TEST_CASE("Globs expand against the filesystem", "[guard][extractor]") {
    auto dir = delguard::infra::resolve_path(fs::temp_directory_path()) / "delguard_extract_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    std::ofstream(dir / "a.log") << "a";
    std::ofstream(dir / "b.log") << "b";
    std::ofstream(dir / "keep.txt") << "k";

    SECTION("matches are listed in sorted order") {
        CHECK(extract_targets("rm *.log", dir) == Paths{dir / "a.log", dir / "b.log"});
    }

    SECTION("a pattern without matches stays literal") {
        CHECK(extract_targets("rm *.pdf", dir) == Paths{dir / "*.pdf"});
    }

    SECTION("quoted globs still expand") {
        CHECK(extract_targets("rm '*.txt'", dir) == Paths{dir / "keep.txt"});
    }

    fs::remove_all(dir);
}

TEST_CASE("is_shell_operator", "[guard][extractor]") {
    for (const char* op : {";", "&&", "||", "|", "&"}) {
        CAPTURE(op);
        CHECK(is_shell_operator(op));
    }
    CHECK_FALSE(is_shell_operator(";;"));
    CHECK_FALSE(is_shell_operator("a;"));
}
