#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

#include "delguard/guard/dry_run.hpp"
#include "delguard/infra/paths.hpp"

namespace fs = std::filesystem;
using namespace delguard::guard;
using namespace std::chrono_literals;

namespace {

/// Replays canned process output instead of spawning a shell.
class ScriptedDiscoverer : public DryRunDiscoverer {
public:
    explicit ScriptedDiscoverer(delguard::Result<delguard::infra::ProcessOutput> output)
        : output_(std::move(output)) {}

    std::vector<std::string> last_argv;
    int calls = 0;

protected:
    auto execute(const std::vector<std::string>& argv, const fs::path&)
        -> delguard::Result<delguard::infra::ProcessOutput> override {
        last_argv = argv;
        ++calls;
        return output_;
    }

private:
    delguard::Result<delguard::infra::ProcessOutput> output_;
};

auto ok(int exit_code, std::string text) -> delguard::Result<delguard::infra::ProcessOutput> {
    return delguard::infra::ProcessOutput{exit_code, std::move(text)};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Rewrites
// ---------------------------------------------------------------------------

TEST_CASE("strip_find_deletion removes the destructive action", "[guard][dry_run]") {
    CHECK(strip_find_deletion("find . -name '*.log' -delete") ==
          std::optional<std::string>("find . -name '*.log'"));
    CHECK(strip_find_deletion(R"(find . -type f -exec rm {} \;)") ==
          std::optional<std::string>("find . -type f"));
    CHECK(strip_find_deletion("find . -type f -exec rm -f {} +") ==
          std::optional<std::string>("find . -type f"));
    CHECK(strip_find_deletion("find . -execdir rm {} +") ==
          std::optional<std::string>("find ."));

    SECTION("nothing to strip") {
        CHECK_FALSE(strip_find_deletion("find . -name x").has_value());
    }
}

TEST_CASE("rewrite_git_clean_dry_run turns force into dry-run", "[guard][dry_run]") {
    CHECK(rewrite_git_clean_dry_run("git clean -f") == std::optional<std::string>("git clean -n"));
    CHECK(rewrite_git_clean_dry_run("git clean -fdx") ==
          std::optional<std::string>("git clean -ndx"));
    CHECK(rewrite_git_clean_dry_run("git clean -xfd") ==
          std::optional<std::string>("git clean -xnd"));
    CHECK(rewrite_git_clean_dry_run("git clean -d --force") ==
          std::optional<std::string>("git clean -d -n"));
    CHECK(rewrite_git_clean_dry_run("git clean -d -f src") ==
          std::optional<std::string>("git clean -d -n src"));

    SECTION("long options and paths are left alone") {
        CHECK(rewrite_git_clean_dry_run("git clean -f --exclude=foo") ==
              std::optional<std::string>("git clean -n --exclude=foo"));
        CHECK(rewrite_git_clean_dry_run("git clean -f a-f") ==
              std::optional<std::string>("git clean -n a-f"));
    }

    SECTION("nothing to rewrite") {
        CHECK_FALSE(rewrite_git_clean_dry_run("git clean -n").has_value());
        CHECK_FALSE(rewrite_git_clean_dry_run("rm -f x").has_value());
    }
}

TEST_CASE("find_dry_run_argv accepts only a plain read-only find", "[guard][dry_run]") {
    using Argv = std::vector<std::string>;

    auto simple = find_dry_run_argv("find . -name '*.log'");
    REQUIRE(simple.has_value());
    CHECK(*simple == Argv{"find", ".", "-name", "*.log"});

    auto grouped = find_dry_run_argv(R"(find src \( -name a -o -name b \))");
    REQUIRE(grouped.has_value());
    CHECK(*grouped == Argv{"find", "src", "(", "-name", "a", "-o", "-name", "b", ")"});

    SECTION("chained commands, redirections and substitutions") {
        CHECK_FALSE(find_dry_run_argv("find .; touch x").has_value());
        CHECK_FALSE(find_dry_run_argv("find . && git reset --hard").has_value());
        CHECK_FALSE(find_dry_run_argv("find . | sh").has_value());
        CHECK_FALSE(find_dry_run_argv("find . > list.txt").has_value());
        CHECK_FALSE(find_dry_run_argv("find .\ntouch x").has_value());
        CHECK_FALSE(find_dry_run_argv("find $(cat dirs)").has_value());
    }

    SECTION("side-effecting actions") {
        CHECK_FALSE(find_dry_run_argv("find . -fprint out.txt").has_value());
        CHECK_FALSE(find_dry_run_argv("find . -fls out.txt").has_value());
        CHECK_FALSE(find_dry_run_argv("find . -ok mv {} /dev/null").has_value());
        CHECK_FALSE(find_dry_run_argv("find . -exec chmod 000 {} +").has_value());
    }

    SECTION("anything but find") {
        CHECK_FALSE(find_dry_run_argv("sudo find .").has_value());
        CHECK_FALSE(find_dry_run_argv("").has_value());
    }
}

TEST_CASE("git_clean_dry_run_argv requires a dry-run flag", "[guard][dry_run]") {
    using Argv = std::vector<std::string>;

    auto cluster = git_clean_dry_run_argv("git clean -ndx");
    REQUIRE(cluster.has_value());
    CHECK(*cluster == Argv{"git", "clean", "-ndx"});

    auto separate = git_clean_dry_run_argv("git clean -d -n src");
    REQUIRE(separate.has_value());
    CHECK(*separate == Argv{"git", "clean", "-d", "-n", "src"});

    CHECK_FALSE(git_clean_dry_run_argv("git clean -d").has_value());
    CHECK_FALSE(git_clean_dry_run_argv("git clean -n && git reset --hard").has_value());
    CHECK_FALSE(git_clean_dry_run_argv("git -c core.pager=x clean -n").has_value());
    CHECK_FALSE(git_clean_dry_run_argv("echo git clean -n").has_value());
}

TEST_CASE("discovery_status_to_string", "[guard][dry_run]") {
    CHECK(discovery_status_to_string(DiscoveryStatus::Found) == "found");
    CHECK(discovery_status_to_string(DiscoveryStatus::FoundNone) == "found_none");
    CHECK(discovery_status_to_string(DiscoveryStatus::CouldNotRun) == "could_not_run");
}

// ---------------------------------------------------------------------------
// Tri-state results
// ---------------------------------------------------------------------------

TEST_CASE("find output becomes resolved targets", "[guard][dry_run]") {
    ScriptedDiscoverer discoverer(ok(0, "./a.log\n\n  ./sub/b.log  \n/abs/c.log\n"));
    auto result = discoverer.discover("find . -name '*.log' -delete", "/repo");

    CHECK(discoverer.last_argv == std::vector<std::string>{"find", ".", "-name", "*.log"});
    REQUIRE(result.status == DiscoveryStatus::Found);
    CHECK(result.targets ==
          std::vector<fs::path>{"/repo/a.log", "/repo/sub/b.log", "/abs/c.log"});
}

TEST_CASE("git clean output is parsed from Would remove lines", "[guard][dry_run]") {
    ScriptedDiscoverer discoverer(
        ok(0, "Would remove build/\nWould remove notes.tmp\nWould skip repository sub\n"));
    auto result = discoverer.discover("git clean -fdx", "/repo");

    CHECK(discoverer.last_argv == std::vector<std::string>{"git", "clean", "-ndx"});
    REQUIRE(result.status == DiscoveryStatus::Found);
    CHECK(result.targets == std::vector<fs::path>{"/repo/build", "/repo/notes.tmp"});
}

TEST_CASE("Successful empty output is FoundNone", "[guard][dry_run]") {
    ScriptedDiscoverer discoverer(ok(0, ""));
    auto result = discoverer.discover("git clean -f", "/repo");
    CHECK(result.status == DiscoveryStatus::FoundNone);
    CHECK(result.targets.empty());
}

TEST_CASE("Failures are CouldNotRun", "[guard][dry_run]") {
    SECTION("failing exit with no output") {
        ScriptedDiscoverer discoverer(ok(128, ""));
        CHECK(discoverer.discover("git clean -f", "/repo").status ==
              DiscoveryStatus::CouldNotRun);
    }

    SECTION("failing exit with output still reports what was listed") {
        ScriptedDiscoverer discoverer(ok(1, "./a\n"));
        auto result = discoverer.discover("find . -delete", "/repo");
        CHECK(result.status == DiscoveryStatus::Found);
        CHECK(result.targets == std::vector<fs::path>{"/repo/a"});
    }

    SECTION("timeout") {
        ScriptedDiscoverer discoverer(std::unexpected(
            delguard::make_error(delguard::ErrorCode::Timeout, "Command timed out")));
        CHECK(discoverer.discover("find . -delete", "/repo").status ==
              DiscoveryStatus::CouldNotRun);
    }

    SECTION("not a find or git clean command") {
        ScriptedDiscoverer discoverer(ok(0, "x\n"));
        CHECK(discoverer.discover("rm -rf x", "/repo").status == DiscoveryStatus::CouldNotRun);
        CHECK(discoverer.calls == 0);
    }

    SECTION("a rewrite that still deletes is never executed") {
        ScriptedDiscoverer discoverer(ok(0, "x\n"));
        auto result = discoverer.discover("find . -delete && rm -rf /", "/repo");
        CHECK(result.status == DiscoveryStatus::CouldNotRun);
        CHECK(discoverer.calls == 0);
    }

    SECTION("chained commands are never executed") {
        ScriptedDiscoverer discoverer(ok(0, "x\n"));
        CHECK(discoverer.discover("find . -delete; touch x", "/repo").status ==
              DiscoveryStatus::CouldNotRun);
        CHECK(discoverer.discover("find . -name '*.o' -delete -fprint gone.txt", "/repo").status ==
              DiscoveryStatus::CouldNotRun);
        CHECK(discoverer.discover("git clean -f && touch x", "/repo").status ==
              DiscoveryStatus::CouldNotRun);
        CHECK(discoverer.discover("git clean -fd; : > keep.txt", "/repo").status ==
              DiscoveryStatus::CouldNotRun);
        CHECK(discoverer.calls == 0);
    }
}

TEST_CASE("Real find runs without deleting anything", "[guard][dry_run]") {
    auto dir = delguard::infra::resolve_path(fs::temp_directory_path()) / "delguard_dry_run_test";
    fs::remove_all(dir);
    fs::create_directories(dir / "sub");
    std::ofstream(dir / "a.log") << "a";
    std::ofstream(dir / "sub" / "b.log") << "b";
    std::ofstream(dir / "c.txt") << "c";

    DryRunDiscoverer discoverer(10s);

    SECTION("matches are listed") {
        auto result = discoverer.discover("find . -name '*.log' -delete", dir);
        REQUIRE(result.status == DiscoveryStatus::Found);
        CHECK(result.targets.size() == 2);
        CHECK(fs::exists(dir / "a.log"));
        CHECK(fs::exists(dir / "sub" / "b.log"));
    }

    SECTION("chained commands have no side effects") {
        std::ofstream(dir / "keep.txt") << "keep me";
        auto result = discoverer.discover(
            "find . -name '*.log' -delete; touch SIDE_EFFECT; : > keep.txt", dir);
        CHECK(result.status == DiscoveryStatus::CouldNotRun);
        CHECK_FALSE(fs::exists(dir / "SIDE_EFFECT"));
        CHECK(fs::file_size(dir / "keep.txt") == 7);
        CHECK(fs::exists(dir / "a.log"));
    }

    SECTION("zero matches is FoundNone") {
        auto result = discoverer.discover("find . -name '*.pdf' -delete", dir);
        CHECK(result.status == DiscoveryStatus::FoundNone);
        CHECK(result.targets.empty());
    }

    fs::remove_all(dir);
}
