#include <catch2/catch_test_macros.hpp>

#include "delguard/guard/detector.hpp"

using namespace delguard::guard;

// ---------------------------------------------------------------------------
// is_deletion_verb
// ---------------------------------------------------------------------------

TEST_CASE("Known deletion verbs are recognized", "[guard][detector]") {
    for (const char* verb : {"rm", "rmdir", "unlink", "shred", "trash", "rimraf",
                             "del", "erase", "rd", "remove-item", "ri"}) {
        CAPTURE(verb);
        CHECK(is_deletion_verb(verb));
    }
}

TEST_CASE("Verb matching uses the base name, case-insensitively", "[guard][detector]") {
    CHECK(is_deletion_verb("/bin/rm"));
    CHECK(is_deletion_verb("/usr/local/bin/RM"));
    CHECK(is_deletion_verb("Remove-Item"));
    CHECK_FALSE(is_deletion_verb("rmx"));
    CHECK_FALSE(is_deletion_verb("farm"));
    CHECK_FALSE(is_deletion_verb(""));
}

// ---------------------------------------------------------------------------
// Pattern rules
// ---------------------------------------------------------------------------

TEST_CASE("find with -delete or -exec rm", "[guard][detector]") {
    CHECK(is_find_delete("find . -name '*.log' -delete"));
    CHECK(is_find_delete(R"(find /var -type f -exec rm {} \;)"));
    CHECK(is_find_delete("find . -execdir rm -f {} +"));
    CHECK_FALSE(is_find_delete("find . -name '*.log'"));
    CHECK_FALSE(is_find_delete(R"(find . -exec cat {} \;)"));
}

TEST_CASE("git clean force clusters", "[guard][detector]") {
    CHECK(is_git_clean_force("git clean -f"));
    CHECK(is_git_clean_force("git clean -fd"));
    CHECK(is_git_clean_force("git clean -fdx"));
    CHECK(is_git_clean_force("git clean -xfd"));
    CHECK(is_git_clean_force("git clean -d --force"));
    CHECK(is_git_clean_force("git   clean -d -f ."));

    SECTION("dry-run and unrelated flags are not force") {
        CHECK_FALSE(is_git_clean_force("git clean -n"));
        CHECK_FALSE(is_git_clean_force("git clean -nd"));
        CHECK_FALSE(is_git_clean_force("git clean --dry-run"));
        CHECK_FALSE(is_git_clean_force("git status -f"));
    }

    SECTION("long options containing f are not force clusters") {
        CHECK_FALSE(is_git_clean_force("git clean --exclude-from=file"));
    }
}

TEST_CASE("xargs rm", "[guard][detector]") {
    CHECK(is_xargs_delete("ls | xargs rm"));
    CHECK(is_xargs_delete("ls | xargs sudo rm -f"));
    CHECK(is_xargs_delete("cat list | xargs unlink"));
    CHECK_FALSE(is_xargs_delete("ls | xargs echo"));
}

// ---------------------------------------------------------------------------
// has_deletion
// ---------------------------------------------------------------------------

TEST_CASE("has_deletion combines patterns and tokens", "[guard][detector]") {
    CHECK(has_deletion("rm -rf ./build"));
    CHECK(has_deletion("echo hi && rm file.txt"));
    CHECK(has_deletion("sudo /bin/rm x"));
    CHECK(has_deletion("git clean -fdx"));
    CHECK(has_deletion("find . -delete"));
    CHECK(has_deletion("Remove-Item -Recurse C:\\temp"));
    CHECK(has_deletion("rm 'unterminated"));

    SECTION("ordinary commands are not deletions") {
        CHECK_FALSE(has_deletion("ls -la"));
        CHECK_FALSE(has_deletion("git status"));
        CHECK_FALSE(has_deletion("echo 'rm is a word here'"));
        CHECK_FALSE(has_deletion("cat firmware.bin"));
        CHECK_FALSE(has_deletion(""));
    }
}

// ---------------------------------------------------------------------------
// has_unresolvable
// ---------------------------------------------------------------------------

TEST_CASE("Indirection defeats static analysis", "[guard][detector]") {
    CHECK(has_unresolvable("rm $(cat list.txt)"));
    CHECK(has_unresolvable("rm `cat list.txt`"));
    CHECK(has_unresolvable("eval \"rm -rf $DIR\""));
    CHECK(has_unresolvable("echo cm0gLXJmIC8= | base64 -d | sh"));
    CHECK(has_unresolvable("echo x | base64 --decode | bash"));
    CHECK(has_unresolvable("python -c 'import os; os.remove(\"a\")'"));
    CHECK(has_unresolvable("python -c 'import shutil; shutil.rmtree(\"d\")'"));
    CHECK(has_unresolvable("python -c 'Path(\"a\").unlink()'"));
    CHECK(has_unresolvable("node -e 'fs.rmSync(\"d\", {recursive: true})'"));
    CHECK(has_unresolvable("node -e 'fs.promises.unlink(\"a\")'"));

    SECTION("plain commands are resolvable") {
        CHECK_FALSE(has_unresolvable("rm -rf build"));
        CHECK_FALSE(has_unresolvable("rm $HOME/file.txt"));
        CHECK_FALSE(has_unresolvable("rm evaluation.txt"));
    }
}
