#include <doctest/doctest.h>
#include <clawrun/platform.hpp>

#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace clawrun;
using clawrun::testing::TempTestDir;
using clawrun::testing::write_plain;
using clawrun::testing::write_script;

TEST_CASE("expand_user") {
    CHECK(expand_user("~", "/home/me") == "/home/me");
    CHECK(expand_user("~/bin/claw", "/home/me") == "/home/me/bin/claw");
    CHECK(expand_user("~/bin/claw", "/home/me/") == "/home/me/bin/claw");
    CHECK(expand_user("~other/bin", "/home/me") == "~other/bin");
    CHECK(expand_user("/usr/bin/claw", "/home/me") == "/usr/bin/claw");
    CHECK(expand_user("bin/~", "/home/me") == "bin/~");
    CHECK(expand_user("~/x", "") == "~/x");
}

TEST_CASE("split_search_path drops empty entries") {
    CHECK(split_search_path("/usr/bin::/bin:") == std::vector<std::string>{"/usr/bin", "/bin"});
    CHECK(split_search_path("").empty());
}

TEST_CASE("join_path and path pieces") {
    CHECK(join_path("/a", "b") == "/a/b");
    CHECK(join_path("/a/", "b") == "/a/b");
    CHECK(join_path("", "b") == "b");
    CHECK(get_filename("/usr/bin/kitty") == "kitty");
    CHECK(get_filename("kitty") == "kitty");
    CHECK(get_parent_directory("/usr/bin/kitty") == "/usr/bin");
    CHECK(is_absolute_path("/usr"));
    CHECK_FALSE(is_absolute_path("usr"));
    CHECK_FALSE(is_absolute_path(""));
}

TEST_CASE("is_executable_file") {
    TempTestDir tmp;

    SUBCASE("executable script") {
        CHECK(is_executable_file(write_script(tmp.sub("run"), "exit 0\n")));
    }
    SUBCASE("plain file") {
        CHECK_FALSE(is_executable_file(write_plain(tmp.sub("data"))));
    }
    SUBCASE("directory") {
        CHECK_FALSE(is_executable_file(tmp.path));
    }
    SUBCASE("missing") {
        CHECK_FALSE(is_executable_file(tmp.sub("missing")));
        CHECK_FALSE(is_executable_file(""));
    }
}

TEST_CASE("find_in_directories returns the first executable hit") {
    TempTestDir tmp;
    write_plain(tmp.sub("a/kitty"));
    auto hit = write_script(tmp.sub("b/kitty"), "exit 0\n");
    write_script(tmp.sub("c/kitty"), "exit 0\n");

    auto found = find_in_directories({tmp.sub("a"), tmp.sub("b"), tmp.sub("c")}, "kitty");
    REQUIRE(found);
    CHECK(*found == hit);
    CHECK_FALSE(find_in_directories({tmp.sub("a")}, "kitty"));
    CHECK_FALSE(find_in_directories({tmp.sub("b")}, ""));
}

TEST_CASE("atomic_write_file creates parents and replaces content") {
    TempTestDir tmp;
    auto path = tmp.sub("deep/er/file.json");

    auto first = atomic_write_file(path, "one\n");
    REQUIRE(first.ok);
    auto second = atomic_write_file(path, "two\n");
    REQUIRE(second.ok);

    std::ifstream file(path);
    std::stringstream ss;
    ss << file.rdbuf();
    CHECK(ss.str() == "two\n");

    // No temp files left behind
    size_t entries = 0;
    for (const auto& e : std::filesystem::directory_iterator(tmp.sub("deep/er"))) {
        (void)e;
        ++entries;
    }
    CHECK(entries == 1);
}
