#include <catch2/catch_test_macros.hpp>
#include <gita/gita.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static fs::path make_temp_dir() {
    auto tmp = fs::temp_directory_path() /
               ("gita_cmds_" + std::to_string(
                    std::hash<std::thread::id>{}(std::this_thread::get_id())
                    ^ static_cast<size_t>(
                          std::chrono::steady_clock::now()
                              .time_since_epoch()
                              .count())));
    fs::create_directories(tmp);
    return tmp;
}

using words = std::vector<std::string>;

// ---------------------------------------------------------------------------
// Bundled table
// ---------------------------------------------------------------------------

TEST_CASE("default_commands: bundled aliases", "[commands]") {
    auto t = gita::default_commands();

    REQUIRE(t.count("fetch"));
    CHECK(t.at("fetch").allow_all);
    CHECK(t.at("fetch").cmd == words{"fetch"});
    CHECK_FALSE(t.at("fetch").disable_async);

    CHECK(t.at("st").cmd == words{"status"});
    CHECK(t.at("stat").cmd == words{"diff", "--stat"});
    CHECK(t.at("difftool").disable_async);
    CHECK(t.at("mergetool").disable_async);
    CHECK_FALSE(t.at("push").allow_all);
    CHECK_FALSE(t.at("log").help.empty());
}

// ---------------------------------------------------------------------------
// parse_commands
// ---------------------------------------------------------------------------

TEST_CASE("parse_commands: entries without cmd run their own name", "[commands]") {
    auto t = gita::parse_commands("gc:\nco:\n  help: checkout\n");
    CHECK(t.at("gc").cmd == words{"gc"});
    CHECK(t.at("co").cmd == words{"co"});
    CHECK(t.at("co").help == "checkout");
}

TEST_CASE("parse_commands: cmd may be a sequence", "[commands]") {
    auto t = gita::parse_commands(
        "lg:\n  cmd: [log, --oneline, -n, \"5\"]\n  allow_all: yes\n");
    CHECK(t.at("lg").cmd == words{"log", "--oneline", "-n", "5"});
    CHECK(t.at("lg").allow_all);
}

TEST_CASE("parse_commands: empty document is an empty table", "[commands]") {
    CHECK(gita::parse_commands("").empty());
    CHECK(gita::parse_commands("# nothing here\n").empty());
}

TEST_CASE("parse_commands: malformed input throws ConfigError", "[commands]") {
    CHECK_THROWS_AS(gita::parse_commands("- fetch\n- pull\n"), gita::ConfigError);
    CHECK_THROWS_AS(gita::parse_commands("x:\n  allow_all: maybe\n"),
                    gita::ConfigError);
    CHECK_THROWS_AS(gita::parse_commands("x: [unclosed\n"), gita::ConfigError);
    CHECK_THROWS_AS(gita::parse_commands("x:\n  cmd: \"\"\n"), gita::ConfigError);
    CHECK_THROWS_AS(gita::parse_commands("x: just a string\n"), gita::ConfigError);
}

// ---------------------------------------------------------------------------
// merge / load
// ---------------------------------------------------------------------------

TEST_CASE("merge_commands: user entries replace defaults whole", "[commands]") {
    auto user = gita::parse_commands("fetch:\n  help: mine\nco:\n  cmd: checkout\n");
    auto t = gita::merge_commands(gita::default_commands(), user);

    CHECK(t.at("fetch").help == "mine");
    CHECK_FALSE(t.at("fetch").allow_all);
    CHECK(t.at("co").cmd == words{"checkout"});
    CHECK(t.count("pull"));
}

TEST_CASE("load_command_file: missing file is an empty table", "[commands]") {
    auto dir = make_temp_dir();
    CHECK(gita::load_command_file(dir / "cmds.yml").empty());
    fs::remove_all(dir);
}

TEST_CASE("load_commands: reads the user file on top of defaults", "[commands]") {
    auto dir = make_temp_dir();
    auto file = dir / "cmds.yml";
    {
        std::ofstream out(file);
        out << "sync:\n  cmd: pull --rebase\n  allow_all: true\n";
    }

    auto t = gita::load_commands(file);
    CHECK(t.at("sync").cmd == words{"pull", "--rebase"});
    CHECK(t.at("sync").allow_all);
    CHECK(t.count("st"));

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// async_denylist / split_words
// ---------------------------------------------------------------------------

TEST_CASE("async_denylist: holds alias name and git verb", "[commands]") {
    auto t = gita::parse_commands(
        "dt:\n  cmd: difftool --dir-diff\n  disable_async: true\n"
        "st:\n  cmd: status\n");
    auto deny = gita::async_denylist(t);

    CHECK(deny.count("dt"));
    CHECK(deny.count("difftool"));
    CHECK_FALSE(deny.count("st"));
    CHECK_FALSE(deny.count("status"));

    auto defaults = gita::async_denylist(gita::default_commands());
    CHECK(defaults.count("mergetool"));
    CHECK_FALSE(defaults.count("fetch"));
}

TEST_CASE("split_words: splits on runs of whitespace", "[commands]") {
    CHECK(gita::split_words("  diff   --stat\t-w ") == words{"diff", "--stat", "-w"});
    CHECK(gita::split_words("").empty());
}
