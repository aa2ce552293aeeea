#include <catch2/catch_test_macros.hpp>
#include <gita/gita.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static fs::path make_temp_dir() {
    auto tmp = fs::temp_directory_path() /
               ("gita_registry_" + std::to_string(
                    std::hash<std::thread::id>{}(std::this_thread::get_id())
                    ^ static_cast<size_t>(
                          std::chrono::steady_clock::now()
                              .time_since_epoch()
                              .count())));
    fs::create_directories(tmp);
    return tmp;
}

/// Create `root/rel` with a `.git` directory inside.
static fs::path make_repo(const fs::path& root, const std::string& rel) {
    auto p = root / rel;
    fs::create_directories(p / ".git");
    return p;
}

static std::string slurp(const fs::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void spit(const fs::path& p, const std::string& text) {
    std::ofstream out(p);
    out << text;
}

static gita::Registry open_registry(const fs::path& dir,
                                    gita::RegistryOptions opts = {}) {
    return gita::Registry(gita::PathStore(dir / "gita" / "repo_path"), opts);
}

static void write_store(const fs::path& dir, const std::string& text) {
    fs::create_directories(dir / "gita");
    spit(dir / "gita" / "repo_path", text);
}

// ---------------------------------------------------------------------------
// is_repository
// ---------------------------------------------------------------------------

TEST_CASE("is_repository: requires a .git directory or file", "[registry]") {
    auto dir = make_temp_dir();
    auto repo = make_repo(dir, "r");
    fs::create_directories(dir / "worktree");
    spit(dir / "worktree" / ".git", "gitdir: /elsewhere\n");
    fs::create_directories(dir / "plain");

    CHECK(gita::is_repository(repo));
    CHECK(gita::is_repository(dir / "worktree"));
    CHECK_FALSE(gita::is_repository(dir / "plain"));
    CHECK_FALSE(gita::is_repository(dir / "missing"));

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// load
// ---------------------------------------------------------------------------

TEST_CASE("Registry: missing store loads as empty", "[registry]") {
    auto dir = make_temp_dir();
    auto reg = open_registry(dir);

    CHECK(reg.load().empty());
    CHECK(reg.warnings().empty());

    fs::remove_all(dir);
}

TEST_CASE("Registry: load keeps every valid entry in file order", "[registry]") {
    auto dir = make_temp_dir();
    auto a = make_repo(dir, "a");
    auto b = make_repo(dir, "b");
    auto c = make_repo(dir, "c");
    write_store(dir, a.string() + ",a\n" + b.string() + ",bee\n" +
                     c.string() + ",c\n");

    auto reg = open_registry(dir);
    auto& repos = reg.load();

    REQUIRE(repos.size() == 3);
    CHECK(repos.names() == std::vector<std::string>{"a", "bee", "c"});
    CHECK(repos.at("bee") == b);

    fs::remove_all(dir);
}

TEST_CASE("Registry: entries that are not repositories are dropped", "[registry]") {
    auto dir = make_temp_dir();
    auto a = make_repo(dir, "a");
    fs::create_directories(dir / "plain");
    write_store(dir, a.string() + ",a\n" + (dir / "plain").string() + ",plain\n" +
                     (dir / "missing").string() + ",missing\n");

    auto reg = open_registry(dir);
    CHECK(reg.load().names() == std::vector<std::string>{"a"});

    fs::remove_all(dir);
}

TEST_CASE("Registry: name collision is re-keyed with the parent directory", "[registry]") {
    auto dir = make_temp_dir();
    auto first  = make_repo(dir, "a/repo1");
    auto second = make_repo(dir, "b/repo1");
    write_store(dir, first.string() + ",repo1\n" + second.string() + ",repo1\n");

    auto reg = open_registry(dir);
    auto& repos = reg.load();

    REQUIRE(repos.size() == 2);
    CHECK(repos.at("repo1") == first);
    CHECK(repos.at("b/repo1") == second);

    fs::remove_all(dir);
}

TEST_CASE("Registry: second-level collision walks further up the path", "[registry]") {
    auto dir = make_temp_dir();
    auto p1 = make_repo(dir, "x/a/repo1");
    auto p2 = make_repo(dir, "x/b/repo1");
    auto p3 = make_repo(dir, "y/b/repo1");
    write_store(dir, p1.string() + ",repo1\n" + p2.string() + ",repo1\n" +
                     p3.string() + ",repo1\n");

    auto reg = open_registry(dir);
    auto& repos = reg.load();

    REQUIRE(repos.size() == 3);
    CHECK(repos.at("repo1") == p1);
    CHECK(repos.at("b/repo1") == p2);
    CHECK(repos.at("y/b/repo1") == p3);

    fs::remove_all(dir);
}

TEST_CASE("Registry: load is deterministic across fresh instances", "[registry]") {
    auto dir = make_temp_dir();
    auto p1 = make_repo(dir, "a/repo1");
    auto p2 = make_repo(dir, "b/repo1");
    write_store(dir, p1.string() + ",repo1\n" + p2.string() + ",repo1\n");

    auto r1 = open_registry(dir);
    auto r2 = open_registry(dir);
    CHECK(r1.load() == r2.load());

    fs::remove_all(dir);
}

TEST_CASE("Registry: load is memoized for the lifetime of the instance", "[registry]") {
    auto dir = make_temp_dir();
    auto a = make_repo(dir, "a");
    auto b = make_repo(dir, "b");
    write_store(dir, a.string() + ",a\n");

    auto reg = open_registry(dir);
    CHECK(reg.load().size() == 1);

    write_store(dir, a.string() + ",a\n" + b.string() + ",b\n");
    CHECK(reg.load().size() == 1);

    CHECK(open_registry(dir).load().size() == 2);

    fs::remove_all(dir);
}

TEST_CASE("Registry: malformed lines are skipped with a warning", "[registry]") {
    auto dir = make_temp_dir();
    auto a = make_repo(dir, "a");
    write_store(dir, "garbage\n" + a.string() + ",a\n");

    std::ostringstream log;
    gita::Logger::instance().set_stream(&log);
    auto reg = open_registry(dir);
    auto names = reg.load().names();
    gita::Logger::instance().set_stream(nullptr);

    CHECK(names == std::vector<std::string>{"a"});
    REQUIRE(reg.warnings().size() == 1);
    CHECK(reg.warnings()[0].find("line 1") != std::string::npos);
    CHECK(log.str().find("[WARN]") != std::string::npos);

    fs::remove_all(dir);
}

TEST_CASE("Registry: strict mode throws StoreCorruptError", "[registry]") {
    auto dir = make_temp_dir();
    auto a = make_repo(dir, "a");
    write_store(dir, a.string() + ",a\nno-comma-here\n");

    gita::RegistryOptions opts;
    opts.strict = true;
    auto reg = open_registry(dir, opts);

    try {
        reg.load();
        FAIL("expected StoreCorruptError");
    } catch (const gita::StoreCorruptError& e) {
        CHECK(e.line() == 2);
    }

    fs::remove_all(dir);
}

TEST_CASE("Registry: the same path listed twice is registered once", "[registry]") {
    auto dir = make_temp_dir();
    auto a = make_repo(dir, "a");
    write_store(dir, a.string() + ",a\n" + a.string() + ",other\n");

    std::ostringstream log;
    gita::Logger::instance().set_stream(&log);
    auto reg = open_registry(dir);
    auto names = reg.load().names();
    gita::Logger::instance().set_stream(nullptr);

    CHECK(names == std::vector<std::string>{"a"});
    CHECK(reg.warnings().size() == 1);

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// add
// ---------------------------------------------------------------------------

TEST_CASE("Registry: add then fresh load finds the repo by base name", "[registry][add]") {
    auto dir = make_temp_dir();
    auto p = make_repo(dir, "work/project");

    {
        auto reg = open_registry(dir);
        auto report = reg.add({p.string()});
        CHECK(report.count() == 1);
        CHECK(report.summary() == "Found 1 new repo(s).");
        CHECK(reg.load().at("project") == p);
    }

    auto reg = open_registry(dir);
    CHECK(reg.load().at("project") == p);

    fs::remove_all(dir);
}

TEST_CASE("Registry: adding the same path twice registers it once", "[registry][add]") {
    auto dir = make_temp_dir();
    auto p = make_repo(dir, "project");

    CHECK(open_registry(dir).add({p.string()}).count() == 1);

    auto again = open_registry(dir).add({p.string(), p.string() + "/"});
    CHECK(again.count() == 0);
    CHECK(again.summary() == "No new repos found!");

    CHECK(slurp(dir / "gita" / "repo_path") == p.string() + ",project\n");

    fs::remove_all(dir);
}

TEST_CASE("Registry: add resolves relative paths and trailing separators", "[registry][add]") {
    auto dir = make_temp_dir();
    auto p = make_repo(dir, "project");

    auto old_cwd = fs::current_path();
    fs::current_path(dir);
    auto report = open_registry(dir).add({"project/"});
    fs::current_path(old_cwd);

    REQUIRE(report.count() == 1);
    CHECK(report.added[0].name == "project");
    CHECK(fs::canonical(report.added[0].path) == fs::canonical(p));

    fs::remove_all(dir);
}

TEST_CASE("Registry: add ignores directories that are not repositories", "[registry][add]") {
    auto dir = make_temp_dir();
    fs::create_directories(dir / "plain");

    auto reg = open_registry(dir);
    auto report = reg.add({(dir / "plain").string(), (dir / "missing").string()});

    CHECK(report.count() == 0);
    CHECK(report.skipped.size() == 2);
    CHECK_FALSE(fs::exists(dir / "gita" / "repo_path"));

    fs::remove_all(dir);
}

TEST_CASE("Registry: add rejects paths containing a comma", "[registry][add]") {
    auto dir = make_temp_dir();
    auto p = make_repo(dir, "a,b");

    auto reg = open_registry(dir);
    CHECK_THROWS_AS(reg.add({p.string()}), gita::InvalidNameError);
    CHECK_FALSE(fs::exists(dir / "gita" / "repo_path"));

    fs::remove_all(dir);
}

TEST_CASE("Registry: add of a colliding name is re-keyed in the snapshot", "[registry][add]") {
    auto dir = make_temp_dir();
    auto p1 = make_repo(dir, "a/repo1");
    auto p2 = make_repo(dir, "b/repo1");

    auto reg = open_registry(dir);
    CHECK(reg.add({p1.string(), p2.string()}).count() == 2);
    CHECK(reg.load().at("repo1") == p1);
    CHECK(reg.load().at("b/repo1") == p2);

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// rename
// ---------------------------------------------------------------------------

TEST_CASE("Registry: rename rewrites the store with the new name", "[registry][rename]") {
    auto dir = make_temp_dir();
    auto x = make_repo(dir, "x");
    write_store(dir, x.string() + ",old\n");

    auto reg = open_registry(dir);
    reg.rename("old", "new");

    CHECK(slurp(dir / "gita" / "repo_path") == x.string() + ",new\n");
    CHECK(reg.load().contains("new"));
    CHECK_FALSE(reg.load().contains("old"));

    fs::remove_all(dir);
}

TEST_CASE("Registry: rename keeps entries that are not repositories on disk", "[registry][rename]") {
    auto dir = make_temp_dir();
    auto x = make_repo(dir, "x");
    auto gone = (dir / "gone").string();
    write_store(dir, x.string() + ",old\n" + gone + ",gone\n");

    auto reg = open_registry(dir);
    reg.rename("old", "new");

    CHECK(slurp(dir / "gita" / "repo_path") ==
          x.string() + ",new\n" + gone + ",gone\n");

    fs::remove_all(dir);
}

TEST_CASE("Registry: rename errors", "[registry][rename]") {
    auto dir = make_temp_dir();
    auto x = make_repo(dir, "x");
    auto y = make_repo(dir, "y");
    write_store(dir, x.string() + ",x\n" + y.string() + ",y\n");
    auto before = slurp(dir / "gita" / "repo_path");

    auto reg = open_registry(dir);
    CHECK_THROWS_AS(reg.rename("nope", "z"), gita::KeyNotFoundError);
    CHECK_THROWS_AS(reg.rename("x", "y"), gita::KeyExistsError);
    CHECK_THROWS_AS(reg.rename("x", "a,b"), gita::InvalidNameError);
    CHECK(slurp(dir / "gita" / "repo_path") == before);

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// remove
// ---------------------------------------------------------------------------

TEST_CASE("Registry: remove drops names and rewrites the store", "[registry][remove]") {
    auto dir = make_temp_dir();
    auto a = make_repo(dir, "a");
    auto b = make_repo(dir, "b");
    auto c = make_repo(dir, "c");
    write_store(dir, a.string() + ",a\n" + b.string() + ",b\n" + c.string() + ",c\n");

    auto reg = open_registry(dir);
    CHECK(reg.remove({"a", "c"}) == 2);

    CHECK(slurp(dir / "gita" / "repo_path") == b.string() + ",b\n");
    CHECK(reg.load().names() == std::vector<std::string>{"b"});

    fs::remove_all(dir);
}

TEST_CASE("Registry: remove keeps lines left out of the active view", "[registry][remove]") {
    auto dir = make_temp_dir();
    auto keep = make_repo(dir, "keep");
    auto r    = make_repo(dir, "w/q/r");

    // Every key r could take is held by another repository listed first.
    std::string text;
    std::string key = "r";
    int i = 0;
    for (auto p = r.parent_path();; p = p.parent_path()) {
        auto holder = make_repo(dir, "holder" + std::to_string(i++));
        text += holder.string() + "," + key + "\n";
        if (!p.has_filename()) break;
        key = p.filename().string() + "/" + key;
    }
    std::string unplaced  = r.string() + ",r";
    std::string malformed = "/some/path/with,comma,name";
    std::string duplicate = keep.string() + ",keep_again";
    text += keep.string() + ",keep\n" + unplaced + "\n" + malformed + "\n" +
            duplicate + "\n";
    write_store(dir, text);

    std::ostringstream log;
    gita::Logger::instance().set_stream(&log);
    auto reg = open_registry(dir);
    CHECK(reg.load().find_path(r) == nullptr);
    CHECK(reg.remove({"r"}) == 1);
    gita::Logger::instance().set_stream(nullptr);

    auto after = slurp(dir / "gita" / "repo_path");
    CHECK(after.find(unplaced + "\n") != std::string::npos);
    CHECK(after.find(malformed + "\n") != std::string::npos);
    CHECK(after.find(keep.string() + ",keep\n") != std::string::npos);
    CHECK(after.find(duplicate + "\n") != std::string::npos);

    // a fresh load now finds a free name for r
    auto fresh = open_registry(dir);
    gita::Logger::instance().set_stream(&log);
    CHECK(fresh.load().find_path(r) != nullptr);
    gita::Logger::instance().set_stream(nullptr);

    fs::remove_all(dir);
}

TEST_CASE("Registry: removing a path drops its duplicate lines too", "[registry][remove]") {
    auto dir = make_temp_dir();
    auto a = make_repo(dir, "a");
    auto b = make_repo(dir, "b");
    write_store(dir, a.string() + ",a\n" + b.string() + ",b\n" + a.string() + ",a2\n");

    std::ostringstream log;
    gita::Logger::instance().set_stream(&log);
    auto reg = open_registry(dir);
    CHECK(reg.remove({"a"}) == 1);
    gita::Logger::instance().set_stream(nullptr);

    CHECK(slurp(dir / "gita" / "repo_path") == b.string() + ",b\n");

    fs::remove_all(dir);
}

TEST_CASE("Registry: remove of an unknown name writes nothing", "[registry][remove]") {
    auto dir = make_temp_dir();
    auto a = make_repo(dir, "a");
    write_store(dir, a.string() + ",a\n");

    auto reg = open_registry(dir);
    CHECK_THROWS_AS(reg.remove({"a", "zzz"}), gita::KeyNotFoundError);
    CHECK(slurp(dir / "gita" / "repo_path") == a.string() + ",a\n");

    fs::remove_all(dir);
}

TEST_CASE("Registry: remove without a store file is a no-op", "[registry][remove]") {
    auto dir = make_temp_dir();

    auto reg = open_registry(dir);
    CHECK(reg.remove({"anything"}) == 0);
    CHECK_FALSE(fs::exists(dir / "gita" / "repo_path"));

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// unique_key
// ---------------------------------------------------------------------------

TEST_CASE("unique_key: gives up when every ancestor is taken", "[registry]") {
    gita::RepoMap repos{{"r", "/x/r"}, {"a/r", "/y/a/r"}};
    CHECK(gita::unique_key(repos, "/q/r", "r") == std::optional<std::string>("q/r"));
    CHECK(gita::unique_key(repos, "/a/r", "r") == std::nullopt);
    CHECK(gita::unique_key(repos, "/z", "free") == std::optional<std::string>("free"));
}
