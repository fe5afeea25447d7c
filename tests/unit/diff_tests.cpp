#include <doctest/doctest.h>
#include <ocx/diff.hpp>
#include <ocx/digest.hpp>

#include "../test_helpers.hpp"

#include <algorithm>

using namespace ocx;
using ocx_test::TempDir;
using ocx_test::write_text;

namespace {

// Write files and record them the way the installer does
LockEntry record_files(TempDir& dir, IntegrityStore& store, const std::string& id,
                       const std::string& root,
                       const std::vector<std::pair<std::string, std::string>>& files) {
    std::vector<std::string> paths;
    for (const auto& [path, content] : files) {
        write_text(dir.file(path), content);
        paths.push_back(path);
    }
    std::sort(paths.begin(), paths.end());

    auto hashed = compute_content_hash(dir.path(), paths);
    REQUIRE(hashed.ok);

    LockEntry entry;
    entry.component_id = id;
    entry.registry = id.substr(0, id.find('/'));
    entry.version = "1.0.0";
    entry.type = root.empty() ? ComponentType::Agent : ComponentType::Skill;
    entry.content_hash = hashed.content_hash;
    entry.installed_files = paths;
    entry.file_hashes = hashed.file_hashes;
    entry.root = root;
    entry.installed_at = get_current_timestamp();
    entry.updated_at = entry.installed_at;
    REQUIRE(store.record(entry).isOk());
    return entry;
}

struct DiffFixture {
    TempDir dir{"ocx_diff_test"};
    IntegrityStore store = IntegrityStore::open(dir.file("ocx.lock")).value();

    DiffFixture() {
        record_files(dir, store, "kdco/researcher", ".opencode/skill/researcher",
                     {{".opencode/skill/researcher/SKILL.md", "# Researcher\n"},
                      {".opencode/skill/researcher/ref/notes.md", "notes\n"}});
        record_files(dir, store, "kdco/reviewer", "",
                     {{".opencode/agent/reviewer.md", "review\n"}});
    }
};

} // namespace

TEST_CASE("a freshly installed project has no drift") {
    DiffFixture f;
    DiffEngine engine(f.store, f.dir.path());

    auto drift = engine.diff();
    REQUIRE(drift.isOk());
    CHECK(drift.value().empty());
}

TEST_CASE("a one-byte change is reported as Modified") {
    DiffFixture f;
    write_text(f.dir.file(".opencode/skill/researcher/SKILL.md"), "# Researcher!\n");

    auto drift = DiffEngine(f.store, f.dir.path()).diff();
    REQUIRE(drift.isOk());
    REQUIRE(drift.value().size() == 1);

    const Drift& d = drift.value()[0];
    CHECK(d.component_id == "kdco/researcher");
    CHECK(d.path == ".opencode/skill/researcher/SKILL.md");
    CHECK(d.kind == DriftKind::Modified);
    CHECK(d.expected_hash != d.actual_hash);
    CHECK(d.actual_hash.rfind("sha256:", 0) == 0);
}

TEST_CASE("a deleted file is reported as Missing") {
    DiffFixture f;
    ocx::remove_file(f.dir.file(".opencode/agent/reviewer.md"));

    auto drift = DiffEngine(f.store, f.dir.path()).diff();
    REQUIRE(drift.isOk());
    REQUIRE(drift.value().size() == 1);
    CHECK(drift.value()[0].kind == DriftKind::Missing);
    CHECK(drift.value()[0].component_id == "kdco/reviewer");
    CHECK(drift.value()[0].actual_hash.empty());
}

TEST_CASE("an untracked file in an owned directory is reported as Added") {
    DiffFixture f;
    write_text(f.dir.file(".opencode/skill/researcher/scratch.md"), "mine\n");
    // Outside any owned directory: not drift
    write_text(f.dir.file(".opencode/agent/local.md"), "local\n");

    auto drift = DiffEngine(f.store, f.dir.path()).diff();
    REQUIRE(drift.isOk());
    REQUIRE(drift.value().size() == 1);
    CHECK(drift.value()[0].kind == DriftKind::Added);
    CHECK(drift.value()[0].path == ".opencode/skill/researcher/scratch.md");
    CHECK(drift.value()[0].expected_hash.empty());
}

TEST_CASE("diff of one component ignores the others") {
    DiffFixture f;
    ocx::remove_file(f.dir.file(".opencode/agent/reviewer.md"));

    auto drift = DiffEngine(f.store, f.dir.path()).diff(std::string("kdco/researcher"));
    REQUIRE(drift.isOk());
    CHECK(drift.value().empty());

    auto unknown = DiffEngine(f.store, f.dir.path()).diff(std::string("kdco/nope"));
    REQUIRE(unknown.isErr());
    CHECK(unknown.error().code() == ErrorCode::FILE_NOT_FOUND);
}

TEST_CASE("drift is ordered by component then path") {
    DiffFixture f;
    ocx::remove_file(f.dir.file(".opencode/agent/reviewer.md"));
    ocx::remove_file(f.dir.file(".opencode/skill/researcher/ref/notes.md"));
    write_text(f.dir.file(".opencode/skill/researcher/SKILL.md"), "changed\n");

    auto drift = DiffEngine(f.store, f.dir.path()).diff();
    REQUIRE(drift.isOk());
    REQUIRE(drift.value().size() == 3);
    CHECK(drift.value()[0].path == ".opencode/skill/researcher/SKILL.md");
    CHECK(drift.value()[1].path == ".opencode/skill/researcher/ref/notes.md");
    CHECK(drift.value()[2].component_id == "kdco/reviewer");
}

TEST_CASE("entry_intact ignores added files but not modified ones") {
    DiffFixture f;
    auto entry = f.store.get("kdco/researcher");
    REQUIRE(entry);

    write_text(f.dir.file(".opencode/skill/researcher/scratch.md"), "mine\n");
    CHECK(entry_intact(*entry, f.dir.path()));

    write_text(f.dir.file(".opencode/skill/researcher/ref/notes.md"), "other\n");
    CHECK_FALSE(entry_intact(*entry, f.dir.path()));
}
