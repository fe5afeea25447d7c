// End-to-end project workflows against an in-memory registry

#include <doctest/doctest.h>
#include <ocx/overlay.hpp>
#include <ocx/project.hpp>

#include "../test_helpers.hpp"

using namespace ocx;
using ocx_test::FakeRegistry;
using ocx_test::FakeTransport;
using ocx_test::TempDir;
using ocx_test::read_text;
using ocx_test::write_text;

namespace {

struct ProjectFixture {
    TempDir dir{"ocx_project_test"};
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    FakeRegistry kdco{transport, "https://kdco.example.com"};

    ProjectFixture() {
        kdco.component("researcher", "skill",
                       R"({"1.0.0": {"files": ["SKILL.md"]},
                           "1.1.0": {"files": ["SKILL.md", "ref/notes.md"]},
                           "2.0.0": {"files": ["SKILL.md"]}})",
                       "Digs through documentation");
        kdco.file("researcher", "SKILL.md", "# Researcher\n");
        kdco.file("researcher", "ref/notes.md", "notes\n");

        kdco.component("mcp-search", "plugin",
                       R"({"1.0.0": {"files": ["search.ts"],
                                     "config": {"mcp": {"search": {"enabled": true}}}}})",
                       "Search server");
        kdco.file("mcp-search", "search.ts", "export {}\n");
    }

    ProjectConfig seed() const {
        ProjectConfig config;
        Registry registry;
        registry.name = "kdco";
        registry.base_url = kdco.url();
        config.registries.push_back(registry);
        config.base_config = {{"$schema", "https://opencode.ai/config.json"}};
        return config;
    }

    Project init() {
        auto project = Project::init(ProjectPaths::for_project(dir.path()), transport, seed());
        REQUIRE(project.isOk());
        return std::move(project.value());
    }
};

} // namespace

TEST_CASE("init writes ocx.json once and reopens it afterwards") {
    ProjectFixture f;
    auto project = f.init();
    CHECK(ocx::is_regular_file(f.dir.file("ocx.json")));
    CHECK(project.config().registries.size() == 1);

    ProjectConfig other;
    auto again = Project::init(ProjectPaths::for_project(f.dir.path()), f.transport, other);
    REQUIRE(again.isOk());
    CHECK(again.value().config().registries.size() == 1);

    auto missing = Project::open(ProjectPaths::for_project(f.dir.file("nowhere")), f.transport);
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::CONFIG_INVALID);
}

TEST_CASE("add installs components, locks them and merges their config") {
    ProjectFixture f;
    auto project = f.init();

    auto summary = project.add({"researcher@1.0.0", "kdco/mcp-search"});
    REQUIRE(summary.isOk());
    CHECK(summary.value().entries.size() == 2);

    CHECK(read_text(f.dir.file(".opencode/skill/researcher/SKILL.md")) == "# Researcher\n");
    CHECK(read_text(f.dir.file(".opencode/plugin/search.ts")) == "export {}\n");

    auto installed = project.installed();
    REQUIRE(installed.isOk());
    REQUIRE(installed.value().size() == 2);
    CHECK(installed.value()[0].component_id == "kdco/mcp-search");
    CHECK(installed.value()[1].version == "1.0.0");

    auto aggregate = nlohmann::json::parse(read_text(f.dir.file("opencode.json")));
    CHECK(aggregate["$schema"] == "https://opencode.ai/config.json");
    CHECK(aggregate["mcp"]["search"]["enabled"] == true);
}

TEST_CASE("add rejects malformed requests before touching the network") {
    ProjectFixture f;
    auto project = f.init();
    f.transport->reset_counts();

    auto bad_name = project.add({"../evil"});
    REQUIRE(bad_name.isErr());
    CHECK(bad_name.error().code() == ErrorCode::INVALID_ARGUMENT);

    auto bad_range = project.add({"researcher@>>1"});
    REQUIRE(bad_range.isErr());
    CHECK(bad_range.error().code() == ErrorCode::INVALID_ARGUMENT);

    CHECK(project.add({}).isErr());
    CHECK(f.transport->requests().empty());
}

TEST_CASE("a concurrent operation is refused") {
    ProjectFixture f;
    auto project = f.init();

    auto held = FileLock::try_acquire(project.paths().operation_lock);
    REQUIRE(held.isOk());

    auto blocked = project.add({"researcher"});
    REQUIRE(blocked.isErr());
    CHECK(blocked.error().code() == ErrorCode::CONCURRENT_OPERATION);
    CHECK_FALSE(ocx::path_exists(f.dir.file(".opencode")));

    // Reading stays possible
    CHECK(project.diff().isOk());

    held.value().reset();
    CHECK(project.add({"researcher"}).isOk());
}

TEST_CASE("update moves components to the highest allowed release") {
    ProjectFixture f;
    auto project = f.init();
    REQUIRE(project.add({"researcher@1.0.0"}).isOk());

    auto minor = project.update({}, "^1.0.0");
    REQUIRE(minor.isOk());
    auto entries = project.installed().value();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].version == "1.1.0");
    CHECK(ocx::is_regular_file(f.dir.file(".opencode/skill/researcher/ref/notes.md")));

    auto major = project.update({"researcher"});
    REQUIRE(major.isOk());
    entries = project.installed().value();
    CHECK(entries[0].version == "2.0.0");
    CHECK_FALSE(ocx::path_exists(f.dir.file(".opencode/skill/researcher/ref/notes.md")));

    auto unknown = project.update({"nope"});
    REQUIRE(unknown.isErr());
    CHECK(unknown.error().code() == ErrorCode::FILE_NOT_FOUND);
}

TEST_CASE("diff finds drift and fix restores the locked files") {
    ProjectFixture f;
    auto project = f.init();
    REQUIRE(project.add({"researcher@1.1.0", "mcp-search"}).isOk());

    auto clean = project.diff();
    REQUIRE(clean.isOk());
    CHECK(clean.value().empty());

    write_text(f.dir.file(".opencode/skill/researcher/SKILL.md"), "# Edited\n");
    ocx::remove_file(f.dir.file(".opencode/skill/researcher/ref/notes.md"));
    write_text(f.dir.file(".opencode/skill/researcher/mine.md"), "mine\n");

    auto drift = project.diff();
    REQUIRE(drift.isOk());
    REQUIRE(drift.value().size() == 3);
    CHECK(drift.value()[0].kind == DriftKind::Modified);
    CHECK(drift.value()[1].kind == DriftKind::Added);
    CHECK(drift.value()[2].kind == DriftKind::Missing);

    auto fixed = project.fix();
    REQUIRE(fixed.isOk());
    CHECK(fixed.value().drift.size() == 3);
    CHECK(fixed.value().reinstalled == std::vector<std::string>{"kdco/researcher"});

    CHECK(read_text(f.dir.file(".opencode/skill/researcher/SKILL.md")) == "# Researcher\n");
    CHECK(read_text(f.dir.file(".opencode/skill/researcher/ref/notes.md")) == "notes\n");
    // Added files are reported, never deleted
    CHECK(ocx::is_regular_file(f.dir.file(".opencode/skill/researcher/mine.md")));

    auto after = project.diff();
    REQUIRE(after.isOk());
    REQUIRE(after.value().size() == 1);
    CHECK(after.value()[0].kind == DriftKind::Added);
    CHECK(project.installed().value()[1].version == "1.1.0");
}

TEST_CASE("search matches registry indexes and installed components") {
    ProjectFixture f;
    auto project = f.init();
    REQUIRE(project.add({"researcher@1.0.0"}).isOk());

    auto hits = project.search("DOCUMENTATION");
    REQUIRE(hits.isOk());
    REQUIRE(hits.value().size() == 1);
    CHECK(hits.value()[0].registry == "kdco");
    CHECK(hits.value()[0].summary.name == "researcher");
    REQUIRE(hits.value()[0].installed_version);
    CHECK(*hits.value()[0].installed_version == "1.0.0");

    auto all = project.search("");
    REQUIRE(all.isOk());
    CHECK(all.value().size() == 2);

    auto local = project.search("mcp", true);
    REQUIRE(local.isOk());
    CHECK(local.value().empty());
}

TEST_CASE("registry edits persist unless registries are locked") {
    ProjectFixture f;
    auto project = f.init();

    Registry extra;
    extra.name = "extra";
    extra.base_url = "https://extra.example.com";
    REQUIRE(project.add_registry(extra).isOk());

    auto reopened = Project::open(project.paths(), f.transport);
    REQUIRE(reopened.isOk());
    REQUIRE(reopened.value().config().registries.size() == 2);
    CHECK(reopened.value().config().registries[1].name == "extra");

    CHECK(project.add_registry(extra).isErr());
    REQUIRE(project.remove_registry("extra").isOk());
    CHECK(project.config().registries.size() == 1);

    TempDir locked_dir("ocx_project_locked");
    ProjectConfig locked = f.seed();
    locked.lock_registries = true;
    auto locked_project =
        Project::init(ProjectPaths::for_project(locked_dir.path()), f.transport, locked);
    REQUIRE(locked_project.isOk());
    CHECK(locked_project.value().add_registry(extra).isErr());
    CHECK(locked_project.value().remove_registry("kdco").isErr());
    CHECK(locked_project.value().config().registries.size() == 1);
}

TEST_CASE("components never claim ocx's own files") {
    ProjectFixture f;
    f.kdco.component("sneaky", "agent",
                     R"({"1.0.0": {"files": [{"source": "x.json", "target": "ocx.json"}]}})");
    f.kdco.file("sneaky", "x.json", "{}");
    auto project = f.init();

    auto result = project.add({"sneaky"});
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::PATH_CONFLICT);
    CHECK(project.config().registries.size() == 1);
    CHECK(Project::open(project.paths(), f.transport).isOk());
}

TEST_CASE("a ghost profile installs into its own tree and shows up in the overlay") {
    ProjectFixture f;
    TempDir home("ocx_ghost_home");
    TempDir repo("ocx_ghost_repo");
    write_text(repo.file("src/main.c"), "int main() {}\n");

    ProfileStore profiles(home.path());
    auto profile = profiles.create("work");
    REQUIRE(profile.isOk());

    auto ghost = Project::open(ProjectPaths::for_profile(profile.value()), f.transport);
    REQUIRE(ghost.isOk());
    Registry registry;
    registry.name = "kdco";
    registry.base_url = f.kdco.url();
    REQUIRE(ghost.value().add_registry(registry).isOk());
    REQUIRE(ghost.value().add({"researcher"}).isOk());

    CHECK(ocx::is_regular_file(home.file("profiles/work/.opencode/skill/researcher/SKILL.md")));
    CHECK(ocx::is_regular_file(home.file("profiles/work/ocx.lock")));
    CHECK_FALSE(ocx::path_exists(repo.file(".opencode")));

    auto reloaded = profiles.load("work");
    REQUIRE(reloaded.isOk());
    OverlayManager manager(home.path());
    auto session = manager.begin(reloaded.value(), repo.path());
    REQUIRE(session.isOk());

    const auto& entries = session.value()->mapping().entries;
    CHECK(entries.count(".opencode/skill/researcher/SKILL.md"));
    CHECK(entries.count("src/main.c"));
    CHECK(read_text(session.value()->overlay_root() + "/.opencode/skill/researcher/SKILL.md") ==
          "# Researcher\n");

    REQUIRE(manager.end(*session.value()).isOk());
    CHECK_FALSE(ocx::path_exists(repo.file(".opencode")));
}
