#include <doctest/doctest.h>
#include <ocx/installer.hpp>

#include "../test_helpers.hpp"

using namespace ocx;
using ocx_test::FakeRegistry;
using ocx_test::FakeTransport;
using ocx_test::TempDir;
using ocx_test::read_text;
using ocx_test::write_text;

namespace {

struct InstallFixture {
    TempDir dir{"ocx_install_test"};
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    FakeRegistry kdco{transport, "https://kdco.example.com"};

    std::vector<Registry> registries() const {
        Registry registry;
        registry.name = "kdco";
        registry.base_url = kdco.url();
        return {registry};
    }

    InstallerLayout layout() const {
        InstallerLayout layout;
        layout.project_root = dir.path();
        layout.component_path = ".opencode";
        layout.reserved = {"ocx.json", "ocx.lock", ".ocx", "opencode.json"};
        return layout;
    }

    // Resolve and install the way a project does, with fresh state each time
    Result<InstallSummary> install(const std::vector<std::string>& texts,
                                   const InstallOptions& options = {}) {
        auto store = IntegrityStore::open(dir.file("ocx.lock"));
        if (store.isErr()) return Result<InstallSummary>::err(store.error());
        return install_with(store.value(), texts, options);
    }

    Result<InstallSummary> install_with(IntegrityStore& store,
                                        const std::vector<std::string>& texts,
                                        const InstallOptions& options = {}) {
        auto aggregate = AggregateConfig::open(dir.file(".ocx/fragments.json"),
                                               dir.file("opencode.json"),
                                               nlohmann::ordered_json::object());
        if (aggregate.isErr()) return Result<InstallSummary>::err(aggregate.error());

        std::vector<ComponentRequest> requests;
        for (const auto& text : texts) requests.push_back(*parse_component_request(text));

        RegistryClient client(transport);
        Resolver resolver(client, registries());
        auto plan = resolver.resolve(requests);
        if (plan.isErr()) return Result<InstallSummary>::err(plan.error());

        Installer installer(client, store, aggregate.value(), layout());
        return installer.install(plan.value(), options);
    }

    std::optional<LockEntry> entry(const std::string& id) {
        auto store = IntegrityStore::open(dir.file("ocx.lock"));
        if (store.isErr()) return std::nullopt;
        return store.value().get(id);
    }
};

} // namespace

// ============================================================================
// Placement
// ============================================================================

TEST_CASE("place_file puts files under the type directory") {
    InstallerLayout layout;
    layout.project_root = "/project";
    layout.component_path = ".opencode";

    ComponentManifest skill;
    skill.name = "researcher";
    skill.type = ComponentType::Skill;
    CHECK(place_file(skill, FileSpec{"SKILL.md", ""}, layout).value() ==
          ".opencode/skill/researcher/SKILL.md");
    CHECK(owned_root(skill, ".opencode") == ".opencode/skill/researcher");

    ComponentManifest agent;
    agent.name = "reviewer";
    agent.type = ComponentType::Agent;
    CHECK(place_file(agent, FileSpec{"reviewer.md", ""}, layout).value() ==
          ".opencode/agent/reviewer.md");
    CHECK(place_file(agent, FileSpec{"reviewer.md", "docs/reviewer.md"}, layout).value() ==
          "docs/reviewer.md");
    CHECK(owned_root(agent, ".opencode").empty());
}

TEST_CASE("place_file rejects unsafe and reserved targets") {
    InstallerLayout layout;
    layout.project_root = "/project";
    layout.reserved = {"ocx.lock", ".ocx"};

    ComponentManifest agent;
    agent.name = "reviewer";
    agent.type = ComponentType::Agent;

    auto escape = place_file(agent, FileSpec{"x.md", "../outside.md"}, layout);
    REQUIRE(escape.isErr());
    CHECK(escape.error().code() == ErrorCode::INVALID_ARGUMENT);

    CHECK(place_file(agent, FileSpec{"../x.md", ""}, layout).isErr());
    CHECK(place_file(agent, FileSpec{"/etc/passwd", ""}, layout).isErr());

    auto reserved = place_file(agent, FileSpec{"x.md", ".ocx/state.json"}, layout);
    REQUIRE(reserved.isErr());
    CHECK(reserved.error().code() == ErrorCode::PATH_CONFLICT);

    ComponentManifest bundle;
    bundle.name = "kit";
    bundle.type = ComponentType::Bundle;
    CHECK(place_file(bundle, FileSpec{"x.md", ""}, layout).isErr());
}

// ============================================================================
// Installation
// ============================================================================

TEST_CASE("install writes files and records hashes") {
    InstallFixture f;
    f.kdco.component("researcher", "skill",
                     R"({"1.0.0": {"files": ["SKILL.md", "ref/notes.md"]}})");
    f.kdco.file("researcher", "SKILL.md", "# Researcher\n");
    f.kdco.file("researcher", "ref/notes.md", "notes\n");

    auto summary = f.install({"researcher"});
    REQUIRE(summary.isOk());
    REQUIRE(summary.value().entries.size() == 1);

    CHECK(read_text(f.dir.file(".opencode/skill/researcher/SKILL.md")) == "# Researcher\n");
    CHECK(read_text(f.dir.file(".opencode/skill/researcher/ref/notes.md")) == "notes\n");

    auto entry = f.entry("kdco/researcher");
    REQUIRE(entry);
    CHECK(entry->version == "1.0.0");
    CHECK(entry->root == ".opencode/skill/researcher");
    CHECK(entry->installed_files ==
          std::vector<std::string>{".opencode/skill/researcher/SKILL.md",
                                   ".opencode/skill/researcher/ref/notes.md"});
    CHECK(entry->file_hashes.size() == 2);
    CHECK(entry->content_hash.rfind("sha256:", 0) == 0);
    CHECK_FALSE(entry->installed_at.empty());
}

TEST_CASE("a bundle installs its dependencies and owns no files") {
    InstallFixture f;
    f.kdco.component("kit", "bundle", R"({"1.0.0": {"dependencies": ["reviewer"]}})");
    f.kdco.component("reviewer", "agent", R"({"1.0.0": {"files": ["reviewer.md"]}})");
    f.kdco.file("reviewer", "reviewer.md", "review\n");

    auto summary = f.install({"kit"});
    REQUIRE(summary.isOk());
    REQUIRE(summary.value().entries.size() == 2);
    CHECK(summary.value().entries[0].component_id == "kdco/reviewer");
    CHECK(summary.value().entries[1].installed_files.empty());
    CHECK(ocx::is_regular_file(f.dir.file(".opencode/agent/reviewer.md")));
}

TEST_CASE("config fragments are merged into the aggregate config") {
    InstallFixture f;
    f.kdco.component("mcp", "plugin",
                     R"({"1.0.0": {"files": ["mcp.ts"],
                                   "config": {"mcp": {"search": {"command": ["s"]}}}}})");
    f.kdco.file("mcp", "mcp.ts", "export {}\n");

    REQUIRE(f.install({"mcp"}).isOk());
    auto aggregate = nlohmann::json::parse(read_text(f.dir.file("opencode.json")));
    CHECK(aggregate["mcp"]["search"]["command"][0] == "s");
}

TEST_CASE("a path owned by another component is a PathConflict") {
    InstallFixture f;
    f.kdco.component("first", "agent", R"({"1.0.0": {"files": ["reviewer.md"]}})");
    f.kdco.component("second", "agent", R"({"1.0.0": {"files": ["reviewer.md", "extra.md"]}})");
    f.kdco.file("first", "reviewer.md", "first\n");
    f.kdco.file("second", "reviewer.md", "second\n");
    f.kdco.file("second", "extra.md", "extra\n");

    REQUIRE(f.install({"first"}).isOk());
    auto before = f.entry("kdco/first");

    auto conflict = f.install({"second"});
    REQUIRE(conflict.isErr());
    CHECK(conflict.error().code() == ErrorCode::PATH_CONFLICT);
    CHECK(conflict.error().message().find("kdco/first") != std::string::npos);

    // The first entry and its file are untouched, nothing of the second landed
    auto after = f.entry("kdco/first");
    REQUIRE(after);
    CHECK(after->content_hash == before->content_hash);
    CHECK(read_text(f.dir.file(".opencode/agent/reviewer.md")) == "first\n");
    CHECK_FALSE(ocx::path_exists(f.dir.file(".opencode/agent/extra.md")));
    CHECK_FALSE(f.entry("kdco/second"));
}

TEST_CASE("overwrite transfers a path to the new component") {
    InstallFixture f;
    f.kdco.component("first", "agent", R"({"1.0.0": {"files": ["reviewer.md", "own.md"]}})");
    f.kdco.component("second", "agent", R"({"1.0.0": {"files": ["reviewer.md"]}})");
    f.kdco.file("first", "reviewer.md", "first\n");
    f.kdco.file("first", "own.md", "own\n");
    f.kdco.file("second", "reviewer.md", "second\n");

    REQUIRE(f.install({"first"}).isOk());

    InstallOptions options;
    options.overwrite = true;
    REQUIRE(f.install({"second"}, options).isOk());

    CHECK(read_text(f.dir.file(".opencode/agent/reviewer.md")) == "second\n");
    auto first = f.entry("kdco/first");
    REQUIRE(first);
    CHECK(first->installed_files == std::vector<std::string>{".opencode/agent/own.md"});
    auto second = f.entry("kdco/second");
    REQUIRE(second);
    CHECK(second->installed_files == std::vector<std::string>{".opencode/agent/reviewer.md"});
}

TEST_CASE("an untracked file is only replaced when its content matches or with overwrite") {
    InstallFixture f;
    f.kdco.component("reviewer", "agent", R"({"1.0.0": {"files": ["reviewer.md"]}})");
    f.kdco.file("reviewer", "reviewer.md", "review\n");

    write_text(f.dir.file(".opencode/agent/reviewer.md"), "hand written\n");
    auto conflict = f.install({"reviewer"});
    REQUIRE(conflict.isErr());
    CHECK(conflict.error().code() == ErrorCode::PATH_CONFLICT);
    CHECK(read_text(f.dir.file(".opencode/agent/reviewer.md")) == "hand written\n");

    write_text(f.dir.file(".opencode/agent/reviewer.md"), "review\n");
    CHECK(f.install({"reviewer"}).isOk());
}

TEST_CASE("reinstalling an intact component is skipped without fetching files") {
    InstallFixture f;
    f.kdco.component("reviewer", "agent", R"({"1.0.0": {"files": ["reviewer.md"]}})");
    f.kdco.file("reviewer", "reviewer.md", "review\n");

    REQUIRE(f.install({"reviewer"}).isOk());
    f.transport->reset_counts();

    auto again = f.install({"reviewer"});
    REQUIRE(again.isOk());
    CHECK(again.value().skipped == std::vector<std::string>{"kdco/reviewer"});
    CHECK(f.transport->file_requests() == 0);
}

TEST_CASE("a locked release served with different bytes is a HashMismatch") {
    InstallFixture f;
    f.kdco.component("reviewer", "agent", R"({"1.0.0": {"files": ["reviewer.md"]}})");
    f.kdco.file("reviewer", "reviewer.md", "review\n");
    REQUIRE(f.install({"reviewer"}).isOk());
    auto locked = f.entry("kdco/reviewer");

    write_text(f.dir.file(".opencode/agent/reviewer.md"), "edited\n");
    f.kdco.file("reviewer", "reviewer.md", "tampered\n");

    InstallOptions options;
    options.reinstall = true;
    auto result = f.install({"reviewer"}, options);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::HASH_MISMATCH);

    CHECK(read_text(f.dir.file(".opencode/agent/reviewer.md")) == "edited\n");
    CHECK(f.entry("kdco/reviewer")->content_hash == locked->content_hash);
}

TEST_CASE("upgrading removes files the new version no longer declares") {
    InstallFixture f;
    f.kdco.component("researcher", "skill",
                     R"({"1.0.0": {"files": ["SKILL.md", "old/legacy.md"]},
                         "2.0.0": {"files": ["SKILL.md"]}})");
    f.kdco.file("researcher", "SKILL.md", "# Researcher\n");
    f.kdco.file("researcher", "old/legacy.md", "legacy\n");

    REQUIRE(f.install({"researcher@1.0.0"}).isOk());
    CHECK(ocx::is_regular_file(f.dir.file(".opencode/skill/researcher/old/legacy.md")));

    auto upgraded = f.install({"researcher@2.0.0"});
    REQUIRE(upgraded.isOk());
    CHECK_FALSE(ocx::path_exists(f.dir.file(".opencode/skill/researcher/old/legacy.md")));
    CHECK_FALSE(ocx::path_exists(f.dir.file(".opencode/skill/researcher/old")));

    auto entry = f.entry("kdco/researcher");
    REQUIRE(entry);
    CHECK(entry->version == "2.0.0");
    CHECK(entry->installed_files.size() == 1);
}

TEST_CASE("a failing component keeps the components installed before it") {
    InstallFixture f;
    f.kdco.component("app", "agent",
                     R"({"1.0.0": {"files": ["app.md"], "dependencies": ["base"]}})");
    f.kdco.component("base", "agent", R"({"1.0.0": {"files": ["base.md"]}})");
    f.kdco.file("base", "base.md", "base\n");

    auto result = f.install({"app"});
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::FILE_NOT_FOUND);

    CHECK(f.entry("kdco/base"));
    CHECK_FALSE(f.entry("kdco/app"));
    CHECK(ocx::is_regular_file(f.dir.file(".opencode/agent/base.md")));
}

TEST_CASE("a failed lockfile write rolls back the component's files and fragment") {
    InstallFixture f;
    f.kdco.component("mcp", "plugin",
                     R"({"1.0.0": {"files": ["mcp.ts"], "config": {"mcp": {"x": 1}}}})");
    f.kdco.file("mcp", "mcp.ts", "export {}\n");

    auto store = IntegrityStore::open(f.dir.file("ocx.lock"));
    REQUIRE(store.isOk());

    // The lockfile cannot be replaced while a directory sits at its path
    ocx::create_directories(f.dir.file("ocx.lock"));

    auto result = f.install_with(store.value(), {"mcp"});
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::IO_ERROR);

    CHECK_FALSE(ocx::path_exists(f.dir.file(".opencode/plugin/mcp.ts")));
    CHECK_FALSE(store.value().get("kdco/mcp"));

    auto aggregate = AggregateConfig::open(f.dir.file(".ocx/fragments.json"),
                                           f.dir.file("opencode.json"),
                                           nlohmann::ordered_json::object());
    REQUIRE(aggregate.isOk());
    CHECK(aggregate.value().fragments().empty());
}

TEST_CASE("a failed lockfile write leaves no orphan fragment in the journal") {
    InstallFixture f;
    f.kdco.component("mcp", "plugin",
                     R"({"1.0.0": {"files": ["mcp.ts"], "config": {"mcp": {"x": 1}}}})");
    f.kdco.file("mcp", "mcp.ts", "export {}\n");

    auto store = IntegrityStore::open(f.dir.file("ocx.lock"));
    REQUIRE(store.isOk());
    ocx::create_directories(f.dir.file("ocx.lock"));

    REQUIRE(f.install_with(store.value(), {"mcp"}).isErr());

    CHECK_FALSE(ocx::path_exists(f.dir.file(".ocx/fragments.json")));
    CHECK_FALSE(ocx::path_exists(f.dir.file("opencode.json")));
}

TEST_CASE("a failed aggregate config write takes the lock entry back out") {
    InstallFixture f;
    f.kdco.component("mcp", "plugin",
                     R"({"1.0.0": {"files": ["mcp.ts"], "config": {"mcp": {"x": 1}}}})");
    f.kdco.file("mcp", "mcp.ts", "export {}\n");

    // The aggregate config cannot be replaced while a directory sits at its path
    ocx::create_directories(f.dir.file("opencode.json"));

    auto result = f.install({"mcp"});
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::IO_ERROR);

    CHECK_FALSE(f.entry("kdco/mcp"));
    CHECK_FALSE(ocx::path_exists(f.dir.file(".opencode/plugin/mcp.ts")));

    auto aggregate = AggregateConfig::open(f.dir.file(".ocx/fragments.json"),
                                           f.dir.file("opencode.json"),
                                           nlohmann::ordered_json::object());
    REQUIRE(aggregate.isOk());
    CHECK(aggregate.value().fragments().empty());
}
