#include <doctest/doctest.h>
#include <ocx/overlay.hpp>

#include "../test_helpers.hpp"

using namespace ocx;
using ocx_test::TempDir;
using ocx_test::read_text;
using ocx_test::write_text;

namespace {

struct GhostFixture {
    TempDir home{"ocx_ghost_home"};
    TempDir repo{"ocx_ghost_repo"};
    ProfileStore store{home.path()};
    Profile profile;

    GhostFixture() {
        write_text(repo.file("AGENTS.md"), "their agents\n");
        write_text(repo.file("src/main.c"), "int main() {}\n");
        write_text(repo.file(".opencode/agent/theirs.md"), "theirs\n");
        write_text(repo.file("opencode.json"), "{\"theirs\": true}\n");
        write_text(repo.file(".git/HEAD"), "ref: refs/heads/main\n");

        profile = store.create("work").value();
        write_text(home.file("profiles/work/.opencode/agent/mine.md"), "mine\n");
        write_text(home.file("profiles/work/opencode.json"), "{\"mine\": true}\n");
    }
};

} // namespace

// ============================================================================
// Mapping
// ============================================================================

TEST_CASE("the mapping hides filtered files and layers the profile on top") {
    GhostFixture f;

    auto mapping = build_overlay_mapping(f.profile, f.repo.path());
    REQUIRE(mapping.isOk());
    const auto& entries = mapping.value().entries;

    REQUIRE(entries.count("src/main.c"));
    CHECK(entries.at("src/main.c").origin == MappingOrigin::Repository);
    CHECK(entries.at("src/main.c").source == f.repo.file("src/main.c"));

    REQUIRE(entries.count(".opencode/agent/mine.md"));
    CHECK(entries.at(".opencode/agent/mine.md").origin == MappingOrigin::Profile);

    // The profile's aggregate config shadows the repository's
    REQUIRE(entries.count("opencode.json"));
    CHECK(entries.at("opencode.json").origin == MappingOrigin::Profile);

    CHECK_FALSE(entries.count("AGENTS.md"));
    CHECK_FALSE(entries.count(".opencode/agent/theirs.md"));
    CHECK_FALSE(entries.count(".git/HEAD"));

    const auto& hidden = mapping.value().hidden;
    CHECK(hidden.count("AGENTS.md"));
    CHECK(hidden.count(".opencode/agent/theirs.md"));
    CHECK_FALSE(hidden.count("opencode.json"));
}

TEST_CASE("a repository larger than maxFiles is refused") {
    GhostFixture f;
    f.profile.config.max_files = 2;
    write_text(f.repo.file("src/util.c"), "\n");
    write_text(f.repo.file("src/more.c"), "\n");

    auto mapping = build_overlay_mapping(f.profile, f.repo.path());
    REQUIRE(mapping.isErr());
    CHECK(mapping.error().code() == ErrorCode::OVERLAY_TOO_LARGE);
}

TEST_CASE("a missing repository is an invalid argument") {
    GhostFixture f;
    auto mapping = build_overlay_mapping(f.profile, f.repo.file("nope"));
    REQUIRE(mapping.isErr());
    CHECK(mapping.error().code() == ErrorCode::INVALID_ARGUMENT);
}

// ============================================================================
// VCS Redirect
// ============================================================================

TEST_CASE("find_vcs_redirect follows a .git directory or gitdir file") {
    TempDir checkout("ocx_vcs_test");
    CHECK_FALSE(find_vcs_redirect(checkout.path()));

    ocx::create_directories(checkout.file("main/.git"));
    auto direct = find_vcs_redirect(checkout.file("main"));
    REQUIRE(direct);
    CHECK(direct->git_dir == checkout.file("main/.git"));
    CHECK(direct->work_tree == checkout.file("main"));

    ocx::create_directories(checkout.file("main/.git/worktrees/feature"));
    write_text(checkout.file("feature/.git"), "gitdir: ../main/.git/worktrees/feature\n");
    auto linked = find_vcs_redirect(checkout.file("feature"));
    REQUIRE(linked);
    CHECK(linked->git_dir == checkout.file("main/.git/worktrees/feature"));
    CHECK(linked->work_tree == checkout.file("feature"));
}

// ============================================================================
// Sessions
// ============================================================================

TEST_CASE("a session materialises the mapping and leaves the repository alone") {
    GhostFixture f;
    OverlayManager manager(f.home.path());

    auto session = manager.begin(f.profile, f.repo.path());
    REQUIRE(session.isOk());
    const std::string root = session.value()->overlay_root();

    CHECK(ocx::is_symlink(root + "/src/main.c"));
    CHECK(read_text(root + "/src/main.c") == "int main() {}\n");
    CHECK(read_text(root + "/opencode.json") == "{\"mine\": true}\n");
    CHECK_FALSE(ocx::path_exists(root + "/AGENTS.md"));

    auto env = session.value()->environment();
    CHECK(env["GIT_DIR"] == f.repo.file(".git"));
    CHECK(env["GIT_WORK_TREE"] == f.repo.path());

    CHECK(read_text(f.repo.file("opencode.json")) == "{\"theirs\": true}\n");
    CHECK_FALSE(ocx::path_exists(f.repo.file(".opencode/agent/mine.md")));

    REQUIRE(manager.end(*session.value()).isOk());
}

TEST_CASE("a second session on the same profile and repository is refused") {
    GhostFixture f;
    OverlayManager manager(f.home.path());

    auto first = manager.begin(f.profile, f.repo.path());
    REQUIRE(first.isOk());

    auto second = manager.begin(f.profile, f.repo.path());
    REQUIRE(second.isErr());
    CHECK(second.error().code() == ErrorCode::CONCURRENT_OPERATION);

    REQUIRE(manager.end(*first.value()).isOk());

    auto third = manager.begin(f.profile, f.repo.path());
    REQUIRE(third.isOk());
    REQUIRE(manager.end(*third.value()).isOk());
}

TEST_CASE("ending a session syncs new component files and removes the overlay") {
    GhostFixture f;
    OverlayManager manager(f.home.path());

    auto session = manager.begin(f.profile, f.repo.path());
    REQUIRE(session.isOk());
    const std::string root = session.value()->overlay_root();

    write_text(root + "/.opencode/skill/new/SKILL.md", "# New\n");
    write_text(root + "/.opencode/agent/theirs.md", "shadow\n");
    write_text(root + "/scratch.txt", "outside the component area\n");

    auto report = manager.end(*session.value());
    REQUIRE(report.isOk());
    CHECK(report.value().copied == std::vector<std::string>{".opencode/skill/new/SKILL.md"});
    CHECK(report.value().skipped == std::vector<std::string>{".opencode/agent/theirs.md"});

    CHECK(read_text(f.repo.file(".opencode/skill/new/SKILL.md")) == "# New\n");
    CHECK(read_text(f.repo.file(".opencode/agent/theirs.md")) == "theirs\n");
    CHECK_FALSE(ocx::path_exists(f.repo.file("scratch.txt")));

    CHECK_FALSE(session.value()->active());
    CHECK_FALSE(ocx::path_exists(root));
    CHECK(ocx::list_directory(f.home.file("sessions")).empty());

    auto again = manager.end(*session.value());
    REQUIRE(again.isErr());
    CHECK(again.error().code() == ErrorCode::INVALID_ARGUMENT);
}

TEST_CASE("run executes inside the overlay and reports the exit code") {
    GhostFixture f;
    OverlayManager manager(f.home.path());

    auto session = manager.begin(f.profile, f.repo.path());
    REQUIRE(session.isOk());

    auto code = manager.run(*session.value(),
                            {"/bin/sh", "-c",
                             "test -L src/main.c && printf ok > .opencode/ran.txt; exit 3"});
    REQUIRE(code.isOk());
    CHECK(code.value() == 3);

    auto report = manager.end(*session.value());
    REQUIRE(report.isOk());
    CHECK(read_text(f.repo.file(".opencode/ran.txt")) == "ok");
}

TEST_CASE("an interrupt sent to the process group during run does not stop the sync") {
    GhostFixture f;
    OverlayManager manager(f.home.path());

    auto session = manager.begin(f.profile, f.repo.path());
    REQUIRE(session.isOk());

    auto code = manager.run(*session.value(),
                            {"/bin/sh", "-c",
                             "trap '' INT; kill -INT 0; printf done > .opencode/after.txt"});
    REQUIRE(code.isOk());
    CHECK(code.value() == 0);

    auto report = manager.end(*session.value());
    REQUIRE(report.isOk());
    CHECK(read_text(f.repo.file(".opencode/after.txt")) == "done");
}

TEST_CASE("a session dropped without end is still cleaned up") {
    GhostFixture f;
    OverlayManager manager(f.home.path());
    std::string root;
    {
        auto session = manager.begin(f.profile, f.repo.path());
        REQUIRE(session.isOk());
        root = session.value()->overlay_root();
        write_text(root + "/.opencode/lost.md", "lost\n");
    }
    CHECK_FALSE(ocx::path_exists(root));
    CHECK_FALSE(ocx::path_exists(f.repo.file(".opencode/lost.md")));
    CHECK(manager.begin(f.profile, f.repo.path()).isOk());
}
