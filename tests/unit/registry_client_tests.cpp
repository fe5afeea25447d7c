#include <doctest/doctest.h>
#include <ocx/registry_client.hpp>

#include "../test_helpers.hpp"

using namespace ocx;
using ocx_test::FakeRegistry;
using ocx_test::FakeTransport;

namespace {

const std::string kBase = "https://registry.example.com";

Registry make_registry(const std::string& name = "kdco", const std::string& url = kBase) {
    Registry registry;
    registry.name = name;
    registry.base_url = url;
    return registry;
}

} // namespace

// ============================================================================
// Document Parsing
// ============================================================================

TEST_CASE("parse_index_document accepts a bare array and a components object") {
    auto bare = parse_index_document(R"([{"name": "a", "type": "agent", "version": "1.0.0"}])");
    REQUIRE(bare.isOk());
    REQUIRE(bare.value().size() == 1);
    CHECK(bare.value()[0].type == ComponentType::Agent);
    CHECK(bare.value()[0].latest_version == "1.0.0");

    auto wrapped = parse_index_document(
        R"({"components": [{"name": "b", "latestVersion": "2.1.0", "description": "B"}]})");
    REQUIRE(wrapped.isOk());
    CHECK(wrapped.value()[0].name == "b");
    CHECK(wrapped.value()[0].latest_version == "2.1.0");
    CHECK(wrapped.value()[0].description == "B");
}

TEST_CASE("parse_index_document rejects malformed JSON as RegistryUnavailable") {
    auto result = parse_index_document("{not json");
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::REGISTRY_UNAVAILABLE);

    auto wrong = parse_index_document(R"({"components": 3})");
    REQUIRE(wrong.isErr());
    CHECK(wrong.error().code() == ErrorCode::REGISTRY_UNAVAILABLE);
}

TEST_CASE("parse_component_document reads every release") {
    auto doc = parse_component_document(R"({
        "name": "researcher",
        "type": "ocx:skill",
        "versions": {
            "1.0.0": {"files": ["SKILL.md"]},
            "1.1.0": {
                "files": ["SKILL.md", {"source": "ref.md", "target": "docs/ref.md"}],
                "dependencies": {"kdco/base": "^1.0.0", "other": "*"},
                "config": {"mcp": {"server": {"command": "x"}}}
            }
        }
    })");
    REQUIRE(doc.isOk());
    CHECK(doc.value().name == "researcher");
    CHECK(doc.value().type == ComponentType::Skill);
    REQUIRE(doc.value().releases.size() == 2);

    const auto& release = doc.value().releases.at("1.1.0");
    CHECK(release.version == "1.1.0");
    REQUIRE(release.files.size() == 2);
    CHECK(release.files[1].source == "ref.md");
    CHECK(release.files[1].target == "docs/ref.md");
    CHECK(release.dependencies == std::vector<std::string>{"kdco/base@^1.0.0", "other"});
    CHECK(release.config_fragment["mcp"]["server"]["command"] == "x");
}

TEST_CASE("parse_component_document accepts a single-release document") {
    auto doc = parse_component_document(
        R"({"name": "lint", "type": "command", "version": "0.2.0", "files": ["lint.md"]})");
    REQUIRE(doc.isOk());
    REQUIRE(doc.value().releases.count("0.2.0") == 1);
    CHECK(doc.value().releases.at("0.2.0").type == ComponentType::Command);
}

TEST_CASE("parse_component_document rejects invalid releases") {
    CHECK(parse_component_document(R"({"versions": {"not-semver": {}}})").isErr());
    CHECK(parse_component_document(R"({"type": "widget", "version": "1.0.0"})").isErr());
    CHECK(parse_component_document(R"({"version": "1.0.0", "config": []})").isErr());
    CHECK(parse_component_document(R"({"version": "1.0.0", "files": [3]})").isErr());

    auto missing = parse_component_document(R"({"name": "x"})");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::REGISTRY_UNAVAILABLE);
}

// ============================================================================
// Client
// ============================================================================

TEST_CASE("fetch_index is cached per registry") {
    auto transport = std::make_shared<FakeTransport>();
    FakeRegistry registry(transport, kBase);
    registry.component("researcher", "skill", R"({"1.0.0": {"files": ["SKILL.md"]}})");

    RegistryClient client(transport);
    REQUIRE(client.fetch_index(make_registry()).isOk());
    REQUIRE(client.fetch_index(make_registry()).isOk());
    CHECK(transport->count(kBase + "/index.json") == 1);

    auto listed = client.lists_component(make_registry(), "researcher");
    REQUIRE(listed.isOk());
    CHECK(listed.value());
    CHECK_FALSE(client.lists_component(make_registry(), "nothing").value());
}

TEST_CASE("fetch_manifest picks the highest satisfying release") {
    auto transport = std::make_shared<FakeTransport>();
    FakeRegistry registry(transport, kBase);
    registry.component("researcher", "skill", R"({"1.0.0": {}, "1.2.0": {}, "2.0.0": {}})");

    RegistryClient client(transport);
    auto manifest = client.fetch_manifest(make_registry(), "researcher", "^1.0.0");
    REQUIRE(manifest.isOk());
    CHECK(manifest.value().version == "1.2.0");
    CHECK(manifest.value().name == "researcher");

    auto latest = client.fetch_manifest(make_registry(), "researcher", "");
    REQUIRE(latest.isOk());
    CHECK(latest.value().version == "2.0.0");

    // One document fetch serves every lookup
    CHECK(transport->count(kBase + "/components/researcher.json") == 1);
}

TEST_CASE("fetch_manifest reports unsatisfiable and invalid constraints") {
    auto transport = std::make_shared<FakeTransport>();
    FakeRegistry registry(transport, kBase);
    registry.component("researcher", "skill", R"({"1.0.0": {}})");

    RegistryClient client(transport);
    auto none = client.fetch_manifest(make_registry(), "researcher", ">=3.0.0");
    REQUIRE(none.isErr());
    CHECK(none.error().code() == ErrorCode::UNSATISFIABLE_VERSION);

    auto bad = client.fetch_manifest(make_registry(), "researcher", ">=");
    REQUIRE(bad.isErr());
    CHECK(bad.error().code() == ErrorCode::INVALID_ARGUMENT);
}

TEST_CASE("a pinned registry only offers the pinned release") {
    auto transport = std::make_shared<FakeTransport>();
    FakeRegistry registry(transport, kBase);
    registry.component("researcher", "skill", R"({"1.0.0": {}, "1.5.0": {}})");

    Registry pinned = make_registry();
    pinned.pinned_version = "1.0.0";

    RegistryClient client(transport);
    auto versions = client.fetch_versions(pinned, "researcher");
    REQUIRE(versions.isOk());
    CHECK(versions.value() == std::vector<std::string>{"1.0.0"});

    auto manifest = client.fetch_manifest(pinned, "researcher", "*");
    REQUIRE(manifest.isOk());
    CHECK(manifest.value().version == "1.0.0");

    pinned.pinned_version = "9.9.9";
    RegistryClient other(transport);
    auto missing = other.fetch_manifest(pinned, "researcher", "*");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::UNSATISFIABLE_VERSION);
}

TEST_CASE("a missing component document is FileNotFound, a failing one RegistryUnavailable") {
    auto transport = std::make_shared<FakeTransport>();
    FakeRegistry registry(transport, kBase);

    RegistryClient client(transport);
    auto missing = client.fetch_versions(make_registry(), "ghost");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::FILE_NOT_FOUND);

    transport->serve(kBase + "/components/broken.json", "oops", 500);
    auto broken = client.fetch_versions(make_registry(), "broken");
    REQUIRE(broken.isErr());
    CHECK(broken.error().code() == ErrorCode::REGISTRY_UNAVAILABLE);
    CHECK(broken.error().message().find("HTTP 500") != std::string::npos);
}

TEST_CASE("an unreachable index is RegistryUnavailable") {
    auto transport = std::make_shared<FakeTransport>();
    RegistryClient client(transport);

    auto index = client.fetch_index(make_registry("down", "https://down.example.com"));
    REQUIRE(index.isErr());
    CHECK(index.error().code() == ErrorCode::REGISTRY_UNAVAILABLE);
}

TEST_CASE("fetch_file returns the served bytes or FileNotFound") {
    auto transport = std::make_shared<FakeTransport>();
    FakeRegistry registry(transport, kBase);
    registry.file("researcher", "SKILL.md", "# Researcher\n");

    RegistryClient client(transport);
    auto content = client.fetch_file(make_registry(), "researcher", "SKILL.md");
    REQUIRE(content.isOk());
    CHECK(std::string(content.value().begin(), content.value().end()) == "# Researcher\n");

    auto missing = client.fetch_file(make_registry(), "researcher", "nope.md");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::FILE_NOT_FOUND);
}

TEST_CASE("non-https registries are refused without a request") {
    auto transport = std::make_shared<FakeTransport>();
    RegistryClient client(transport);

    auto result = client.fetch_index(make_registry("plain", "http://registry.example.com"));
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::INVALID_ARGUMENT);
    CHECK(transport->requests().empty());
}

TEST_CASE("fetch_capabilities treats a missing discovery document as empty") {
    auto transport = std::make_shared<FakeTransport>();
    RegistryClient client(transport);

    auto absent = client.fetch_capabilities(make_registry());
    REQUIRE(absent.isOk());
    CHECK(absent.value().is_null());

    transport->serve(kBase + "/.well-known/ocx.json", R"({"version": 1})");
    auto present = client.fetch_capabilities(make_registry());
    REQUIRE(present.isOk());
    CHECK(present.value()["version"] == 1);
}
