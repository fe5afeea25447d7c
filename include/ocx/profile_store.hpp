#pragma once

/**
 * @file profile_store.hpp
 * @brief Ghost-mode profiles kept under the ocx home
 *
 * Layout:
 *
 *   <home>/profiles/<name>/ghost.json        profile configuration
 *   <home>/profiles/<name>/ocx.lock          the profile's own lockfile
 *   <home>/profiles/<name>/<componentPath>/  the profile's component tree
 *   <home>/current -> profiles/<name>        persisted pointer (symlink)
 *
 * <home> is $OCX_HOME, else $XDG_CONFIG_HOME/ocx, else $HOME/.config/ocx.
 */

#include "ocx/errors.hpp"
#include "ocx/project_config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ocx {

constexpr const char* kDefaultProfileName = "default";
constexpr const char* kProfileConfigFile = "ghost.json";
constexpr const char* kProfileEnvVar = "OCX_PROFILE";

// Inputs to current-profile lookup, passed explicitly by the caller
struct ProfileSelection {
    std::optional<std::string> explicit_name;  // e.g. --profile
    std::optional<std::string> env_name;       // $OCX_PROFILE

    // explicit_name as given, env_name read from the process environment
    static ProfileSelection from_environment(std::optional<std::string> explicit_name);
};

struct Profile {
    std::string name;
    std::string directory;  // <home>/profiles/<name>
    ProjectConfig config;
};

// Home directory from the environment
Result<std::string> resolve_ocx_home();

class ProfileStore {
public:
    explicit ProfileStore(std::string home);

    const std::string& home() const { return home_; }
    std::string profile_directory(const std::string& name) const;

    // Names of existing profiles, sorted
    std::vector<std::string> list() const;
    bool exists(const std::string& name) const;

    // From the built-in seed, or a full copy of clone_from
    Result<Profile> create(const std::string& name,
                           const std::optional<std::string>& clone_from = std::nullopt);

    Result<Profile> load(const std::string& name) const;
    Result<void> save(const Profile& profile);

    // Persist name as the current profile
    Result<void> use(const std::string& name);

    // Explicit override > environment override > persisted pointer > the
    // implicit default profile, created on first use
    Result<Profile> current(const ProfileSelection& selection);

    // CANNOT_REMOVE_ACTIVE_PROFILE for the current or persisted profile
    Result<void> remove(const std::string& name, const ProfileSelection& selection);

    // Profile the persisted pointer names, if it is set
    std::optional<std::string> pointer() const;

private:
    Result<void> ensure_default();

    std::string home_;
};

} // namespace ocx
