#include "ocx/profile_store.hpp"
#include "ocx/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <utility>

namespace ocx {

namespace fs = std::filesystem;

namespace {

Result<void> check_profile_name(const std::string& name) {
    if (!is_valid_name(name)) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                       "invalid profile name: '" + name + "'"));
    }
    return Result<void>::ok();
}

} // namespace

ProfileSelection ProfileSelection::from_environment(std::optional<std::string> explicit_name) {
    ProfileSelection selection;
    selection.explicit_name = std::move(explicit_name);
    auto env = get_env(kProfileEnvVar);
    if (env && !env->empty()) {
        selection.env_name = *env;
    }
    return selection;
}

Result<std::string> resolve_ocx_home() {
    if (auto home = get_env("OCX_HOME"); home && !home->empty()) {
        return Result<std::string>::ok(*home);
    }
    if (auto xdg = get_env("XDG_CONFIG_HOME"); xdg && !xdg->empty()) {
        return Result<std::string>::ok(join_path(*xdg, "ocx"));
    }
    if (auto home = get_env("HOME"); home && !home->empty()) {
        return Result<std::string>::ok(join_path(*home, ".config/ocx"));
    }
    return Result<std::string>::err(
        Error(ErrorCode::INVALID_ARGUMENT, "cannot locate the ocx home: set OCX_HOME or HOME"));
}

ProfileStore::ProfileStore(std::string home) : home_(std::move(home)) {}

std::string ProfileStore::profile_directory(const std::string& name) const {
    return join_path(home_, "profiles/" + name);
}

std::vector<std::string> ProfileStore::list() const {
    std::vector<std::string> names;
    for (const auto& name : list_directory(join_path(home_, "profiles"))) {
        if (exists(name)) names.push_back(name);
    }
    return names;
}

bool ProfileStore::exists(const std::string& name) const {
    if (!is_valid_name(name)) return false;
    return is_regular_file(join_path(profile_directory(name), kProfileConfigFile));
}

Result<Profile> ProfileStore::load(const std::string& name) const {
    using R = Result<Profile>;

    auto valid = check_profile_name(name);
    if (valid.isErr()) return R::err(valid.error());

    if (!exists(name)) {
        return R::err(Error(ErrorCode::PROFILE_MISSING, "profile does not exist: " + name));
    }

    Profile profile;
    profile.name = name;
    profile.directory = profile_directory(name);

    auto config = load_project_config(join_path(profile.directory, kProfileConfigFile));
    if (config.isErr()) return R::err(config.error().withContext("profile " + name));
    profile.config = std::move(config.value());
    return R::ok(std::move(profile));
}

Result<void> ProfileStore::save(const Profile& profile) {
    auto valid = check_profile_name(profile.name);
    if (valid.isErr()) return valid;

    return save_project_config(join_path(profile_directory(profile.name), kProfileConfigFile),
                               profile.config);
}

Result<Profile> ProfileStore::create(const std::string& name,
                                     const std::optional<std::string>& clone_from) {
    using R = Result<Profile>;

    auto valid = check_profile_name(name);
    if (valid.isErr()) return R::err(valid.error());

    if (exists(name)) {
        return R::err(Error(ErrorCode::INVALID_ARGUMENT, "profile already exists: " + name));
    }

    std::string directory = profile_directory(name);

    // Cloning a default profile that was never created means using the seed
    bool clone = clone_from && (exists(*clone_from) || *clone_from != kDefaultProfileName);
    if (clone) {
        if (!exists(*clone_from)) {
            return R::err(Error(ErrorCode::PROFILE_MISSING,
                                "cannot clone missing profile: " + *clone_from));
        }

        // A deep copy, so the two profiles share nothing afterwards
        std::error_code ec;
        fs::create_directories(directory, ec);
        if (!ec) {
            fs::copy(profile_directory(*clone_from), directory,
                     fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
        }
        if (ec) {
            remove_directory(directory);
            return R::err(Error(ErrorCode::IO_ERROR, "cannot clone profile " + *clone_from +
                                                         " into " + name + ": " + ec.message()));
        }
        remove_file(join_path(directory, ".ocx/operation.lock"));

        spdlog::info("created profile {} from {}", name, *clone_from);
        return load(name);
    }

    Profile profile;
    profile.name = name;
    profile.directory = directory;
    profile.config = default_profile_config();

    if (!create_directories(directory)) {
        return R::err(Error(ErrorCode::IO_ERROR, "cannot create " + directory));
    }
    auto saved = save(profile);
    if (saved.isErr()) return R::err(saved.error());

    spdlog::info("created profile {}", name);
    return R::ok(std::move(profile));
}

std::optional<std::string> ProfileStore::pointer() const {
    auto target = read_symlink(join_path(home_, "current"));
    if (!target) return std::nullopt;
    std::string name = get_filename(to_portable_path(*target));
    if (name.empty()) return std::nullopt;
    return name;
}

Result<void> ProfileStore::use(const std::string& name) {
    auto valid = check_profile_name(name);
    if (valid.isErr()) return valid;

    if (!exists(name)) {
        return Result<void>::err(
            Error(ErrorCode::PROFILE_MISSING, "profile does not exist: " + name));
    }

    if (!create_directories(home_)) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "cannot create " + home_));
    }

    auto updated = atomic_update_symlink(join_path(home_, "current"), "profiles/" + name);
    if (!updated.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, updated.error));
    }
    return Result<void>::ok();
}

Result<void> ProfileStore::ensure_default() {
    if (exists(kDefaultProfileName)) return Result<void>::ok();

    auto created = create(kDefaultProfileName);
    if (created.isErr()) return Result<void>::err(created.error());
    return Result<void>::ok();
}

Result<Profile> ProfileStore::current(const ProfileSelection& selection) {
    if (selection.explicit_name) return load(*selection.explicit_name);
    if (selection.env_name) return load(*selection.env_name);

    if (auto persisted = pointer()) {
        if (exists(*persisted)) return load(*persisted);
        spdlog::warn("current profile pointer names missing profile {}, using {}", *persisted,
                     kDefaultProfileName);
    }

    auto seeded = ensure_default();
    if (seeded.isErr()) return Result<Profile>::err(seeded.error());

    if (!pointer()) {
        auto pointed = use(kDefaultProfileName);
        if (pointed.isErr()) return Result<Profile>::err(pointed.error());
    }
    return load(kDefaultProfileName);
}

Result<void> ProfileStore::remove(const std::string& name, const ProfileSelection& selection) {
    auto valid = check_profile_name(name);
    if (valid.isErr()) return valid;

    if (!exists(name)) {
        return Result<void>::err(
            Error(ErrorCode::PROFILE_MISSING, "profile does not exist: " + name));
    }

    std::optional<std::string> active = selection.explicit_name;
    if (!active) active = selection.env_name;
    if (!active) active = pointer();
    if (!active) active = std::string(kDefaultProfileName);

    if (*active == name || pointer() == name) {
        return Result<void>::err(Error(ErrorCode::CANNOT_REMOVE_ACTIVE_PROFILE,
                                       "profile " + name + " is the current profile"));
    }

    if (!remove_directory(profile_directory(name))) {
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, "cannot remove " + profile_directory(name)));
    }

    spdlog::info("removed profile {}", name);
    return Result<void>::ok();
}

} // namespace ocx
