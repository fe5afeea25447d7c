#include "ocx/config_merge.hpp"
#include "ocx/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ocx {

using ojson = nlohmann::ordered_json;

void merge_fragment(ojson& target, const ojson& fragment) {
    if (target.is_object() && fragment.is_object()) {
        for (auto& [key, value] : fragment.items()) {
            if (target.contains(key)) {
                merge_fragment(target[key], value);
            } else {
                target[key] = value;
            }
        }
        return;
    }

    if (target.is_array() && fragment.is_array()) {
        for (const auto& elem : fragment) {
            target.push_back(elem);
        }
        return;
    }

    target = fragment;
}

Result<AggregateConfig> AggregateConfig::open(std::string journal_path,
                                              std::string output_path,
                                              ojson base) {
    using R = Result<AggregateConfig>;

    AggregateConfig config(std::move(journal_path), std::move(output_path), std::move(base));
    if (!path_exists(config.journal_path_)) {
        return R::ok(std::move(config));
    }

    auto text = read_file_text(config.journal_path_);
    if (!text) {
        return R::err(Error(ErrorCode::IO_ERROR, "cannot read " + config.journal_path_));
    }

    try {
        ojson j = ojson::parse(*text);
        if (!j.is_object() || !j.contains("fragments") || !j["fragments"].is_array()) {
            return R::err(Error(ErrorCode::CONFIG_INVALID,
                                config.journal_path_ + ": expected {\"fragments\": [...]}"));
        }
        for (const auto& elem : j["fragments"]) {
            if (!elem.is_object() || !elem.contains("component") ||
                !elem["component"].is_string()) {
                return R::err(Error(ErrorCode::CONFIG_INVALID,
                                    config.journal_path_ + ": fragment without a component"));
            }
            ojson fragment = elem.contains("config") ? elem["config"] : ojson::object();
            config.fragments_.emplace_back(elem["component"].get<std::string>(), fragment);
        }
    } catch (const ojson::parse_error& e) {
        return R::err(Error(ErrorCode::CONFIG_INVALID, config.journal_path_ + ": " + e.what()));
    }

    return R::ok(std::move(config));
}

ojson AggregateConfig::fold() const {
    ojson result = base_.is_object() ? base_ : ojson::object();
    for (const auto& [id, fragment] : fragments_) {
        merge_fragment(result, fragment);
    }
    return result;
}

Result<void> AggregateConfig::apply(const std::string& component_id, const ojson& fragment) {
    std::vector<Fragment> next = fragments_;
    auto it = std::find_if(next.begin(), next.end(),
                           [&](const Fragment& f) { return f.first == component_id; });
    if (it != next.end()) {
        it->second = fragment;
    } else {
        next.emplace_back(component_id, fragment);
    }
    return commit(std::move(next));
}

Result<void> AggregateConfig::remove(const std::string& component_id) {
    std::vector<Fragment> next = fragments_;
    auto it = std::remove_if(next.begin(), next.end(),
                             [&](const Fragment& f) { return f.first == component_id; });
    if (it == next.end()) return Result<void>::ok();
    next.erase(it, next.end());
    return commit(std::move(next));
}

Result<void> AggregateConfig::commit(std::vector<Fragment> next) {
    ojson journal;
    journal["fragments"] = ojson::array();
    for (const auto& [id, fragment] : next) {
        journal["fragments"].push_back({{"component", id}, {"config", fragment}});
    }

    std::string journal_dir = get_parent_directory(journal_path_);
    if (!journal_dir.empty() && !create_directories(journal_dir)) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "cannot create " + journal_dir));
    }

    auto written = atomic_write_file(journal_path_, journal.dump(2) + "\n");
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, written.error));
    }

    fragments_ = std::move(next);

    ojson folded = fold();
    bool has_content = !folded.empty();
    if (!has_content && !path_exists(output_path_)) {
        return Result<void>::ok();
    }

    std::string output_dir = get_parent_directory(output_path_);
    if (!output_dir.empty() && !create_directories(output_dir)) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "cannot create " + output_dir));
    }

    written = atomic_write_file(output_path_, folded.dump(2) + "\n");
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, written.error));
    }

    spdlog::debug("refolded {} config fragments into {}", fragments_.size(), output_path_);
    return Result<void>::ok();
}

} // namespace ocx
