#pragma once

/**
 * @file config_merge.hpp
 * @brief Aggregate configuration folded from component config fragments
 *
 * Every installed component may carry a config fragment. The aggregate
 * document is the project's base config with every fragment folded in, in
 * install order:
 *
 *   - arrays concatenate
 *   - objects merge recursively
 *   - scalars (and type changes) shadow, latest write wins
 *
 * Fragments are journaled per component (.ocx/fragments.json), so replacing
 * one component's fragment refolds the stored fragments without consulting
 * any other component.
 */

#include "ocx/errors.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace ocx {

// Fold fragment into target in place
void merge_fragment(nlohmann::ordered_json& target, const nlohmann::ordered_json& fragment);

class AggregateConfig {
public:
    using Fragment = std::pair<std::string, nlohmann::ordered_json>;  // component id, fragment

    // Missing journal opens empty
    static Result<AggregateConfig> open(std::string journal_path,
                                        std::string output_path,
                                        nlohmann::ordered_json base);

    // Replace the component's fragment in place, or append it
    Result<void> apply(const std::string& component_id, const nlohmann::ordered_json& fragment);

    // Drop the component's fragment; unknown ids are a no-op
    Result<void> remove(const std::string& component_id);

    // Base plus every fragment, in journal order
    nlohmann::ordered_json fold() const;

    const std::vector<Fragment>& fragments() const { return fragments_; }

private:
    AggregateConfig(std::string journal_path, std::string output_path,
                    nlohmann::ordered_json base)
        : journal_path_(std::move(journal_path)),
          output_path_(std::move(output_path)),
          base_(std::move(base)) {}

    Result<void> commit(std::vector<Fragment> next);

    std::string journal_path_;
    std::string output_path_;
    nlohmann::ordered_json base_;
    std::vector<Fragment> fragments_;
};

} // namespace ocx
