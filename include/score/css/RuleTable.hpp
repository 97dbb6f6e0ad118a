#pragma once

#include <score/css/CssDeclaration.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace SC::Css {

/**
 * Insertion-ordered, deduplicated map of class name to declaration set.
 *
 * Class names derive from the declaration fingerprint. When two different
 * sets share a fingerprint the later one probes "s-<h>-1", "s-<h>-2", ...
 * and takes the first free slot. find() walks the same probe sequence, so a
 * lookup against a finished table resolves to the name insert() assigned.
 */
class RuleTable {
public:
    struct Rule {
        std::string  class_name;
        Declarations declarations;
    };

    // Returns the class name for `declarations`; first writer wins.
    auto insert(Declarations const& declarations) -> std::string;
    auto insert(Declarations const& declarations, std::uint64_t fingerprint) -> std::string;

    [[nodiscard]] auto find(Declarations const& declarations) const -> std::optional<std::string>;
    [[nodiscard]] auto find(Declarations const& declarations, std::uint64_t fingerprint) const
        -> std::optional<std::string>;

    [[nodiscard]] auto rules() const -> std::vector<Rule> const& { return rules_; }
    [[nodiscard]] auto size() const -> std::size_t { return rules_.size(); }
    [[nodiscard]] auto empty() const -> bool { return rules_.empty(); }

    // ".cls {\n  prop: value;\n}\n" per rule, in first-seen order.
    [[nodiscard]] auto stylesheet() const -> std::string;

private:
    std::vector<Rule>                               rules_;
    phmap::flat_hash_map<std::string, std::size_t> index_;
};

} // namespace SC::Css
