#include <score/css/RuleTable.hpp>

#include <score/css/Fingerprint.hpp>

#include <score/log/TaggedLogger.hpp>

namespace SC::Css {

auto RuleTable::insert(Declarations const& declarations) -> std::string {
    return insert(declarations, Fingerprint(declarations));
}

auto RuleTable::insert(Declarations const& declarations, std::uint64_t fingerprint) -> std::string {
    if (declarations.empty()) {
        return {};
    }
    for (std::size_t probe = 0;; ++probe) {
        auto name = ClassNameFor(fingerprint, probe);
        auto it   = index_.find(name);
        if (it == index_.end()) {
            index_.emplace(name, rules_.size());
            rules_.push_back(Rule{name, declarations});
            return name;
        }
        if (rules_[it->second].declarations == declarations) {
            return name;
        }
        sc_log("Fingerprint collision on " + name + ", probing next slot", "RuleTable");
    }
}

auto RuleTable::find(Declarations const& declarations) const -> std::optional<std::string> {
    return find(declarations, Fingerprint(declarations));
}

auto RuleTable::find(Declarations const& declarations, std::uint64_t fingerprint) const
    -> std::optional<std::string> {
    if (declarations.empty()) {
        return std::nullopt;
    }
    for (std::size_t probe = 0;; ++probe) {
        auto name = ClassNameFor(fingerprint, probe);
        auto it   = index_.find(name);
        if (it == index_.end()) {
            return std::nullopt;
        }
        if (rules_[it->second].declarations == declarations) {
            return name;
        }
    }
}

auto RuleTable::stylesheet() const -> std::string {
    std::string output;
    for (auto const& rule : rules_) {
        output.push_back('.');
        output.append(rule.class_name);
        output.append(" {\n");
        for (auto const& declaration : rule.declarations) {
            output.append("  ");
            output.append(declaration.render());
            output.append(";\n");
        }
        output.append("}\n");
    }
    return output;
}

} // namespace SC::Css
