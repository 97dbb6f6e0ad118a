#include <score/css/CssCollector.hpp>

namespace SC::Css {

void CssCollector::register_modifiers(ModifierList const& modifiers) {
    auto declarations = DeclarationsFor(modifiers);
    if (declarations.empty()) {
        return;
    }
    (void)table_.insert(declarations);
}

auto MakeClassLookup(RuleTable const& table) -> ClassLookup {
    return [&table](ModifierList const& modifiers) -> std::optional<std::string> {
        auto declarations = DeclarationsFor(modifiers);
        if (declarations.empty()) {
            return std::nullopt;
        }
        return table.find(declarations);
    };
}

} // namespace SC::Css
