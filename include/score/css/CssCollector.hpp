#pragma once

#include <score/css/CssConverterRegistry.hpp>
#include <score/css/RuleTable.hpp>
#include <score/node/Node.hpp>

#include <functional>
#include <optional>
#include <string>

namespace SC::Css {

// Maps a node's modifier list to the class name the collection pass assigned.
using ClassLookup = std::function<std::optional<std::string>(ModifierList const&)>;

/**
 * First pass: walks a node tree in document order and records one rule per
 * distinct declaration set.
 */
class CssCollector {
public:
    template <typename N>
    void collect(N const& node);

    [[nodiscard]] auto rules() const -> RuleTable const& { return table_; }
    [[nodiscard]] auto stylesheet() const -> std::string { return table_.stylesheet(); }

private:
    void register_modifiers(ModifierList const& modifiers);

    RuleTable table_;
};

template <typename N>
void CssCollector::collect(N const& node) {
    static_assert(Node<N>, "node type must be either primitive or composite, not both");
    if constexpr (ModifiedNode<N>) {
        register_modifiers(node.modifiers());
        collect(node.content());
    } else if constexpr (ErasedNode<N>) {
        node.collect_css(*this);
    } else if constexpr (PrimitiveNode<N>) {
        node.for_each_child([this](auto const& child) { collect(child); });
    } else {
        collect(node.body());
    }
}

// Replays declaration building and fingerprinting against a finished table.
// The returned callable references `table`, which must outlive it.
auto MakeClassLookup(RuleTable const& table) -> ClassLookup;

} // namespace SC::Css
