#pragma once

#include <score/modifier/BehaviorModifiers.hpp>
#include <score/node/Node.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace SC::Reactive {

struct ElementBinding {
    std::size_t position{0};
    std::string event;
    std::string handler;

    auto operator==(ElementBinding const&) const -> bool = default;
};

/**
 * Third pass: collects event bindings keyed by document-order position.
 *
 * The position counter advances once per Modified node in pre-order, the same
 * rule the HTML renderer applies when it emits `data-s` attributes.
 */
class BindingExtractor {
public:
    template <typename N>
    void extract(N const& node);

    void record(ModifierList const& modifiers);

    [[nodiscard]] auto bindings() const -> std::vector<ElementBinding> const& { return bindings_; }
    [[nodiscard]] auto visited() const -> std::size_t { return next_position_; }

private:
    std::vector<ElementBinding> bindings_;
    std::size_t                 next_position_{0};
};

template <typename N>
void BindingExtractor::extract(N const& node) {
    static_assert(Node<N>, "node type must be either primitive or composite, not both");
    if constexpr (ModifiedNode<N>) {
        record(node.modifiers());
        extract(node.content());
    } else if constexpr (ErasedNode<N>) {
        node.extract_bindings(*this);
    } else if constexpr (PrimitiveNode<N>) {
        node.for_each_child([this](auto const& child) { extract(child); });
    } else {
        extract(node.body());
    }
}

inline void BindingExtractor::record(ModifierList const& modifiers) {
    auto const position = next_position_++;
    for (auto const& modifier : modifiers) {
        if (auto const* binding = modifier.as<EventBindingModifier>()) {
            bindings_.push_back(ElementBinding{position, std::string{EventName(binding->event)}, binding->handler});
        }
    }
}

} // namespace SC::Reactive
