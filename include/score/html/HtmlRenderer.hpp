#pragma once

#include <score/css/CssCollector.hpp>
#include <score/node/Elements.hpp>
#include <score/node/Node.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace SC::Html {

// True when `node` renders as exactly one root element that a decoration can attach to.
template <typename N>
auto EmitsSingleElement(N const& node) -> bool {
    if constexpr (ModifiedNode<N>) {
        return EmitsSingleElement(node.content());
    } else if constexpr (ErasedNode<N>) {
        return node.emits_single_element();
    } else if constexpr (ElementNode<N> || VoidElementNode<N>) {
        return true;
    } else if constexpr (SelectingNode<N>) {
        bool single = false;
        node.for_each_child([&](auto const& child) { single = EmitsSingleElement(child); });
        return single;
    } else if constexpr (PrimitiveNode<N>) {
        return false;
    } else {
        return EmitsSingleElement(node.body());
    }
}

/**
 * Second pass: renders markup in document order.
 *
 * Every Modified node consumes one position from a counter shared in meaning
 * with the binding extractor. Its decoration (lookup class, `data-s` position
 * for event bindings, aria attributes) lands on the element its content
 * renders; content without a single root element is wrapped in a <span>.
 */
class HtmlRenderer {
public:
    HtmlRenderer() = default;
    explicit HtmlRenderer(Css::ClassLookup lookup)
        : lookup_(std::move(lookup)) {}

    template <typename N>
    void render(N const& node);

    void text(std::string_view content);

    template <typename F>
    void tag(std::string_view name, Attributes const& attributes, F&& content) {
        open_tag(name, attributes);
        std::forward<F>(content)();
        close_tag(name);
    }

    void void_tag(std::string_view name, Attributes const& attributes);

    [[nodiscard]] auto output() const -> std::string const& { return out_; }
    auto take_output() -> std::string { return std::move(out_); }

private:
    struct Decoration {
        std::vector<std::string> classes;
        std::vector<std::size_t> positions;
        Attributes               aria;

        [[nodiscard]] auto empty() const -> bool { return classes.empty() && positions.empty() && aria.empty(); }
    };

    auto decorate(ModifierList const& modifiers) -> Decoration;
    void open_tag(std::string_view name, Attributes const& attributes);
    void close_tag(std::string_view name);

    Css::ClassLookup        lookup_;
    std::string             out_;
    std::vector<Decoration> pending_;
    std::size_t             next_position_{0};
};

template <typename N>
void HtmlRenderer::render(N const& node) {
    static_assert(Node<N>, "node type must be either primitive or composite, not both");
    if constexpr (ModifiedNode<N>) {
        auto decoration = decorate(node.modifiers());
        if (decoration.empty()) {
            render(node.content());
        } else if (EmitsSingleElement(node.content())) {
            pending_.push_back(std::move(decoration));
            render(node.content());
        } else {
            pending_.push_back(std::move(decoration));
            tag("span", {}, [&] { render(node.content()); });
        }
    } else if constexpr (ErasedNode<N>) {
        node.render_html(*this);
    } else if constexpr (std::same_as<N, TextNode>) {
        text(node.text());
    } else if constexpr (VoidElementNode<N>) {
        void_tag(node.tag(), node.attributes());
    } else if constexpr (ElementNode<N>) {
        tag(node.tag(), node.attributes(), [&] { render(node.content()); });
    } else if constexpr (PrimitiveNode<N>) {
        node.for_each_child([this](auto const& child) { render(child); });
    } else {
        render(node.body());
    }
}

} // namespace SC::Html
