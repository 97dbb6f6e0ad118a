#pragma once

#include <score/css/CssCollector.hpp>
#include <score/html/HtmlRenderer.hpp>
#include <score/node/Node.hpp>
#include <score/reactive/BindingExtractor.hpp>

#include <concepts>
#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>

namespace SC {

/**
 * Type-erased node.
 *
 * Lets runtime-assembled trees (`Array<AnyNode>`, a body chosen among
 * unrelated types) flow through the statically dispatched consumers. Each
 * consumer reaches the wrapped node through its own virtual entry point,
 * which re-enters the consumer's template dispatch with the concrete type.
 */
class AnyNode {
public:
    template <typename N>
        requires(!std::same_as<std::remove_cvref_t<N>, AnyNode>
                 && (Node<std::remove_cvref_t<N>> || std::is_convertible_v<N, std::string_view>))
    AnyNode(N&& node)
        : self_(std::make_unique<Model<lifted_t<N>>>(LiftNode(std::forward<N>(node)))) {}

    AnyNode(AnyNode const& other)
        : self_(other.self_->clone()) {}
    AnyNode(AnyNode&&) noexcept = default;

    auto operator=(AnyNode const& other) -> AnyNode& {
        if (this != &other) {
            self_ = other.self_->clone();
        }
        return *this;
    }
    auto operator=(AnyNode&&) noexcept -> AnyNode& = default;

    void collect_css(Css::CssCollector& collector) const { self_->collect_css(collector); }
    void render_html(Html::HtmlRenderer& renderer) const { self_->render_html(renderer); }
    void extract_bindings(Reactive::BindingExtractor& extractor) const { self_->extract_bindings(extractor); }
    [[nodiscard]] auto emits_single_element() const -> bool { return self_->emits_single_element(); }

private:
    struct Concept {
        virtual ~Concept()                                                    = default;
        virtual auto clone() const -> std::unique_ptr<Concept>                = 0;
        virtual void collect_css(Css::CssCollector& collector) const          = 0;
        virtual void render_html(Html::HtmlRenderer& renderer) const          = 0;
        virtual void extract_bindings(Reactive::BindingExtractor& extractor) const = 0;
        virtual auto emits_single_element() const -> bool                     = 0;
    };

    template <typename N>
    struct Model final : Concept {
        explicit Model(N n)
            : node(std::move(n)) {}

        auto clone() const -> std::unique_ptr<Concept> override { return std::make_unique<Model>(node); }
        void collect_css(Css::CssCollector& collector) const override { collector.collect(node); }
        void render_html(Html::HtmlRenderer& renderer) const override { renderer.render(node); }
        void extract_bindings(Reactive::BindingExtractor& extractor) const override { extractor.extract(node); }
        auto emits_single_element() const -> bool override { return Html::EmitsSingleElement(node); }

        N node;
    };

    std::unique_ptr<Concept> self_;
};

} // namespace SC
