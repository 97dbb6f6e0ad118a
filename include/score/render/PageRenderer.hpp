#pragma once

#include <score/css/CssCollector.hpp>
#include <score/document/Metadata.hpp>
#include <score/html/HtmlRenderer.hpp>
#include <score/node/Node.hpp>
#include <score/reactive/BindingExtractor.hpp>
#include <score/reactive/JsEmitter.hpp>
#include <score/reactive/Reactive.hpp>
#include <score/render/Environment.hpp>
#include <score/theme/Theme.hpp>

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace SC::Render {

// A page expands into a root node through body(); it may also expose
// `metadata() const -> std::optional<MetadataPatch>` and `reactive_fields()`.
template <typename P>
concept Page = requires(P const& page) {
    page.body();
    requires Node<std::remove_cvref_t<decltype(page.body())>>;
};

struct RenderResult {
    std::string html;
    std::string component_css;
    std::string theme_css;
    std::string script;
    std::size_t rule_count{0};
    std::size_t binding_count{0};
    Environment environment{Environment::Development};
};

// Output of the three tree passes over one page body.
struct PassOutputs {
    std::string body_html;
    std::string component_css;
    std::string script;
    std::size_t rule_count{0};
    std::size_t binding_count{0};
};

template <typename P>
auto MetadataPatchOf(P const& page) -> std::optional<MetadataPatch> {
    if constexpr (requires { { page.metadata() } -> std::convertible_to<std::optional<MetadataPatch>>; }) {
        return page.metadata();
    } else {
        return std::nullopt;
    }
}

// Merges page overrides over application metadata and assembles the final document.
auto AssemblePage(PassOutputs                         passes,
                  std::optional<MetadataPatch> const& patch,
                  Metadata const*                     metadata,
                  Theme const*                        theme,
                  Environment                         environment) -> RenderResult;

/**
 * Renders one page into a complete document.
 *
 * The body is expanded once. The CSS collector, HTML renderer and binding
 * extractor then walk that same tree independently; the renderer resolves
 * class names through a lookup built over the collector's rule table.
 */
template <Page P>
auto RenderPage(P const&        page,
                Metadata const* metadata,
                Theme const*    theme,
                Environment     environment = CurrentEnvironment()) -> RenderResult {
    auto const body = page.body();

    Css::CssCollector collector;
    collector.collect(body);

    Html::HtmlRenderer renderer{Css::MakeClassLookup(collector.rules())};
    renderer.render(body);

    Reactive::BindingExtractor extractor;
    extractor.extract(body);

    PassOutputs passes;
    passes.body_html     = renderer.take_output();
    passes.component_css = collector.stylesheet();
    passes.script        = Reactive::EmitScript(Reactive::ReactiveFieldsOf(page), extractor.bindings());
    passes.rule_count    = collector.rules().size();
    passes.binding_count = extractor.bindings().size();

    return AssemblePage(std::move(passes), MetadataPatchOf(page), metadata, theme, environment);
}

} // namespace SC::Render
