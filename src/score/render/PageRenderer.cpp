#include <score/render/PageRenderer.hpp>

#include <score/css/ThemeCss.hpp>
#include <score/document/DocumentAssembler.hpp>
#include <score/html/HtmlEscape.hpp>

#include <score/log/TaggedLogger.hpp>

namespace SC::Render {

namespace {

constexpr auto kSignalPolyfillScript = "<script src=\"/_score/signal-polyfill.js\"></script>";
constexpr auto kRuntimeScript        = "<script src=\"/_score/score-runtime.js\"></script>";

template <typename T>
auto pick(std::optional<MetadataPatch> const& patch,
          std::optional<T> MetadataPatch::*patchField,
          Metadata const* metadata,
          T Metadata::*metadataField,
          T fallback) -> T {
    if (patch && (*patch).*patchField) {
        return *((*patch).*patchField);
    }
    if (metadata) {
        return metadata->*metadataField;
    }
    return fallback;
}

template <typename T>
auto pick_optional(std::optional<MetadataPatch> const& patch,
                   std::optional<T> MetadataPatch::*patchField,
                   Metadata const* metadata,
                   std::optional<T> Metadata::*metadataField) -> std::optional<T> {
    if (patch && (*patch).*patchField) {
        return (*patch).*patchField;
    }
    if (metadata) {
        return metadata->*metadataField;
    }
    return std::nullopt;
}

} // namespace

auto AssemblePage(PassOutputs                         passes,
                  std::optional<MetadataPatch> const& patch,
                  Metadata const*                     metadata,
                  Theme const*                        theme,
                  Environment                         environment) -> RenderResult {
    RenderResult result;
    result.component_css = std::move(passes.component_css);
    result.script        = std::move(passes.script);
    result.rule_count    = passes.rule_count;
    result.binding_count = passes.binding_count;
    result.environment   = environment;
    if (theme) {
        result.theme_css = Css::EmitThemeCss(*theme);
    }

    Document::DocumentParts parts;
    parts.title = Document::ComposeTitle(pick_optional(patch, &MetadataPatch::title, metadata, &Metadata::title),
                                         pick(patch, &MetadataPatch::title_separator, metadata,
                                              &Metadata::title_separator, std::string{" | "}),
                                         pick_optional(patch, &MetadataPatch::site, metadata, &Metadata::site));
    parts.description = pick_optional(patch, &MetadataPatch::description, metadata, &Metadata::description);
    parts.keywords    = pick(patch, &MetadataPatch::keywords, metadata, &Metadata::keywords, std::vector<std::string>{});

    auto const structured = pick(patch, &MetadataPatch::structured_data, metadata, &Metadata::structured_data,
                                 std::vector<nlohmann::json>{});
    for (auto const& payload : structured) {
        parts.structured_data.push_back(Html::EscapeScriptPayload(payload.dump()));
    }

    parts.theme_css     = result.theme_css;
    parts.component_css = result.component_css;
    parts.body_html     = std::move(passes.body_html);
    if (!result.script.empty()) {
        parts.scripts.emplace_back(kSignalPolyfillScript);
        parts.scripts.emplace_back(kRuntimeScript);
        parts.scripts.push_back(result.script);
    }
    if (theme) {
        parts.active_theme = theme->name;
    }

    result.html = Document::AssembleDocument(parts);
    sc_log("Rendered page in " + std::string{EnvironmentName(environment)} + " with "
                   + std::to_string(result.rule_count) + " rules and " + std::to_string(result.binding_count)
                   + " bindings",
           "Render");
    return result;
}

} // namespace SC::Render
