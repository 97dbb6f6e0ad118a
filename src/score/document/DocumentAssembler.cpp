#include <score/document/DocumentAssembler.hpp>

#include <score/html/HtmlEscape.hpp>

namespace SC::Document {

auto ComposeTitle(std::optional<std::string> const& page,
                  std::string const&                separator,
                  std::optional<std::string> const& site) -> std::optional<std::string> {
    if (page && site) {
        return *page + separator + *site;
    }
    if (page) {
        return page;
    }
    return site;
}

auto AssembleDocument(DocumentParts const& parts) -> std::string {
    std::string html = "<!DOCTYPE html>\n<html lang=\"en\"";
    if (parts.active_theme) {
        html.append(" data-theme=\"");
        Html::AppendEscapedAttribute(html, *parts.active_theme);
        html.push_back('"');
    }
    html.append(">\n<head>\n");
    html.append("<meta charset=\"utf-8\">\n");
    html.append("<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n");

    if (parts.title) {
        html.append("<title>");
        Html::AppendEscapedText(html, *parts.title);
        html.append("</title>\n");
    }

    if (parts.description && !parts.description->empty()) {
        html.append("<meta name=\"description\" content=\"");
        Html::AppendEscapedAttribute(html, *parts.description);
        html.append("\">\n");
    }

    if (!parts.keywords.empty()) {
        html.append("<meta name=\"keywords\" content=\"");
        for (std::size_t i = 0; i < parts.keywords.size(); ++i) {
            if (i > 0) {
                html.append(", ");
            }
            Html::AppendEscapedAttribute(html, parts.keywords[i]);
        }
        html.append("\">\n");
    }

    if (!parts.theme_css.empty()) {
        html.append("<style>\n").append(parts.theme_css).append("</style>\n");
    }
    if (!parts.component_css.empty()) {
        html.append("<style>\n").append(parts.component_css).append("</style>\n");
    }

    for (auto const& payload : parts.structured_data) {
        html.append("<script type=\"application/ld+json\">").append(payload).append("</script>\n");
    }

    html.append("</head>\n<body>\n");
    html.append(parts.body_html);
    html.push_back('\n');

    for (auto const& script : parts.scripts) {
        html.append(script).push_back('\n');
    }

    html.append("</body>\n</html>\n");
    return html;
}

} // namespace SC::Document
