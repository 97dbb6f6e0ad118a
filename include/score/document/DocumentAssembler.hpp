#pragma once

#include <optional>
#include <string>
#include <vector>

namespace SC::Document {

struct DocumentParts {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::vector<std::string>   keywords;
    // Serialized JSON-LD payloads, already escaped for a script element.
    std::vector<std::string>   structured_data;
    std::string                theme_css;
    std::string                component_css;
    std::string                body_html;
    // Complete script elements appended before </body>.
    std::vector<std::string>   scripts;
    std::optional<std::string> active_theme;
};

// `page + separator + site`, whichever one is present, or nullopt when both are absent.
auto ComposeTitle(std::optional<std::string> const& page,
                  std::string const&                separator,
                  std::optional<std::string> const& site) -> std::optional<std::string>;

auto AssembleDocument(DocumentParts const& parts) -> std::string;

} // namespace SC::Document
