#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace SC {

// Application-wide document metadata.
struct Metadata {
    std::optional<std::string>  site;
    std::optional<std::string>  title;
    std::string                 title_separator{" | "};
    std::optional<std::string>  description;
    std::vector<std::string>    keywords;
    std::vector<nlohmann::json> structured_data;
};

// Page-level overrides; each present field replaces the application value.
struct MetadataPatch {
    std::optional<std::string>                 site;
    std::optional<std::string>                 title;
    std::optional<std::string>                 title_separator;
    std::optional<std::string>                 description;
    std::optional<std::vector<std::string>>    keywords;
    std::optional<std::vector<nlohmann::json>> structured_data;
};

} // namespace SC
