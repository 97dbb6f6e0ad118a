#pragma once

#include <score/core/Error.hpp>
#include <score/document/Metadata.hpp>
#include <score/modifier/ColorToken.hpp>
#include <score/theme/Theme.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace SC::Config {

/**
 * Site-wide settings loaded from a JSON document:
 *
 * {
 *   "metadata": { "site", "title", "title_separator", "description",
 *                 "keywords": [..], "structured_data": [{..}] },
 *   "theme":    { "extends": "default", "name", "color_roles": {..},
 *                 "custom_color_roles": { "brand": { "500": .. } },
 *                 "font_families": {..}, "type_scale_base", "type_scale_ratio",
 *                 "spacing_unit", "radius_base", "dark": {..}, "named": { "x": {..} } }
 * }
 *
 * Both sections are optional.
 */
struct SiteConfig {
    std::optional<Metadata> metadata;
    std::optional<Theme>    theme;
};

// Accepts "accent" (semantic), "blue-500" (palette), "brand-600" (custom scale),
// [l, c, h] (oklch) or {"name": "brand", "shade": 600}.
auto ParseColorToken(nlohmann::json const& value) -> Expected<ColorToken>;

auto ParseSiteConfig(std::string_view text) -> Expected<SiteConfig>;
auto LoadSiteConfig(std::filesystem::path const& path) -> Expected<SiteConfig>;

} // namespace SC::Config
