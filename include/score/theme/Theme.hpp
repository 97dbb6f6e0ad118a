#pragma once

#include <score/modifier/ColorToken.hpp>

#include <map>
#include <optional>
#include <string>

namespace SC {

using ColorRoles       = std::map<std::string, ColorToken>;
using CustomColorRoles = std::map<std::string, std::map<int, ColorToken>>;
using FontFamilies     = std::map<std::string, std::string>;

// Partial override layered over a theme: the dark variant or a named variant.
struct ThemePatch {
    std::optional<ColorRoles>       color_roles;
    std::optional<CustomColorRoles> custom_color_roles;
    std::optional<FontFamilies>     font_families;
    std::optional<double>           type_scale_base;
    std::optional<double>           type_scale_ratio;
    std::optional<double>           spacing_unit;
    std::optional<double>           radius_base;
};

/**
 * Design tokens emitted as CSS custom properties ahead of component rules.
 *
 * Maps are ordered, so emission is sorted by key. `name` marks the active
 * named theme and is written to `<html data-theme>`.
 */
struct Theme {
    std::optional<std::string>        name;
    ColorRoles                        color_roles;
    CustomColorRoles                  custom_color_roles;
    FontFamilies                      font_families;
    double                            type_scale_base{16.0};
    double                            type_scale_ratio{1.25};
    double                            spacing_unit{4.0};
    double                            radius_base{4.0};
    std::optional<ThemePatch>         dark;
    std::map<std::string, ThemePatch> named;
};

auto DefaultTheme() -> Theme;

} // namespace SC
