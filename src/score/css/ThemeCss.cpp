#include <score/css/ThemeCss.hpp>

#include <score/css/CssValues.hpp>

#include <string_view>

namespace SC::Css {

namespace {

void append_property(std::string& out, std::string_view indent, std::string_view name, std::string_view value) {
    out.append(indent).append("--").append(name).append(": ").append(value).append(";\n");
}

void append_colors(std::string& out, std::string_view indent, ColorRoles const& roles) {
    for (auto const& [role, token] : roles) {
        append_property(out, indent, "color-" + role, CssValue(token));
    }
}

void append_custom_colors(std::string& out, std::string_view indent, CustomColorRoles const& roles) {
    for (auto const& [scale, shades] : roles) {
        for (auto const& [shade, token] : shades) {
            append_property(out, indent, "color-" + scale + "-" + std::to_string(shade), CssValue(token));
        }
    }
}

void append_fonts(std::string& out, std::string_view indent, FontFamilies const& families) {
    for (auto const& [key, stack] : families) {
        append_property(out, indent, "font-" + key, stack);
    }
}

void append_patch(std::string& out, std::string_view indent, ThemePatch const& patch) {
    if (patch.color_roles) {
        append_colors(out, indent, *patch.color_roles);
    }
    if (patch.custom_color_roles) {
        append_custom_colors(out, indent, *patch.custom_color_roles);
    }
    if (patch.font_families) {
        append_fonts(out, indent, *patch.font_families);
    }
    if (patch.type_scale_base) {
        append_property(out, indent, "type-scale-base", Px(*patch.type_scale_base));
    }
    if (patch.type_scale_ratio) {
        append_property(out, indent, "type-scale-ratio", Num(*patch.type_scale_ratio));
    }
    if (patch.spacing_unit) {
        append_property(out, indent, "spacing-unit", Px(*patch.spacing_unit));
    }
    if (patch.radius_base) {
        append_property(out, indent, "radius-base", Px(*patch.radius_base));
    }
}

} // namespace

auto EmitThemeCss(Theme const& theme) -> std::string {
    std::string out = ":root {\n";
    append_colors(out, "  ", theme.color_roles);
    append_custom_colors(out, "  ", theme.custom_color_roles);
    append_fonts(out, "  ", theme.font_families);
    append_property(out, "  ", "type-scale-base", Px(theme.type_scale_base));
    append_property(out, "  ", "type-scale-ratio", Num(theme.type_scale_ratio));
    append_property(out, "  ", "spacing-unit", Px(theme.spacing_unit));
    append_property(out, "  ", "radius-base", Px(theme.radius_base));
    out.append("}\n");

    if (theme.dark) {
        out.append("@media (prefers-color-scheme: dark) {\n");
        out.append("  :root {\n");
        append_patch(out, "    ", *theme.dark);
        out.append("  }\n");
        out.append("}\n");
    }

    for (auto const& [name, patch] : theme.named) {
        out.append("[data-theme=\"").append(name).append("\"] {\n");
        append_patch(out, "  ", patch);
        out.append("}\n");
    }
    return out;
}

} // namespace SC::Css
