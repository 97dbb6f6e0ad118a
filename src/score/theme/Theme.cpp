#include <score/theme/Theme.hpp>

namespace SC {

namespace {

auto oklch(double lightness, double chroma, double hue) -> ColorToken {
    return OklchColor{lightness, chroma, hue};
}

auto default_dark_patch() -> ThemePatch {
    ThemePatch patch;
    patch.color_roles = ColorRoles{
            {"surface", oklch(0.17, 0.014, 240)},
            {"text", oklch(0.93, 0.004, 240)},
            {"border", oklch(0.26, 0.012, 240)},
            {"accent", oklch(0.68, 0.13, 215)},
            {"muted", oklch(0.58, 0.006, 240)},
            {"destructive", oklch(0.65, 0.2, 25)},
            {"success", oklch(0.7, 0.17, 145)},
    };
    return patch;
}

} // namespace

auto DefaultTheme() -> Theme {
    Theme theme;
    theme.color_roles = ColorRoles{
            {"surface", oklch(1.0, 0.0, 0)},
            {"text", oklch(0.16, 0.0, 0)},
            {"border", oklch(0.88, 0.006, 240)},
            {"accent", oklch(0.52, 0.13, 215)},
            {"muted", oklch(0.50, 0.0, 0)},
            {"destructive", oklch(0.55, 0.22, 25)},
            {"success", oklch(0.6, 0.19, 145)},
    };
    theme.font_families = FontFamilies{
            {"sans",
             "ui-sans-serif, system-ui, -apple-system, BlinkMacSystemFont, \"Segoe UI\", Roboto, \"Helvetica Neue\", "
             "Arial, sans-serif"},
            {"mono", "ui-monospace, SFMono-Regular, Menlo, Monaco, Consolas, monospace"},
    };
    theme.type_scale_base  = 16.0;
    theme.type_scale_ratio = 1.25;
    theme.spacing_unit     = 4.0;
    theme.radius_base      = 8.0;
    theme.dark             = default_dark_patch();
    return theme;
}

} // namespace SC
