#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace SC {

// Theme roles resolved through `--color-<role>` custom properties.
enum class SemanticColor {
    Surface,
    Text,
    Border,
    Accent,
    Muted,
    Destructive,
    Success,
};

enum class Palette {
    Neutral,
    Blue,
    Red,
    Green,
    Amber,
    Sky,
    Slate,
    Cyan,
    Emerald,
};

struct PaletteColor {
    Palette palette{Palette::Neutral};
    int     shade{500};

    auto operator==(PaletteColor const&) const -> bool = default;
};

struct OklchColor {
    double lightness{0.0};
    double chroma{0.0};
    double hue{0.0};

    auto operator==(OklchColor const&) const -> bool = default;
};

struct CustomColor {
    std::string name;
    int         shade{500};

    auto operator==(CustomColor const&) const -> bool = default;
};

using ColorToken = std::variant<SemanticColor, PaletteColor, OklchColor, CustomColor>;

auto SemanticColorName(SemanticColor color) -> std::string_view;
auto PaletteName(Palette palette) -> std::string_view;
auto ParseSemanticColor(std::string_view name) -> std::optional<SemanticColor>;
auto ParsePalette(std::string_view name) -> std::optional<Palette>;

} // namespace SC
