#include <score/modifier/ColorToken.hpp>

#include <array>

namespace SC {

namespace {

constexpr std::array kSemanticColors{
        SemanticColor::Surface, SemanticColor::Text,        SemanticColor::Border,  SemanticColor::Accent,
        SemanticColor::Muted,   SemanticColor::Destructive, SemanticColor::Success,
};

constexpr std::array kPalettes{
        Palette::Neutral, Palette::Blue,  Palette::Red,  Palette::Green,   Palette::Amber,
        Palette::Sky,     Palette::Slate, Palette::Cyan, Palette::Emerald,
};

} // namespace

auto SemanticColorName(SemanticColor color) -> std::string_view {
    switch (color) {
    case SemanticColor::Surface:
        return "surface";
    case SemanticColor::Text:
        return "text";
    case SemanticColor::Border:
        return "border";
    case SemanticColor::Accent:
        return "accent";
    case SemanticColor::Muted:
        return "muted";
    case SemanticColor::Destructive:
        return "destructive";
    case SemanticColor::Success:
        return "success";
    }
    return "text";
}

auto PaletteName(Palette palette) -> std::string_view {
    switch (palette) {
    case Palette::Neutral:
        return "neutral";
    case Palette::Blue:
        return "blue";
    case Palette::Red:
        return "red";
    case Palette::Green:
        return "green";
    case Palette::Amber:
        return "amber";
    case Palette::Sky:
        return "sky";
    case Palette::Slate:
        return "slate";
    case Palette::Cyan:
        return "cyan";
    case Palette::Emerald:
        return "emerald";
    }
    return "neutral";
}

auto ParseSemanticColor(std::string_view name) -> std::optional<SemanticColor> {
    for (auto color : kSemanticColors) {
        if (SemanticColorName(color) == name) {
            return color;
        }
    }
    return std::nullopt;
}

auto ParsePalette(std::string_view name) -> std::optional<Palette> {
    for (auto palette : kPalettes) {
        if (PaletteName(palette) == name) {
            return palette;
        }
    }
    return std::nullopt;
}

} // namespace SC
