#pragma once

#include <score/modifier/ColorToken.hpp>
#include <score/modifier/Edges.hpp>
#include <score/modifier/Typography.hpp>

#include <optional>
#include <utility>

namespace SC {

enum class FlexDirection {
    Row,
    Column,
    RowReverse,
    ColumnReverse,
};

enum class JustifyContent {
    Start,
    Center,
    End,
    SpaceBetween,
    SpaceAround,
    SpaceEvenly,
};

enum class AlignItems {
    Stretch,
    Start,
    Center,
    End,
    Baseline,
};

enum class GridAutoFlow {
    Row,
    Column,
    Dense,
    RowDense,
    ColumnDense,
};

enum class BorderStyle {
    Solid,
    Dashed,
    Dotted,
    Double,
    None,
};

enum class Cursor {
    Auto,
    Default,
    Pointer,
    Text,
    Move,
    NotAllowed,
    Grab,
};

enum class UserSelect {
    Auto,
    None,
    Text,
    All,
};

enum class PositionKind {
    Static,
    Relative,
    Absolute,
    Fixed,
    Sticky,
};

struct PaddingModifier {
    using modifier_tag = void;
    double value{0.0};
    Edges  edges{};
};

struct MarginModifier {
    using modifier_tag = void;
    double value{0.0};
    Edges  edges{};
};

struct BackgroundModifier {
    using modifier_tag = void;
    ColorToken color{SemanticColor::Surface};
};

struct FontModifier {
    using modifier_tag = void;
    std::optional<FontFamily> family;
    std::optional<double>     size;
    std::optional<FontWeight> weight;
    std::optional<double>     tracking;
    std::optional<double>     line_height;
    std::optional<ColorToken> color;
};

struct TextStyleModifier {
    using modifier_tag = void;
    std::optional<TextAlign>      align;
    std::optional<TextTransform>  transform;
    std::optional<TextDecoration> decoration;
    std::optional<WhiteSpace>     white_space;
    std::optional<int>            line_clamp;
};

struct SizeModifier {
    using modifier_tag = void;
    std::optional<double> width;
    std::optional<double> min_width;
    std::optional<double> max_width;
    std::optional<double> height;
    std::optional<double> min_height;
    std::optional<double> max_height;
};

struct AspectRatioModifier {
    using modifier_tag = void;
    double ratio{1.0};
};

struct OpacityModifier {
    using modifier_tag = void;
    double value{1.0};
};

struct ShadowModifier {
    using modifier_tag = void;
    double     x{0.0};
    double     y{0.0};
    double     blur{0.0};
    double     spread{0.0};
    ColorToken color{SemanticColor::Border};
};

struct RadiusModifier {
    using modifier_tag = void;
    double value{0.0};
};

struct BorderModifier {
    using modifier_tag = void;
    double                width{1.0};
    BorderStyle           style{BorderStyle::Solid};
    ColorToken            color{SemanticColor::Border};
    Edges                 edges{};
    std::optional<double> radius;
};

struct HiddenModifier {
    using modifier_tag = void;
};

struct FlexModifier {
    using modifier_tag = void;
    FlexDirection                 direction{FlexDirection::Row};
    bool                          wrap{false};
    std::optional<JustifyContent> justify;
    std::optional<AlignItems>     align;
    std::optional<double>         gap;
};

struct GridModifier {
    using modifier_tag = void;
    int                         columns{1};
    std::optional<int>          rows;
    std::optional<double>       gap;
    std::optional<GridAutoFlow> auto_flow;
};

struct CursorModifier {
    using modifier_tag = void;
    Cursor cursor{Cursor::Auto};
};

struct UserSelectModifier {
    using modifier_tag = void;
    UserSelect value{UserSelect::Auto};
};

struct PositionModifier {
    using modifier_tag = void;
    PositionKind          position{PositionKind::Relative};
    std::optional<double> top;
    std::optional<double> trailing;
    std::optional<double> bottom;
    std::optional<double> leading;
    std::optional<int>    z_index;
};

inline auto Padding(double value, Edges edges = {}) -> PaddingModifier {
    return PaddingModifier{.value = value, .edges = edges};
}

inline auto Margin(double value, Edges edges = {}) -> MarginModifier {
    return MarginModifier{.value = value, .edges = edges};
}

inline auto Background(ColorToken color) -> BackgroundModifier {
    return BackgroundModifier{.color = std::move(color)};
}

inline auto ForegroundColor(ColorToken color) -> FontModifier {
    return FontModifier{.color = std::move(color)};
}

inline auto FontSize(double size, std::optional<FontWeight> weight = std::nullopt) -> FontModifier {
    return FontModifier{.size = size, .weight = weight};
}

inline auto Frame(std::optional<double> width, std::optional<double> height = std::nullopt) -> SizeModifier {
    return SizeModifier{.width = width, .height = height};
}

inline auto Opacity(double value) -> OpacityModifier {
    return OpacityModifier{.value = value};
}

inline auto CornerRadius(double value) -> RadiusModifier {
    return RadiusModifier{.value = value};
}

inline auto Border(double width, ColorToken color, BorderStyle style = BorderStyle::Solid) -> BorderModifier {
    return BorderModifier{.width = width, .style = style, .color = std::move(color)};
}

inline auto Hidden() -> HiddenModifier {
    return HiddenModifier{};
}

inline auto Flex(FlexDirection direction, std::optional<double> gap = std::nullopt) -> FlexModifier {
    return FlexModifier{.direction = direction, .gap = gap};
}

inline auto Grid(int columns, std::optional<double> gap = std::nullopt) -> GridModifier {
    return GridModifier{.columns = columns, .gap = gap};
}

} // namespace SC
