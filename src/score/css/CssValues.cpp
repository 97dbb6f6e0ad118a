#include <score/css/CssValues.hpp>

#include <score/util/NumberFormat.hpp>

#include <type_traits>
#include <variant>

namespace SC::Css {

namespace {

auto font_kind_value(FontFamily::Kind kind) -> std::string_view {
    switch (kind) {
    case FontFamily::Kind::System:
        return "system-ui, -apple-system, sans-serif";
    case FontFamily::Kind::Sans:
        return "var(--font-sans)";
    case FontFamily::Kind::Mono:
        return "var(--font-mono)";
    case FontFamily::Kind::Serif:
        return "var(--font-serif)";
    case FontFamily::Kind::Brand:
        return "var(--font-brand)";
    case FontFamily::Kind::Custom:
        break;
    }
    return "system-ui, -apple-system, sans-serif";
}

} // namespace

auto Px(double value) -> std::string {
    return FormatNumber(value) + "px";
}

auto Num(double value) -> std::string {
    return FormatNumber(value);
}

auto EdgeSuffix(Edge edge) -> std::string_view {
    switch (edge) {
    case Edge::Top:
        return "top";
    case Edge::Bottom:
        return "bottom";
    case Edge::Leading:
        return "inline-start";
    case Edge::Trailing:
        return "inline-end";
    case Edge::Horizontal:
        return "inline";
    case Edge::Vertical:
        return "block";
    }
    return "top";
}

auto SpacingDeclarations(std::string_view base, double value, Edges edges) -> Declarations {
    if (edges.empty() || edges.covers_all_sides()) {
        return {CssDeclaration{std::string{base}, Px(value)}};
    }
    Declarations result;
    for (auto edge : kEdgeOrder) {
        if (edges.contains(edge)) {
            std::string property{base};
            property.push_back('-');
            property.append(EdgeSuffix(edge));
            result.push_back(CssDeclaration{std::move(property), Px(value)});
        }
    }
    return result;
}

auto CssValue(ColorToken const& color) -> std::string {
    return std::visit(
        [](auto const& token) -> std::string {
            using T = std::decay_t<decltype(token)>;
            if constexpr (std::is_same_v<T, SemanticColor>) {
                return "var(--color-" + std::string{SemanticColorName(token)} + ")";
            } else if constexpr (std::is_same_v<T, PaletteColor>) {
                return "var(--color-" + std::string{PaletteName(token.palette)} + "-" + std::to_string(token.shade) + ")";
            } else if constexpr (std::is_same_v<T, OklchColor>) {
                return "oklch(" + FormatNumber(token.lightness) + " " + FormatNumber(token.chroma) + " "
                       + FormatNumber(token.hue) + ")";
            } else {
                return "var(--color-" + token.name + "-" + std::to_string(token.shade) + ")";
            }
        },
        color);
}

auto CssValue(FontFamily const& family) -> std::string {
    if (family.kind == FontFamily::Kind::Custom) {
        return "\"" + family.name + "\", " + std::string{font_kind_value(family.fallback)};
    }
    return std::string{font_kind_value(family.kind)};
}

auto CssValue(FontWeight weight) -> std::string_view {
    switch (weight) {
    case FontWeight::Thin:
        return "100";
    case FontWeight::Light:
        return "300";
    case FontWeight::Regular:
        return "400";
    case FontWeight::Medium:
        return "500";
    case FontWeight::Semibold:
        return "600";
    case FontWeight::Bold:
        return "700";
    case FontWeight::Black:
        return "900";
    }
    return "400";
}

auto CssValue(TextAlign align) -> std::string_view {
    switch (align) {
    case TextAlign::Start:
        return "start";
    case TextAlign::Center:
        return "center";
    case TextAlign::End:
        return "end";
    case TextAlign::Justify:
        return "justify";
    }
    return "start";
}

auto CssValue(TextTransform transform) -> std::string_view {
    switch (transform) {
    case TextTransform::None:
        return "none";
    case TextTransform::Uppercase:
        return "uppercase";
    case TextTransform::Lowercase:
        return "lowercase";
    case TextTransform::Capitalize:
        return "capitalize";
    }
    return "none";
}

auto CssValue(TextDecoration decoration) -> std::string_view {
    switch (decoration) {
    case TextDecoration::None:
        return "none";
    case TextDecoration::Underline:
        return "underline";
    case TextDecoration::LineThrough:
        return "line-through";
    case TextDecoration::Overline:
        return "overline";
    }
    return "none";
}

auto CssValue(WhiteSpace whiteSpace) -> std::string_view {
    switch (whiteSpace) {
    case WhiteSpace::Normal:
        return "normal";
    case WhiteSpace::NoWrap:
        return "nowrap";
    case WhiteSpace::Pre:
        return "pre";
    case WhiteSpace::PreWrap:
        return "pre-wrap";
    case WhiteSpace::PreLine:
        return "pre-line";
    }
    return "normal";
}

auto CssValue(FlexDirection direction) -> std::string_view {
    switch (direction) {
    case FlexDirection::Row:
        return "row";
    case FlexDirection::Column:
        return "column";
    case FlexDirection::RowReverse:
        return "row-reverse";
    case FlexDirection::ColumnReverse:
        return "column-reverse";
    }
    return "row";
}

auto CssValue(JustifyContent justify) -> std::string_view {
    switch (justify) {
    case JustifyContent::Start:
        return "flex-start";
    case JustifyContent::Center:
        return "center";
    case JustifyContent::End:
        return "flex-end";
    case JustifyContent::SpaceBetween:
        return "space-between";
    case JustifyContent::SpaceAround:
        return "space-around";
    case JustifyContent::SpaceEvenly:
        return "space-evenly";
    }
    return "flex-start";
}

auto CssValue(AlignItems align) -> std::string_view {
    switch (align) {
    case AlignItems::Stretch:
        return "stretch";
    case AlignItems::Start:
        return "flex-start";
    case AlignItems::Center:
        return "center";
    case AlignItems::End:
        return "flex-end";
    case AlignItems::Baseline:
        return "baseline";
    }
    return "stretch";
}

auto CssValue(GridAutoFlow flow) -> std::string_view {
    switch (flow) {
    case GridAutoFlow::Row:
        return "row";
    case GridAutoFlow::Column:
        return "column";
    case GridAutoFlow::Dense:
        return "dense";
    case GridAutoFlow::RowDense:
        return "row dense";
    case GridAutoFlow::ColumnDense:
        return "column dense";
    }
    return "row";
}

auto CssValue(BorderStyle style) -> std::string_view {
    switch (style) {
    case BorderStyle::Solid:
        return "solid";
    case BorderStyle::Dashed:
        return "dashed";
    case BorderStyle::Dotted:
        return "dotted";
    case BorderStyle::Double:
        return "double";
    case BorderStyle::None:
        return "none";
    }
    return "solid";
}

auto CssValue(Cursor cursor) -> std::string_view {
    switch (cursor) {
    case Cursor::Auto:
        return "auto";
    case Cursor::Default:
        return "default";
    case Cursor::Pointer:
        return "pointer";
    case Cursor::Text:
        return "text";
    case Cursor::Move:
        return "move";
    case Cursor::NotAllowed:
        return "not-allowed";
    case Cursor::Grab:
        return "grab";
    }
    return "auto";
}

auto CssValue(UserSelect select) -> std::string_view {
    switch (select) {
    case UserSelect::Auto:
        return "auto";
    case UserSelect::None:
        return "none";
    case UserSelect::Text:
        return "text";
    case UserSelect::All:
        return "all";
    }
    return "auto";
}

auto CssValue(PositionKind position) -> std::string_view {
    switch (position) {
    case PositionKind::Static:
        return "static";
    case PositionKind::Relative:
        return "relative";
    case PositionKind::Absolute:
        return "absolute";
    case PositionKind::Fixed:
        return "fixed";
    case PositionKind::Sticky:
        return "sticky";
    }
    return "static";
}

} // namespace SC::Css
