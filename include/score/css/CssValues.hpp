#pragma once

#include <score/css/CssDeclaration.hpp>
#include <score/modifier/ColorToken.hpp>
#include <score/modifier/Edges.hpp>
#include <score/modifier/StyleModifiers.hpp>
#include <score/modifier/Typography.hpp>

#include <string>
#include <string_view>

namespace SC::Css {

auto Px(double value) -> std::string;
auto Num(double value) -> std::string;

auto EdgeSuffix(Edge edge) -> std::string_view;

// `base: v` when edges is empty or covers every side, otherwise one `base-<edge>: v` per edge.
auto SpacingDeclarations(std::string_view base, double value, Edges edges) -> Declarations;

auto CssValue(ColorToken const& color) -> std::string;
auto CssValue(FontFamily const& family) -> std::string;
auto CssValue(FontWeight weight) -> std::string_view;
auto CssValue(TextAlign align) -> std::string_view;
auto CssValue(TextTransform transform) -> std::string_view;
auto CssValue(TextDecoration decoration) -> std::string_view;
auto CssValue(WhiteSpace whiteSpace) -> std::string_view;
auto CssValue(FlexDirection direction) -> std::string_view;
auto CssValue(JustifyContent justify) -> std::string_view;
auto CssValue(AlignItems align) -> std::string_view;
auto CssValue(GridAutoFlow flow) -> std::string_view;
auto CssValue(BorderStyle style) -> std::string_view;
auto CssValue(Cursor cursor) -> std::string_view;
auto CssValue(UserSelect select) -> std::string_view;
auto CssValue(PositionKind position) -> std::string_view;

} // namespace SC::Css
