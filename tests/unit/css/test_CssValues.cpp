#include <doctest/doctest.h>
#include <score/css/CssValues.hpp>
#include <score/util/NumberFormat.hpp>

#include <cmath>
#include <limits>

using namespace SC;
using namespace SC::Css;

TEST_SUITE("css.values") {

TEST_CASE("Numbers drop a zero fractional part") {
    CHECK(FormatNumber(16.0) == "16");
    CHECK(FormatNumber(-3.0) == "-3");
    CHECK(FormatNumber(0.0) == "0");
    CHECK(FormatNumber(-0.0) == "0");
    CHECK(FormatNumber(1.5) == "1.5");
    CHECK(FormatNumber(0.25) == "0.25");
    CHECK(FormatNumber(std::numeric_limits<double>::quiet_NaN()) == "NaN");
    CHECK(FormatNumber(-std::numeric_limits<double>::infinity()) == "-Infinity");

    CHECK(Px(16) == "16px");
    CHECK(Px(0.5) == "0.5px");
    CHECK(Num(1.25) == "1.25");
}

TEST_CASE("Spacing collapses to the shorthand for empty or complete edge sets") {
    CHECK(SpacingDeclarations("padding", 16, {}) == Declarations{{"padding", "16px"}});
    CHECK(SpacingDeclarations("margin", 4, Edges::all()) == Declarations{{"margin", "4px"}});
    CHECK(SpacingDeclarations("padding", 8, Edge::Top | Edge::Bottom | Edge::Horizontal)
          == Declarations{{"padding", "8px"}});
}

TEST_CASE("Spacing expands partial edge sets in fixed order") {
    CHECK(SpacingDeclarations("padding", 8, Edge::Top) == Declarations{{"padding-top", "8px"}});
    CHECK(SpacingDeclarations("margin", 2, Edge::Trailing | Edge::Top)
          == Declarations{{"margin-top", "2px"}, {"margin-inline-end", "2px"}});
    CHECK(SpacingDeclarations("padding", 12, Edge::Vertical)
          == Declarations{{"padding-block", "12px"}});
    CHECK(SpacingDeclarations("padding", 12, Edge::Horizontal)
          == Declarations{{"padding-inline", "12px"}});
}

TEST_CASE("Edge sets report full coverage") {
    CHECK(Edges{}.empty());
    CHECK_FALSE(Edges{Edge::Top}.covers_all_sides());
    CHECK((Edge::Vertical | Edge::Horizontal).covers_all_sides());
    CHECK((Edge::Top | Edge::Bottom | Edge::Leading | Edge::Trailing).covers_all_sides());
    CHECK_FALSE((Edge::Top | Edge::Bottom | Edge::Leading).covers_all_sides());
}

TEST_CASE("Color tokens map to custom properties or literal oklch") {
    CHECK(CssValue(ColorToken{SemanticColor::Accent}) == "var(--color-accent)");
    CHECK(CssValue(ColorToken{PaletteColor{Palette::Blue, 500}}) == "var(--color-blue-500)");
    CHECK(CssValue(ColorToken{OklchColor{0.5, 0.1, 200}}) == "oklch(0.5 0.1 200)");
    CHECK(CssValue(ColorToken{CustomColor{"brand", 600}}) == "var(--color-brand-600)");
}

TEST_CASE("Color names parse back to their tokens") {
    CHECK(SemanticColorName(SemanticColor::Destructive) == "destructive");
    CHECK(ParseSemanticColor("muted") == SemanticColor::Muted);
    CHECK_FALSE(ParseSemanticColor("Muted").has_value());
    CHECK(PaletteName(Palette::Emerald) == "emerald");
    CHECK(ParsePalette("slate") == Palette::Slate);
    CHECK_FALSE(ParsePalette("brand").has_value());
}

TEST_CASE("Keyword values") {
    CHECK(CssValue(FontFamily{FontFamily::Kind::Mono}) == "var(--font-mono)");
    CHECK(CssValue(FontFamily::Custom("Inter")) == "\"Inter\", var(--font-sans)");
    CHECK(CssValue(FontFamily::Custom("Fira Code", FontFamily::Kind::Mono)) == "\"Fira Code\", var(--font-mono)");
    CHECK(CssValue(FontWeight::Semibold) == "600");
    CHECK(CssValue(JustifyContent::SpaceBetween) == "space-between");
    CHECK(CssValue(AlignItems::End) == "flex-end");
    CHECK(CssValue(GridAutoFlow::ColumnDense) == "column dense");
    CHECK(CssValue(Cursor::NotAllowed) == "not-allowed");
    CHECK(CssValue(WhiteSpace::PreWrap) == "pre-wrap");
    CHECK(CssValue(TextDecoration::LineThrough) == "line-through");
}

} // TEST_SUITE
