#include <doctest/doctest.h>
#include <score/css/CssConverterRegistry.hpp>
#include <score/css/CssValues.hpp>
#include <score/modifier/BehaviorModifiers.hpp>
#include <score/modifier/StyleModifiers.hpp>

#include <stdexcept>
#include <string>
#include <typeindex>

using namespace SC;
using namespace SC::Css;

namespace {

struct UnregisteredModifier {
    using modifier_tag = void;
};

struct TintModifier {
    using modifier_tag = void;
    int level{0};
};

struct OutlineWidthModifier {
    using modifier_tag = void;
    double width{1.0};
};

} // namespace

SCORE_REGISTER_CSS_CONVERTER(OutlineWidthModifier,
                             ([](OutlineWidthModifier const& modifier) -> SC::Css::Declarations {
                                 return {{"outline-width", SC::Css::Px(modifier.width)}};
                             }))

TEST_SUITE("css.registry") {

TEST_CASE("Builtin conversions cover every style and behavior kind") {
    auto& registry = CssConverterRegistry::instance();
    CHECK(registry.size() >= 19);
    CHECK(registry.find(std::type_index(typeid(PaddingModifier))) != nullptr);
    CHECK(registry.find(std::type_index(typeid(EventBindingModifier))) != nullptr);
    CHECK(registry.find(std::type_index(typeid(UnregisteredModifier))) == nullptr);
    CHECK(registry.typeName(std::type_index(typeid(BorderModifier))) == "BorderModifier");
}

TEST_CASE("Declarations follow modifier list order") {
    ModifierList modifiers{Padding(16), Background(SemanticColor::Accent), CornerRadius(8)};
    CHECK(DeclarationsFor(modifiers)
          == Declarations{{"padding", "16px"}, {"background-color", "var(--color-accent)"}, {"border-radius", "8px"}});
}

TEST_CASE("Behavior modifiers contribute no declarations") {
    ModifierList modifiers{OnClick("save"), AccessibilityLabel("Save"), AccessibilityHidden()};
    CHECK(DeclarationsFor(modifiers).empty());
}

TEST_CASE("Builtin conversions") {
    CHECK(DeclarationsFor({Border(1, SemanticColor::Border)})
          == Declarations{{"border", "1px solid var(--color-border)"}});

    BorderModifier topRule{.width = 2, .style = BorderStyle::Dashed, .color = PaletteColor{Palette::Red, 600}, .edges = Edge::Top, .radius = 4};
    CHECK(DeclarationsFor({topRule})
          == Declarations{{"border-top", "2px dashed var(--color-red-600)"}, {"border-radius", "4px"}});

    CHECK(DeclarationsFor({Flex(FlexDirection::Column, 24)})
          == Declarations{{"display", "flex"}, {"flex-direction", "column"}, {"flex-wrap", "nowrap"}, {"gap", "24px"}});
    CHECK(DeclarationsFor({Grid(3, 16)})
          == Declarations{{"display", "grid"}, {"grid-template-columns", "repeat(3, 1fr)"}, {"gap", "16px"}});
    CHECK(DeclarationsFor({FontSize(20, FontWeight::Semibold)})
          == Declarations{{"font-size", "20px"}, {"font-weight", "600"}});
    CHECK(DeclarationsFor({ForegroundColor(SemanticColor::Muted)})
          == Declarations{{"color", "var(--color-muted)"}});
    CHECK(DeclarationsFor({Frame(64, 32)}) == Declarations{{"width", "64px"}, {"height", "32px"}});
    CHECK(DeclarationsFor({Opacity(0.7)}) == Declarations{{"opacity", "0.7"}});
    CHECK(DeclarationsFor({Hidden()}) == Declarations{{"display", "none"}});
    CHECK(DeclarationsFor({ShadowModifier{.x = 0, .y = 2, .blur = 4, .spread = 0, .color = SemanticColor::Border}})
          == Declarations{{"box-shadow", "0px 2px 4px 0px var(--color-border)"}});
    CHECK(DeclarationsFor({TextStyleModifier{.line_clamp = 2}})
          == Declarations{{"display", "-webkit-box"},
                          {"-webkit-box-orient", "vertical"},
                          {"-webkit-line-clamp", "2"},
                          {"overflow", "hidden"}});
    CHECK(DeclarationsFor({PositionModifier{.position = PositionKind::Sticky, .top = 0, .z_index = 10}})
          == Declarations{{"position", "sticky"}, {"top", "0px"}, {"z-index", "10"}});
}

TEST_CASE("Unregistered modifier kinds are reported") {
    ModifierList modifiers{Padding(4), UnregisteredModifier{}};

    auto result = TryDeclarationsFor(modifiers);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::ConverterMissing);
    CHECK_THROWS_AS(DeclarationsFor(modifiers), std::logic_error);
}

TEST_CASE("Custom kinds register once") {
    auto& registry = CssConverterRegistry::instance();
    auto  convert  = [](TintModifier const& modifier) -> Declarations {
        return {{"filter", "brightness(" + std::to_string(modifier.level) + ")"}};
    };

    CHECK(registry.registerConverter<TintModifier>(convert, "TintModifier"));
    CHECK_FALSE(registry.registerConverter<TintModifier>(convert, "TintModifier"));
    CHECK(DeclarationsFor({TintModifier{.level = 2}}) == Declarations{{"filter", "brightness(2)"}});
}

TEST_CASE("Static registration macro installs a conversion") {
    CHECK(DeclarationsFor({OutlineWidthModifier{.width = 3}}) == Declarations{{"outline-width", "3px"}});
    CHECK(CssConverterRegistry::instance().typeName(std::type_index(typeid(OutlineWidthModifier)))
          == "OutlineWidthModifier");
}

} // TEST_SUITE
