#include <score/css/CssConverterRegistry.hpp>
#include <score/css/CssValues.hpp>
#include <score/modifier/BehaviorModifiers.hpp>
#include <score/modifier/StyleModifiers.hpp>

#include <score/log/TaggedLogger.hpp>

#include <optional>
#include <string>

namespace SC::Css {

namespace {

auto padding_declarations(PaddingModifier const& modifier) -> Declarations {
    return SpacingDeclarations("padding", modifier.value, modifier.edges);
}

auto margin_declarations(MarginModifier const& modifier) -> Declarations {
    return SpacingDeclarations("margin", modifier.value, modifier.edges);
}

auto background_declarations(BackgroundModifier const& modifier) -> Declarations {
    return {{"background-color", CssValue(modifier.color)}};
}

auto font_declarations(FontModifier const& modifier) -> Declarations {
    Declarations result;
    if (modifier.family) {
        result.push_back({"font-family", CssValue(*modifier.family)});
    }
    if (modifier.size) {
        result.push_back({"font-size", Px(*modifier.size)});
    }
    if (modifier.weight) {
        result.push_back({"font-weight", std::string{CssValue(*modifier.weight)}});
    }
    if (modifier.tracking) {
        result.push_back({"letter-spacing", Px(*modifier.tracking)});
    }
    if (modifier.line_height) {
        result.push_back({"line-height", Num(*modifier.line_height)});
    }
    if (modifier.color) {
        result.push_back({"color", CssValue(*modifier.color)});
    }
    return result;
}

auto text_style_declarations(TextStyleModifier const& modifier) -> Declarations {
    Declarations result;
    if (modifier.align) {
        result.push_back({"text-align", std::string{CssValue(*modifier.align)}});
    }
    if (modifier.transform) {
        result.push_back({"text-transform", std::string{CssValue(*modifier.transform)}});
    }
    if (modifier.decoration) {
        result.push_back({"text-decoration", std::string{CssValue(*modifier.decoration)}});
    }
    if (modifier.white_space) {
        result.push_back({"white-space", std::string{CssValue(*modifier.white_space)}});
    }
    if (modifier.line_clamp) {
        result.push_back({"display", "-webkit-box"});
        result.push_back({"-webkit-box-orient", "vertical"});
        result.push_back({"-webkit-line-clamp", std::to_string(*modifier.line_clamp)});
        result.push_back({"overflow", "hidden"});
    }
    return result;
}

auto size_declarations(SizeModifier const& modifier) -> Declarations {
    Declarations result;
    auto append = [&](char const* property, std::optional<double> const& value) {
        if (value) {
            result.push_back({property, Px(*value)});
        }
    };
    append("width", modifier.width);
    append("min-width", modifier.min_width);
    append("max-width", modifier.max_width);
    append("height", modifier.height);
    append("min-height", modifier.min_height);
    append("max-height", modifier.max_height);
    return result;
}

auto shadow_declarations(ShadowModifier const& modifier) -> Declarations {
    std::string value = Px(modifier.x);
    value += ' ';
    value += Px(modifier.y);
    value += ' ';
    value += Px(modifier.blur);
    value += ' ';
    value += Px(modifier.spread);
    value += ' ';
    value += CssValue(modifier.color);
    return {{"box-shadow", std::move(value)}};
}

auto border_declarations(BorderModifier const& modifier) -> Declarations {
    Declarations result;
    std::string  shorthand = Px(modifier.width) + " " + std::string{CssValue(modifier.style)} + " " + CssValue(modifier.color);
    if (modifier.edges.empty()) {
        result.push_back({"border", shorthand});
    } else {
        for (auto edge : kEdgeOrder) {
            if (modifier.edges.contains(edge)) {
                result.push_back({"border-" + std::string{EdgeSuffix(edge)}, shorthand});
            }
        }
    }
    if (modifier.radius) {
        result.push_back({"border-radius", Px(*modifier.radius)});
    }
    return result;
}

auto flex_declarations(FlexModifier const& modifier) -> Declarations {
    Declarations result{
        {"display", "flex"},
        {"flex-direction", std::string{CssValue(modifier.direction)}},
        {"flex-wrap", modifier.wrap ? "wrap" : "nowrap"},
    };
    if (modifier.justify) {
        result.push_back({"justify-content", std::string{CssValue(*modifier.justify)}});
    }
    if (modifier.align) {
        result.push_back({"align-items", std::string{CssValue(*modifier.align)}});
    }
    if (modifier.gap) {
        result.push_back({"gap", Px(*modifier.gap)});
    }
    return result;
}

auto grid_declarations(GridModifier const& modifier) -> Declarations {
    Declarations result{
        {"display", "grid"},
        {"grid-template-columns", "repeat(" + std::to_string(modifier.columns) + ", 1fr)"},
    };
    if (modifier.rows) {
        result.push_back({"grid-template-rows", "repeat(" + std::to_string(*modifier.rows) + ", 1fr)"});
    }
    if (modifier.gap) {
        result.push_back({"gap", Px(*modifier.gap)});
    }
    if (modifier.auto_flow) {
        result.push_back({"grid-auto-flow", std::string{CssValue(*modifier.auto_flow)}});
    }
    return result;
}

auto position_declarations(PositionModifier const& modifier) -> Declarations {
    Declarations result{{"position", std::string{CssValue(modifier.position)}}};
    if (modifier.top) {
        result.push_back({"top", Px(*modifier.top)});
    }
    if (modifier.trailing) {
        result.push_back({"inset-inline-end", Px(*modifier.trailing)});
    }
    if (modifier.bottom) {
        result.push_back({"bottom", Px(*modifier.bottom)});
    }
    if (modifier.leading) {
        result.push_back({"inset-inline-start", Px(*modifier.leading)});
    }
    if (modifier.z_index) {
        result.push_back({"z-index", std::to_string(*modifier.z_index)});
    }
    return result;
}

} // namespace

void RegisterBuiltinCssConverters(CssConverterRegistry& registry) {
    bool ok = true;
    ok &= registry.registerConverter<PaddingModifier>(padding_declarations, "PaddingModifier");
    ok &= registry.registerConverter<MarginModifier>(margin_declarations, "MarginModifier");
    ok &= registry.registerConverter<BackgroundModifier>(background_declarations, "BackgroundModifier");
    ok &= registry.registerConverter<FontModifier>(font_declarations, "FontModifier");
    ok &= registry.registerConverter<TextStyleModifier>(text_style_declarations, "TextStyleModifier");
    ok &= registry.registerConverter<SizeModifier>(size_declarations, "SizeModifier");
    ok &= registry.registerConverter<AspectRatioModifier>(
        [](AspectRatioModifier const& modifier) -> Declarations {
            return {{"aspect-ratio", Num(modifier.ratio)}};
        },
        "AspectRatioModifier");
    ok &= registry.registerConverter<OpacityModifier>(
        [](OpacityModifier const& modifier) -> Declarations {
            return {{"opacity", Num(modifier.value)}};
        },
        "OpacityModifier");
    ok &= registry.registerConverter<ShadowModifier>(shadow_declarations, "ShadowModifier");
    ok &= registry.registerConverter<RadiusModifier>(
        [](RadiusModifier const& modifier) -> Declarations {
            return {{"border-radius", Px(modifier.value)}};
        },
        "RadiusModifier");
    ok &= registry.registerConverter<BorderModifier>(border_declarations, "BorderModifier");
    ok &= registry.registerConverter<HiddenModifier>(
        [](HiddenModifier const&) -> Declarations {
            return {{"display", "none"}};
        },
        "HiddenModifier");
    ok &= registry.registerConverter<FlexModifier>(flex_declarations, "FlexModifier");
    ok &= registry.registerConverter<GridModifier>(grid_declarations, "GridModifier");
    ok &= registry.registerConverter<CursorModifier>(
        [](CursorModifier const& modifier) -> Declarations {
            return {{"cursor", std::string{CssValue(modifier.cursor)}}};
        },
        "CursorModifier");
    ok &= registry.registerConverter<UserSelectModifier>(
        [](UserSelectModifier const& modifier) -> Declarations {
            return {{"user-select", std::string{CssValue(modifier.value)}}};
        },
        "UserSelectModifier");
    ok &= registry.registerConverter<PositionModifier>(position_declarations, "PositionModifier");

    // Behavior modifiers carry no styling.
    ok &= registry.registerConverter<EventBindingModifier>(
        [](EventBindingModifier const&) -> Declarations { return {}; },
        "EventBindingModifier");
    ok &= registry.registerConverter<AccessibilityModifier>(
        [](AccessibilityModifier const&) -> Declarations { return {}; },
        "AccessibilityModifier");

    if (!ok) {
        sc_log("Some builtin CSS converters were already registered", "CssRegistry");
    }
}

} // namespace SC::Css
