#include <score/config/SiteConfig.hpp>

#include <score/log/TaggedLogger.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>

namespace SC::Config {

namespace {

using json = nlohmann::json;

auto type_error(std::string const& where, std::string_view expected) -> Error {
    return Error{Error::Code::InvalidType, where + ": expected " + std::string{expected}};
}

// Names end up in custom property names and [data-theme] selectors.
auto is_css_name(std::string_view text) -> bool {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) {
        return std::isalnum(ch) || ch == '-' || ch == '_';
    });
}

// Font stacks are emitted as declaration values inside a <style> element.
auto is_font_stack(std::string_view text) -> bool {
    return std::none_of(text.begin(), text.end(), [](unsigned char ch) {
        return std::iscntrl(ch) || ch == '<' || ch == '>' || ch == '{' || ch == '}' || ch == ';' || ch == '\\';
    });
}

auto name_error(std::string const& where, std::string const& name) -> Error {
    return Error{Error::Code::MalformedInput, where + ": '" + name + "' is not a valid name"};
}

auto parse_shade(std::string_view text) -> std::optional<int> {
    int value = 0;
    auto const* begin = text.data();
    auto const* end   = text.data() + text.size();
    auto [ptr, ec]    = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

auto read_string(json const& object, char const* key, std::string const& where)
        -> Expected<std::optional<std::string>> {
    if (!object.contains(key) || object[key].is_null()) {
        return std::optional<std::string>{};
    }
    if (!object[key].is_string()) {
        return std::unexpected(type_error(where + "." + key, "string"));
    }
    return std::optional<std::string>{object[key].get<std::string>()};
}

auto read_number(json const& object, char const* key, std::string const& where) -> Expected<std::optional<double>> {
    if (!object.contains(key) || object[key].is_null()) {
        return std::optional<double>{};
    }
    if (!object[key].is_number()) {
        return std::unexpected(type_error(where + "." + key, "number"));
    }
    return std::optional<double>{object[key].get<double>()};
}

auto read_string_list(json const& object, char const* key, std::string const& where)
        -> Expected<std::optional<std::vector<std::string>>> {
    if (!object.contains(key) || object[key].is_null()) {
        return std::optional<std::vector<std::string>>{};
    }
    auto const& list = object[key];
    if (!list.is_array()) {
        return std::unexpected(type_error(where + "." + key, "array of strings"));
    }
    std::vector<std::string> values;
    for (auto const& entry : list) {
        if (!entry.is_string()) {
            return std::unexpected(type_error(where + "." + key, "array of strings"));
        }
        values.push_back(entry.get<std::string>());
    }
    return std::optional<std::vector<std::string>>{std::move(values)};
}

auto read_color_roles(json const& value, std::string const& where) -> Expected<ColorRoles> {
    if (!value.is_object()) {
        return std::unexpected(type_error(where, "object"));
    }
    ColorRoles roles;
    for (auto const& [role, token] : value.items()) {
        if (!is_css_name(role)) {
            return std::unexpected(name_error(where, role));
        }
        auto parsed = ParseColorToken(token);
        if (!parsed) {
            return std::unexpected(Error{parsed.error().code, where + "." + role + ": " + parsed.error().message.value_or("")});
        }
        roles.emplace(role, std::move(*parsed));
    }
    return roles;
}

auto read_custom_color_roles(json const& value, std::string const& where) -> Expected<CustomColorRoles> {
    if (!value.is_object()) {
        return std::unexpected(type_error(where, "object"));
    }
    CustomColorRoles roles;
    for (auto const& [scale, shades] : value.items()) {
        if (!is_css_name(scale)) {
            return std::unexpected(name_error(where, scale));
        }
        if (!shades.is_object()) {
            return std::unexpected(type_error(where + "." + scale, "object keyed by shade"));
        }
        auto& target = roles[scale];
        for (auto const& [shadeKey, token] : shades.items()) {
            auto shade = parse_shade(shadeKey);
            if (!shade) {
                return std::unexpected(
                        Error{Error::Code::MalformedInput, where + "." + scale + ": shade '" + shadeKey + "' is not an integer"});
            }
            auto parsed = ParseColorToken(token);
            if (!parsed) {
                return std::unexpected(
                        Error{parsed.error().code, where + "." + scale + "." + shadeKey + ": " + parsed.error().message.value_or("")});
            }
            target.emplace(*shade, std::move(*parsed));
        }
    }
    return roles;
}

auto read_font_families(json const& value, std::string const& where) -> Expected<FontFamilies> {
    if (!value.is_object()) {
        return std::unexpected(type_error(where, "object"));
    }
    FontFamilies families;
    for (auto const& [key, stack] : value.items()) {
        if (!is_css_name(key)) {
            return std::unexpected(name_error(where, key));
        }
        if (!stack.is_string()) {
            return std::unexpected(type_error(where + "." + key, "string"));
        }
        if (!is_font_stack(stack.get<std::string>())) {
            return std::unexpected(Error{Error::Code::MalformedInput,
                                         where + "." + key + ": font stack contains a reserved character"});
        }
        families.emplace(key, stack.get<std::string>());
    }
    return families;
}

auto parse_patch(json const& value, std::string const& where) -> Expected<ThemePatch> {
    if (!value.is_object()) {
        return std::unexpected(type_error(where, "object"));
    }
    ThemePatch patch;
    if (value.contains("color_roles")) {
        auto roles = read_color_roles(value["color_roles"], where + ".color_roles");
        if (!roles) {
            return std::unexpected(roles.error());
        }
        patch.color_roles = std::move(*roles);
    }
    if (value.contains("custom_color_roles")) {
        auto roles = read_custom_color_roles(value["custom_color_roles"], where + ".custom_color_roles");
        if (!roles) {
            return std::unexpected(roles.error());
        }
        patch.custom_color_roles = std::move(*roles);
    }
    if (value.contains("font_families")) {
        auto families = read_font_families(value["font_families"], where + ".font_families");
        if (!families) {
            return std::unexpected(families.error());
        }
        patch.font_families = std::move(*families);
    }

    struct ScalarField {
        char const*            key;
        std::optional<double>* target;
    };
    ScalarField const scalars[] = {
            {"type_scale_base", &patch.type_scale_base},
            {"type_scale_ratio", &patch.type_scale_ratio},
            {"spacing_unit", &patch.spacing_unit},
            {"radius_base", &patch.radius_base},
    };
    for (auto const& field : scalars) {
        auto number = read_number(value, field.key, where);
        if (!number) {
            return std::unexpected(number.error());
        }
        *field.target = *number;
    }
    return patch;
}

auto parse_metadata(json const& value) -> Expected<Metadata> {
    if (!value.is_object()) {
        return std::unexpected(type_error("metadata", "object"));
    }
    Metadata metadata;
    auto site        = read_string(value, "site", "metadata");
    auto title       = read_string(value, "title", "metadata");
    auto separator   = read_string(value, "title_separator", "metadata");
    auto description = read_string(value, "description", "metadata");
    auto keywords    = read_string_list(value, "keywords", "metadata");
    for (auto const* failed : {&site, &title, &separator, &description}) {
        if (!*failed) {
            return std::unexpected(failed->error());
        }
    }
    if (!keywords) {
        return std::unexpected(keywords.error());
    }
    metadata.site        = *site;
    metadata.title       = *title;
    metadata.description = *description;
    if (*separator) {
        metadata.title_separator = **separator;
    }
    if (*keywords) {
        metadata.keywords = std::move(**keywords);
    }

    if (value.contains("structured_data")) {
        auto const& payloads = value["structured_data"];
        if (!payloads.is_array()) {
            return std::unexpected(type_error("metadata.structured_data", "array of objects"));
        }
        for (auto const& payload : payloads) {
            if (!payload.is_object()) {
                return std::unexpected(type_error("metadata.structured_data", "array of objects"));
            }
            metadata.structured_data.push_back(payload);
        }
    }
    return metadata;
}

auto parse_theme(json const& value) -> Expected<Theme> {
    if (!value.is_object()) {
        return std::unexpected(type_error("theme", "object"));
    }

    auto base = read_string(value, "extends", "theme");
    if (!base) {
        return std::unexpected(base.error());
    }
    Theme theme;
    if (*base) {
        if (**base != "default") {
            return std::unexpected(Error{Error::Code::NotFound, "theme.extends: unknown base theme '" + **base + "'"});
        }
        theme = DefaultTheme();
    }

    auto name = read_string(value, "name", "theme");
    if (!name) {
        return std::unexpected(name.error());
    }
    if (*name) {
        if (!is_css_name(**name)) {
            return std::unexpected(name_error("theme.name", **name));
        }
        theme.name = **name;
    }

    auto patch = parse_patch(value, "theme");
    if (!patch) {
        return std::unexpected(patch.error());
    }
    if (patch->color_roles) {
        for (auto& [role, token] : *patch->color_roles) {
            theme.color_roles.insert_or_assign(role, token);
        }
    }
    if (patch->custom_color_roles) {
        for (auto& [scale, shades] : *patch->custom_color_roles) {
            theme.custom_color_roles[scale] = shades;
        }
    }
    if (patch->font_families) {
        for (auto& [key, stack] : *patch->font_families) {
            theme.font_families.insert_or_assign(key, stack);
        }
    }
    theme.type_scale_base  = patch->type_scale_base.value_or(theme.type_scale_base);
    theme.type_scale_ratio = patch->type_scale_ratio.value_or(theme.type_scale_ratio);
    theme.spacing_unit     = patch->spacing_unit.value_or(theme.spacing_unit);
    theme.radius_base      = patch->radius_base.value_or(theme.radius_base);

    if (value.contains("dark")) {
        if (value["dark"].is_null()) {
            theme.dark.reset();
        } else {
            auto dark = parse_patch(value["dark"], "theme.dark");
            if (!dark) {
                return std::unexpected(dark.error());
            }
            theme.dark = std::move(*dark);
        }
    }

    if (value.contains("named")) {
        auto const& named = value["named"];
        if (!named.is_object()) {
            return std::unexpected(type_error("theme.named", "object"));
        }
        for (auto const& [variant, body] : named.items()) {
            if (!is_css_name(variant)) {
                return std::unexpected(name_error("theme.named", variant));
            }
            auto parsed = parse_patch(body, "theme.named." + variant);
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            theme.named.insert_or_assign(variant, std::move(*parsed));
        }
    }
    return theme;
}

} // namespace

auto ParseColorToken(nlohmann::json const& value) -> Expected<ColorToken> {
    if (value.is_array()) {
        if (value.size() != 3 || !value[0].is_number() || !value[1].is_number() || !value[2].is_number()) {
            return std::unexpected(Error{Error::Code::InvalidType, "oklch color needs three numbers"});
        }
        return ColorToken{OklchColor{value[0].get<double>(), value[1].get<double>(), value[2].get<double>()}};
    }
    if (value.is_object()) {
        if (!value.contains("name") || !value["name"].is_string() || !value.contains("shade")
            || !value["shade"].is_number_integer()) {
            return std::unexpected(Error{Error::Code::InvalidType, "custom color needs a string name and integer shade"});
        }
        auto scale = value["name"].get<std::string>();
        if (!is_css_name(scale)) {
            return std::unexpected(Error{Error::Code::MalformedInput, "custom color name '" + scale + "' is not a valid name"});
        }
        return ColorToken{CustomColor{std::move(scale), value["shade"].get<int>()}};
    }
    if (!value.is_string()) {
        return std::unexpected(Error{Error::Code::InvalidType, "color must be a string, array or object"});
    }

    auto const text = value.get<std::string>();
    if (auto semantic = ParseSemanticColor(text)) {
        return ColorToken{*semantic};
    }
    auto const dash = text.rfind('-');
    if (dash == std::string::npos || dash == 0) {
        return std::unexpected(Error{Error::Code::MalformedInput, "unknown color token '" + text + "'"});
    }
    auto shade = parse_shade(std::string_view{text}.substr(dash + 1));
    if (!shade) {
        return std::unexpected(Error{Error::Code::MalformedInput, "color token '" + text + "' has no numeric shade"});
    }
    auto const scale = text.substr(0, dash);
    if (auto palette = ParsePalette(scale)) {
        return ColorToken{PaletteColor{*palette, *shade}};
    }
    if (!is_css_name(scale)) {
        return std::unexpected(Error{Error::Code::MalformedInput, "unknown color token '" + text + "'"});
    }
    return ColorToken{CustomColor{scale, *shade}};
}

auto ParseSiteConfig(std::string_view text) -> Expected<SiteConfig> {
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "site config is not valid JSON"});
    }
    if (!document.is_object()) {
        return std::unexpected(type_error("site config", "object"));
    }

    SiteConfig config;
    if (document.contains("metadata")) {
        auto metadata = parse_metadata(document["metadata"]);
        if (!metadata) {
            return std::unexpected(metadata.error());
        }
        config.metadata = std::move(*metadata);
    }
    if (document.contains("theme")) {
        auto theme = parse_theme(document["theme"]);
        if (!theme) {
            return std::unexpected(theme.error());
        }
        config.theme = std::move(*theme);
    }
    return config;
}

auto LoadSiteConfig(std::filesystem::path const& path) -> Expected<SiteConfig> {
    std::ifstream input(path);
    if (!input) {
        return std::unexpected(Error{Error::Code::NotFound, "cannot open " + path.string()});
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    sc_log("Loaded site config from " + path.string(), "Config");

    auto config = ParseSiteConfig(buffer.str());
    if (!config) {
        return std::unexpected(Error{config.error().code, path.string() + ": " + config.error().message.value_or("")});
    }
    return config;
}

} // namespace SC::Config
