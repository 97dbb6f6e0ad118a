#include <score/cli/RenderOptions.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

namespace SC::Cli {

namespace {

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

bool IsValidPageName(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char ch) {
        return std::islower(ch) || std::isdigit(ch) || ch == '-' || ch == '_';
    });
}

auto ValidateRenderOptions(RenderOptions const& options) -> std::optional<std::string> {
    if (options.list_pages || options.show_help) {
        return std::nullopt;
    }
    if (!IsValidPageName(options.page)) {
        return std::string{"--page must be lowercase letters, digits, '-' or '_'"};
    }
    return std::nullopt;
}

bool ApplyRenderEnvOverrides(RenderOptions& options) {
    if (!apply_env("SCORE_RENDER_PAGE", [&](std::string_view value) {
            if (!IsValidPageName(value)) {
                std::cerr << "SCORE_RENDER_PAGE must be lowercase letters, digits, '-' or '_'\n";
                return false;
            }
            options.page = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("SCORE_RENDER_CONFIG", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "SCORE_RENDER_CONFIG must not be empty\n";
                return false;
            }
            options.config_path = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("SCORE_RENDER_OUTPUT", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "SCORE_RENDER_OUTPUT must not be empty\n";
                return false;
            }
            options.output_path = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("SCORE_RENDER_NO_THEME", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed.has_value()) {
                std::cerr << "SCORE_RENDER_NO_THEME must be a boolean (true/false, 1/0, yes/no)\n";
                return false;
            }
            options.use_default_theme = !*parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

void PrintRenderUsage() {
    std::cout << "Usage: score_render [options]\n"
              << "  --page <name>           Demo page to render (default home)\n"
              << "  --config <path>         Site config JSON (metadata and theme)\n"
              << "  --output <path>         Write the document to a file instead of stdout\n"
              << "  --env <name>            development|production (default SCORE_ENV or build type)\n"
              << "  --no-theme              Skip the default theme when the config has none\n"
              << "  --list-pages            Print the available demo pages\n"
              << "  --help                  Show this help\n";
}

std::optional<RenderOptions> ParseRenderArguments(int argc, char** argv) {
    RenderOptions options{};
    if (!ApplyRenderEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--page") {
            if (auto value = require_value(i, "--page")) {
                if (!IsValidPageName(*value)) {
                    std::cerr << "--page must be lowercase letters, digits, '-' or '_'\n";
                    return std::nullopt;
                }
                options.page = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--config") {
            if (auto value = require_value(i, "--config")) {
                if (value->empty()) {
                    std::cerr << "--config must not be empty\n";
                    return std::nullopt;
                }
                options.config_path = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--output") {
            if (auto value = require_value(i, "--output")) {
                if (value->empty()) {
                    std::cerr << "--output must not be empty\n";
                    return std::nullopt;
                }
                options.output_path = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--env") {
            if (auto value = require_value(i, "--env")) {
                auto parsed = Render::ParseEnvironment(*value);
                if (!parsed) {
                    std::cerr << "--env must be 'development' or 'production'\n";
                    return std::nullopt;
                }
                options.environment = *parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--no-theme") {
            options.use_default_theme = false;
        } else if (arg == "--list-pages") {
            options.list_pages = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (auto error = ValidateRenderOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }
    return options;
}

} // namespace SC::Cli
