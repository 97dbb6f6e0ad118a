#pragma once

#include <score/render/Environment.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace SC::Cli {

struct RenderOptions {
    std::string                        page{"home"};
    std::string                        config_path;
    std::string                        output_path;
    std::optional<Render::Environment> environment;
    bool                               use_default_theme{true};
    bool                               list_pages{false};
    bool                               show_help{false};
};

auto ParseRenderArguments(int argc, char** argv) -> std::optional<RenderOptions>;

void PrintRenderUsage();

bool ApplyRenderEnvOverrides(RenderOptions& options);

auto ValidateRenderOptions(RenderOptions const& options) -> std::optional<std::string>;

bool IsValidPageName(std::string_view name);

} // namespace SC::Cli
