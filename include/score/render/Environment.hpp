#pragma once

#include <optional>
#include <string_view>

namespace SC::Render {

enum class Environment {
    Development,
    Production,
};

auto EnvironmentName(Environment environment) -> std::string_view;

// Accepts "development"/"dev" and "production"/"prod", case-insensitively.
auto ParseEnvironment(std::string_view text) -> std::optional<Environment>;

// SCORE_ENV when set and valid; otherwise development for debug builds, production for NDEBUG builds.
auto CurrentEnvironment() -> Environment;

} // namespace SC::Render
