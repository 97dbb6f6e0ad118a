#include <score/render/Environment.hpp>

#include <score/log/TaggedLogger.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace SC::Render {

namespace {

auto build_default() -> Environment {
#ifdef NDEBUG
    return Environment::Production;
#else
    return Environment::Development;
#endif
}

} // namespace

auto EnvironmentName(Environment environment) -> std::string_view {
    switch (environment) {
    case Environment::Development:
        return "development";
    case Environment::Production:
        return "production";
    }
    return "development";
}

auto ParseEnvironment(std::string_view text) -> std::optional<Environment> {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "development" || lowered == "dev") {
        return Environment::Development;
    }
    if (lowered == "production" || lowered == "prod") {
        return Environment::Production;
    }
    return std::nullopt;
}

auto CurrentEnvironment() -> Environment {
    if (auto const* value = std::getenv("SCORE_ENV")) {
        if (auto parsed = ParseEnvironment(value)) {
            return *parsed;
        }
        sc_log("Ignoring unrecognised SCORE_ENV value '" + std::string{value} + "'", "Render");
    }
    return build_default();
}

} // namespace SC::Render
