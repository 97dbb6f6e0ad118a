#pragma once

#include <score/theme/Theme.hpp>

#include <string>

namespace SC::Css {

// `:root` tokens, then the dark-scheme media block, then one `[data-theme]` block per named patch.
auto EmitThemeCss(Theme const& theme) -> std::string;

} // namespace SC::Css
