#pragma once

#include <string>
#include <vector>

namespace SC::Css {

struct CssDeclaration {
    std::string property;
    std::string value;

    [[nodiscard]] auto render() const -> std::string { return property + ": " + value; }

    auto operator==(CssDeclaration const&) const -> bool = default;
};

// Ordered declaration set produced by one modifier list.
using Declarations = std::vector<CssDeclaration>;

} // namespace SC::Css
