#pragma once

#include <score/core/Error.hpp>
#include <score/document/Metadata.hpp>
#include <score/render/Environment.hpp>
#include <score/render/PageRenderer.hpp>
#include <score/theme/Theme.hpp>

#include <string_view>
#include <vector>

namespace SC::Demo {

// Names accepted by RenderDemoPage, in display order.
auto DemoPageNames() -> std::vector<std::string_view>;

auto RenderDemoPage(std::string_view    name,
                    Metadata const*     metadata,
                    Theme const*        theme,
                    Render::Environment environment) -> Expected<Render::RenderResult>;

} // namespace SC::Demo
