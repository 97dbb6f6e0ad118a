#pragma once

#include <string>

namespace SC {

// Whole values print without a fractional part ("16", not "16.0"); everything
// else uses the shortest representation that round-trips.
auto FormatNumber(double value) -> std::string;

} // namespace SC
