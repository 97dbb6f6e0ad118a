#include <score/util/NumberFormat.hpp>

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>

namespace SC {

auto FormatNumber(double value) -> std::string {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    if (value == std::trunc(value) && std::fabs(value) < 9.0e15) {
        if (value == 0.0) {
            return "0";
        }
        return std::to_string(static_cast<std::int64_t>(value));
    }
    std::array<char, 64> buffer{};
    auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    return std::string(buffer.data(), result.ptr);
}

} // namespace SC
