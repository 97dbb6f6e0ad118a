#pragma once

#include <score/util/NumberFormat.hpp>

#include <concepts>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

namespace SC::Reactive {

// Escapes backslash, double quote, newline and carriage return for a double-quoted JS string.
// `</` becomes `<\/` so the literal can sit inside an inline <script> element.
auto EscapeJs(std::string_view text) -> std::string;
auto QuoteJsString(std::string_view text) -> std::string;

// ASCII identifier: letter, '_' or '$' followed by letters, digits, '_' or '$'.
auto IsJsIdentifier(std::string_view text) -> bool;

template <typename T>
concept Streamable = requires(std::ostream& os, T const& value) { os << value; };

// Serializes a state initializer as a JS literal. Unknown types fall back to a quoted description.
template <typename T>
auto FormatJsValue(T const& value) -> std::string {
    if constexpr (std::same_as<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::same_as<T, char>) {
        return QuoteJsString(std::string_view{&value, 1});
    } else if constexpr (std::is_convertible_v<T const&, std::string_view>) {
        return QuoteJsString(std::string_view{value});
    } else if constexpr (std::is_integral_v<T>) {
        return std::to_string(value);
    } else if constexpr (std::is_floating_point_v<T>) {
        return FormatNumber(static_cast<double>(value));
    } else if constexpr (std::is_enum_v<T>) {
        return std::to_string(static_cast<std::underlying_type_t<T>>(value));
    } else if constexpr (Streamable<T>) {
        std::ostringstream stream;
        stream << value;
        return QuoteJsString(stream.str());
    } else {
        return QuoteJsString(typeid(T).name());
    }
}

} // namespace SC::Reactive
