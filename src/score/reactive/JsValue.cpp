#include <score/reactive/JsValue.hpp>

#include <algorithm>
#include <cctype>

namespace SC::Reactive {

auto EscapeJs(std::string_view text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char const ch = text[i];
        switch (ch) {
        case '\\':
            escaped.append("\\\\");
            break;
        case '"':
            escaped.append("\\\"");
            break;
        case '\n':
            escaped.append("\\n");
            break;
        case '\r':
            escaped.append("\\r");
            break;
        case '<':
            if (i + 1 < text.size() && text[i + 1] == '/') {
                escaped.append("<\\/");
                ++i;
            } else {
                escaped.push_back(ch);
            }
            break;
        default:
            escaped.push_back(ch);
            break;
        }
    }
    return escaped;
}

auto IsJsIdentifier(std::string_view text) -> bool {
    if (text.empty()) {
        return false;
    }
    auto const head = [](unsigned char ch) { return std::isalpha(ch) || ch == '_' || ch == '$'; };
    if (!head(static_cast<unsigned char>(text.front()))) {
        return false;
    }
    return std::all_of(text.begin() + 1, text.end(), [&](unsigned char ch) { return head(ch) || std::isdigit(ch); });
}

auto QuoteJsString(std::string_view text) -> std::string {
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted.push_back('"');
    quoted.append(EscapeJs(text));
    quoted.push_back('"');
    return quoted;
}

} // namespace SC::Reactive
