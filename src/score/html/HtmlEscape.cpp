#include <score/html/HtmlEscape.hpp>

namespace SC::Html {

namespace {

void append_escaped(std::string& out, std::string_view text, bool attribute) {
    for (char ch : text) {
        switch (ch) {
        case '&':
            out.append("&amp;");
            break;
        case '<':
            out.append("&lt;");
            break;
        case '>':
            out.append("&gt;");
            break;
        case '"':
            if (attribute) {
                out.append("&quot;");
            } else {
                out.push_back(ch);
            }
            break;
        default:
            out.push_back(ch);
            break;
        }
    }
}

} // namespace

void AppendEscapedText(std::string& out, std::string_view text) {
    append_escaped(out, text, false);
}

void AppendEscapedAttribute(std::string& out, std::string_view text) {
    append_escaped(out, text, true);
}

auto EscapeText(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    AppendEscapedText(out, text);
    return out;
}

auto EscapeAttribute(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    AppendEscapedAttribute(out, text);
    return out;
}

auto EscapeScriptPayload(std::string_view text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '<' && i + 1 < text.size() && text[i + 1] == '/') {
            escaped.append("<\\/");
            ++i;
        } else {
            escaped.push_back(text[i]);
        }
    }
    return escaped;
}

} // namespace SC::Html
