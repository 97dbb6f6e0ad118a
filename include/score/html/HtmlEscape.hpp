#pragma once

#include <string>
#include <string_view>

namespace SC::Html {

// Element text: & < >
auto EscapeText(std::string_view text) -> std::string;
// Double-quoted attribute values: & < > "
auto EscapeAttribute(std::string_view text) -> std::string;

void AppendEscapedText(std::string& out, std::string_view text);
void AppendEscapedAttribute(std::string& out, std::string_view text);

// Rewrites every `</` as `<\/` so a JSON or JS payload cannot end its <script> element.
auto EscapeScriptPayload(std::string_view text) -> std::string;

} // namespace SC::Html
