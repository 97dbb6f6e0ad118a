#include <doctest/doctest.h>
#include <score/reactive/JsValue.hpp>

#include <cstdint>
#include <ostream>
#include <string>

using namespace SC::Reactive;

namespace {

enum class Mode : std::uint8_t {
    Idle    = 0,
    Running = 7,
};

struct Point {
    int x{0};
    int y{0};
};

auto operator<<(std::ostream& os, Point const& point) -> std::ostream& {
    return os << point.x << "," << point.y;
}

struct Opaque {};

} // namespace

TEST_SUITE("reactive.js_value") {

TEST_CASE("String escaping for double-quoted literals") {
    CHECK(EscapeJs("plain") == "plain");
    CHECK(EscapeJs("say \"hi\"") == "say \\\"hi\\\"");
    CHECK(EscapeJs("a\\b") == "a\\\\b");
    CHECK(EscapeJs("line\r\nnext") == "line\\r\\nnext");
    CHECK(QuoteJsString("x\"y") == "\"x\\\"y\"");
    CHECK(QuoteJsString("") == "\"\"");
    CHECK(EscapeJs("</script>") == "<\\/script>");
    CHECK(EscapeJs("</SCRIPT >") == "<\\/SCRIPT >");
    CHECK(EscapeJs("a < b") == "a < b");
}

TEST_CASE("Identifier check") {
    CHECK(IsJsIdentifier("count"));
    CHECK(IsJsIdentifier("_private"));
    CHECK(IsJsIdentifier("$el2"));
    CHECK_FALSE(IsJsIdentifier(""));
    CHECK_FALSE(IsJsIdentifier("9lives"));
    CHECK_FALSE(IsJsIdentifier("on-click"));
    CHECK_FALSE(IsJsIdentifier("a b"));
}

TEST_CASE("Initial values serialize as JS literals") {
    CHECK(FormatJsValue(true) == "true");
    CHECK(FormatJsValue(false) == "false");
    CHECK(FormatJsValue(0) == "0");
    CHECK(FormatJsValue(-42) == "-42");
    CHECK(FormatJsValue(std::uint64_t{18}) == "18");
    CHECK(FormatJsValue(2.5) == "2.5");
    CHECK(FormatJsValue(3.0) == "3");
    CHECK(FormatJsValue(0.5f) == "0.5");
    CHECK(FormatJsValue('c') == "\"c\"");
    CHECK(FormatJsValue(std::string{"he said \"no\""}) == "\"he said \\\"no\\\"\"");
    CHECK(FormatJsValue("literal") == "\"literal\"");
    CHECK(FormatJsValue(Mode::Running) == "7");
}

TEST_CASE("Other types fall back to a quoted description") {
    CHECK(FormatJsValue(Point{1, 2}) == "\"1,2\"");

    auto const opaque = FormatJsValue(Opaque{});
    REQUIRE(opaque.size() >= 2);
    CHECK(opaque.front() == '"');
    CHECK(opaque.back() == '"');
}

} // TEST_SUITE
