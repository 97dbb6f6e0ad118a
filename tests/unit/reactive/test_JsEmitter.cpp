#include <doctest/doctest.h>
#include <score/reactive/JsEmitter.hpp>
#include <score/reactive/Reactive.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace SC::Reactive;

namespace {

struct StaticPage {};

struct CounterState {
    State<int>         count{0};
    State<std::string> label{"clicks"};
    Computed<int>      doubled{[] { return 0; }};
    Action             increment;

    auto reactive_fields() const -> FieldList {
        FieldList fields;
        fields.add("increment", increment).add("doubled", doubled).add("count", count).add("label", label);
        return fields;
    }
};

} // namespace

TEST_SUITE("reactive.js_emitter") {

TEST_CASE("Position selectors match one entry of a data-s list") {
    CHECK(PositionSelector(0) == "[data-s~=\"0\"]");
    CHECK(PositionSelector(12) == "[data-s~=\"12\"]");
}

TEST_CASE("Nothing declared and nothing bound produces no script") {
    CHECK(EmitScript(FieldList{}, {}).empty());
    CHECK(ReactiveFieldsOf(StaticPage{}).empty());
}

TEST_CASE("Field list records kinds in declaration order") {
    auto const fields = ReactiveFieldsOf(CounterState{});

    REQUIRE(fields.fields().size() == 4);
    CHECK(fields.fields()[0].kind == FieldKind::Action);
    CHECK(fields.fields()[2].name == "count");
    CHECK(fields.fields()[2].initial == "0");
    CHECK(fields.fields()[3].initial == "\"clicks\"");
    CHECK_FALSE(fields.fields()[1].initial.has_value());
    CHECK(fields.count(FieldKind::State) == 2);
    CHECK(fields.count(FieldKind::Computed) == 1);
    CHECK(fields.count(FieldKind::Action) == 1);
    CHECK(FieldKindName(FieldKind::Computed) == "computed");
}

TEST_CASE("Script groups states, computeds, actions, then listeners") {
    std::vector<ElementBinding> bindings{{2, "click", "increment"}, {5, "keydown", "increment"}};

    CHECK(EmitScript(ReactiveFieldsOf(CounterState{}), bindings)
          == "<script>\n"
             "const count = Score.state(0);\n"
             "const label = Score.state(\"clicks\");\n"
             "const doubled = Score.computed(() => doubled);\n"
             "function increment() {}\n"
             "document.querySelector('[data-s~=\"2\"]').addEventListener(\"click\", increment);\n"
             "document.querySelector('[data-s~=\"5\"]').addEventListener(\"keydown\", increment);\n"
             "</script>");
}

TEST_CASE("Bindings alone still produce a script") {
    CHECK(EmitScript(FieldList{}, {{0, "submit", "send"}})
          == "<script>\n"
             "document.querySelector('[data-s~=\"0\"]').addEventListener(\"submit\", send);\n"
             "</script>");
}

TEST_CASE("String state cannot end the inline script") {
    FieldList fields;
    fields.add("greeting", State<std::string>{"</script><img src=x onerror=alert(1)>"});

    auto const script = EmitScript(fields, {});
    CHECK(script
          == "<script>\n"
             "const greeting = Score.state(\"<\\/script><img src=x onerror=alert(1)>\");\n"
             "</script>");
    CHECK(script.find("</script>") == script.size() - 9);
}

TEST_CASE("Names that are not JS identifiers are rejected") {
    FieldList badField;
    badField.add("count); alert(1", State<int>{0});
    CHECK_THROWS_AS(EmitScript(badField, {}), std::logic_error);

    FieldList badAction;
    badAction.add("2fast", Action{});
    CHECK_THROWS_AS(EmitScript(badAction, {}), std::logic_error);

    CHECK_THROWS_AS(EmitScript(FieldList{}, {{0, "click", "go()</script>"}}), std::logic_error);
    CHECK_THROWS_AS(EmitScript(FieldList{}, {{0, "click", ""}}), std::logic_error);
    CHECK_NOTHROW(EmitScript(FieldList{}, {{0, "click", "$on_click2"}}));
}

TEST_CASE("Reactive cells keep server-side behavior") {
    int     calls = 0;
    Action  bump{[&] { ++calls; }};
    bump();
    bump();
    CHECK(calls == 2);
    Action{}();

    Computed<int> answer{[] { return 42; }};
    CHECK(answer.value() == 42);
    CHECK(State<double>{1.5}.initial() == 1.5);
}

} // TEST_SUITE
