#include <doctest/doctest.h>
#include <score/modifier/StyleModifiers.hpp>
#include <score/node/Elements.hpp>
#include <score/node/Node.hpp>

#include <string>
#include <vector>

using namespace SC;

namespace {

struct Card {
    std::string title;

    auto body() const { return Article(Heading(2, title), Paragraph("details")); }
};

struct Ambiguous : Primitive {
    auto body() const { return Empty{}; }
};

// Mirrors the consumer dispatch and records every text node in visit order.
template <typename N>
void collect_texts(N const& node, std::vector<std::string>& out) {
    if constexpr (std::same_as<N, TextNode>) {
        out.push_back(node.text());
    } else if constexpr (PrimitiveNode<N>) {
        node.for_each_child([&](auto const& child) { collect_texts(child, out); });
    } else {
        collect_texts(node.body(), out);
    }
}

template <typename N>
auto texts_of(N const& node) -> std::vector<std::string> {
    std::vector<std::string> out;
    collect_texts(node, out);
    return out;
}

} // namespace

TEST_SUITE("node.traversal") {

TEST_CASE("node kinds are classified at compile time") {
    static_assert(PrimitiveNode<TextNode>);
    static_assert(PrimitiveNode<Empty>);
    static_assert(CompositeNode<Card>);
    static_assert(Node<Card>);
    static_assert(Node<Element<TextNode>>);
    static_assert(!Node<Ambiguous>);
    static_assert(!Node<std::string>);
    static_assert(ElementNode<Element<Empty>>);
    static_assert(VoidElementNode<VoidElement>);
    static_assert(SelectingNode<Optional<TextNode>>);
    static_assert(SelectingNode<Conditional<TextNode, Empty>>);
    static_assert(!SelectingNode<Tuple<TextNode>>);
    CHECK(true);
}

TEST_CASE("Build lifts strings and groups siblings") {
    static_assert(std::same_as<decltype(Build()), Empty>);
    static_assert(std::same_as<decltype(Build("a")), TextNode>);
    static_assert(std::same_as<decltype(Build("a", Text("b"))), Tuple<TextNode, TextNode>>);

    auto tuple = Build("a", Text("b"), std::string{"c"});
    CHECK(texts_of(tuple) == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("Composite bodies expand one step per visit") {
    Card card{"Title"};
    CHECK(texts_of(card) == std::vector<std::string>{"Title", "details"});
    CHECK(texts_of(Stack(card, Card{"Second"}))
          == std::vector<std::string>{"Title", "details", "Second", "details"});
}

TEST_CASE("Conditional visits only the chosen branch") {
    auto chooseFirst  = If(true, [] { return Text("yes"); }, [] { return Paragraph("no"); });
    auto chooseSecond = If(false, [] { return Text("yes"); }, [] { return Paragraph("no"); });

    CHECK(chooseFirst.is_first());
    CHECK_FALSE(chooseSecond.is_first());
    CHECK(texts_of(chooseFirst) == std::vector<std::string>{"yes"});
    CHECK(texts_of(chooseSecond) == std::vector<std::string>{"no"});
}

TEST_CASE("Optional contributes nothing when absent") {
    auto present = If(true, [] { return "shown"; });
    auto absent  = If(false, [] { return "hidden"; });

    CHECK(present.has_value());
    CHECK_FALSE(absent.has_value());
    CHECK(texts_of(present) == std::vector<std::string>{"shown"});
    CHECK(texts_of(absent).empty());
}

TEST_CASE("ForEach produces children in source order") {
    std::vector<int> items{3, 1, 2};
    auto             list = Each(items, [](int value) { return ListItem(std::to_string(value)); });

    CHECK(list.data().size() == 3);
    CHECK(texts_of(list) == std::vector<std::string>{"3", "1", "2"});
    CHECK(texts_of(Each(std::vector<int>{}, [](int value) { return std::to_string(value); })).empty());
}

TEST_CASE("Array holds homogeneous children") {
    Array<TextNode> array;
    array.push_back(Text("one"));
    array.push_back(Text("two"));

    CHECK(array.size() == 2);
    CHECK(texts_of(array) == std::vector<std::string>{"one", "two"});
}

TEST_CASE("Each pipe application adds an outer wrapper") {
    auto node = Text("x") | Padding(4) | Margin(8);

    static_assert(std::same_as<decltype(node), Modified<Modified<TextNode>>>);
    REQUIRE(node.modifiers().size() == 1);
    CHECK(node.modifiers()[0].is<MarginModifier>());
    REQUIRE(node.content().modifiers().size() == 1);
    CHECK(node.content().modifiers()[0].is<PaddingModifier>());
    CHECK(node.content().modifiers()[0].as<PaddingModifier>()->value == 4.0);
    CHECK(texts_of(node) == std::vector<std::string>{"x"});
}

TEST_CASE("WithModifiers keeps every modifier on one wrapper in order") {
    auto node = WithModifiers("label", Padding(4), Background(SemanticColor::Accent), Opacity(0.5));

    static_assert(std::same_as<decltype(node), Modified<TextNode>>);
    REQUIRE(node.modifiers().size() == 3);
    CHECK(node.modifiers()[0].is<PaddingModifier>());
    CHECK(node.modifiers()[1].is<BackgroundModifier>());
    CHECK(node.modifiers()[2].is<OpacityModifier>());
    CHECK(node.modifiers()[2].as<PaddingModifier>() == nullptr);
}

TEST_CASE("Element attributes keep insertion order and replace duplicates") {
    auto input = Input("email", "address").attribute("required").attribute("type", "text");

    REQUIRE(input.attributes().size() == 3);
    CHECK(input.attributes()[0] == std::pair<std::string, std::string>{"type", "text"});
    CHECK(input.attributes()[1].first == "name");
    CHECK(input.attributes()[2] == std::pair<std::string, std::string>{"required", ""});

    auto heading = Heading(9, "clamped");
    CHECK(heading.tag() == "h6");
}

} // TEST_SUITE
