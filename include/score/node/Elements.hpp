#pragma once

#include <score/node/Node.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace SC {

// Ordered attribute list; an empty value renders as a boolean attribute.
using Attributes = std::vector<std::pair<std::string, std::string>>;

inline auto SetAttribute(Attributes& attributes, std::string name, std::string value) -> void {
    auto it = std::find_if(attributes.begin(), attributes.end(), [&](auto const& entry) { return entry.first == name; });
    if (it != attributes.end()) {
        it->second = std::move(value);
        return;
    }
    attributes.emplace_back(std::move(name), std::move(value));
}

template <typename Content>
class Element : public Primitive {
public:
    Element(std::string tag, Attributes attributes, Content content)
        : tag_(std::move(tag)), attributes_(std::move(attributes)), content_(std::move(content)) {}

    [[nodiscard]] auto tag() const -> std::string const& { return tag_; }
    [[nodiscard]] auto attributes() const -> Attributes const& { return attributes_; }
    [[nodiscard]] auto content() const -> Content const& { return content_; }

    auto attribute(std::string name, std::string value = {}) const& -> Element {
        Element copy = *this;
        SetAttribute(copy.attributes_, std::move(name), std::move(value));
        return copy;
    }
    auto attribute(std::string name, std::string value = {}) && -> Element {
        SetAttribute(attributes_, std::move(name), std::move(value));
        return std::move(*this);
    }

    template <typename F>
    void for_each_child(F&& fn) const {
        fn(content_);
    }

private:
    std::string tag_;
    Attributes  attributes_;
    Content     content_;
};

class VoidElement : public Primitive {
public:
    VoidElement(std::string tag, Attributes attributes)
        : tag_(std::move(tag)), attributes_(std::move(attributes)) {}

    [[nodiscard]] auto tag() const -> std::string const& { return tag_; }
    [[nodiscard]] auto attributes() const -> Attributes const& { return attributes_; }

    auto attribute(std::string name, std::string value = {}) const& -> VoidElement {
        VoidElement copy = *this;
        SetAttribute(copy.attributes_, std::move(name), std::move(value));
        return copy;
    }
    auto attribute(std::string name, std::string value = {}) && -> VoidElement {
        SetAttribute(attributes_, std::move(name), std::move(value));
        return std::move(*this);
    }

    template <typename F>
    void for_each_child(F&&) const {}

private:
    std::string tag_;
    Attributes  attributes_;
};

template <typename T>
struct is_element : std::false_type {};
template <typename C>
struct is_element<Element<C>> : std::true_type {};

template <typename N>
concept ElementNode = is_element<N>::value;

template <typename N>
concept VoidElementNode = std::same_as<N, VoidElement>;

template <typename Content>
auto MakeElement(std::string tag, Attributes attributes, Content content) -> Element<Content> {
    return Element<Content>{std::move(tag), std::move(attributes), std::move(content)};
}

#define SCORE_DEFINE_CONTAINER_ELEMENT(Name, Tag)                                  \
    template <typename... Children>                                                \
    auto Name(Children&&... children) {                                            \
        return MakeElement(Tag, {}, Build(std::forward<Children>(children)...));   \
    }

SCORE_DEFINE_CONTAINER_ELEMENT(Stack, "div")
SCORE_DEFINE_CONTAINER_ELEMENT(Main, "main")
SCORE_DEFINE_CONTAINER_ELEMENT(Section, "section")
SCORE_DEFINE_CONTAINER_ELEMENT(Article, "article")
SCORE_DEFINE_CONTAINER_ELEMENT(Header, "header")
SCORE_DEFINE_CONTAINER_ELEMENT(Footer, "footer")
SCORE_DEFINE_CONTAINER_ELEMENT(Aside, "aside")
SCORE_DEFINE_CONTAINER_ELEMENT(Navigation, "nav")
SCORE_DEFINE_CONTAINER_ELEMENT(Paragraph, "p")
SCORE_DEFINE_CONTAINER_ELEMENT(Strong, "strong")
SCORE_DEFINE_CONTAINER_ELEMENT(Emphasis, "em")
SCORE_DEFINE_CONTAINER_ELEMENT(Small, "small")
SCORE_DEFINE_CONTAINER_ELEMENT(Code, "code")
SCORE_DEFINE_CONTAINER_ELEMENT(Preformatted, "pre")
SCORE_DEFINE_CONTAINER_ELEMENT(Blockquote, "blockquote")
SCORE_DEFINE_CONTAINER_ELEMENT(UnorderedList, "ul")
SCORE_DEFINE_CONTAINER_ELEMENT(OrderedList, "ol")
SCORE_DEFINE_CONTAINER_ELEMENT(ListItem, "li")

#undef SCORE_DEFINE_CONTAINER_ELEMENT

template <typename... Children>
auto Heading(int level, Children&&... children) {
    level = std::clamp(level, 1, 6);
    return MakeElement("h" + std::to_string(level), {}, Build(std::forward<Children>(children)...));
}

template <typename... Children>
auto Link(std::string href, Children&&... children) {
    return MakeElement("a", {{"href", std::move(href)}}, Build(std::forward<Children>(children)...));
}

template <typename... Children>
auto Button(Children&&... children) {
    return MakeElement("button", {{"type", "button"}}, Build(std::forward<Children>(children)...));
}

template <typename... Children>
auto SubmitButton(Children&&... children) {
    return MakeElement("button", {{"type", "submit"}}, Build(std::forward<Children>(children)...));
}

template <typename... Children>
auto Label(std::string for_id, Children&&... children) {
    return MakeElement("label", {{"for", std::move(for_id)}}, Build(std::forward<Children>(children)...));
}

template <typename... Children>
auto Form(std::string action, std::string method, Children&&... children) {
    return MakeElement("form",
                       {{"action", std::move(action)}, {"method", std::move(method)}},
                       Build(std::forward<Children>(children)...));
}

inline auto HorizontalRule() -> VoidElement {
    return VoidElement{"hr", {}};
}

inline auto LineBreak() -> VoidElement {
    return VoidElement{"br", {}};
}

inline auto Image(std::string src, std::string alt) -> VoidElement {
    return VoidElement{"img", {{"src", std::move(src)}, {"alt", std::move(alt)}}};
}

inline auto Input(std::string type, std::string name) -> VoidElement {
    return VoidElement{"input", {{"type", std::move(type)}, {"name", std::move(name)}}};
}

} // namespace SC
