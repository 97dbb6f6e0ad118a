#pragma once

#include <score/modifier/Modifier.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace SC {

/*
 * Node model
 *
 * Every node type is either primitive or composite:
 *  - primitive nodes derive from Primitive and enumerate their structural
 *    children through `for_each_child(fn)`; they have no body().
 *  - composite nodes provide `body() const`, a one-step expansion into
 *    another node.
 *
 * Consumers (CSS collector, HTML renderer, binding extractor) dispatch on
 * these shapes at compile time. AnyNode erases a node behind one virtual
 * entry point per consumer.
 */
struct Primitive {};

class AnyNode;

template <typename N>
concept PrimitiveNode = std::derived_from<N, Primitive>;

template <typename N>
concept CompositeNode = requires(N const& node) { node.body(); };

template <typename N>
concept ErasedNode = std::same_as<N, AnyNode>;

template <typename N>
concept Node = ErasedNode<N> || (PrimitiveNode<N> != CompositeNode<N>);

struct Empty : Primitive {
    template <typename F>
    void for_each_child(F&&) const {}
};

class TextNode : public Primitive {
public:
    explicit TextNode(std::string text)
        : text_(std::move(text)) {}

    [[nodiscard]] auto text() const -> std::string const& { return text_; }

    template <typename F>
    void for_each_child(F&&) const {}

private:
    std::string text_;
};

// Strings become TextNode; nodes pass through unchanged.
template <typename T>
auto LiftNode(T&& value) {
    using Raw = std::remove_cvref_t<T>;
    if constexpr (!Node<Raw> && std::is_convertible_v<T, std::string_view>) {
        return TextNode{std::string{std::string_view{value}}};
    } else {
        static_assert(Node<Raw>, "value is not a node: derive from Primitive or provide body()");
        return Raw(std::forward<T>(value));
    }
}

template <typename T>
using lifted_t = decltype(LiftNode(std::declval<T>()));

template <typename... Children>
class Tuple : public Primitive {
public:
    explicit Tuple(Children... children)
        : children_(std::move(children)...) {}

    template <typename F>
    void for_each_child(F&& fn) const {
        std::apply([&](auto const&... child) { (fn(child), ...); }, children_);
    }

    [[nodiscard]] auto children() const -> std::tuple<Children...> const& { return children_; }

private:
    std::tuple<Children...> children_;
};

template <typename First, typename Second>
class Conditional : public Primitive {
public:
    static auto first(First node) -> Conditional {
        return Conditional{std::in_place_index<0>, std::move(node)};
    }
    static auto second(Second node) -> Conditional {
        return Conditional{std::in_place_index<1>, std::move(node)};
    }

    [[nodiscard]] auto is_first() const -> bool { return storage_.index() == 0; }

    template <typename F>
    void for_each_child(F&& fn) const {
        if (storage_.index() == 0) {
            fn(std::get<0>(storage_));
        } else {
            fn(std::get<1>(storage_));
        }
    }

private:
    template <std::size_t I, typename N>
    Conditional(std::in_place_index_t<I> tag, N node)
        : storage_(tag, std::move(node)) {}

    std::variant<First, Second> storage_;
};

template <typename T>
class Optional : public Primitive {
public:
    Optional() = default;
    explicit Optional(std::optional<T> wrapped)
        : wrapped_(std::move(wrapped)) {}

    [[nodiscard]] auto has_value() const -> bool { return wrapped_.has_value(); }

    template <typename F>
    void for_each_child(F&& fn) const {
        if (wrapped_) {
            fn(*wrapped_);
        }
    }

private:
    std::optional<T> wrapped_;
};

// Children are produced lazily from the data items, in source order.
template <typename Data, typename Content>
class ForEach : public Primitive {
public:
    ForEach(Data data, Content content)
        : data_(std::move(data)), content_(std::move(content)) {}

    [[nodiscard]] auto data() const -> Data const& { return data_; }

    template <typename F>
    void for_each_child(F&& fn) const {
        for (auto const& item : data_) {
            fn(LiftNode(std::invoke(content_, item)));
        }
    }

private:
    Data    data_;
    Content content_;
};

template <typename T>
class Array : public Primitive {
public:
    Array() = default;
    explicit Array(std::vector<T> children)
        : children_(std::move(children)) {}

    auto push_back(T child) -> void { children_.push_back(std::move(child)); }
    [[nodiscard]] auto size() const -> std::size_t { return children_.size(); }

    template <typename F>
    void for_each_child(F&& fn) const {
        for (auto const& child : children_) {
            fn(child);
        }
    }

private:
    std::vector<T> children_;
};

template <typename Content>
class Modified : public Primitive {
public:
    Modified(Content content, ModifierList modifiers)
        : content_(std::move(content)), modifiers_(std::move(modifiers)) {}

    [[nodiscard]] auto content() const -> Content const& { return content_; }
    [[nodiscard]] auto modifiers() const -> ModifierList const& { return modifiers_; }

    template <typename F>
    void for_each_child(F&& fn) const {
        fn(content_);
    }

private:
    Content      content_;
    ModifierList modifiers_;
};

template <typename T>
struct is_modified : std::false_type {};
template <typename C>
struct is_modified<Modified<C>> : std::true_type {};

template <typename T>
struct is_conditional : std::false_type {};
template <typename A, typename B>
struct is_conditional<Conditional<A, B>> : std::true_type {};

template <typename T>
struct is_optional_node : std::false_type {};
template <typename T>
struct is_optional_node<Optional<T>> : std::true_type {};

template <typename N>
concept ModifiedNode = is_modified<N>::value;

// Nodes that visit at most one child, chosen at runtime.
template <typename N>
concept SelectingNode = is_conditional<N>::value || is_optional_node<N>::value;

template <typename... Children>
auto Build(Children&&... children) {
    if constexpr (sizeof...(Children) == 0) {
        return Empty{};
    } else if constexpr (sizeof...(Children) == 1) {
        return LiftNode(std::forward<Children>(children)...);
    } else {
        return Tuple<lifted_t<Children>...>{LiftNode(std::forward<Children>(children))...};
    }
}

inline auto Text(std::string text) -> TextNode {
    return TextNode{std::move(text)};
}

template <typename Then>
auto If(bool condition, Then&& then) {
    using Result = lifted_t<std::invoke_result_t<Then>>;
    if (condition) {
        return Optional<Result>{LiftNode(std::invoke(std::forward<Then>(then)))};
    }
    return Optional<Result>{};
}

template <typename Then, typename Else>
auto If(bool condition, Then&& then, Else&& otherwise) {
    using First  = lifted_t<std::invoke_result_t<Then>>;
    using Second = lifted_t<std::invoke_result_t<Else>>;
    if (condition) {
        return Conditional<First, Second>::first(LiftNode(std::invoke(std::forward<Then>(then))));
    }
    return Conditional<First, Second>::second(LiftNode(std::invoke(std::forward<Else>(otherwise))));
}

template <typename Data, typename Content>
auto Each(Data data, Content content) -> ForEach<Data, Content> {
    return ForEach<Data, Content>{std::move(data), std::move(content)};
}

// Wraps `node` in one Modified carrying all `modifiers` in order.
template <typename N, typename... Ms>
    requires(ModifierKind<std::remove_cvref_t<Ms>> && ...)
auto WithModifiers(N&& node, Ms&&... modifiers) {
    ModifierList list;
    list.reserve(sizeof...(Ms));
    (list.emplace_back(std::remove_cvref_t<Ms>(std::forward<Ms>(modifiers))), ...);
    return Modified<lifted_t<N>>{LiftNode(std::forward<N>(node)), std::move(list)};
}

// Each application adds an outer wrapper: `node | a | b` is Modified{Modified{node, [a]}, [b]}.
template <typename N, typename M>
    requires Node<std::remove_cvref_t<N>> && ModifierKind<std::remove_cvref_t<M>>
auto operator|(N&& node, M&& modifier) {
    return Modified<std::remove_cvref_t<N>>{std::forward<N>(node), ModifierList{AnyModifier{std::forward<M>(modifier)}}};
}

} // namespace SC
