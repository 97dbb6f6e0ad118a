#pragma once

#include <score/reactive/JsValue.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace SC::Reactive {

// A client-side reactive cell seeded with a serializable initial value.
template <typename T>
class State {
public:
    explicit State(T initial)
        : value_(std::move(initial)) {}

    [[nodiscard]] auto initial() const -> T const& { return value_; }

private:
    T value_;
};

// A derived cell. The server-side function is evaluated only on request; the client recomputes it.
template <typename T>
class Computed {
public:
    explicit Computed(std::function<T()> fn)
        : fn_(std::move(fn)) {}

    [[nodiscard]] auto value() const -> T { return fn_(); }

private:
    std::function<T()> fn_;
};

// A named handler. The client receives an empty function stub under the same name.
class Action {
public:
    Action() = default;
    explicit Action(std::function<void()> fn)
        : fn_(std::move(fn)) {}

    void operator()() const {
        if (fn_) {
            fn_();
        }
    }

private:
    std::function<void()> fn_;
};

enum class FieldKind {
    State,
    Computed,
    Action,
};

auto FieldKindName(FieldKind kind) -> std::string_view;

struct Field {
    FieldKind                  kind;
    std::string                name;
    std::optional<std::string> initial;
};

/**
 * Explicit registry of a page's reactive fields, in declaration order.
 *
 * Pages expose `auto reactive_fields() const -> Reactive::FieldList` and add
 * each field by name. Building the list never mutates the page.
 */
class FieldList {
public:
    template <typename T>
    auto add(std::string name, State<T> const& state) -> FieldList& {
        fields_.push_back(Field{FieldKind::State, std::move(name), FormatJsValue(state.initial())});
        return *this;
    }

    template <typename T>
    auto add(std::string name, Computed<T> const&) -> FieldList& {
        fields_.push_back(Field{FieldKind::Computed, std::move(name), std::nullopt});
        return *this;
    }

    auto add(std::string name, Action const& action) -> FieldList&;

    [[nodiscard]] auto fields() const -> std::vector<Field> const& { return fields_; }
    [[nodiscard]] auto empty() const -> bool { return fields_.empty(); }
    [[nodiscard]] auto count(FieldKind kind) const -> std::size_t;

private:
    std::vector<Field> fields_;
};

template <typename P>
concept DeclaresReactiveFields = requires(P const& page) {
    { page.reactive_fields() } -> std::convertible_to<FieldList>;
};

template <typename P>
auto ReactiveFieldsOf(P const& page) -> FieldList {
    if constexpr (DeclaresReactiveFields<P>) {
        return page.reactive_fields();
    } else {
        return {};
    }
}

} // namespace SC::Reactive
