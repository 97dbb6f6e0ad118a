#pragma once

#include <concepts>
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace SC {

// A modifier kind is any copyable value type that declares `using modifier_tag = void;`.
template <typename M>
concept ModifierKind = std::copy_constructible<M> && requires { typename M::modifier_tag; };

/**
 * Type-erased, immutable annotation value.
 *
 * Modifiers are attached to nodes through Modified<T>. Consumers identify the
 * concrete kind through type() and recover the value with as<M>().
 */
class AnyModifier {
public:
    template <ModifierKind M>
    AnyModifier(M modifier)
        : self_(std::make_unique<Model<M>>(std::move(modifier))) {}

    AnyModifier(AnyModifier const& other)
        : self_(other.self_->clone()) {}
    AnyModifier(AnyModifier&&) noexcept = default;

    auto operator=(AnyModifier const& other) -> AnyModifier& {
        if (this != &other) {
            self_ = other.self_->clone();
        }
        return *this;
    }
    auto operator=(AnyModifier&&) noexcept -> AnyModifier& = default;

    [[nodiscard]] auto type() const -> std::type_index { return self_->type(); }

    template <ModifierKind M>
    [[nodiscard]] auto is() const -> bool {
        return type() == std::type_index(typeid(M));
    }

    template <ModifierKind M>
    [[nodiscard]] auto as() const -> M const* {
        if (!is<M>()) {
            return nullptr;
        }
        return static_cast<M const*>(self_->address());
    }

private:
    struct Concept {
        virtual ~Concept()                                         = default;
        virtual auto clone() const -> std::unique_ptr<Concept>     = 0;
        virtual auto type() const -> std::type_index               = 0;
        virtual auto address() const -> void const*                = 0;
    };

    template <typename M>
    struct Model final : Concept {
        explicit Model(M v)
            : value(std::move(v)) {}
        auto clone() const -> std::unique_ptr<Concept> override { return std::make_unique<Model>(value); }
        auto type() const -> std::type_index override { return std::type_index(typeid(M)); }
        auto address() const -> void const* override { return &value; }

        M const value;
    };

    std::unique_ptr<Concept> self_;
};

using ModifierList = std::vector<AnyModifier>;

} // namespace SC
