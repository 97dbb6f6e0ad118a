#pragma once

#include <score/css/CssDeclaration.hpp>
#include <score/modifier/Modifier.hpp>

#include <score/core/Error.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace SC::Css {

/**
 * Process-wide table mapping each modifier kind to its CSS conversion.
 *
 * Built-in kinds are registered on first access. Behavior-only kinds
 * (event bindings, accessibility) are registered with a conversion that
 * yields no declarations, so an unregistered kind is always a defect.
 */
class CssConverterRegistry {
public:
    using Converter = std::function<void(AnyModifier const&, Declarations&)>;

    static CssConverterRegistry& instance();

    // Returns false when the kind already has a conversion.
    template <ModifierKind M, typename Fn>
    [[nodiscard]] bool registerConverter(Fn fn, std::string type_name = typeid(M).name()) {
        static_assert(std::is_invocable_r_v<Declarations, Fn&, M const&>,
                      "CSS converter must be callable as Declarations(M const&)");
        Converter converter = [fn = std::move(fn)](AnyModifier const& modifier, Declarations& out) {
            auto produced = fn(*modifier.as<M>());
            out.insert(out.end(), std::make_move_iterator(produced.begin()), std::make_move_iterator(produced.end()));
        };
        return registerEntry(std::type_index(typeid(M)), std::move(type_name), std::move(converter));
    }

    [[nodiscard]] auto find(std::type_index type) const -> Converter const*;
    [[nodiscard]] auto typeName(std::type_index type) const -> std::string;
    [[nodiscard]] auto size() const -> std::size_t;

private:
    struct Entry {
        std::string type_name;
        Converter   converter;
    };

    struct TypeIndexHash {
        auto operator()(std::type_index index) const noexcept -> std::size_t {
            return index.hash_code();
        }
    };

    [[nodiscard]] bool registerEntry(std::type_index type, std::string type_name, Converter converter);

    mutable std::mutex                                                   mutex_;
    std::vector<std::unique_ptr<Entry>>                                  entries_;
    std::unordered_map<std::type_index, Entry const*, TypeIndexHash>     by_type_;
};

void RegisterBuiltinCssConverters(CssConverterRegistry& registry);

// Fails with ConverterMissing when a modifier kind has no registered conversion.
auto TryDeclarationsFor(ModifierList const& modifiers) -> Expected<Declarations>;

// Concatenation of every modifier's declarations, in list order.
// Throws std::logic_error for an unregistered modifier kind.
auto DeclarationsFor(ModifierList const& modifiers) -> Declarations;

} // namespace SC::Css

#define SCORE_INTERNAL_CSS_CONCAT_IMPL(a, b) a##b
#define SCORE_INTERNAL_CSS_CONCAT(a, b) SCORE_INTERNAL_CSS_CONCAT_IMPL(a, b)

#define SCORE_REGISTER_CSS_CONVERTER(Type, Lambda)                                                         \
    namespace {                                                                                            \
    struct SCORE_INTERNAL_CSS_CONCAT(ScoreCssConverterAutoRegister_, __LINE__) {                           \
        SCORE_INTERNAL_CSS_CONCAT(ScoreCssConverterAutoRegister_, __LINE__)() {                            \
            (void)::SC::Css::CssConverterRegistry::instance().registerConverter<Type>(Lambda, #Type);       \
        }                                                                                                  \
    } SCORE_INTERNAL_CSS_CONCAT(ScoreCssConverterAutoRegisterInstance_, __LINE__);                         \
    }
