#include <score/css/CssConverterRegistry.hpp>

#include <score/log/TaggedLogger.hpp>

#include <stdexcept>

namespace SC::Css {

CssConverterRegistry& CssConverterRegistry::instance() {
    static CssConverterRegistry registry;
    static bool const           builtins = [] {
        RegisterBuiltinCssConverters(registry);
        return true;
    }();
    (void)builtins;
    return registry;
}

bool CssConverterRegistry::registerEntry(std::type_index type, std::string type_name, Converter converter) {
    if (!converter) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (by_type_.find(type) != by_type_.end()) {
        sc_log("Converter already registered for " + type_name, "CssRegistry");
        return false;
    }

    auto entry       = std::make_unique<Entry>();
    entry->type_name = std::move(type_name);
    entry->converter = std::move(converter);

    auto const* raw = entry.get();
    entries_.push_back(std::move(entry));
    by_type_.emplace(type, raw);
    sc_log("Registered CSS converter for " + raw->type_name, "CssRegistry");
    return true;
}

auto CssConverterRegistry::find(std::type_index type) const -> Converter const* {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = by_type_.find(type);
    if (it == by_type_.end()) {
        return nullptr;
    }
    return &it->second->converter;
}

auto CssConverterRegistry::typeName(std::type_index type) const -> std::string {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = by_type_.find(type);
    if (it == by_type_.end()) {
        return std::string{type.name()};
    }
    return it->second->type_name;
}

auto CssConverterRegistry::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

auto TryDeclarationsFor(ModifierList const& modifiers) -> Expected<Declarations> {
    auto&        registry = CssConverterRegistry::instance();
    Declarations declarations;
    for (auto const& modifier : modifiers) {
        auto const* converter = registry.find(modifier.type());
        if (converter == nullptr) {
            return std::unexpected(Error{Error::Code::ConverterMissing,
                                         std::string{"no CSS conversion registered for modifier type "}
                                             + modifier.type().name()});
        }
        (*converter)(modifier, declarations);
    }
    return declarations;
}

auto DeclarationsFor(ModifierList const& modifiers) -> Declarations {
    auto declarations = TryDeclarationsFor(modifiers);
    if (!declarations) {
        throw std::logic_error(describeError(declarations.error()));
    }
    return std::move(*declarations);
}

} // namespace SC::Css
