#include <score/reactive/Reactive.hpp>

#include <algorithm>

namespace SC::Reactive {

auto FieldKindName(FieldKind kind) -> std::string_view {
    switch (kind) {
    case FieldKind::State:
        return "state";
    case FieldKind::Computed:
        return "computed";
    case FieldKind::Action:
        return "action";
    }
    return "unknown";
}

auto FieldList::add(std::string name, Action const&) -> FieldList& {
    fields_.push_back(Field{FieldKind::Action, std::move(name), std::nullopt});
    return *this;
}

auto FieldList::count(FieldKind kind) const -> std::size_t {
    return static_cast<std::size_t>(
            std::count_if(fields_.begin(), fields_.end(), [kind](Field const& field) { return field.kind == kind; }));
}

} // namespace SC::Reactive
