#pragma once

#include <score/reactive/BindingExtractor.hpp>
#include <score/reactive/Reactive.hpp>

#include <string>
#include <vector>

namespace SC::Reactive {

// Selector targeting every element whose `data-s` list contains `position`.
auto PositionSelector(std::size_t position) -> std::string;

/**
 * Builds the page script: state cells, computed cells, action stubs, then one
 * listener per binding. Returns an empty string when nothing is declared or bound.
 * Field and handler names that are not JS identifiers throw std::logic_error.
 */
auto EmitScript(FieldList const& fields, std::vector<ElementBinding> const& bindings) -> std::string;

} // namespace SC::Reactive
