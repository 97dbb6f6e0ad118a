#pragma once

#include <score/css/CssDeclaration.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace SC::Css {

// 64-bit FNV-1a over the length-prefixed property and value bytes of every
// declaration, in order. Pure: equal sets always produce equal fingerprints.
auto Fingerprint(Declarations const& declarations) -> std::uint64_t;

auto ToBase36(std::uint64_t value) -> std::string;

// "s-<base36>" for probe 0, "s-<base36>-<probe>" afterwards.
auto ClassNameFor(std::uint64_t fingerprint, std::size_t probe = 0) -> std::string;

} // namespace SC::Css
