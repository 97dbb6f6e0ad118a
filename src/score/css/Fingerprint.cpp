#include <score/css/Fingerprint.hpp>

#include <algorithm>
#include <string_view>

namespace SC::Css {

namespace {

constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ull;
constexpr std::uint64_t kFnvPrime       = 1099511628211ull;

struct Fnv1a {
    std::uint64_t state{kFnvOffsetBasis};

    void byte(std::uint8_t value) {
        state ^= value;
        state *= kFnvPrime;
    }

    void length(std::size_t size) {
        auto value = static_cast<std::uint64_t>(size);
        for (int i = 0; i < 8; ++i) {
            byte(static_cast<std::uint8_t>(value & 0xffu));
            value >>= 8;
        }
    }

    void field(std::string_view text) {
        length(text.size());
        for (char ch : text) {
            byte(static_cast<std::uint8_t>(ch));
        }
    }
};

} // namespace

auto Fingerprint(Declarations const& declarations) -> std::uint64_t {
    Fnv1a hash;
    hash.length(declarations.size());
    for (auto const& declaration : declarations) {
        hash.field(declaration.property);
        hash.field(declaration.value);
    }
    return hash.state;
}

auto ToBase36(std::uint64_t value) -> std::string {
    static constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value != 0) {
        out.push_back(kDigits[value % 36]);
        value /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

auto ClassNameFor(std::uint64_t fingerprint, std::size_t probe) -> std::string {
    std::string name = "s-" + ToBase36(fingerprint);
    if (probe > 0) {
        name.push_back('-');
        name.append(std::to_string(probe));
    }
    return name;
}

} // namespace SC::Css
