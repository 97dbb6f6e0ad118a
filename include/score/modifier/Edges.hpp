#pragma once

#include <array>
#include <cstdint>

namespace SC {

enum class Edge : std::uint8_t {
    Top        = 1u << 0,
    Bottom     = 1u << 1,
    Leading    = 1u << 2,
    Trailing   = 1u << 3,
    Horizontal = 1u << 4,
    Vertical   = 1u << 5,
};

// Iteration order of edge sets; declarations are emitted in this order.
inline constexpr std::array<Edge, 6> kEdgeOrder{
    Edge::Top, Edge::Bottom, Edge::Leading, Edge::Trailing, Edge::Horizontal, Edge::Vertical};

class Edges {
public:
    constexpr Edges() = default;
    constexpr Edges(Edge edge)
        : bits_(static_cast<std::uint8_t>(edge)) {}

    [[nodiscard]] constexpr auto contains(Edge edge) const -> bool {
        return (bits_ & static_cast<std::uint8_t>(edge)) != 0;
    }
    [[nodiscard]] constexpr auto empty() const -> bool { return bits_ == 0; }

    // True when the set reaches every physical side, e.g. {Horizontal, Vertical}.
    [[nodiscard]] constexpr auto covers_all_sides() const -> bool {
        bool const block  = contains(Edge::Vertical) || (contains(Edge::Top) && contains(Edge::Bottom));
        bool const inline_ = contains(Edge::Horizontal) || (contains(Edge::Leading) && contains(Edge::Trailing));
        return block && inline_;
    }

    constexpr auto operator|(Edges other) const -> Edges {
        Edges result;
        result.bits_ = static_cast<std::uint8_t>(bits_ | other.bits_);
        return result;
    }

    constexpr auto operator==(Edges const&) const -> bool = default;

    static constexpr auto all() -> Edges { return Edges{Edge::Horizontal} | Edges{Edge::Vertical}; }

private:
    std::uint8_t bits_{0};
};

constexpr auto operator|(Edge lhs, Edge rhs) -> Edges {
    return Edges{lhs} | Edges{rhs};
}

} // namespace SC
