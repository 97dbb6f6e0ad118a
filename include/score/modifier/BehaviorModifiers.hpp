#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace SC {

enum class DOMEvent {
    Click,
    Input,
    Change,
    Submit,
    KeyDown,
    KeyUp,
    Focus,
    Blur,
};

[[nodiscard]] constexpr auto EventName(DOMEvent event) -> std::string_view {
    switch (event) {
    case DOMEvent::Click:
        return "click";
    case DOMEvent::Input:
        return "input";
    case DOMEvent::Change:
        return "change";
    case DOMEvent::Submit:
        return "submit";
    case DOMEvent::KeyDown:
        return "keydown";
    case DOMEvent::KeyUp:
        return "keyup";
    case DOMEvent::Focus:
        return "focus";
    case DOMEvent::Blur:
        return "blur";
    }
    return "click";
}

// Binds a DOM event on the decorated element to a page action.
struct EventBindingModifier {
    using modifier_tag = void;
    DOMEvent    event{DOMEvent::Click};
    std::string handler;
};

struct AccessibilityModifier {
    using modifier_tag = void;
    std::optional<std::string> label;
    bool                       hidden{false};
    std::optional<std::string> role;
};

inline auto On(DOMEvent event, std::string handler) -> EventBindingModifier {
    return EventBindingModifier{.event = event, .handler = std::move(handler)};
}

inline auto OnClick(std::string handler) -> EventBindingModifier {
    return On(DOMEvent::Click, std::move(handler));
}

inline auto AccessibilityLabel(std::string label) -> AccessibilityModifier {
    return AccessibilityModifier{.label = std::move(label)};
}

inline auto AccessibilityHidden() -> AccessibilityModifier {
    return AccessibilityModifier{.hidden = true};
}

inline auto AccessibilityRole(std::string role) -> AccessibilityModifier {
    return AccessibilityModifier{.role = std::move(role)};
}

} // namespace SC
