#include <score/html/HtmlRenderer.hpp>

#include <score/html/HtmlEscape.hpp>
#include <score/modifier/BehaviorModifiers.hpp>

#include <algorithm>

namespace SC::Html {

namespace {

auto has_attribute(Attributes const& attributes, std::string_view name) -> bool {
    return std::any_of(attributes.begin(), attributes.end(), [&](auto const& entry) { return entry.first == name; });
}

void append_attribute(std::string& out, std::string_view name, std::string_view value) {
    out.push_back(' ');
    out.append(name);
    if (value.empty()) {
        return;
    }
    out.append("=\"");
    AppendEscapedAttribute(out, value);
    out.push_back('"');
}

} // namespace

void HtmlRenderer::text(std::string_view content) {
    AppendEscapedText(out_, content);
}

void HtmlRenderer::void_tag(std::string_view name, Attributes const& attributes) {
    open_tag(name, attributes);
}

auto HtmlRenderer::decorate(ModifierList const& modifiers) -> Decoration {
    auto const position = next_position_++;

    Decoration decoration;
    if (lookup_) {
        if (auto className = lookup_(modifiers)) {
            decoration.classes.push_back(std::move(*className));
        }
    }

    bool bound = false;
    for (auto const& modifier : modifiers) {
        if (modifier.is<EventBindingModifier>()) {
            bound = true;
        } else if (auto const* accessibility = modifier.as<AccessibilityModifier>()) {
            if (accessibility->label) {
                decoration.aria.emplace_back("aria-label", *accessibility->label);
            }
            if (accessibility->hidden) {
                decoration.aria.emplace_back("aria-hidden", "true");
            }
            if (accessibility->role) {
                decoration.aria.emplace_back("role", *accessibility->role);
            }
        }
    }
    if (bound) {
        decoration.positions.push_back(position);
    }
    return decoration;
}

void HtmlRenderer::open_tag(std::string_view name, Attributes const& attributes) {
    out_.push_back('<');
    out_.append(name);

    if (pending_.empty()) {
        for (auto const& [key, value] : attributes) {
            append_attribute(out_, key, value);
        }
        out_.push_back('>');
        return;
    }

    // Pending decorations were pushed outermost first; classes apply innermost first.
    std::string classes;
    for (auto it = pending_.rbegin(); it != pending_.rend(); ++it) {
        for (auto const& className : it->classes) {
            if (!classes.empty()) {
                classes.push_back(' ');
            }
            classes.append(className);
        }
    }
    std::string positions;
    for (auto const& decoration : pending_) {
        for (auto position : decoration.positions) {
            if (!positions.empty()) {
                positions.push_back(' ');
            }
            positions.append(std::to_string(position));
        }
    }

    Attributes merged = attributes;
    if (!classes.empty()) {
        auto existing = std::find_if(merged.begin(), merged.end(), [](auto const& entry) { return entry.first == "class"; });
        if (existing == merged.end()) {
            merged.emplace_back("class", classes);
        } else if (existing->second.empty()) {
            existing->second = classes;
        } else {
            existing->second.push_back(' ');
            existing->second.append(classes);
        }
    }
    if (!positions.empty()) {
        merged.emplace_back("data-s", positions);
    }
    for (auto it = pending_.rbegin(); it != pending_.rend(); ++it) {
        for (auto const& entry : it->aria) {
            if (!has_attribute(merged, entry.first)) {
                merged.push_back(entry);
            }
        }
    }
    pending_.clear();

    for (auto const& [key, value] : merged) {
        append_attribute(out_, key, value);
    }
    out_.push_back('>');
}

void HtmlRenderer::close_tag(std::string_view name) {
    out_.append("</");
    out_.append(name);
    out_.push_back('>');
}

} // namespace SC::Html
