#include <score/reactive/JsEmitter.hpp>

#include <stdexcept>

namespace SC::Reactive {

namespace {

void require_identifier(std::string const& name, char const* what) {
    if (!IsJsIdentifier(name)) {
        throw std::logic_error(std::string{what} + " '" + name + "' is not a JS identifier");
    }
}

void append_fields(std::string& js, FieldList const& fields, FieldKind kind) {
    for (auto const& field : fields.fields()) {
        if (field.kind != kind) {
            continue;
        }
        switch (kind) {
        case FieldKind::State:
            js.append("const ").append(field.name).append(" = Score.state(");
            js.append(field.initial.value_or("undefined")).append(");\n");
            break;
        case FieldKind::Computed:
            js.append("const ").append(field.name).append(" = Score.computed(() => ");
            js.append(field.name).append(");\n");
            break;
        case FieldKind::Action:
            js.append("function ").append(field.name).append("() {}\n");
            break;
        }
    }
}

} // namespace

auto PositionSelector(std::size_t position) -> std::string {
    return "[data-s~=\"" + std::to_string(position) + "\"]";
}

auto EmitScript(FieldList const& fields, std::vector<ElementBinding> const& bindings) -> std::string {
    if (fields.empty() && bindings.empty()) {
        return {};
    }

    for (auto const& field : fields.fields()) {
        require_identifier(field.name, "reactive field");
    }
    for (auto const& binding : bindings) {
        require_identifier(binding.handler, "handler");
    }

    std::string js;
    append_fields(js, fields, FieldKind::State);
    append_fields(js, fields, FieldKind::Computed);
    append_fields(js, fields, FieldKind::Action);

    for (auto const& binding : bindings) {
        js.append("document.querySelector('").append(PositionSelector(binding.position)).append("')");
        js.append(".addEventListener(").append(QuoteJsString(binding.event)).append(", ");
        js.append(binding.handler).append(");\n");
    }

    return "<script>\n" + js + "</script>";
}

} // namespace SC::Reactive
