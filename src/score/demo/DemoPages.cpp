#include <score/demo/DemoPages.hpp>

#include <score/modifier/BehaviorModifiers.hpp>
#include <score/modifier/StyleModifiers.hpp>
#include <score/node/AnyNode.hpp>
#include <score/node/Elements.hpp>
#include <score/reactive/Reactive.hpp>

#include <string>
#include <utility>

namespace SC::Demo {

namespace {

struct Feature {
    std::string title;
    std::string summary;
};

// Composite card reused by the home and catalog pages.
struct FeatureCard {
    Feature feature;

    auto body() const {
        return Article(Heading(3, feature.title) | FontSize(20, FontWeight::Semibold),
                       Paragraph(feature.summary) | ForegroundColor(SemanticColor::Muted))
               | Padding(16) | Background(SemanticColor::Surface) | CornerRadius(8)
               | Border(1, SemanticColor::Border);
    }
};

auto features() -> std::vector<Feature> {
    return {
            {"Typed trees", "Pages are plain C++ values; the compiler checks their structure."},
            {"Scoped styles", "Each distinct set of declarations becomes one content-addressed class."},
            {"Small scripts", "Only pages that declare state or bind events ship a script."},
    };
}

struct HomePage {
    auto metadata() const -> std::optional<MetadataPatch> {
        MetadataPatch patch;
        patch.title       = "Home";
        patch.description = "Declarative pages rendered to static HTML.";
        return patch;
    }

    auto body() const {
        return Main(Header(Heading(1, "Score") | FontSize(40, FontWeight::Bold),
                           Paragraph("Static-first pages with scoped styles.") | ForegroundColor(SemanticColor::Muted))
                            | Padding(24, Edge::Vertical),
                    Section(Each(features(), [](Feature const& feature) { return FeatureCard{feature}; }))
                            | Grid(3, 16),
                    Footer(Small("Rendered on the server."))
                            | Padding(16, Edge::Top) | Border(1, SemanticColor::Border))
               | Padding(32) | Flex(FlexDirection::Column, 24);
    }
};

struct CounterPage {
    Reactive::State<int>    count{0};
    Reactive::State<bool>   paused{false};
    Reactive::Computed<int> doubled{[] { return 0; }};
    Reactive::Action        increment;
    Reactive::Action        decrement;

    auto metadata() const -> std::optional<MetadataPatch> {
        MetadataPatch patch;
        patch.title = "Counter";
        return patch;
    }

    auto reactive_fields() const -> Reactive::FieldList {
        Reactive::FieldList fields;
        fields.add("count", count)
                .add("paused", paused)
                .add("doubled", doubled)
                .add("increment", increment)
                .add("decrement", decrement);
        return fields;
    }

    auto body() const {
        auto control = [](std::string label, std::string handler) {
            return Button(std::move(label)) | OnClick(std::move(handler)) | Padding(8)
                   | Background(PaletteColor{Palette::Blue, 500}) | ForegroundColor(SemanticColor::Surface)
                   | CornerRadius(6);
        };
        return Main(Heading(1, "Counter"),
                    Paragraph("0").attribute("data-bind", "count") | FontSize(32, FontWeight::Bold),
                    Stack(control("-", "decrement") | AccessibilityLabel("Decrement"),
                          control("+", "increment") | AccessibilityLabel("Increment"))
                            | Flex(FlexDirection::Row, 8))
               | Padding(32);
    }
};

struct CatalogPage {
    bool signed_in{false};

    auto metadata() const -> std::optional<MetadataPatch> {
        MetadataPatch patch;
        patch.title    = "Catalog";
        patch.keywords = std::vector<std::string>{"catalog", "elements"};
        return patch;
    }

    auto body() const {
        Array<AnyNode> samples;
        samples.push_back(Paragraph("Plain paragraph with ", Strong("strong"), " and ", Emphasis("emphasis"), " text."));
        samples.push_back(Blockquote("Quoted <markup> & entities stay escaped.") | Padding(12, Edge::Leading)
                          | Border(4, SemanticColor::Accent));
        samples.push_back(Preformatted(Code("auto page = RenderPage(home, nullptr, nullptr);"))
                          | Background(PaletteColor{Palette::Slate, 100}) | Padding(12));
        samples.push_back(UnorderedList(ListItem("Tuple"), ListItem("Conditional"), ListItem("Sequence")));
        samples.push_back(Image("/images/logo.svg", "Score logo") | Frame(64, 64) | AccessibilityRole("img"));
        samples.push_back(Form("/subscribe",
                               "post",
                               Label("email", "Email"),
                               Input("email", "email").attribute("id", "email").attribute("required"),
                               SubmitButton("Subscribe") | Padding(8, Edge::Horizontal))
                          | Flex(FlexDirection::Row, 8));
        samples.push_back(HorizontalRule() | Margin(16, Edge::Vertical));

        return Main(Heading(1, "Catalog"),
                    If(signed_in,
                       [] { return Paragraph("Welcome back."); },
                       [] { return Link("/login", "Sign in") | ForegroundColor(SemanticColor::Accent); }),
                    If(!signed_in, [] { return Small("Sign in to save favourites.") | Opacity(0.7); }),
                    std::move(samples),
                    Each(features(), [](Feature const& feature) { return FeatureCard{feature}; }))
               | Padding(32) | Flex(FlexDirection::Column, 16);
    }
};

} // namespace

auto DemoPageNames() -> std::vector<std::string_view> {
    return {"home", "counter", "catalog"};
}

auto RenderDemoPage(std::string_view    name,
                    Metadata const*     metadata,
                    Theme const*        theme,
                    Render::Environment environment) -> Expected<Render::RenderResult> {
    if (name == "home") {
        return Render::RenderPage(HomePage{}, metadata, theme, environment);
    }
    if (name == "counter") {
        return Render::RenderPage(CounterPage{}, metadata, theme, environment);
    }
    if (name == "catalog") {
        return Render::RenderPage(CatalogPage{}, metadata, theme, environment);
    }
    return std::unexpected(Error{Error::Code::NotFound, "no demo page named '" + std::string{name} + "'"});
}

} // namespace SC::Demo
