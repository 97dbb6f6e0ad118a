#include <doctest/doctest.h>
#include <score/css/Fingerprint.hpp>
#include <score/modifier/BehaviorModifiers.hpp>
#include <score/modifier/StyleModifiers.hpp>
#include <score/node/AnyNode.hpp>
#include <score/node/Elements.hpp>
#include <score/render/PageRenderer.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

using namespace SC;
using namespace SC::Render;

namespace {

struct PlainPage {
    auto body() const { return Paragraph("Hello") | Padding(16); }
};

struct TitledPage {
    auto metadata() const -> std::optional<MetadataPatch> {
        MetadataPatch patch;
        patch.title    = "Home";
        patch.keywords = std::vector<std::string>{"start"};
        return patch;
    }

    auto body() const { return Main(Heading(1, "Home")); }
};

struct CounterPage {
    Reactive::State<int> count{0};
    Reactive::Action     increment;

    auto reactive_fields() const -> Reactive::FieldList {
        Reactive::FieldList fields;
        fields.add("count", count).add("increment", increment);
        return fields;
    }

    auto body() const {
        return Main(Paragraph("0") | FontSize(32), Button("+") | OnClick("increment") | Padding(8));
    }
};

struct MisnamedHandlerPage {
    auto body() const { return Button("Go") | OnClick("go();alert(1)"); }
};

struct ErasedPage {
    bool compact{false};

    auto body() const -> AnyNode {
        if (compact) {
            return Small("compact");
        }
        return Section(Paragraph("full") | Margin(4));
    }
};

auto position_of(std::string const& html, std::string const& needle) -> std::size_t {
    auto const position = html.find(needle);
    REQUIRE(position != std::string::npos);
    return position;
}

} // namespace

TEST_SUITE("render.page") {

TEST_CASE("Pages are recognised by their body") {
    static_assert(Page<PlainPage>);
    static_assert(Page<ErasedPage>);
    static_assert(!Page<MetadataPatch>);
    CHECK(true);
}

TEST_CASE("A padded paragraph yields one rule and a classed element") {
    auto const result = RenderPage(PlainPage{}, nullptr, nullptr, Environment::Production);
    auto const cls    = Css::ClassNameFor(Css::Fingerprint({{"padding", "16px"}}));

    CHECK(result.rule_count == 1);
    CHECK(result.component_css == "." + cls + " {\n  padding: 16px;\n}\n");
    CHECK(result.html.find("<p class=\"" + cls + "\">Hello</p>") != std::string::npos);
    CHECK(result.theme_css.empty());
    CHECK(result.environment == Environment::Production);
}

TEST_CASE("Pages without reactivity ship no script") {
    auto const result = RenderPage(PlainPage{}, nullptr, nullptr, Environment::Development);

    CHECK(result.script.empty());
    CHECK(result.binding_count == 0);
    CHECK(result.html.find("<script") == std::string::npos);
    CHECK(result.html.find("<title>") == std::string::npos);
}

TEST_CASE("Reactive pages load the runtime before the page script") {
    auto const result = RenderPage(CounterPage{}, nullptr, nullptr, Environment::Development);

    CHECK(result.binding_count == 1);
    CHECK(result.script.starts_with("<script>\nconst count = Score.state(0);\nfunction increment() {}\n"));
    CHECK(result.script.find("document.querySelector('[data-s~=\"2\"]').addEventListener(\"click\", increment);")
          != std::string::npos);
    CHECK(result.html.find("data-s=\"2\"") != std::string::npos);

    auto const polyfill = position_of(result.html, "<script src=\"/_score/signal-polyfill.js\"></script>");
    auto const runtime  = position_of(result.html, "<script src=\"/_score/score-runtime.js\"></script>");
    auto const page     = position_of(result.html, "<script>\nconst count");
    auto const body     = position_of(result.html, "<body>");
    CHECK(body < polyfill);
    CHECK(polyfill < runtime);
    CHECK(runtime < page);
}

TEST_CASE("Page metadata overrides application metadata") {
    Metadata metadata;
    metadata.site        = "Score";
    metadata.title       = "Docs";
    metadata.description = "Site description";
    metadata.keywords    = {"site"};

    auto const overridden = RenderPage(TitledPage{}, &metadata, nullptr, Environment::Production);
    CHECK(overridden.html.find("<title>Home | Score</title>") != std::string::npos);
    CHECK(overridden.html.find("<meta name=\"keywords\" content=\"start\">") != std::string::npos);
    CHECK(overridden.html.find("<meta name=\"description\" content=\"Site description\">") != std::string::npos);

    auto const inherited = RenderPage(PlainPage{}, &metadata, nullptr, Environment::Production);
    CHECK(inherited.html.find("<title>Docs | Score</title>") != std::string::npos);
    CHECK(inherited.html.find("<meta name=\"keywords\" content=\"site\">") != std::string::npos);

    metadata.title_separator = " - ";
    auto const separated = RenderPage(TitledPage{}, &metadata, nullptr, Environment::Production);
    CHECK(separated.html.find("<title>Home - Score</title>") != std::string::npos);

    auto const standalone = RenderPage(TitledPage{}, nullptr, nullptr, Environment::Production);
    CHECK(standalone.html.find("<title>Home</title>") != std::string::npos);
}

TEST_CASE("Structured data is embedded and cannot close its script") {
    Metadata metadata;
    metadata.structured_data.push_back(nlohmann::json{{"@type", "Organization"}, {"name", "</script>"}});

    auto const result = RenderPage(PlainPage{}, &metadata, nullptr, Environment::Production);
    CHECK(result.html.find("<script type=\"application/ld+json\">{\"@type\":\"Organization\",\"name\":\"<\\/script>\"}"
                           "</script>")
          != std::string::npos);
}

TEST_CASE("Theme tokens precede component rules") {
    auto theme = DefaultTheme();
    theme.name = "ocean";

    auto const result = RenderPage(PlainPage{}, nullptr, &theme, Environment::Production);
    CHECK_FALSE(result.theme_css.empty());
    CHECK(result.html.find("<html lang=\"en\" data-theme=\"ocean\">") != std::string::npos);

    auto const tokens = position_of(result.html, "<style>\n:root {");
    auto const rules  = position_of(result.html, "<style>\n.s-");
    CHECK(tokens < rules);
}

TEST_CASE("Type-erased bodies render through the same passes") {
    auto const full = RenderPage(ErasedPage{}, nullptr, nullptr, Environment::Production);
    CHECK(full.rule_count == 1);
    CHECK(full.html.find("<section><p class=\"s-") != std::string::npos);

    auto const compact = RenderPage(ErasedPage{.compact = true}, nullptr, nullptr, Environment::Production);
    CHECK(compact.rule_count == 0);
    CHECK(compact.html.find("<small>compact</small>") != std::string::npos);
}

TEST_CASE("Rendering is deterministic") {
    auto theme = DefaultTheme();
    auto const first  = RenderPage(CounterPage{}, nullptr, &theme, Environment::Production);
    auto const second = RenderPage(CounterPage{}, nullptr, &theme, Environment::Production);
    CHECK(first.html == second.html);
    CHECK(first.component_css == second.component_css);
}

TEST_CASE("Results come back directly and catalog defects throw") {
    RenderResult const result = RenderPage(PlainPage{}, nullptr, nullptr, Environment::Production);
    CHECK(result.environment == Environment::Production);
    CHECK_THROWS_AS(RenderPage(MisnamedHandlerPage{}, nullptr, nullptr, Environment::Production), std::logic_error);
}

} // TEST_SUITE
