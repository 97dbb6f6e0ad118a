#include <doctest/doctest.h>
#include <score/cli/RenderOptions.hpp>

#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* key, const char* value)
        : key_(key) {
        if (const char* existing = std::getenv(key)) {
            original_ = std::string{existing};
        }
        if (value != nullptr) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }

    ~EnvGuard() {
        if (original_.has_value()) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string                key_;
    std::optional<std::string> original_;
};

struct ArgvBuilder {
    explicit ArgvBuilder(std::initializer_list<const char*> args) {
        storage.reserve(args.size());
        for (auto value : args) {
            storage.emplace_back(value);
        }
        pointers.reserve(storage.size());
        for (auto& entry : storage) {
            pointers.push_back(entry.data());
        }
    }

    auto argc() const -> int { return static_cast<int>(pointers.size()); }
    auto argv() -> char** { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

// Clears every override so ambient variables cannot leak into a case.
struct CleanEnvironment {
    EnvGuard page{"SCORE_RENDER_PAGE", nullptr};
    EnvGuard config{"SCORE_RENDER_CONFIG", nullptr};
    EnvGuard output{"SCORE_RENDER_OUTPUT", nullptr};
    EnvGuard noTheme{"SCORE_RENDER_NO_THEME", nullptr};
};

} // namespace

TEST_SUITE("cli.render_options") {

TEST_CASE("Defaults without arguments") {
    CleanEnvironment clean;
    ArgvBuilder      argv{"score_render"};
    auto             parsed = SC::Cli::ParseRenderArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK(parsed->page == "home");
    CHECK(parsed->config_path.empty());
    CHECK(parsed->output_path.empty());
    CHECK_FALSE(parsed->environment.has_value());
    CHECK(parsed->use_default_theme);
    CHECK_FALSE(parsed->list_pages);
    CHECK_FALSE(parsed->show_help);
}

TEST_CASE("Flags populate options") {
    CleanEnvironment clean;
    ArgvBuilder      argv{"score_render",
                     "--page", "counter",
                     "--config", "site.json",
                     "--output", "out.html",
                     "--env", "prod",
                     "--no-theme"};
    auto             parsed = SC::Cli::ParseRenderArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK(parsed->page == "counter");
    CHECK(parsed->config_path == "site.json");
    CHECK(parsed->output_path == "out.html");
    CHECK(parsed->environment == SC::Render::Environment::Production);
    CHECK_FALSE(parsed->use_default_theme);
}

TEST_CASE("Help and listing skip page validation") {
    CleanEnvironment clean;
    ArgvBuilder      help{"score_render", "-h"};
    auto             parsedHelp = SC::Cli::ParseRenderArguments(help.argc(), help.argv());
    REQUIRE(parsedHelp.has_value());
    CHECK(parsedHelp->show_help);

    ArgvBuilder list{"score_render", "--list-pages"};
    auto        parsedList = SC::Cli::ParseRenderArguments(list.argc(), list.argv());
    REQUIRE(parsedList.has_value());
    CHECK(parsedList->list_pages);
}

TEST_CASE("Invalid arguments are rejected") {
    CleanEnvironment clean;
    for (auto args : {std::vector<const char*>{"score_render", "--page", "Home"},
                      std::vector<const char*>{"score_render", "--page"},
                      std::vector<const char*>{"score_render", "--env", "staging"},
                      std::vector<const char*>{"score_render", "--config", ""},
                      std::vector<const char*>{"score_render", "--verbose"}}) {
        std::vector<std::string> storage(args.begin(), args.end());
        std::vector<char*>       pointers;
        for (auto& entry : storage) {
            pointers.push_back(entry.data());
        }
        CHECK_FALSE(SC::Cli::ParseRenderArguments(static_cast<int>(pointers.size()), pointers.data()).has_value());
    }
}

TEST_CASE("Page name validation") {
    CHECK(SC::Cli::IsValidPageName("home"));
    CHECK(SC::Cli::IsValidPageName("blog-post_2"));
    CHECK_FALSE(SC::Cli::IsValidPageName(""));
    CHECK_FALSE(SC::Cli::IsValidPageName("Home"));
    CHECK_FALSE(SC::Cli::IsValidPageName("../etc"));

    SC::Cli::RenderOptions options{};
    options.page = "bad name";
    auto error   = SC::Cli::ValidateRenderOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--page") != std::string::npos);

    options.list_pages = true;
    CHECK_FALSE(SC::Cli::ValidateRenderOptions(options).has_value());
}

TEST_CASE("Environment overrides apply before flags") {
    CleanEnvironment clean;
    EnvGuard         page{"SCORE_RENDER_PAGE", "catalog"};
    EnvGuard         noTheme{"SCORE_RENDER_NO_THEME", "yes"};

    ArgvBuilder argv{"score_render"};
    auto        parsed = SC::Cli::ParseRenderArguments(argv.argc(), argv.argv());
    REQUIRE(parsed.has_value());
    CHECK(parsed->page == "catalog");
    CHECK_FALSE(parsed->use_default_theme);

    ArgvBuilder withFlag{"score_render", "--page", "home"};
    auto        flagged = SC::Cli::ParseRenderArguments(withFlag.argc(), withFlag.argv());
    REQUIRE(flagged.has_value());
    CHECK(flagged->page == "home");
}

TEST_CASE("Invalid environment override fails early") {
    CleanEnvironment clean;
    EnvGuard         noTheme{"SCORE_RENDER_NO_THEME", "maybe"};

    ArgvBuilder argv{"score_render"};
    CHECK_FALSE(SC::Cli::ParseRenderArguments(argv.argc(), argv.argv()).has_value());
}

} // TEST_SUITE
