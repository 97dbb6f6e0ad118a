#include <score/cli/RenderOptions.hpp>
#include <score/config/SiteConfig.hpp>
#include <score/demo/DemoPages.hpp>
#include <score/log/TaggedLogger.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

// Node catalog defects surface as logic_error; report them like any other failure.
auto render_page(std::string const&  page,
                 SC::Metadata const* metadata,
                 SC::Theme const*    theme,
                 SC::Render::Environment environment) -> SC::Expected<SC::Render::RenderResult> {
    try {
        return SC::Demo::RenderDemoPage(page, metadata, theme, environment);
    } catch (std::logic_error const& error) {
        return std::unexpected(SC::Error{SC::Error::Code::UnknownError, "rendering '" + page + "' failed: " + error.what()});
    }
}

} // namespace

int main(int argc, char** argv) {
#ifdef SC_LOG_DEBUG
    SC::set_thread_name("score_render");
#endif

    auto options_opt = SC::Cli::ParseRenderArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        SC::Cli::PrintRenderUsage();
        return EXIT_SUCCESS;
    }
    if (options.list_pages) {
        for (auto name : SC::Demo::DemoPageNames()) {
            std::cout << name << "\n";
        }
        return EXIT_SUCCESS;
    }

    std::optional<SC::Metadata> metadata;
    std::optional<SC::Theme>    theme;
    if (!options.config_path.empty()) {
        auto config = SC::Config::LoadSiteConfig(options.config_path);
        if (!config) {
            std::cerr << "Failed to load site config: " << SC::describeError(config.error()) << std::endl;
            return EXIT_FAILURE;
        }
        metadata = std::move(config->metadata);
        theme    = std::move(config->theme);
    }
    if (!theme && options.use_default_theme) {
        theme = SC::DefaultTheme();
    }

    auto const environment = options.environment.value_or(SC::Render::CurrentEnvironment());

    auto result = render_page(options.page, metadata ? &*metadata : nullptr, theme ? &*theme : nullptr, environment);
    if (!result) {
        std::cerr << SC::describeError(result.error()) << std::endl;
        return EXIT_FAILURE;
    }

    if (options.output_path.empty()) {
        std::cout << result->html;
        return std::cout ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    std::ofstream stream(options.output_path, std::ios::binary);
    if (!stream) {
        std::cerr << "Failed to open output file '" << options.output_path << "'" << std::endl;
        return EXIT_FAILURE;
    }
    stream << result->html;
    if (!stream) {
        std::cerr << "Failed to write document" << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
