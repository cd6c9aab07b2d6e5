#include "element/Element.hpp"
#include "log/TaggedLogger.hpp"
#include "markup/MarkupDocument.hpp"
#include "path/PathData.hpp"
#include "path/PathJson.hpp"
#include "tools/cli/CommandLine.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

enum class OutputMode {
    Canonical,
    Json,
    Markup
};

struct PathToolOptions {
    std::vector<std::string>             paths;
    OutputMode                           mode   = OutputMode::Canonical;
    int                                  indent = 2;
    std::optional<std::filesystem::path> outputPath;
};

void print_usage() {
    std::cout << "Usage: svgdom_path [options] <path-data>...\n"
                 "Parses each path-data argument and prints its canonical form.\n"
                 "Options:\n"
                 "  --json, -j            Print the parsed segments as JSON\n"
                 "  --markup, -m          Print an SVG document with one <path> per argument\n"
                 "  --indent <n>          JSON indent (default 2, -1 for compact)\n"
                 "  --output, -o <file>   Write to file instead of stdout\n"
                 "  --help, -h            Show this message\n"
                 "Environment:\n"
                 "  SVGDOM_LOG=1          Enable debug logging (debug builds)\n";
}

auto parse_cli(int argc, char** argv) -> std::optional<PathToolOptions> {
    using SD::Tools::CLI::CommandLine;
    PathToolOptions options;

    CommandLine cli;
    cli.set_program_name("svgdom_path");
    cli.set_error_logger([](std::string const& message) { std::cerr << message << "\n"; });
    cli.set_positional_handler([&](std::string_view token) {
        options.paths.emplace_back(token);
        return true;
    });

    cli.add_flag("--json", {.on_set = [&] { options.mode = OutputMode::Json; }});
    cli.add_flag("--markup", {.on_set = [&] { options.mode = OutputMode::Markup; }});
    cli.add_int("--indent", {.on_value = [&](int value) { options.indent = value; }});

    CommandLine::ValueOption outputOption{};
    outputOption.on_value = [&](std::optional<std::string_view> value) -> CommandLine::ParseError {
        if (!value || value->empty()) {
            return std::string{"--output requires a file"};
        }
        options.outputPath = std::filesystem::path(std::string{*value});
        return std::nullopt;
    };
    cli.add_value("--output", std::move(outputOption));

    auto helpHandler = [] {
        print_usage();
        std::exit(0);
    };
    cli.add_flag("--help", {.on_set = helpHandler});
    cli.add_alias("-h", "--help");
    cli.add_alias("-j", "--json");
    cli.add_alias("-m", "--markup");
    cli.add_alias("-o", "--output");

    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }
    if (options.paths.empty()) {
        std::cerr << "svgdom_path: no path data given\n";
        return std::nullopt;
    }
    return options;
}

auto write_output(std::string const& text, std::optional<std::filesystem::path> const& output) -> bool {
    if (!output) {
        std::cout << text;
        return true;
    }
    std::ofstream stream(*output, std::ios::binary);
    if (!stream.is_open()) {
        std::cerr << "Failed to open output file '" << output->string() << "'" << std::endl;
        return false;
    }
    stream << text;
    if (!stream.good()) {
        std::cerr << "Failed to write output" << std::endl;
        return false;
    }
    return true;
}

auto render_markup(std::vector<SD::PathData> paths) -> SD::Expected<std::string> {
    SD::Element svg{"svg"};
    for (auto& path : paths) {
        SD::Element element{"path"};
        element.setPath(std::move(path));
        svg.addChild(std::move(element));
    }
    SD::MarkupDocument document;
    if (auto error = svg.writeMarkup(document))
        return std::unexpected(*error);
    return document.toString();
}

} // namespace

int main(int argc, char** argv) {
#ifdef SD_LOG_DEBUG
    SD::set_thread_name("Main");
    SD::enable_logging_from_environment();
#endif

    auto options = parse_cli(argc, argv);
    if (!options) {
        print_usage();
        return 1;
    }

    std::vector<SD::PathData> parsed;
    parsed.reserve(options->paths.size());
    for (auto const& text : options->paths) {
        auto path = SD::PathData::parse(text);
        if (!path) {
            std::cerr << "svgdom_path: " << SD::describeError(path.error()) << std::endl;
            return 1;
        }
        parsed.push_back(std::move(*path));
    }

    std::string output;
    switch (options->mode) {
    case OutputMode::Canonical:
        for (auto const& path : parsed) {
            output.append(path.toString());
            output.push_back('\n');
        }
        break;
    case OutputMode::Json:
        for (auto const& path : parsed) {
            output.append(SD::PathJsonExporter::Export(path, SD::PathJsonOptions{.indent = options->indent}));
            output.push_back('\n');
        }
        break;
    case OutputMode::Markup: {
        auto markup = render_markup(std::move(parsed));
        if (!markup) {
            std::cerr << "svgdom_path: " << SD::describeError(markup.error()) << std::endl;
            return 1;
        }
        output = std::move(*markup);
        break;
    }
    }

    return write_output(output, options->outputPath) ? 0 : 1;
}
