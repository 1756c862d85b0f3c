#include "cli_options.h"

#include <cxxopts.hpp>

#include <stdexcept>

CliOptions parseCliOptions(int argc, const char* const* argv) {
    cxxopts::Options options("veracity", "Scores an English article as likely fake or likely reliable news");
    options.add_options()("model", "Model parameters (JSON)", cxxopts::value<std::string>())(
        "input", "Article file, - for stdin", cxxopts::value<std::string>()->default_value("-"))(
        "html", "Input is an HTML page")("any-page", "Classify pages without article markup")(
        "trace", "Print the processing and prediction breakdown to stderr")(
        "threshold", "Confidence below which the verdict is Uncertain",
        cxxopts::value<double>()->default_value("0.6"))("h,help", "Print help");
    options.parse_positional({"model", "input"});
    options.positional_help("MODEL_JSON [INPUT_FILE]");

    auto r = options.parse(argc, argv);

    CliOptions cli;
    cli.help_text = options.help();
    if (r.count("help")) {
        cli.help = true;
        return cli;
    }

    if (!r.count("model")) throw std::invalid_argument("missing model path");
    cli.model_path = r["model"].as<std::string>();
    cli.input_path = r["input"].as<std::string>();
    cli.html = r.count("html") > 0;
    cli.any_page = r.count("any-page") > 0;
    cli.trace = r.count("trace") > 0;
    cli.threshold = r["threshold"].as<double>();
    if (!(cli.threshold >= 0.5 && cli.threshold <= 1.0)) {
        throw std::invalid_argument("threshold must be within [0.5, 1]");
    }
    return cli;
}
