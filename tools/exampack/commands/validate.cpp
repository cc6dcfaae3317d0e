/**
 * exampack CLI - validate command
 *
 * Run the schema and business-rule checks over an unpacked pack directory.
 */

#include "../common.hpp"
#include <exampack/validator.hpp>
#include <CLI/CLI.hpp>

namespace exampack::cli::commands {

namespace {

struct ValidateOptions {
    std::string dir;
};

nlohmann::json issues_to_json(const std::vector<ValidationIssue>& issues) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& issue : issues) {
        nlohmann::json j;
        j["file"] = issue.file;
        if (issue.line) j["line"] = *issue.line;
        j["field"] = issue.field;
        j["message"] = issue.message;
        arr.push_back(j);
    }
    return arr;
}

int cmd_validate(const GlobalOptions& opts, const ValidateOptions& validate_opts) {
    configure_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto report = validate_pack_directory(validate_opts.dir);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = report.is_valid;
        j["errors"] = issues_to_json(report.errors);
        j["warnings"] = issues_to_json(report.warnings);
        output_json(j);
        return report.is_valid ? 0 : 1;
    }

    for (const auto& e : report.errors) {
        std::cout << "error: " << format_issue(e) << std::endl;
    }
    if (!opts.quiet) {
        for (const auto& w : report.warnings) {
            std::cout << "warning: " << format_issue(w) << std::endl;
        }
    }
    std::cout << (report.is_valid ? "Pack is valid" : "Pack is invalid")
              << " (" << report.errors.size() << " error(s), "
              << report.warnings.size() << " warning(s))" << std::endl;
    return report.is_valid ? 0 : 1;
}

} // anonymous namespace

void setup_validate(CLI::App* app, GlobalOptions& opts) {
    static ValidateOptions validate_opts;

    app->add_option("dir", validate_opts.dir, "Directory containing manifest.json")
        ->required()->check(CLI::ExistingDirectory);

    app->callback([&opts]() {
        std::exit(cmd_validate(opts, validate_opts));
    });
}

} // namespace exampack::cli::commands
