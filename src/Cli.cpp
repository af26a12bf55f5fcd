/**
 * @file Cli.cpp
 * @brief Subcommand dispatch for the autodeploy tool
 */

#include "autodeploy/Cli.hpp"
#include "autodeploy/Engine.hpp"
#include "autodeploy/Environment.hpp"
#include "autodeploy/Errors.hpp"
#include "autodeploy/Ingest.hpp"
#include "autodeploy/Loader.hpp"
#include "autodeploy/Logging.hpp"
#include "autodeploy/Parse.hpp"
#include "autodeploy/Settings.hpp"
#include "autodeploy/SourceModel.hpp"

#include <cxxopts.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace autodeploy {

namespace {

void write_text(const std::string& path, const std::string& text) {
    std::ofstream ofs(path);
    if (!ofs) throw ConfigError("Cannot write to " + path);
    ofs << text;
}

int run_merge(const Settings& settings, const std::string& out_path, const std::string& report_path,
              std::ostream& out, std::ostream& err) {
    const EngineConfig config = settings.engine_config();
    const auto descriptors = settings.repositories();
    if (descriptors.empty()) {
        err << "Error: no repositories configured\n";
        return kExitFatal;
    }

    const LicenseFileResolver resolver(config.policy);
    std::vector<RepositoryInput> inputs;
    for (const auto& d : descriptors) {
        inputs.push_back(load_repository(d, resolver, config.source_extensions));
    }

    try {
        MergeResult result = merge(std::move(inputs), config);

        if (out_path.empty()) {
            out << result.unit.serialize();
        } else {
            write_text(out_path, result.unit.serialize());
        }
        if (!report_path.empty()) {
            write_text(report_path, result.report.to_json().dump(2) + "\n");
        }
        if (result.has_conflicts()) {
            err << result.report.summary() << "\n";
            return kExitConflicts;
        }
        return kExitClean;
    } catch (const EngineError& e) {
        if (!report_path.empty()) {
            write_text(report_path, e.report().to_json().dump(2) + "\n");
        }
        throw;
    }
}

int run_fingerprint(const std::vector<std::string>& files, std::ostream& out, std::ostream& err) {
    if (files.empty()) {
        err << "Error: fingerprint needs at least one FILE\n";
        return kExitFatal;
    }
    Repository scratch;
    scratch.id = "cli";
    scratch.index = 0;

    for (const auto& path : files) {
        const SourceUnit unit = parse(scratch, path, read_text_file(path));
        for (const auto& decl : unit.declarations) {
            out << path << ":" << decl.line << "\t" << to_string(decl.kind) << "\t" << decl.name
                << "\t" << decl.fingerprint.hex() << "\n";
        }
    }
    return kExitClean;
}

} // anonymous namespace

int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    try {
        cxxopts::Options options("autodeploy", "Merge C-family repositories into one deduplicated unit");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("c,config", "Path to JSON/TOML settings", cxxopts::value<std::string>())
            ("s,set", "key:value override (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("o,out", "Write merged source here instead of stdout", cxxopts::value<std::string>()->default_value(""))
            ("r,report", "Write the conflict report (JSON) here", cxxopts::value<std::string>()->default_value(""))
            ("no-env", "Ignore AUTODEPLOY_* environment variables")
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            out << options.help() << "\n";
            out << "Commands: merge | fingerprint FILE... | dump-config\n";
            return kExitClean;
        }

        LoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        if (!result.count("no-env")) load.env_prefix = kEnvPrefix;
        if (result.count("set")) {
            load.overrides = parse_overrides(result["set"].as<std::vector<std::string>>());
        }

        const Settings settings = Settings::load(load);
        initialize_logging(settings.logging());

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv.front();

        if (cmd == "merge") {
            return run_merge(settings, result["out"].as<std::string>(), result["report"].as<std::string>(),
                             out, err);
        }
        if (cmd == "fingerprint") {
            return run_fingerprint(std::vector<std::string>(cmdv.begin() + 1, cmdv.end()), out, err);
        }
        if (cmd == "dump-config") {
            out << settings.to_json_string(2) << "\n";
            return kExitClean;
        }
        err << "Unknown command: " << cmd << "\n";
        return kExitFatal;

    } catch (const ConfigError& ex) {
        err << "Configuration error: " << ex.what() << "\n";
        return kExitFatal;
    } catch (const EngineError& ex) {
        err << "Error: " << ex.what() << "\n";
        if (!ex.report().empty()) {
            err << ex.report().summary() << "\n";
        }
        return kExitFatal;
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return kExitFatal;
    }
}

} // namespace autodeploy
