#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "graft/Command.hpp"
#include "graft/Config.hpp"
#include "graft/Errors.hpp"
#include "graft/Format.hpp"
#include "graft/Log.hpp"
#include "graft/Util.hpp"

using namespace graft;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("graft", "Merge structured documents with path selectors");
        options.positional_help("[INPUT|-]");

        options.add_options()
            ("i,input-format", "Input format (" + join(format_names(), ", ") + "); default by extension",
                cxxopts::value<std::string>())
            ("o,output-format", "Output format; default is the format of the written document",
                cxxopts::value<std::string>())
            ("m,merge-with", "Merge the input into BASE at SELECTOR: 'BASE@SELECTOR'",
                cxxopts::value<std::string>())
            ("out", "Write to FILE instead of stdout", cxxopts::value<std::string>())
            ("on-duplicate", "Keyed updates with several matches: first|all|error",
                cxxopts::value<std::string>())
            ("strict", "Fail when the merge applied nothing")
            ("report", "Print merge counts to stderr")
            ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("set", "Override a setting: KEY=VALUE (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("log-level", "error|warn|info|debug", cxxopts::value<std::string>())
            ("v,verbose", "Same as --log-level debug")
            ("h,help", "Show help");

        options.add_options()
            ("input", "Input document", cxxopts::value<std::string>()->default_value("-"));
        options.parse_positional({"input"});

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Example: graft -i yaml ips.yaml --merge-with "
                         "'base.json@environment.preview.[].(name=allowedIps on value from Ips)'\n";
            return 0;
        }

        // Settings: --set first, dedicated flags win over it
        LoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        if (result.count("set")) {
            load.overrides = parse_overrides(result["set"].as<std::vector<std::string>>());
        }
        if (result.count("output-format")) load.overrides["output_format"] = result["output-format"].as<std::string>();
        if (result.count("on-duplicate")) load.overrides["merge.duplicates"] = result["on-duplicate"].as<std::string>();
        if (result.count("strict")) load.overrides["merge.strict"] = true;
        if (result.count("log-level")) load.overrides["log_level"] = result["log-level"].as<std::string>();
        if (result.count("verbose")) load.overrides["log_level"] = "debug";

        Config cfg = Config::load(load);
        set_log_level(cfg.log_level());
        log_debug("settings: " + cfg.to_json_string(-1));

        CommandOptions command;
        command.input = result["input"].as<std::string>();
        if (result.count("input-format")) command.input_format = result["input-format"].as<std::string>();
        if (result.count("merge-with")) command.merge_with = result["merge-with"].as<std::string>();
        if (result.count("out")) command.output_file = result["out"].as<std::string>();
        command.report = result.count("report") > 0;

        run_command(command, cfg, std::cout, std::cerr);
        return 0;

    } catch (const GraftError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
