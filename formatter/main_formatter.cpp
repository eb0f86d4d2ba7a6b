#include <glob.h>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "argparse/argparse.hpp"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"
#include "fmt/format.h"
#include "nlohmann/json.hpp"

#include "ast_print.hpp"
#include "dfixxer_errors.hpp"
#include "options.hpp"
#include "pascal_syntax_tree.hpp"
#include "pascal_formatter.hpp"
#include "replacements.hpp"
#include "section_extractor.hpp"

#ifndef DFIXXER_VERSION_STRING
#define DFIXXER_VERSION_STRING "custom-build"
#endif

namespace fs = std::filesystem;
using namespace dfixxer;

static const std::vector<std::string> LOG_LEVELS = {"off", "error", "warn", "info", "debug", "trace"};

/**
 * @brief Files designated by the command line argument, expanded as a glob
 * pattern in multi mode.
 */
static std::vector<fs::path> expand_files(const std::string& arg, bool multi)
{
    if(! multi)
        return {fs::path(arg)};

    glob_t results;
    int rc = ::glob(arg.c_str(), 0, nullptr, &results);
    if(rc != 0)
    {
        globfree(&results);
        if(rc == GLOB_NOMATCH)
            throw io_error(fmt::format("No file matches {}", arg));
        throw io_error(fmt::format("Failed to expand pattern {}", arg));
    }

    std::vector<fs::path> ret;
    for(std::size_t i = 0; i < results.gl_pathc; i++)
        ret.emplace_back(results.gl_pathv[i]);
    globfree(&results);
    std::sort(ret.begin(), ret.end());
    return ret;
}

static void announce(const fs::path& file, bool multi)
{
    if(multi)
        std::cout << "Processing file: " << fs::absolute(file).string() << std::endl;
}

static bool is_excluded(const fs::path& file, const fs::path& config_path)
{
    Options options = Options::load_or_default(config_path);
    if(options.exclude_files.empty())
        return false;
    return options.is_file_excluded(fs::absolute(config_path).parent_path(), fs::absolute(file));
}

/**
 * @brief Run update or check over @p files.
 * @return The number of replacements found over all files.
 */
static std::size_t format_files(const std::vector<fs::path>& files, const std::optional<fs::path>& config, bool multi, bool write)
{
    std::size_t total = 0;
    for(const fs::path& file : files)
    {
        fs::path config_path = resolve_config_path(file, config);
        if(is_excluded(file, config_path))
            continue;

        if(! write)
            announce(file, multi);

        TimingCollector timing;
        FileResult result = process_file(file, config_path, timing);
        total += result.replacements.size();

        if(write)
        {
            if(! result.replacements.empty())
                timing.time_operation("File writing", [&]() {
                    merge_replacements_to_file(file, result.source, result.replacements);
                });
        }
        else
            print_replacements(std::cout, result.source, result.replacements);

        timing.log_summary();
    }
    return total;
}

static void parse_files(const std::vector<fs::path>& files, bool multi, bool as_json)
{
    for(const fs::path& file : files)
    {
        announce(file, multi);
        std::string source = read_source_file(file);
        if(as_json)
        {
            nlohmann::json dump = extract_sections(source);
            std::cout << dump.dump(2) << std::endl;
        }
        else
        {
            std::unique_ptr<pascal::PascalSyntaxTree> tree = pascal::PascalSyntaxTree::parse(source);
            if(! tree)
                throw parse_error(fmt::format("Failed to parse {}", file.string()));
            print_pascal_cst(std::cout, &tree->root(), tree->source());
        }
    }
}

static void add_file_arguments(argparse::ArgumentParser& cmd, bool with_config)
{
    cmd.add_argument("file")
        .help("File path, or glob pattern with --multi");
    cmd.add_argument("--multi")
        .help("Expand the file argument as a glob pattern")
        .default_value(false)
        .implicit_value(true);
    if(with_config)
        cmd.add_argument("--config")
            .help("Configuration file to use instead of the discovered one");
}

int main(int argc, char** argv) {
    argparse::ArgumentParser prog("dfixxer", DFIXXER_VERSION_STRING);
    prog.add_description("Delphi / Object Pascal source formatter");
    prog.add_argument("--log-level")
        .help("One of off, error, warn, info, debug, trace")
        .default_value(std::string{"warn"});

    argparse::ArgumentParser update_cmd("update");
    update_cmd.add_description("Rewrite the file(s) in place");
    add_file_arguments(update_cmd, true);

    argparse::ArgumentParser check_cmd("check");
    check_cmd.add_description("Print the replacements, exit status is their count");
    add_file_arguments(check_cmd, true);

    argparse::ArgumentParser init_cmd("init-config");
    init_cmd.add_description("Write a default configuration file");
    init_cmd.add_argument("file")
        .help("Configuration file to create");

    argparse::ArgumentParser parse_cmd("parse");
    parse_cmd.add_description("Print the syntax tree");
    add_file_arguments(parse_cmd, false);

    argparse::ArgumentParser parse_debug_cmd("parse-debug");
    parse_debug_cmd.add_description("Print the extracted sections as JSON");
    add_file_arguments(parse_debug_cmd, false);

    argparse::ArgumentParser version_cmd("version");
    version_cmd.add_description("Print the version");

    prog.add_subparser(update_cmd);
    prog.add_subparser(check_cmd);
    prog.add_subparser(init_cmd);
    prog.add_subparser(parse_cmd);
    prog.add_subparser(parse_debug_cmd);
    prog.add_subparser(version_cmd);

    try {
        prog.parse_args(argc, argv);
    }
    catch (const std::runtime_error& err) {
        spdlog::error(err.what());
        std::cerr << prog << std::endl;
        std::exit(1);
    }

    std::string level_name = prog.get<std::string>("--log-level");
    if(std::find(LOG_LEVELS.begin(), LOG_LEVELS.end(), level_name) == LOG_LEVELS.end())
    {
        spdlog::error(invalid_args_error(fmt::format("Unknown log level {}", level_name)).what());
        std::cerr << prog << std::endl;
        std::exit(1);
    }

    // Setup SPDLOG
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("main", console_sink);
    logger->set_level(spdlog::level::from_str(level_name));
    logger->flush_on(logger->level());
    spdlog::set_default_logger(logger);

    try {
        if(prog.is_subcommand_used(update_cmd) || prog.is_subcommand_used(check_cmd))
        {
            bool write = prog.is_subcommand_used(update_cmd);
            argparse::ArgumentParser& cmd = write ? update_cmd : check_cmd;

            std::optional<fs::path> config;
            if(auto path = cmd.present<std::string>("--config"))
                config = fs::path(*path);

            bool multi = cmd.get<bool>("--multi");
            std::size_t total = format_files(expand_files(cmd.get<std::string>("file"), multi), config, multi, write);
            return write ? 0 : check_exit_status(total);
        }
        else if(prog.is_subcommand_used(init_cmd))
        {
            fs::path target = init_cmd.get<std::string>("file");
            Options::create_default_config(target);
            spdlog::info("Default configuration written to {}", target.string());
        }
        else if(prog.is_subcommand_used(parse_cmd) || prog.is_subcommand_used(parse_debug_cmd))
        {
            bool as_json = prog.is_subcommand_used(parse_debug_cmd);
            argparse::ArgumentParser& cmd = as_json ? parse_debug_cmd : parse_cmd;
            bool multi = cmd.get<bool>("--multi");
            parse_files(expand_files(cmd.get<std::string>("file"), multi), multi, as_json);
        }
        else if(prog.is_subcommand_used(version_cmd))
        {
            std::cout << "dfixxer " << DFIXXER_VERSION_STRING << std::endl;
        }
        else
        {
            std::cerr << prog << std::endl;
            return 1;
        }
    }
    catch (const dfixxer_base_exception& err) {
        spdlog::error(err.what());
        spdlog::debug("Error details: {}", nlohmann::json(err).dump());
        return 1;
    }
    catch (const fs::filesystem_error& err) {
        spdlog::error(err.what());
        return 1;
    }

    return 0;
}
