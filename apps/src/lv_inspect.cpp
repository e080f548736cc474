// Inspect chunked, indexed datasets from the command line.
//
// Usage:
//   lv_inspect index <path>
//   lv_inspect chunks <chunk> [<chunk>...]
//   lv_inspect items <index> <chunk>
//   lv_inspect peek <index> <chunk> <item> <field>
//   lv_inspect open <index> <chunk> <item> <field>
//
// Results are printed to stdout as JSON. Failures print {"code", "message"}
// to stderr and exit with status 1. Log output goes to stderr.

#include "lv/core/Config.hpp"
#include "lv/core/Inspector.hpp"
#include "lv/core/Version.hpp"
#include "lv/core/util/Error.hpp"
#include "lv/core/util/LoadJson.hpp"
#include "lv/core/util/Logging.hpp"

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace po = boost::program_options;
using json = nlohmann::json;

static void print_usage(const po::options_description& desc)
{
    std::cout << lv::ProjectInfo::NameAndVersion() << "\n\n"
              << "Usage: lv_inspect <command> [args] [options]\n\n"
              << "Commands:\n"
              << "  index <path>                          Describe a dataset (index file, directory or chunk)\n"
              << "  chunks <chunk> [<chunk>...]           Describe an explicit selection of chunk files\n"
              << "  items <index> <chunk>                 List the items of one chunk\n"
              << "  peek <index> <chunk> <item> <field>   Preview one field\n"
              << "  open <index> <chunk> <item> <field>   Export one field and open it\n\n"
              << desc << "\n";
}

static void expect_args(const std::string& command, const std::vector<std::string>& args, std::size_t n)
{
    if (args.size() != n) {
        throw lv::Error::invalid(command + " expects " + std::to_string(n) + " argument(s), got " +
                                 std::to_string(args.size()));
    }
}

static uint64_t parse_index(const std::string& text, const char* what, uint64_t max)
{
    std::size_t used = 0;
    unsigned long long v = 0;
    try {
        if (!text.empty() && text[0] == '-') throw std::invalid_argument(text);
        v = std::stoull(text, &used);
    } catch (const std::logic_error&) {
        throw lv::Error::invalid(std::string(what) + " must be a non-negative integer: " + text);
    }
    if (used != text.size() || v > max) {
        throw lv::Error::invalid(std::string(what) + " out of range: " + text);
    }
    return v;
}

static json run_command(lv::InspectorService& service, const std::string& command, const std::vector<std::string>& args)
{
    if (command == "index") {
        expect_args(command, args, 1);
        return service.loadIndex(args[0]).get().toJson();
    }
    if (command == "chunks") {
        std::vector<fs::path> paths(args.begin(), args.end());
        return service.loadChunkList(std::move(paths)).get().toJson();
    }
    if (command == "items") {
        expect_args(command, args, 2);
        return lv::toJson(service.listChunkItems(args[0], args[1]).get());
    }
    if (command == "peek" || command == "open") {
        expect_args(command, args, 4);
        auto item = static_cast<uint32_t>(parse_index(args[2], "item index", std::numeric_limits<uint32_t>::max()));
        auto field = static_cast<std::size_t>(parse_index(args[3], "field index", std::numeric_limits<uint32_t>::max()));
        if (command == "peek") {
            return service.peekField(args[0], args[1], item, field).get().toJson();
        }
        return service.openLeaf(args[0], args[1], item, field).get().toJson();
    }
    throw lv::Error::invalid("unknown command: " + command);
}

int main(int argc, char* argv[])
{
    // stdout carries the JSON result only
    lv::Logger()->use_stderr(true);

    po::options_description desc("lv_inspect options");
    desc.add_options()
        ("help,h", "Show help")
        ("config,c", po::value<std::string>(), "Engine configuration JSON file")
        ("log-level", po::value<std::string>()->default_value("warn"), "debug, info, warn, error or off")
        ("log-file", po::value<std::string>(), "Append log output to this file")
        ("threads,t", po::value<unsigned>(), "Worker threads (0 = one per core)")
        ("temp-dir", po::value<std::string>(), "Directory exported fields are written to")
        ("no-launch", po::bool_switch()->default_value(false), "Export fields without opening a viewer")
        ("pretty", po::bool_switch()->default_value(false), "Indent the JSON output");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>(), "Command to run")
        ("args", po::value<std::vector<std::string>>()->default_value({}, ""), "Command arguments");

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description pos;
    pos.add("command", 1).add("args", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(pos).run(), vm);
        if (vm.count("help") || !vm.count("command")) {
            print_usage(desc);
            return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\nUse --help for usage\n";
        return EXIT_FAILURE;
    }

    const bool pretty = vm["pretty"].as<bool>();
    try {
        lv::SetLogLevel(vm["log-level"].as<std::string>());
        if (vm.count("log-file")) {
            lv::AddLogFile(vm["log-file"].as<std::string>());
        }

        lv::EngineConfig cfg;
        if (vm.count("config")) {
            cfg = lv::EngineConfig::load(vm["config"].as<std::string>());
        }
        if (vm.count("threads")) {
            cfg.workerThreads = vm["threads"].as<unsigned>();
        }
        if (vm.count("temp-dir")) {
            cfg.tempDir = vm["temp-dir"].as<std::string>();
        }
        if (vm["no-launch"].as<bool>()) {
            cfg.launchViewer = false;
        }
        lv::Logger()->debug("engine config: {}", lv::json::dump_json(cfg.toJson()));

        lv::InspectorService service(cfg);
        auto result = run_command(service, vm["command"].as<std::string>(),
                                  vm["args"].as<std::vector<std::string>>());
        std::cout << lv::json::dump_json(result, pretty ? 2 : -1) << std::endl;
        return EXIT_SUCCESS;
    } catch (const lv::Error& e) {
        std::cerr << lv::json::dump_json(lv::toJson(e), pretty ? 2 : -1) << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << lv::json::dump_json(lv::toJson(lv::Error::task(e.what())), pretty ? 2 : -1) << std::endl;
        return EXIT_FAILURE;
    }
}
