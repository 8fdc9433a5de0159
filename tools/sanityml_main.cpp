// sanityml command line
//
//     sanityml TARGET [--full] [--python] [--notebooks] [--deps] [--models]
//                     [--rules FILE] [--advisories FILE] [--json] [--no-info]
//                     [--jobs N] [--timeout-ms N] [--log-level LEVEL]
//     sanityml --disassemble FILE
//
// Exit status: 0 clean, 1 warn or critical findings, 2 usage or
// configuration error.

#include "sanityml/sanityml.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_USAGE = 2;

void print_usage(std::ostream& os) {
    os << "Usage: sanityml TARGET [options]\n"
       << "       sanityml --disassemble FILE\n"
       << "\n"
       << "Scan an ML project for code-execution risk without running anything.\n"
       << "\n"
       << "Categories (default: all):\n"
       << "  --full               Scan everything\n"
       << "  --python             Python source files\n"
       << "  --notebooks          Jupyter notebooks\n"
       << "  --deps               requirements files\n"
       << "  --models             Serialized model files\n"
       << "\n"
       << "Options:\n"
       << "  --rules FILE         Rule table to use instead of the built-in one\n"
       << "  --advisories FILE    Local advisory database for dependencies\n"
       << "  --json               Write the report as JSON\n"
       << "  --no-info            Hide info findings in the text report\n"
       << "  --jobs N             Worker threads (0 = one per core)\n"
       << "  --timeout-ms N       Per-artifact time limit (0 = none)\n"
       << "  --log-level LEVEL    debug, info, warning or error\n"
       << "  --disassemble FILE   Print the pickle opcodes of a model file\n";
}

struct CliArgs {
    std::string target;
    bool python = false;
    bool notebooks = false;
    bool deps = false;
    bool models = false;
    bool full = false;
    bool json = false;
    bool show_info = true;
    bool help = false;
    std::optional<std::string> rules_file;
    std::optional<std::string> advisories_file;
    std::optional<std::string> disassemble;
    sanityml::ScanOptions options;
};

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return v;
    } catch (const std::exception&) {
        throw sanityml::SanityMLError(flag + " expects an integer, got '" + value + "'");
    }
}

CliArgs parse_args(int argc, char** argv) {
    CliArgs args;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw sanityml::SanityMLError(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return args;
        }
        if (arg == "--full") args.full = true;
        else if (arg == "--python") args.python = true;
        else if (arg == "--notebooks") args.notebooks = true;
        else if (arg == "--deps" || arg == "--dependencies") args.deps = true;
        else if (arg == "--models") args.models = true;
        else if (arg == "--json") args.json = true;
        else if (arg == "--no-info") args.show_info = false;
        else if (arg == "--rules") args.rules_file = value();
        else if (arg == "--advisories") args.advisories_file = value();
        else if (arg == "--disassemble") args.disassemble = value();
        else if (arg == "--jobs") args.options.num_workers = parse_int(arg, value());
        else if (arg == "--timeout-ms") args.options.artifact_timeout_ms = parse_int(arg, value());
        else if (arg == "--log-level") args.options.log_level = value();
        else if (!arg.empty() && arg[0] == '-') {
            throw sanityml::SanityMLError("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (args.disassemble) {
        if (!positional.empty()) {
            throw sanityml::SanityMLError("--disassemble takes no TARGET");
        }
        return args;
    }
    if (positional.size() != 1) {
        throw sanityml::SanityMLError("Expected exactly one TARGET");
    }
    args.target = positional.front();

    auto errors = args.options.validate();
    if (!errors.empty()) {
        throw sanityml::OptionsError(errors);
    }
    return args;
}

// Print every stream of a model file, pickletools style
int disassemble(const std::string& path, const sanityml::ScanOptions& options) {
    using namespace sanityml;

    io::FileBuffer buffer = io::FileBuffer::load(path, options.max_artifact_bytes);
    container::Demultiplexer demux(options);
    container::DemuxResult parts = demux.split(buffer.view(), extension_of(path));

    for (const auto& failure : parts.failures) {
        std::cout << "# " << failure.entry << ": " << scan_error_kind_name(failure.failure.kind)
                  << ": " << failure.failure.message << "\n";
    }

    for (const auto& stream : parts.streams) {
        std::cout << "# stream " << (stream.name.empty() ? "<artifact>" : stream.name) << "\n";
        pickle::ReaderLimits limits;
        limits.max_stream_bytes = options.max_stream_bytes;
        pickle::OpcodeReader reader(stream.bytes, limits, stream.start);
        try {
            while (auto op = reader.next()) {
                std::cout << pickle::format_operation(*op) << "\n";
            }
            std::cout << "highest protocol among opcodes = " << reader.protocol() << "\n";
        } catch (const StreamError& e) {
            std::cout << "# " << scan_error_kind_name(e.kind()) << " at offset "
                      << e.offset() << ": " << e.what() << "\n";
        }
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    using namespace sanityml;

    CliArgs args;
    try {
        args = parse_args(argc, argv);
    } catch (const SanityMLError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    if (args.help) {
        print_usage(std::cout);
        return 0;
    }

    if (args.disassemble) {
        try {
            return disassemble(*args.disassemble, args.options);
        } catch (const SanityMLError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    const LogLevel log_level = parse_log_level(args.options.log_level);
    const auto start_time = std::chrono::steady_clock::now();

    // Rule and advisory files are loaded before anything is scanned; a bad
    // table aborts the run
    std::shared_ptr<const rules::RuleTable> rules;
    std::shared_ptr<const deps::AdvisoryDatabase> advisories;
    try {
        rules = args.rules_file ? rules::RuleTable::load_file(*args.rules_file)
                                : rules::RuleTable::defaults();
        if (args.advisories_file) {
            advisories = deps::AdvisoryDatabase::load_file(*args.advisories_file);
        }
    } catch (const RuleLoadError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const deps::AdvisoryLoadError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
    log_message(log_level, LogLevel::Info,
                "Loaded " + std::to_string(rules->size()) + " rules" +
                (advisories ? " and " + std::to_string(advisories->size()) + " advisories" : ""));

    const bool any_category = args.python || args.notebooks || args.deps || args.models;
    DiscoveryOptions discovery_options;
    discovery_options.python = args.full || !any_category || args.python;
    discovery_options.notebooks = args.full || !any_category || args.notebooks;
    discovery_options.dependencies = args.full || !any_category || args.deps;
    discovery_options.models = args.full || !any_category || args.models;

    Discovery found;
    try {
        found = discover_targets(args.target, discovery_options);
    } catch (const SanityMLError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
    log_message(log_level, LogLevel::Info,
                "Discovered " + std::to_string(found.python_files.size()) + " python files, " +
                std::to_string(found.notebooks.size()) + " notebooks, " +
                std::to_string(found.requirements.size()) + " requirements files, " +
                std::to_string(found.models.size()) + " models");

    if (discovery_options.dependencies && found.requirements.empty()) {
        log_message(log_level, LogLevel::Info, "No requirements file found");
    }
    if (!found.requirements.empty() && !advisories) {
        log_message(log_level, LogLevel::Warning,
                    "No advisory database given (--advisories); requirements are parsed only");
    }

    ScanPool pool(rules, args.options, advisories);
    auto reports = pool.run(found.targets());

    const double seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_time).count();
    ScanReport report = ScanReport::build(std::move(reports), seconds);

    if (args.json) {
        std::cout << render_json(report) << "\n";
    } else {
        std::cout << render_text(report, args.show_info);
    }
    return exit_status(report);
}
