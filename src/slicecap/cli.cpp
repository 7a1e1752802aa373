#include "cli.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "../dispatch/subprocess.hpp"
#include "../include/errors.hpp"

namespace {

unsigned long long parse_unsigned(const std::string& opt, const std::string& value) {
    if (value.empty() || value[0] == '-' || value[0] == '+')
        throw ConfigError(opt + " expects a non-negative integer, got '" + value + "'");
    try {
        size_t used = 0;
        unsigned long long v = std::stoull(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::logic_error&) {
        throw ConfigError(opt + " expects a non-negative integer, got '" + value + "'");
    }
}

long long parse_signed(const std::string& opt, const std::string& value) {
    try {
        size_t used = 0;
        long long v = std::stoll(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::logic_error&) {
        throw ConfigError(opt + " expects an integer, got '" + value + "'");
    }
}

double parse_seconds(const std::string& opt, const std::string& value) {
    try {
        size_t used = 0;
        double v = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::logic_error&) {
        throw ConfigError(opt + " expects a number of seconds, got '" + value + "'");
    }
}

} // namespace

void print_usage(const std::string& prog_name) {
    std::cout << "Usage:\n";
    std::cout << "  " << prog_name << " -r <infile> [options] [--] <command template...>\n\n";
    std::cout << "Slice a pcap file into pieces at packet boundaries and feed each piece,\n";
    std::cout << "as a complete pcap stream, to the standard input of a command.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -r, --infile PATH        source pcap file (required)\n";
    std::cout << "  -n, --number N           number of slices (default: 2)\n";
    std::cout << "  -g, --maxgap SECONDS     idle gap that attracts a cut (default: 3600)\n";
    std::cout << "  -p, --parallel P|auto    concurrent commands (default: auto = CPU count)\n";
    std::cout << "      --resync-window B    bytes scanned for a record header (default: from snaplen)\n";
    std::cout << "      --gap-window B       bytes searched for a gap around each cut (default: 262144)\n";
    std::cout << "      --gap-records N      records searched per cut (default: 4096)\n";
    std::cout << "      --verify             check every record header before slicing\n";
    std::cout << "      --dry-run            print the slices and commands, run nothing\n";
    std::cout << "  -v, --verbose            more logging (repeat for trace)\n";
    std::cout << "  -q, --quiet              warnings and errors only\n";
    std::cout << "  -h, --help               this text\n\n";
    std::cout << "Placeholders in the command: {OFFSET} {SIZE} {SLICE_ID}; {{ and }} are literal braces.\n";
    std::cout << "The command runs through /bin/sh -c.\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << prog_name << " -r big.pcap -n 8 -- 'gzip > part_{SLICE_ID}.pcap.gz'\n";
    std::cout << "  " << prog_name << " -r big.pcap -n 4 -p 2 -- tcpdump -r - -w 'out_{OFFSET}.pcap'\n";
}

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cl;
    SliceConfig& cfg = cl.config;
    int verbosity = 0;

    int i = 1;
    auto value_of = [&](const std::string& opt) -> std::string {
        if (i + 1 >= argc) throw ConfigError("option " + opt + " needs a value");
        return argv[++i];
    };

    for (; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--") {
            ++i;
            break;
        }
        if (arg.empty() || arg[0] != '-' || arg == "-") break; // start of the command

        if (arg == "-h" || arg == "--help") {
            cl.help = true;
        } else if (arg == "-r" || arg == "--infile") {
            cfg.infile = value_of(arg);
        } else if (arg == "-n" || arg == "--number") {
            long long n = parse_signed(arg, value_of(arg));
            if (n < 1) throw ConfigError("number of slices must be at least 1, got " + std::to_string(n));
            cfg.slice_count = static_cast<size_t>(n);
        } else if (arg == "-g" || arg == "--maxgap") {
            cfg.max_gap_seconds = parse_seconds(arg, value_of(arg));
        } else if (arg == "-p" || arg == "--parallel") {
            std::string v = value_of(arg);
            if (v == "auto") {
                cfg.parallel = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
            } else {
                long long p = parse_signed(arg, v);
                if (p <= 0 || p > 1 << 16)
                    throw ConfigError("parallelism must be between 1 and 65536, got " + v);
                cfg.parallel = static_cast<int>(p);
            }
        } else if (arg == "--resync-window") {
            cfg.resync_window = parse_unsigned(arg, value_of(arg));
        } else if (arg == "--gap-window") {
            cfg.gap_window = parse_unsigned(arg, value_of(arg));
        } else if (arg == "--gap-records") {
            cfg.gap_window_records = static_cast<size_t>(parse_unsigned(arg, value_of(arg)));
        } else if (arg == "--verify") {
            cfg.verify = true;
        } else if (arg == "--dry-run") {
            cfg.dry_run = true;
        } else if (arg == "-v" || arg == "--verbose") {
            ++verbosity;
        } else if (arg == "-vv") {
            verbosity += 2;
        } else if (arg == "-q" || arg == "--quiet") {
            verbosity = -1;
        } else {
            throw ConfigError("unknown option " + arg);
        }
    }

    for (; i < argc; ++i) cfg.command_words.push_back(argv[i]);

    if (verbosity < 0) cfg.log_level = LogLevel::WARN;
    else if (verbosity == 1) cfg.log_level = LogLevel::DEBUG;
    else if (verbosity >= 2) cfg.log_level = LogLevel::TRACE;

    return cl;
}

int run_command_line(int argc, char* argv[], const DispatcherFactory& make_dispatcher) {
    ignore_sigpipe();

    CommandLine cl;
    try {
        cl = parse_command_line(argc, argv);
        if (!cl.help) cl.config.validate();
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 2;
    }
    if (cl.help) {
        print_usage(argv[0]);
        return 0;
    }

    Logger::instance().set_level(cl.config.log_level);

    try {
        Slicecap slicer(cl.config);

        if (cl.config.dry_run) {
            RunReport report = slicer.plan();
            for (size_t k = 0; k < report.plan.size(); ++k) {
                const auto& s = report.plan[k];
                std::cout << s.slice_id << " " << s.offset << " " << s.size;
                if (k < report.tasks.size()) std::cout << " " << report.tasks[k].command;
                std::cout << std::endl;
            }
            return 0;
        }

        std::unique_ptr<SliceDispatcher> dispatcher = make_dispatcher(cl.config.parallel);
        RunReport report = slicer.run(*dispatcher);
        return report.ok() ? 0 : 1;
    } catch (const FormatError& e) {
        LOG_ERROR("cannot slice %s: %s", cl.config.infile.c_str(), e.what());
    } catch (const ConfigError& e) {
        LOG_ERROR("configuration error: %s", e.what());
    } catch (const std::system_error& e) {
        LOG_ERROR("%s", e.what());
    } catch (const std::runtime_error& e) {
        LOG_ERROR("run aborted: %s", e.what());
    }
    return 2;
}
