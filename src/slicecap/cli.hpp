#ifndef SLICECAP_CLI_HPP
#define SLICECAP_CLI_HPP

#include <functional>
#include <memory>
#include <string>

#include "slicecap.hpp"

struct CommandLine {
    SliceConfig config;
    bool help = false;
};

/**
 * Parse slicecap's options. Everything after "--", or from the first word
 * that is not an option, is the command template.
 *
 * @throws ConfigError on unknown options or malformed values.
 */
CommandLine parse_command_line(int argc, char* argv[]);

void print_usage(const std::string& prog_name);

using DispatcherFactory = std::function<std::unique_ptr<SliceDispatcher>(int parallel)>;

/**
 * The whole tool: parse, plan, dispatch, report.
 *
 * @return 0 when every slice worker succeeded, 1 when some worker failed,
 *         2 when the run could not start (bad options or unusable capture).
 */
int run_command_line(int argc, char* argv[], const DispatcherFactory& make_dispatcher);

#endif // SLICECAP_CLI_HPP
