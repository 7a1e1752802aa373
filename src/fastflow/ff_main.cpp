#include <memory>

#include "ff_dispatcher.hpp"
#include "../slicecap/cli.hpp"

// Same tool as slicecap, with the worker slots run as a FastFlow farm
int main(int argc, char* argv[]) {
    return run_command_line(argc, argv, [](int parallel) {
        return std::unique_ptr<SliceDispatcher>(new FastFlowDispatcher(parallel));
    });
}
