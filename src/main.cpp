#include <memory>

#include "openmp/omp_dispatcher.hpp"
#include "slicecap/cli.hpp"

int main(int argc, char* argv[]) {
    return run_command_line(argc, argv, [](int parallel) {
        return std::unique_ptr<SliceDispatcher>(new OpenMPDispatcher(parallel));
    });
}
