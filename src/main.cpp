#include "config/config.hpp"
#include "core/core.hpp"

int main(int argc, char **argv) {
    Err err = config::InitFromArgs(argc, argv);
    if (err != Err::Ok) {
        return ExitCode(err);
    }

    err = core::Init();
    if (err != Err::Ok) {
        return ExitCode(err);
    }

    return ExitCode(core::Run());
}
