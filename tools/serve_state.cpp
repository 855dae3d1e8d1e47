#include <csignal>
#include <cstdlib>

#include <statespace/web/StateServer.hpp>

namespace {
void handle_signal(int) {
    STS::Web::RequestStateServerStop();
}
} // namespace

int main(int argc, char** argv) {
    auto options_opt = STS::Web::ParseStateServerArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        STS::Web::PrintStateServerUsage();
        return EXIT_SUCCESS;
    }

    STS::Web::ResetStateServerStopFlag();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    return STS::Web::RunStateServer(options);
}
