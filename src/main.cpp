#include "core/cli.hpp"
#include "app.hpp"

int main(int argc, char* argv[]) {
    int cli_result = CLI::run(argc, argv);
    if (cli_result != -1) {
        // handled by CLI (help, version, one-shot operation, or error)
        return cli_result;
    }

    if (!CLI::ensure_root()) {
        return 1;
    }

    App app;
    return app.run_menu();
}
