#include "delguard/cli/app.hpp"

int main(int argc, char** argv) {
    delguard::cli::App app;
    return app.run(argc, argv);
}
