#include "llmgate/cli/app.hpp"

int main(int argc, char** argv) {
    llmgate::cli::App app;
    return app.run(argc, argv);
}
