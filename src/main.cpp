#include <csignal>

#include "superagent/cli/app.hpp"

int main(int argc, char** argv) {
    // A dead MCP server must surface as a write error, not kill the agent.
    std::signal(SIGPIPE, SIG_IGN);

    superagent::cli::App app;
    return app.run(argc, argv);
}
