/*
 * chatgate - Multi-session chat gateway
 *
 * Usage:
 *   ./chatgate [config.json]
 */

#include <chatgate/core/application.hpp>

int main(int argc, char* argv[]) {
    chatgate::Application& app = chatgate::Application::instance();

    if (!app.init(argc, argv)) {
        app.shutdown();
        return 1;
    }

    int rc = app.run();
    app.shutdown();
    return rc;
}
