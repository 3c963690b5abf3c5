/*
 * HalBox C++17 - Sandboxed code execution for a personal automation agent
 *
 * Usage:
 *   halbox --run-file script.py [--profile NAME]
 *   halbox --run-stdin [--prompt TEXT] [--profile NAME] < script.py
 *   halbox --env [--profile NAME]
 */
#include <halbox/app/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = halbox::Application::instance();

    if (!app.init(argc, argv)) {
        // --help/--version or a usage error
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}
