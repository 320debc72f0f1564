/*
 * NovelForge C++ - Long-form story generation with memory
 *
 * Usage:
 *   ./novelforge [--config novelforge.json] <command> [options]
 *
 * Run with --help for the list of commands.
 */
#include <novelforge/app/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = novelforge::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        app.shutdown();
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}
