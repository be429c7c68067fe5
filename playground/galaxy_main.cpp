// Galaxy Generator
// Model: GalaxyModel lays out the spiral point cloud
// View: PointsRenderer draws it as additive point sprites
// Controller: GalaxyController runs the window, tweak panel and orbit camera

#include <galaxy/GalaxyController.hpp>
#include <galaxy/Logger.hpp>

int main() {
    Logger::instance().info("Starting Galaxy Generator...");

    try {
        galaxy::ViewerConfig config{
            .window_width = 1280,
            .window_height = 720,
            .window_title = "Galaxy Generator"
        };

        auto controller_result = galaxy::GalaxyController::create(config);
        if (!controller_result) {
            Logger::instance().error("Failed to create controller: {}", controller_result.error());
            return 1;
        }
        auto& controller = *controller_result;

        // Run main loop (blocks until window closes)
        if (auto result = controller->run(); !result) {
            Logger::instance().error("Runtime error: {}", result.error());
            return 1;
        }

        Logger::instance().info("Application exited successfully");
        return 0;

    } catch (const std::exception& e) {
        Logger::instance().error("Unhandled exception: {}", e.what());
        return 1;
    }
}
