#include <filesystem>
#include <iostream>

#include "app/LinkerApp.hpp"

int main(int argc, char* argv[]) {
    try {
        zlinker::app::LinkerApp app(std::filesystem::current_path());
        return app.Run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[zlinker] Fatal: " << e.what() << std::endl;
        return zlinker::app::LinkerApp::kExitFailure;
    }
}
