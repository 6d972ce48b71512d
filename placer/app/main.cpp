#include <filesystem>

#include "placer/app/App.hpp"

int main(int argc, char** argv)
{
    const std::filesystem::path configPath = argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::path("config/placer.json");
    placer::app::App app(configPath);
    return app.Run() ? 0 : 1;
}
