#include <exception>
#include <iostream>
#include <string>

#include "core/map_config.hpp"
#include "core/map_renderer.hpp"

constexpr const char *CONFIG_FILE = "braille_map.json";
constexpr int VIEW_WIDTH = 160;
constexpr int VIEW_HEIGHT = 96;

// Main code
int main(int argc, char **argv)
{
  std::string config_path = argc > 1 ? argv[1] : CONFIG_FILE;

  braille_map::map_config_t config;
  if (!braille_map::load_map_config(config_path, config))
  {
    std::cout << "Using default configuration (" << config_path << " not loaded)" << std::endl;
  }

  try
  {
    braille_map::map_renderer_t renderer(VIEW_WIDTH, VIEW_HEIGHT, config);

    auto frame = renderer.draw();
    for (const auto &line : frame.lines)
    {
      std::cout << line << "\n";
    }
    std::cout << "Center: " << frame.center.lat << ", " << frame.center.lon << "  Zoom: " << frame.zoom << "  Scale: " << frame.scale << std::endl;

    renderer.close();
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
