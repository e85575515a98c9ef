#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace braille_map
{

// xterm-256 palette index
using color_t = std::uint8_t;

namespace color
{

// Parse "#rgb" or "#rrggbb". Malformed input yields pure red.
auto hex_to_rgb(const std::string &hex) -> std::array<int, 3>;

// Nearest entry of the 6x6x6 cube (16-231) or the greyscale ramp (232-255)
auto rgb_to_xterm(int r, int g, int b) -> color_t;

auto hex_to_xterm(const std::string &hex) -> color_t;

// Inverse of rgb_to_xterm on the cube and ramp levels. Indices 0-15 map to the
// standard terminal colours.
auto xterm_to_hex(int index) -> std::string;

} // namespace color
} // namespace braille_map
