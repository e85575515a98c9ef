#include "core/color_math.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace braille_map
{
namespace color
{

namespace
{

// Channel intensities of the xterm colour cube
constexpr std::array<int, 6> CUBE_LEVELS = {0, 95, 135, 175, 215, 255};

auto nearest_cube_level(int v) -> int
{
  int best = 0;
  for (int i = 1; i < static_cast<int>(CUBE_LEVELS.size()); ++i)
  {
    if (std::abs(CUBE_LEVELS[i] - v) < std::abs(CUBE_LEVELS[best] - v))
      best = i;
  }
  return best;
}

auto parse_hex_digits(const std::string &digits, int &out) -> bool
{
  if (digits.empty())
    return false;
  out = 0;
  for (char c : digits)
  {
    int v;
    if (c >= '0' && c <= '9')
      v = c - '0';
    else if (c >= 'a' && c <= 'f')
      v = c - 'a' + 10;
    else if (c >= 'A' && c <= 'F')
      v = c - 'A' + 10;
    else
      return false;
    out = out * 16 + v;
  }
  return true;
}

} // namespace

auto hex_to_rgb(const std::string &hex) -> std::array<int, 3>
{
  std::string digits = hex;
  if (!digits.empty() && digits[0] == '#')
    digits.erase(0, 1);

  if (digits.size() == 3)
  {
    std::array<int, 3> rgb{};
    for (int i = 0; i < 3; ++i)
    {
      if (!parse_hex_digits(std::string(2, digits[i]), rgb[i]))
        return {255, 0, 0};
    }
    return rgb;
  }

  int value = 0;
  if (digits.size() != 6 || !parse_hex_digits(digits, value))
    return {255, 0, 0};

  return {(value >> 16) & 255, (value >> 8) & 255, value & 255};
}

auto rgb_to_xterm(int r, int g, int b) -> color_t
{
  if (r == g && g == b)
  {
    if (r < 4)
      return 16; // black
    if (r > 246)
      return 231; // white
    int step = static_cast<int>(std::lround((r - 8) / 10.0));
    return static_cast<color_t>(232 + std::clamp(step, 0, 23));
  }

  int ri = nearest_cube_level(r);
  int gi = nearest_cube_level(g);
  int bi = nearest_cube_level(b);
  return static_cast<color_t>(16 + 36 * ri + 6 * gi + bi);
}

auto hex_to_xterm(const std::string &hex) -> color_t
{
  auto rgb = hex_to_rgb(hex);
  return rgb_to_xterm(rgb[0], rgb[1], rgb[2]);
}

auto xterm_to_hex(int index) -> std::string
{
  if (index < 0 || index > 255)
    return "#000000";

  if (index < 16)
  {
    static const char *basic[] = {"#000000", "#800000", "#008000", "#808000", "#000080", "#800080", "#008080", "#c0c0c0",
                                  "#808080", "#ff0000", "#00ff00", "#ffff00", "#0000ff", "#ff00ff", "#00ffff", "#ffffff"};
    return basic[index];
  }

  if (index < 232)
  {
    int i = index - 16;
    int r = CUBE_LEVELS[i / 36];
    int g = CUBE_LEVELS[(i % 36) / 6];
    int b = CUBE_LEVELS[i % 6];
    return std::format("#{:02x}{:02x}{:02x}", r, g, b);
  }

  int grey = 8 + (index - 232) * 10;
  return std::format("#{:02x}{:02x}{:02x}", grey, grey, grey);
}

} // namespace color
} // namespace braille_map
