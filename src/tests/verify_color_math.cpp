#include "../core/color_math.hpp"
#include <cassert>
#include <cstdlib>
#include <iostream>

using namespace braille_map;

void test_hex_parsing()
{
  std::cout << "Testing hex parsing..." << std::endl;
  auto rgb = color::hex_to_rgb("#0a4040");
  assert(rgb[0] == 10 && rgb[1] == 64 && rgb[2] == 64);

  auto short_form = color::hex_to_rgb("#fa0");
  assert(short_form[0] == 255 && short_form[1] == 170 && short_form[2] == 0);

  auto no_hash = color::hex_to_rgb("00ff00");
  assert(no_hash[0] == 0 && no_hash[1] == 255 && no_hash[2] == 0);

  // Malformed input falls back to red
  auto bad = color::hex_to_rgb("#zzzzzz");
  assert(bad[0] == 255 && bad[1] == 0 && bad[2] == 0);
  assert(color::hex_to_xterm("nonsense") == 196);
}

void test_cube_corners()
{
  std::cout << "Testing colour cube corners..." << std::endl;
  assert(color::hex_to_xterm("#000000") == 16);
  assert(color::hex_to_xterm("#ffffff") == 231);
  assert(color::hex_to_xterm("#ff0000") == 196);
  assert(color::hex_to_xterm("#00ff00") == 46);
  assert(color::hex_to_xterm("#0000ff") == 21);
  assert(color::hex_to_xterm("#ff00ff") == 201);

  const char *corners[] = {"#000000", "#ff0000", "#00ff00", "#0000ff", "#ffff00", "#ff00ff", "#00ffff", "#ffffff", "#5f87af", "#d7af5f"};
  for (const char *hex : corners)
  {
    std::string back = color::xterm_to_hex(color::hex_to_xterm(hex));
    std::cout << "  " << hex << " -> " << static_cast<int>(color::hex_to_xterm(hex)) << " -> " << back << std::endl;
    assert(back == hex);
  }
}

void test_grey_ramp()
{
  std::cout << "Testing greyscale ramp..." << std::endl;
  assert(color::hex_to_xterm("#080808") == 232);
  assert(color::hex_to_xterm("#eeeeee") == 255);
  assert(color::hex_to_xterm("#808080") == 244);
  assert(color::xterm_to_hex(232) == "#080808");
  assert(color::xterm_to_hex(255) == "#eeeeee");

  for (int index = 232; index <= 255; ++index)
  {
    std::string hex = color::xterm_to_hex(index);
    assert(color::hex_to_xterm(hex) == index);
  }
}

void test_bounded_quantization()
{
  std::cout << "Testing quantization error bound..." << std::endl;
  for (int r = 0; r < 256; r += 17)
  {
    for (int g = 0; g < 256; g += 17)
    {
      for (int b = 0; b < 256; b += 17)
      {
        auto back = color::hex_to_rgb(color::xterm_to_hex(color::rgb_to_xterm(r, g, b)));
        // Half of the widest cube step (0 -> 95)
        assert(std::abs(back[0] - r) <= 48);
        assert(std::abs(back[1] - g) <= 48);
        assert(std::abs(back[2] - b) <= 48);
      }
    }
  }
}

void test_basic_and_invalid_indices()
{
  std::cout << "Testing basic palette..." << std::endl;
  assert(color::xterm_to_hex(0) == "#000000");
  assert(color::xterm_to_hex(9) == "#ff0000");
  assert(color::xterm_to_hex(15) == "#ffffff");
  assert(color::xterm_to_hex(-1) == "#000000");
  assert(color::xterm_to_hex(256) == "#000000");
}

int main()
{
  test_hex_parsing();
  test_cube_corners();
  test_grey_ramp();
  test_bounded_quantization();
  test_basic_and_invalid_indices();
  std::cout << "Color Math Verification Passed" << std::endl;
  return 0;
}
