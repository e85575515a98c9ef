#pragma once

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>
#include <vector>

namespace braille_map
{

struct bbox_t
{
  double min_x = 0.0;
  double min_y = 0.0;
  double max_x = 0.0;
  double max_y = 0.0;
};

inline auto intersects(const bbox_t &a, const bbox_t &b) -> bool
{
  return a.min_x <= b.max_x && a.max_x >= b.min_x && a.min_y <= b.max_y && a.max_y >= b.min_y;
}

// Uniform grid bucket index over axis aligned boxes.
// T must expose a `bbox_t bounds` member. Every item is registered in each
// cell its bounds overlap, so queries only visit the cells they cover.
template <typename T> class spatial_index_t
{
public:
  explicit spatial_index_t(double cell_size = 256.0) : m_cell_size(cell_size)
  {
  }

  // Replace the contents with a batch of items
  auto load(std::vector<T> items) -> void
  {
    clear();
    m_items = std::move(items);
    for (size_t i = 0; i < m_items.size(); ++i)
    {
      add_to_grid(i);
    }
  }

  auto insert(T item) -> void
  {
    m_items.push_back(std::move(item));
    add_to_grid(m_items.size() - 1);
  }

  auto clear() -> void
  {
    m_items.clear();
    m_grid.clear();
    m_has_cells = false;
  }

  // Items whose bounds intersect the box, in insertion order
  auto search(const bbox_t &box) const -> std::vector<const T *>
  {
    std::vector<const T *> result;
    for (size_t idx : candidates(box))
    {
      if (intersects(m_items[idx].bounds, box))
        result.push_back(&m_items[idx]);
    }
    return result;
  }

  auto collides(const bbox_t &box) const -> bool
  {
    for (size_t idx : candidates(box))
    {
      if (intersects(m_items[idx].bounds, box))
        return true;
    }
    return false;
  }

  auto size() const -> size_t
  {
    return m_items.size();
  }

  auto empty() const -> bool
  {
    return m_items.empty();
  }

  auto items() const -> const std::vector<T> &
  {
    return m_items;
  }

private:
  using grid_key_t = std::pair<int, int>;

  double m_cell_size;
  std::vector<T> m_items;
  std::map<grid_key_t, std::vector<size_t>> m_grid;

  // Occupied cell range, used to clamp queries far outside the data
  bool m_has_cells = false;
  int m_min_cx = 0, m_min_cy = 0, m_max_cx = 0, m_max_cy = 0;

  auto cell_of(double v) const -> int
  {
    return static_cast<int>(std::floor(v / m_cell_size));
  }

  auto add_to_grid(size_t index) -> void
  {
    const bbox_t &b = m_items[index].bounds;
    int cx0 = cell_of(b.min_x), cx1 = cell_of(b.max_x);
    int cy0 = cell_of(b.min_y), cy1 = cell_of(b.max_y);

    for (int cy = cy0; cy <= cy1; ++cy)
    {
      for (int cx = cx0; cx <= cx1; ++cx)
      {
        m_grid[{cx, cy}].push_back(index);
      }
    }

    if (!m_has_cells)
    {
      m_min_cx = cx0;
      m_max_cx = cx1;
      m_min_cy = cy0;
      m_max_cy = cy1;
      m_has_cells = true;
    }
    else
    {
      m_min_cx = std::min(m_min_cx, cx0);
      m_max_cx = std::max(m_max_cx, cx1);
      m_min_cy = std::min(m_min_cy, cy0);
      m_max_cy = std::max(m_max_cy, cy1);
    }
  }

  auto candidates(const bbox_t &box) const -> std::vector<size_t>
  {
    std::vector<size_t> indices;
    if (!m_has_cells || box.min_x > box.max_x || box.min_y > box.max_y)
      return indices;

    int cx0 = std::max(cell_of(box.min_x), m_min_cx);
    int cx1 = std::min(cell_of(box.max_x), m_max_cx);
    int cy0 = std::max(cell_of(box.min_y), m_min_cy);
    int cy1 = std::min(cell_of(box.max_y), m_max_cy);

    for (int cy = cy0; cy <= cy1; ++cy)
    {
      for (int cx = cx0; cx <= cx1; ++cx)
      {
        auto it = m_grid.find({cx, cy});
        if (it != m_grid.end())
          indices.insert(indices.end(), it->second.begin(), it->second.end());
      }
    }

    // Items spanning several cells show up once per cell
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    return indices;
  }
};

} // namespace braille_map
