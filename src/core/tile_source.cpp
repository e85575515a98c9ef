#include "core/tile_source.hpp"
#include <iostream>

namespace braille_map
{

tile_source_t::tile_source_t(const tile_source_config_t &config, std::shared_ptr<const style_set_t> style, tile_source_options_t options)
    : tile_source_t(make_tile_fetcher(config, options.http_timeout_ms), std::move(style), options)
{
}

tile_source_t::tile_source_t(std::unique_ptr<tile_fetcher_t> fetcher, std::shared_ptr<const style_set_t> style, tile_source_options_t options)
    : m_fetcher(std::move(fetcher)), m_style(std::move(style)), m_options(std::move(options)), m_empty_tile(std::make_shared<parsed_tile_t>())
{
  if (m_options.cache_size == 0)
    m_options.cache_size = 1;
  if (!m_style)
    m_style = std::make_shared<style_set_t>();
}

tile_source_t::~tile_source_t()
{
  close();
}

auto tile_source_t::lookup(const std::string &key) -> std::shared_ptr<const parsed_tile_t>
{
  std::lock_guard<std::mutex> lock(m_cache_mutex);
  auto it = m_cache.find(key);
  if (it == m_cache.end())
    return nullptr;

  m_lru.splice(m_lru.begin(), m_lru, it->second.second);
  return it->second.first;
}

auto tile_source_t::store(const std::string &key, std::shared_ptr<const parsed_tile_t> tile) -> void
{
  std::lock_guard<std::mutex> lock(m_cache_mutex);
  if (m_closed)
    return;

  auto it = m_cache.find(key);
  if (it != m_cache.end())
  {
    // Another thread decoded the same tile first
    m_lru.splice(m_lru.begin(), m_lru, it->second.second);
    it->second.first = std::move(tile);
    return;
  }

  m_lru.push_front(key);
  m_cache.emplace(key, cache_entry_t{std::move(tile), m_lru.begin()});

  while (m_cache.size() > m_options.cache_size)
  {
    m_cache.erase(m_lru.back());
    m_lru.pop_back();
  }
}

auto tile_source_t::get_tile(const tile_id_t &id) -> std::shared_ptr<const parsed_tile_t>
{
  const auto key = id.key();
  if (auto cached = lookup(key))
    return cached;

  std::shared_ptr<tile_fetcher_t> fetcher;
  {
    std::lock_guard<std::mutex> lock(m_fetcher_mutex);
    fetcher = m_fetcher;
  }
  if (!fetcher)
    return m_empty_tile;

  // Fetches run outside the lock so visible tiles load in parallel
  std::optional<std::string> data = fetcher->fetch_tile(id);

  if (!data)
    return m_empty_tile;

  std::shared_ptr<const parsed_tile_t> tile;
  try
  {
    tile = std::make_shared<parsed_tile_t>(decode_tile(*data, *m_style, m_options.language));
  }
  catch (const std::exception &e)
  {
    std::cerr << "TileSource: failed to decode tile " << key << ": " << e.what() << std::endl;
    return m_empty_tile;
  }

  ++m_decode_count;
  store(key, tile);
  return tile;
}

auto tile_source_t::get_metadata() -> std::map<std::string, std::string>
{
  std::lock_guard<std::mutex> lock(m_fetcher_mutex);
  if (!m_fetcher)
    return {};
  return m_fetcher->get_metadata();
}

auto tile_source_t::close() -> void
{
  {
    std::lock_guard<std::mutex> lock(m_fetcher_mutex);
    if (m_fetcher)
    {
      m_fetcher->close();
      m_fetcher.reset();
    }
  }

  std::lock_guard<std::mutex> lock(m_cache_mutex);
  m_closed = true;
  m_cache.clear();
  m_lru.clear();
}

auto tile_source_t::cached_count() const -> size_t
{
  std::lock_guard<std::mutex> lock(m_cache_mutex);
  return m_cache.size();
}

} // namespace braille_map
