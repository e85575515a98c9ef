#pragma once

#include "core/style.hpp"
#include "core/tile_decoder.hpp"
#include "core/tile_fetcher.hpp"
#include <atomic>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace braille_map
{

struct tile_source_options_t
{
  size_t cache_size = 32;
  std::string language = "en";
  int http_timeout_ms = 5000;
};

/*
 * Hands out decoded tiles from a local archive or a remote server.
 *
 * Decoded tiles are held in a bounded LRU cache keyed by "z-x-y"; a hit
 * skips decoding. Failures never escape get_tile(): the caller receives an
 * empty tile, and transient failures stay uncached so the next frame retries.
 * get_tile() is safe to call from several threads at once.
 */
class tile_source_t
{
public:
  // Throws std::runtime_error if a local archive cannot be opened
  tile_source_t(const tile_source_config_t &config, std::shared_ptr<const style_set_t> style, tile_source_options_t options = {});
  tile_source_t(std::unique_ptr<tile_fetcher_t> fetcher, std::shared_ptr<const style_set_t> style, tile_source_options_t options = {});
  ~tile_source_t();

  tile_source_t(const tile_source_t &) = delete;
  auto operator=(const tile_source_t &) -> tile_source_t & = delete;

  auto get_tile(const tile_id_t &id) -> std::shared_ptr<const parsed_tile_t>;

  auto get_metadata() -> std::map<std::string, std::string>;

  // Releases the fetcher and drops cached tiles. Later calls return empty tiles.
  auto close() -> void;

  auto cached_count() const -> size_t;
  auto decode_count() const -> size_t
  {
    return m_decode_count;
  }

private:
  using cache_entry_t = std::pair<std::shared_ptr<const parsed_tile_t>, std::list<std::string>::iterator>;

  std::shared_ptr<tile_fetcher_t> m_fetcher;
  std::shared_ptr<const style_set_t> m_style;
  tile_source_options_t m_options;

  mutable std::mutex m_cache_mutex;
  std::list<std::string> m_lru; // front = most recently used
  std::unordered_map<std::string, cache_entry_t> m_cache;
  std::shared_ptr<const parsed_tile_t> m_empty_tile;

  std::mutex m_fetcher_mutex;
  std::atomic<size_t> m_decode_count{0};
  bool m_closed = false;

  auto lookup(const std::string &key) -> std::shared_ptr<const parsed_tile_t>;
  auto store(const std::string &key, std::shared_ptr<const parsed_tile_t> tile) -> void;
};

} // namespace braille_map
