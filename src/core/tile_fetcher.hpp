#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

struct sqlite3;

namespace braille_map
{

struct tile_id_t
{
  int z = 0;
  int x = 0;
  int y = 0;

  // Cache key "z-x-y"
  auto key() const -> std::string;
};

// Local MBTiles archive
struct mbtiles_source_t
{
  std::string path;
};

// Remote tile server, tiles at {base_url}{z}/{x}/{y}.pbf
struct http_source_t
{
  std::string base_url;
};

using tile_source_config_t = std::variant<mbtiles_source_t, http_source_t>;

// Map a source string onto a source kind. Throws std::invalid_argument for
// unsupported schemes.
auto parse_tile_source(const std::string &source) -> tile_source_config_t;

class tile_fetcher_t
{
public:
  virtual ~tile_fetcher_t() = default;

  // Raw tile bytes. An empty string is a definitive "no tile here";
  // std::nullopt reports a transient failure worth retrying later.
  virtual auto fetch_tile(const tile_id_t &id) -> std::optional<std::string> = 0;

  virtual auto get_metadata() -> std::map<std::string, std::string>
  {
    return {};
  }

  virtual auto close() -> void
  {
  }

  virtual auto get_name() const -> const char * = 0;
};

class mbtiles_fetcher_t : public tile_fetcher_t
{
public:
  // Opens the archive read-only. Throws std::runtime_error on failure.
  explicit mbtiles_fetcher_t(const std::string &path);
  ~mbtiles_fetcher_t() override;

  auto fetch_tile(const tile_id_t &id) -> std::optional<std::string> override;
  auto get_metadata() -> std::map<std::string, std::string> override;
  auto close() -> void override;
  auto get_name() const -> const char * override
  {
    return "MBTiles";
  }

private:
  std::string m_path;
  sqlite3 *m_db = nullptr;
  std::mutex m_mutex;
};

class http_fetcher_t : public tile_fetcher_t
{
public:
  http_fetcher_t(std::string base_url, int timeout_ms);

  auto fetch_tile(const tile_id_t &id) -> std::optional<std::string> override;
  auto get_name() const -> const char * override
  {
    return "HTTP";
  }

private:
  std::string m_base_url;
  int m_timeout_ms;
};

auto make_tile_fetcher(const tile_source_config_t &config, int http_timeout_ms = 5000) -> std::unique_ptr<tile_fetcher_t>;

} // namespace braille_map
