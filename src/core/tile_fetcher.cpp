#include "core/tile_fetcher.hpp"
#include <cpr/cpr.h>
#include <format>
#include <iostream>
#include <sqlite3.h>
#include <stdexcept>

namespace braille_map
{

auto tile_id_t::key() const -> std::string
{
  return std::format("{}-{}-{}", z, x, y);
}

auto parse_tile_source(const std::string &source) -> tile_source_config_t
{
  if (source.rfind("http://", 0) == 0 || source.rfind("https://", 0) == 0)
  {
    return http_source_t{source};
  }

  const std::string ext = ".mbtiles";
  if (source.size() > ext.size() && source.compare(source.size() - ext.size(), ext.size(), ext) == 0)
  {
    return mbtiles_source_t{source};
  }

  throw std::invalid_argument("Unsupported tile source: " + source);
}

// --- MBTiles ---------------------------------------------------------------

mbtiles_fetcher_t::mbtiles_fetcher_t(const std::string &path) : m_path(path)
{
  int rc = sqlite3_open_v2(path.c_str(), &m_db, SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK)
  {
    std::string msg = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
    sqlite3_close(m_db);
    m_db = nullptr;
    throw std::runtime_error("Failed to open MBTiles file: " + path + ": " + msg);
  }
  std::cout << "TileSource: opened " << path << std::endl;
}

mbtiles_fetcher_t::~mbtiles_fetcher_t()
{
  close();
}

auto mbtiles_fetcher_t::close() -> void
{
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_db)
  {
    sqlite3_close(m_db);
    m_db = nullptr;
  }
}

auto mbtiles_fetcher_t::fetch_tile(const tile_id_t &id) -> std::optional<std::string>
{
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_db)
    return std::nullopt;

  // MBTiles stores rows in TMS order (y axis flipped)
  int tms_y = (1 << id.z) - 1 - id.y;

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT tile_data FROM tiles WHERE zoom_level = ? AND tile_column = ? AND tile_row = ?";
  if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK)
  {
    std::cerr << "TileSource: SQLite error: " << sqlite3_errmsg(m_db) << std::endl;
    return std::nullopt;
  }

  sqlite3_bind_int(stmt, 1, id.z);
  sqlite3_bind_int(stmt, 2, id.x);
  sqlite3_bind_int(stmt, 3, tms_y);

  std::optional<std::string> result;
  int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW)
  {
    const void *blob = sqlite3_column_blob(stmt, 0);
    int size = sqlite3_column_bytes(stmt, 0);
    result = blob ? std::string(static_cast<const char *>(blob), static_cast<size_t>(size)) : std::string();
  }
  else if (rc == SQLITE_DONE)
  {
    // Missing row: nothing stored for this tile
    result = std::string();
  }
  else
  {
    std::cerr << "TileSource: SQLite error reading " << id.key() << ": " << sqlite3_errmsg(m_db) << std::endl;
  }

  sqlite3_finalize(stmt);
  return result;
}

auto mbtiles_fetcher_t::get_metadata() -> std::map<std::string, std::string>
{
  std::map<std::string, std::string> metadata;
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_db)
    return metadata;

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(m_db, "SELECT name, value FROM metadata", -1, &stmt, nullptr) != SQLITE_OK)
  {
    std::cerr << "TileSource: SQLite error: " << sqlite3_errmsg(m_db) << std::endl;
    return metadata;
  }

  while (sqlite3_step(stmt) == SQLITE_ROW)
  {
    const auto *name = sqlite3_column_text(stmt, 0);
    const auto *value = sqlite3_column_text(stmt, 1);
    if (name)
      metadata[reinterpret_cast<const char *>(name)] = value ? reinterpret_cast<const char *>(value) : "";
  }

  sqlite3_finalize(stmt);
  return metadata;
}

// --- HTTP ------------------------------------------------------------------

http_fetcher_t::http_fetcher_t(std::string base_url, int timeout_ms) : m_base_url(std::move(base_url)), m_timeout_ms(timeout_ms)
{
}

auto http_fetcher_t::fetch_tile(const tile_id_t &id) -> std::optional<std::string>
{
  std::string url = std::format("{}{}/{}/{}.pbf", m_base_url, id.z, id.x, id.y);

  cpr::Response r = cpr::Get(cpr::Url{url}, cpr::Timeout{m_timeout_ms}, cpr::Header{{"User-Agent", "BrailleMap/0.1"}});

  if (r.error.code != cpr::ErrorCode::OK)
  {
    std::cerr << "TileSource: fetch failed for " << url << ": " << r.error.message << std::endl;
    return std::nullopt;
  }
  if (r.status_code < 200 || r.status_code >= 300)
  {
    std::cerr << "TileSource: HTTP " << r.status_code << " for " << url << std::endl;
    return std::nullopt;
  }
  return r.text;
}

auto make_tile_fetcher(const tile_source_config_t &config, int http_timeout_ms) -> std::unique_ptr<tile_fetcher_t>
{
  if (const auto *local = std::get_if<mbtiles_source_t>(&config))
  {
    return std::make_unique<mbtiles_fetcher_t>(local->path);
  }
  const auto &remote = std::get<http_source_t>(config);
  return std::make_unique<http_fetcher_t>(remote.base_url, http_timeout_ms);
}

} // namespace braille_map
