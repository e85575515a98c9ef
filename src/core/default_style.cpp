#include "core/style.hpp"

namespace braille_map
{

namespace
{

// Pip-Boy green palette. Source layer names follow osm2vectortiles / OpenMapTiles.
constexpr const char *DEFAULT_STYLE_JSON = R"({
  "name": "pip-boy-green",
  "layers": [
    {"id": "background", "type": "background", "paint": {"background-color": "#0a0a0a"}},

    {"id": "landuse_park", "type": "fill", "source-layer": "landuse",
     "paint": {"fill-color": "#1a3300"}, "filter": ["==", "class", "park"]},
    {"id": "landuse_wood", "type": "line", "source-layer": "landuse",
     "paint": {"line-color": "#1a3300"}, "filter": ["==", "class", "wood"]},
    {"id": "landuse_hospital", "type": "line", "source-layer": "landuse",
     "paint": {"line-color": "#cc8800"}, "filter": ["==", "class", "hospital"]},

    {"id": "waterway", "type": "line", "source-layer": "waterway", "paint": {"line-color": "#0a4040"}},
    {"id": "water", "type": "fill", "source-layer": "water", "paint": {"fill-color": "#0a4040"}},

    {"id": "building", "type": "line", "source-layer": "building", "paint": {"line-color": "#4a3800"}},

    {"id": "road_path", "type": "line", "source-layer": "road",
     "paint": {"line-color": "#338833", "line-width": 1}, "filter": ["in", "class", "path", "pedestrian"]},
    {"id": "road_service", "type": "line", "source-layer": "road",
     "paint": {"line-color": "#338833", "line-width": 1}, "filter": ["in", "class", "service", "track"]},
    {"id": "road_street", "type": "line", "source-layer": "road",
     "paint": {"line-color": "#00cc00", "line-width": 1}, "filter": ["in", "class", "street", "street_limited"]},
    {"id": "road_secondary", "type": "line", "source-layer": "road",
     "paint": {"line-color": "#00cc00", "line-width": 1}, "filter": ["in", "class", "secondary", "tertiary"]},
    {"id": "road_primary", "type": "line", "source-layer": "road",
     "paint": {"line-color": "#00ff00", "line-width": 2}, "filter": ["in", "class", "trunk", "primary"]},
    {"id": "road_motorway", "type": "line", "source-layer": "road",
     "paint": {"line-color": "#00ff00", "line-width": 2}, "filter": ["==", "class", "motorway"], "minzoom": 5},
    {"id": "road_motorway_link", "type": "line", "source-layer": "road",
     "paint": {"line-color": "#00cc00", "line-width": 1}, "filter": ["==", "class", "motorway_link"], "minzoom": 12},
    {"id": "road_link", "type": "line", "source-layer": "road",
     "paint": {"line-color": "#338833", "line-width": 1}, "filter": ["==", "class", "link"], "minzoom": 13},

    {"id": "rail", "type": "line", "source-layer": "road",
     "paint": {"line-color": "#553355", "line-width": 1}, "filter": ["in", "class", "major_rail", "minor_rail"]},

    {"id": "admin_country", "type": "line", "source-layer": "admin",
     "paint": {"line-color": "#44aa44"}, "filter": ["all", ["==", "admin_level", 2], ["==", "maritime", 0]]},
    {"id": "admin_state", "type": "line", "source-layer": "admin",
     "paint": {"line-color": "#336633"}, "filter": ["all", [">=", "admin_level", 3], ["==", "maritime", 0]]},

    {"id": "water_label", "type": "symbol", "source-layer": "water_label",
     "paint": {"text-color": "#1a8888"}, "filter": ["==", "$type", "Point"]},
    {"id": "marine_label", "type": "symbol", "source-layer": "marine_label", "paint": {"text-color": "#1a6666"}},
    {"id": "poi_label", "type": "symbol", "source-layer": "poi_label",
     "paint": {"text-color": "#cc8800"}, "filter": ["==", "$type", "Point"], "minzoom": 13},
    {"id": "road_label", "type": "symbol", "source-layer": "road_label", "paint": {"text-color": "#55aa55"}, "minzoom": 15},

    {"id": "place_label_city", "type": "symbol", "source-layer": "place_label",
     "paint": {"text-color": "#ffff00"}, "filter": ["==", "type", "city"]},
    {"id": "place_label_town", "type": "symbol", "source-layer": "place_label",
     "paint": {"text-color": "#ccdd00"}, "filter": ["==", "type", "town"]},
    {"id": "place_label_village", "type": "symbol", "source-layer": "place_label",
     "paint": {"text-color": "#88bb00"}, "filter": ["==", "type", "village"]},
    {"id": "place_label_other", "type": "symbol", "source-layer": "place_label",
     "paint": {"text-color": "#669900"}, "filter": ["in", "type", "hamlet", "suburb", "neighbourhood"]},

    {"id": "country_label", "type": "symbol", "source-layer": "country_label", "paint": {"text-color": "#ffff00"}},
    {"id": "state_label", "type": "symbol", "source-layer": "state_label", "paint": {"text-color": "#336633"}}
  ]
})";

} // namespace

auto default_style_sheet() -> style_sheet_t
{
  return parse_style_sheet(nlohmann::json::parse(DEFAULT_STYLE_JSON));
}

} // namespace braille_map
