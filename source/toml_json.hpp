#ifndef TOML_JSON_HPP
#define TOML_JSON_HPP

#include <json/json.h>
#include <toml++/toml.hpp>

// Converts a parsed TOML node into the equivalent Json::Value tree.
// Tables become objects and arrays stay arrays. Dates, times and
// date-times are stored as their TOML text, e.g. "2024-01-01".
Json::Value tomlToJson(const toml::node& node);

#endif
