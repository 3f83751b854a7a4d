#include "toml_json.hpp"
#include <sstream>

namespace {

template<typename T>
std::string toText(const toml::value<T>& value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

}

Json::Value tomlToJson(const toml::node& node) {
    switch (node.type()) {
    case toml::node_type::table: {
        Json::Value object(Json::objectValue);
        for (auto&& [key, child] : *node.as_table()) {
            object[std::string(key.str())] = tomlToJson(child);
        }
        return object;
    }
    case toml::node_type::array: {
        Json::Value array(Json::arrayValue);
        for (auto&& element : *node.as_array()) {
            array.append(tomlToJson(element));
        }
        return array;
    }
    case toml::node_type::string:
        return Json::Value(node.as_string()->get());
    case toml::node_type::integer:
        return Json::Value(static_cast<Json::Int64>(node.as_integer()->get()));
    case toml::node_type::floating_point:
        return Json::Value(node.as_floating_point()->get());
    case toml::node_type::boolean:
        return Json::Value(node.as_boolean()->get());
    case toml::node_type::date:
        return Json::Value(toText(*node.as_date()));
    case toml::node_type::time:
        return Json::Value(toText(*node.as_time()));
    case toml::node_type::date_time:
        return Json::Value(toText(*node.as_date_time()));
    case toml::node_type::none:
        break;
    }
    return Json::Value();
}
