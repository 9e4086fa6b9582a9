#pragma once

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace agentbridge {
namespace py = pybind11;

// Python objects cross the boundary as JSON text through the json module.
inline nlohmann::json object_to_json(const py::object& object) {
    py::object dumps = py::module_::import("json").attr("dumps");
    return nlohmann::json::parse(dumps(object).cast<std::string>());
}

inline py::object json_to_object(const nlohmann::json& json) {
    py::object loads = py::module_::import("json").attr("loads");
    return loads(json.dump());
}

template<typename T>
py::list vector_to_list(const std::vector<T>& vec) {
    py::list result;
    for (const auto& item : vec) {
        result.append(json_to_object(item.toJson()));
    }
    return result;
}

void init_type_converters(py::module_& m);

} // namespace agentbridge
