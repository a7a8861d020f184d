/// @file property.hpp
/// @brief Named get/set accessor pair through which bindings drive a value

#pragma once

#include <functional>
#include <string>
#include <utility>

namespace tweenflow {

/// Reads and writes one animatable value on some external object.
/// The engine never owns the object; liveness is tracked by the tween's target handle.
template <typename T>
struct Property {
    std::string name;
    std::function<T()> get;
    std::function<void(const T&)> set;
};

/// Builds a Property that reads and writes a plain variable
template <typename T>
[[nodiscard]] Property<T> make_property(std::string name, T* value) {
    return {std::move(name), [value]() { return *value; }, [value](const T& v) { *value = v; }};
}

} // namespace tweenflow
