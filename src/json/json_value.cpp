//! # JSON Value Implementation
//!
//! Object access helpers, deep copy and structural equality for `JsonValue`.

#include "json/json_value.hpp"

namespace pjsk::json {

auto JsonValue::get(const std::string& key) const -> const JsonValue* {
    if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        auto it = (*obj)->find(key);
        if (it != (*obj)->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

auto JsonValue::get_mut(const std::string& key) -> JsonValue* {
    if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        auto it = (*obj)->find(key);
        if (it != (*obj)->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

void JsonValue::set(const std::string& key, JsonValue value) {
    as_object_mut().insert_or_assign(key, std::move(value));
}

auto JsonValue::remove(const std::string& key) -> bool {
    if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        return (*obj)->erase(key) > 0;
    }
    return false;
}

auto JsonValue::size() const -> size_t {
    if (auto* arr = std::get_if<Box<JsonArray>>(&data)) {
        return (*arr)->size();
    }
    if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        return (*obj)->size();
    }
    return 0;
}

auto JsonValue::clone() const -> JsonValue {
    if (is_bool()) {
        return JsonValue(as_bool());
    }
    if (is_number()) {
        return JsonValue(as_number());
    }
    if (is_string()) {
        return JsonValue(as_string());
    }
    if (is_array()) {
        JsonArray arr;
        arr.reserve(as_array().size());
        for (const auto& elem : as_array()) {
            arr.push_back(elem.clone());
        }
        return JsonValue(std::move(arr));
    }
    if (is_object()) {
        JsonObject obj;
        for (const auto& [key, val] : as_object()) {
            obj.emplace(key, val.clone());
        }
        return JsonValue(std::move(obj));
    }
    return JsonValue();
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }

    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_number()) {
        return as_number() == other.as_number();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }

    if (is_array()) {
        const auto& arr1 = as_array();
        const auto& arr2 = other.as_array();
        if (arr1.size() != arr2.size()) {
            return false;
        }
        for (size_t i = 0; i < arr1.size(); ++i) {
            if (!(arr1[i] == arr2[i])) {
                return false;
            }
        }
        return true;
    }

    const auto& obj1 = as_object();
    const auto& obj2 = other.as_object();
    if (obj1.size() != obj2.size()) {
        return false;
    }
    for (const auto& [key, val] : obj1) {
        auto it = obj2.find(key);
        if (it == obj2.end() || !(it->second == val)) {
            return false;
        }
    }
    return true;
}

} // namespace pjsk::json
