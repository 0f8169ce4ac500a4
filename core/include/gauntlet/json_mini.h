#pragma once

// json_mini.h
//
// Thin helpers over json-c: an owning Doc plus typed member lookups.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gauntlet::json_mini {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    // Hand ownership to the caller (e.g. before json_object_object_add).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    return Doc{obj};
}

inline bool is_object(json_object* o) {
    return o && json_object_is_type(o, json_type_object);
}

// Borrowed pointer to obj[key], or nullptr. JSON null counts as absent.
inline json_object* member(json_object* obj, const char* key) {
    if (!is_object(obj)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return nullptr;
    if (!v || json_object_is_type(v, json_type_null)) return nullptr;
    return v;
}

inline std::optional<std::string> member_string(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

inline std::optional<int64_t> member_int(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v) return std::nullopt;
    if (json_object_is_type(v, json_type_int)) return static_cast<int64_t>(json_object_get_int64(v));
    if (json_object_is_type(v, json_type_double)) {
        // [-2^63, 2^63) converts exactly; anything else (inf, nan, 1e300) is absent
        const double d = json_object_get_double(v);
        if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0)) return std::nullopt;
        return static_cast<int64_t>(d);
    }
    return std::nullopt;
}

inline std::optional<double> member_double(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v) return std::nullopt;
    if (!(json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int))) return std::nullopt;
    return json_object_get_double(v);
}

inline std::optional<bool> member_bool(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

inline std::vector<std::string> member_strings(json_object* obj, const char* key) {
    std::vector<std::string> out;
    json_object* arr = member(obj, key);
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, static_cast<int>(i));
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

// String-valued members of obj[key]; non-string values are stringified.
inline std::map<std::string, std::string> member_string_map(json_object* obj, const char* key) {
    std::map<std::string, std::string> out;
    json_object* m = member(obj, key);
    if (!is_object(m)) return out;
    json_object_object_foreach(m, k, v) {
        if (!v) continue;
        if (json_object_is_type(v, json_type_string)) out[k] = json_object_get_string(v);
        else out[k] = json_object_to_json_string_ext(v, JSON_C_TO_STRING_PLAIN);
    }
    return out;
}

inline std::optional<std::string> get_string(const std::string& json, const std::string& key) {
    Doc d = parse(json);
    if (!d) return std::nullopt;
    return member_string(d.root, key.c_str());
}

inline json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), static_cast<int>(s.size()));
}

inline std::string to_string_plain(json_object* obj) {
    if (!obj) return "null";
    return json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
}

} // namespace gauntlet::json_mini
