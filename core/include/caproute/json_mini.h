#pragma once

// json_mini.h
//
// Thin helpers over json-c: an owning Doc handle, typed field readers for
// raw JSON strings and for already-parsed objects, and canonical
// (sorted-key) serialization used for fingerprints and the audit chain.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace caproute::json_mini {

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

    // Hands ownership to the caller (e.g. when adding into a parent object).
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

inline bool is_object(const std::string& json) {
    Doc d = parse(json);
    return d && json_object_is_type(d.root, json_type_object);
}

// ---------- readers over parsed objects ----------

inline json_object* field(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return nullptr;
    return v;
}

inline bool is_number(json_object* v) {
    return v && (json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int));
}

inline std::optional<std::string> field_string(json_object* o, const char* key) {
    json_object* v = field(o, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v));
}

inline std::optional<double> field_double(json_object* o, const char* key) {
    json_object* v = field(o, key);
    if (!is_number(v)) return std::nullopt;
    return json_object_get_double(v);
}

inline std::optional<int64_t> field_int(json_object* o, const char* key) {
    json_object* v = field(o, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::optional<bool> field_bool(json_object* o, const char* key) {
    json_object* v = field(o, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

inline std::vector<std::string> field_strings(json_object* o, const char* key) {
    std::vector<std::string> out;
    json_object* arr = field(o, key);
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_string)) out.emplace_back(json_object_get_string(el));
    }
    return out;
}

// String-valued object -> map. Non-string scalars are stringified, nested values skipped.
inline std::map<std::string, std::string> field_string_map(json_object* o, const char* key) {
    std::map<std::string, std::string> out;
    json_object* m = field(o, key);
    if (!m || !json_object_is_type(m, json_type_object)) return out;
    json_object_object_foreach(m, k, v) {
        if (!v) continue;
        if (json_object_is_type(v, json_type_string)) out[k] = json_object_get_string(v);
        else if (is_number(v) || json_object_is_type(v, json_type_boolean))
            out[k] = json_object_to_json_string_ext(v, JSON_C_TO_STRING_PLAIN);
    }
    return out;
}

inline std::string to_string(json_object* o) {
    if (!o) return "null";
    const char* s = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    return s ? std::string(s) : std::string("null");
}

// ---------- readers over raw JSON text ----------

inline std::optional<std::string> get_string(const std::string& json, const std::string& key) {
    Doc d = parse(json);
    return field_string(d.root, key.c_str());
}

inline std::optional<int64_t> get_int(const std::string& json, const std::string& key) {
    Doc d = parse(json);
    return field_int(d.root, key.c_str());
}

inline std::optional<double> get_double(const std::string& json, const std::string& key) {
    Doc d = parse(json);
    return field_double(d.root, key.c_str());
}

inline std::optional<bool> get_bool(const std::string& json, const std::string& key) {
    Doc d = parse(json);
    return field_bool(d.root, key.c_str());
}

inline std::optional<std::string> get_object_raw(const std::string& json, const std::string& key) {
    Doc d = parse(json);
    json_object* v = field(d.root, key.c_str());
    if (!v || !json_object_is_type(v, json_type_object)) return std::nullopt;
    return to_string(v);
}

// ---------- canonical serialization ----------

// Sorted keys, plain formatting. Deterministic for identical documents.
inline void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string_len(keys[i].c_str(), static_cast<int>(keys[i].size()));
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

inline std::string canonical(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

// Re-serializes raw JSON canonically. Returns the input unchanged if it does not parse.
inline std::string canonicalize(const std::string& raw) {
    Doc d = parse(raw);
    if (!d) return raw;
    return canonical(d.root);
}

// Escape a string for embedding inside a JSON string literal (no surrounding quotes).
inline std::string json_escape(const std::string& s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '\\': oss << "\\\\"; break;
            case '"':  oss << "\\\""; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
                    oss << buf;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

} // namespace caproute::json_mini
