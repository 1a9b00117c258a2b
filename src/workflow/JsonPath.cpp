#include "workflow/JsonPath.hpp"
#include <cctype>

namespace drflow {
namespace workflow {

std::vector<JsonPath::Segment> JsonPath::parse(const std::string& path) {
    if (path.empty() || path[0] != '$') {
        throw JsonPathError("Path must start with '$': '" + path + "'");
    }

    std::vector<Segment> segments;
    size_t pos = 1;
    while (pos < path.size()) {
        char c = path[pos];
        if (c == '.') {
            size_t end = pos + 1;
            while (end < path.size() && path[end] != '.' && path[end] != '[') {
                ++end;
            }
            if (end == pos + 1) {
                throw JsonPathError("Empty field name in path '" + path + "'");
            }
            Segment seg;
            seg.key = path.substr(pos + 1, end - pos - 1);
            segments.push_back(std::move(seg));
            pos = end;
        } else if (c == '[') {
            size_t close = path.find(']', pos);
            if (close == std::string::npos || close == pos + 1) {
                throw JsonPathError("Unterminated index in path '" + path + "'");
            }
            std::string digits = path.substr(pos + 1, close - pos - 1);
            for (char d : digits) {
                if (!std::isdigit(static_cast<unsigned char>(d))) {
                    throw JsonPathError("Non-numeric index '" + digits + "' in path '" + path + "'");
                }
            }
            Segment seg;
            seg.isIndex = true;
            seg.index = static_cast<size_t>(std::stoull(digits));
            segments.push_back(std::move(seg));
            pos = close + 1;
        } else {
            throw JsonPathError("Unexpected character '" + std::string(1, c) +
                                "' in path '" + path + "'");
        }
    }
    return segments;
}

bool JsonPath::isValid(const std::string& path) {
    try {
        parse(path);
        return true;
    } catch (const JsonPathError&) {
        return false;
    }
}

json JsonPath::select(const json& document, const std::string& path) {
    const json* current = &document;
    for (const auto& seg : parse(path)) {
        if (seg.isIndex) {
            if (!current->is_array() || seg.index >= current->size()) {
                throw JsonPathError("Index [" + std::to_string(seg.index) +
                                    "] not found for path '" + path + "'");
            }
            current = &(*current)[seg.index];
        } else {
            if (!current->is_object() || !current->contains(seg.key)) {
                throw JsonPathError("Field '" + seg.key + "' not found for path '" + path + "'");
            }
            current = &(*current)[seg.key];
        }
    }
    return *current;
}

json JsonPath::merge(const json& target, const std::string& path, const json& value) {
    auto segments = parse(path);
    if (segments.empty()) {
        return value;
    }

    json result = target;
    json* current = &result;
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        bool last = (i + 1 == segments.size());

        if (seg.isIndex) {
            if (!current->is_array() || seg.index >= current->size()) {
                throw JsonPathError("Index [" + std::to_string(seg.index) +
                                    "] out of range for path '" + path + "'");
            }
            current = &(*current)[seg.index];
        } else {
            if (!current->is_object()) {
                *current = json::object();
            }
            current = &(*current)[seg.key];
        }

        if (last) {
            *current = value;
        }
    }
    return result;
}

} // namespace workflow
} // namespace drflow
