#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace drflow {
namespace workflow {

using json = nlohmann::json;

/**
 * Malformed path, or a path that does not resolve against a document
 */
class JsonPathError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Minimal JSONPath subset used by InputPath / ResultPath / OutputPath
 *
 * Supported forms:
 *   $            whole document
 *   $.a.b        object fields
 *   $.list[2]    array element
 */
class JsonPath {
public:
    struct Segment {
        std::string key;
        size_t index = 0;
        bool isIndex = false;
    };

    /**
     * Parse a path expression, throws JsonPathError on bad syntax
     */
    static std::vector<Segment> parse(const std::string& path);

    /**
     * Syntax check only
     */
    static bool isValid(const std::string& path);

    /**
     * Return the sub-value addressed by path
     * Throws JsonPathError if any segment is missing
     */
    static json select(const json& document, const std::string& path);

    /**
     * Return a copy of target with value placed at path.
     * Missing or non-object intermediate fields are replaced by objects.
     */
    static json merge(const json& target, const std::string& path, const json& value);
};

} // namespace workflow
} // namespace drflow
