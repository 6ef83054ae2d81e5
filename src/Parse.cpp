/**
 * @file Parse.cpp
 * @brief Implementation of type parsing
 */

#include "graft/Parse.hpp"
#include "graft/Json.hpp"
#include "graft/Util.hpp"

#include <cmath>
#include <regex>

namespace graft {

namespace {
    /**
     * @brief Check if string matches regex pattern
     */
    bool matches_regex(const std::string& str, const std::string& pattern) {
        try {
            std::regex re(pattern);
            return std::regex_match(str, re);
        } catch (const std::regex_error&) {
            return false;
        }
    }
}

Scalar parse_scalar(const std::string& str) {
    if (str.empty()) {
        return Scalar(str);
    }

    // T1: Boolean
    const std::string lower = to_lower(str);
    if (lower == "true") {
        return Scalar(true);
    }
    if (lower == "false") {
        return Scalar(false);
    }

    // T2: Null
    if (lower == "null") {
        return Scalar();
    }

    // T3: Integer
    if (matches_regex(str, "^-?[0-9]+$")) {
        try {
            size_t pos = 0;
            long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return Scalar(static_cast<std::int64_t>(val));
            }
        } catch (const std::out_of_range&) {
            // Too large for int64: fall through to float/string
        }
    }

    // T4: Float
    if (matches_regex(str, "^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$")) {
        try {
            size_t pos = 0;
            double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return Scalar(val);
            }
        } catch (const std::out_of_range&) {
            // Fall through to string
        }
    }

    return Scalar(str);
}

Node parse_value(const std::string& str) {
    if (str.empty()) {
        return Node(str);
    }

    Scalar typed = parse_scalar(str);
    if (!typed.is_string()) {
        return Node(std::move(typed));
    }

    // T5: JSON Compound (objects and arrays)
    if ((str.front() == '{' && str.back() == '}') ||
        (str.front() == '[' && str.back() == ']')) {
        try {
            return node_from_json(nlohmann::ordered_json::parse(str));
        } catch (const nlohmann::json::parse_error&) {
            // Not JSON: fall through
        }
    }

    // T6: Quoted String
    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        try {
            auto parsed = nlohmann::ordered_json::parse(str);
            if (parsed.is_string()) {
                return Node(parsed.get<std::string>());
            }
        } catch (const nlohmann::json::parse_error&) {
            // Fall through
        }
    }

    // T7: Raw String
    return Node(str);
}

std::string float_text(double value) {
    std::string text = Scalar(value).to_string();
    if (!std::isfinite(value) || text.find('.') != std::string::npos) {
        return text;
    }
    const auto exp = text.find_first_of("eE");
    if (exp == std::string::npos) {
        return text + ".0";
    }
    return text.substr(0, exp) + ".0" + text.substr(exp);
}

} // namespace graft
