// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include <cctype>
#include <charconv>
#include <system_error>
#include <string>

namespace agentflow {

namespace {

// Whole-token numeric parse: "42" -> integer, "1.5e3" -> double, "12abc" -> nothing.
// A leading '+' is accepted; integers that overflow int64 fall back to double.
bool parse_number(const std::string& text, Value& out) {
    if (text.empty()) return false;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (*first == '+') ++first;
    if (first == last) return false;
    // "inf" / "nan" stay strings
    if (!std::isdigit(static_cast<unsigned char>(*first)) && *first != '-' && *first != '.') return false;

    long long as_int = 0;
    auto [int_end, int_ec] = std::from_chars(first, last, as_int);
    if (int_ec == std::errc() && int_end == last) {
        out = as_int;
        return true;
    }

    double as_double = 0.0;
    auto [dbl_end, dbl_ec] = std::from_chars(first, last, as_double);
    if (dbl_ec == std::errc() && dbl_end == last) {
        out = as_double;
        return true;
    }
    return false;
}

Value scalar_to_json(const YAML::Node& node) {
    const std::string& s = node.Scalar();

    // "!" tag marks a quoted scalar
    if (node.Tag() == "!") {
        return s;
    }

    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    if (s == "~" || s == "null" || s.empty()) return nullptr;

    Value number;
    if (parse_number(s, number)) {
        return number;
    }
    return s;
}

} // namespace

Value yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

} // namespace agentflow
