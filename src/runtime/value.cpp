#include "runtime/value.h"

#include <cmath>
#include <sstream>

namespace prism {

Value::Kind Value::kind() const {
    switch (data_.index()) {
        case 0: return Kind::Null;
        case 1: return Kind::Bool;
        case 2: return Kind::Int;
        case 3: return Kind::Float;
        case 4: return Kind::String;
        case 5: return Kind::List;
        default: return Kind::Map;
    }
}

const char* Value::typeName() const {
    switch (kind()) {
        case Kind::Null:   return "null";
        case Kind::Bool:   return "bool";
        case Kind::Int:    return "int";
        case Kind::Float:  return "float";
        case Kind::String: return "string";
        case Kind::List:   return "list";
        case Kind::Map:    return "map";
    }
    return "value";
}

double Value::asFloat() const {
    if (kind() == Kind::Int) return static_cast<double>(asInt());
    return std::get<double>(data_);
}

bool Value::truthy() const {
    switch (kind()) {
        case Kind::Null:   return false;
        case Kind::Bool:   return asBool();
        case Kind::Int:    return asInt() != 0;
        case Kind::Float:  return asFloat() != 0.0;
        case Kind::String: return !asString().empty();
        case Kind::List:   return !asList().empty();
        case Kind::Map:    return !asMap().empty();
    }
    return false;
}

static std::string formatFloat(double d) {
    if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15) {
        std::ostringstream out;
        out << static_cast<int64_t>(d) << ".0";
        return out.str();
    }
    std::ostringstream out;
    out.precision(15);
    out << d;
    return out.str();
}

static void writeJsonString(std::ostringstream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out << "\\u00" << hex[(c >> 4) & 0xf] << hex[c & 0xf];
                } else {
                    out << c;
                }
        }
    }
    out << '"';
}

static void writeJson(std::ostringstream& out, const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Null:   out << "null"; break;
        case Value::Kind::Bool:   out << (v.asBool() ? "true" : "false"); break;
        case Value::Kind::Int:    out << v.asInt(); break;
        case Value::Kind::Float:
            if (std::isfinite(v.asFloat())) out << formatFloat(v.asFloat());
            else out << "null";
            break;
        case Value::Kind::String: writeJsonString(out, v.asString()); break;
        case Value::Kind::List: {
            out << '[';
            bool first = true;
            for (const auto& el : v.asList()) {
                if (!first) out << ',';
                first = false;
                writeJson(out, el);
            }
            out << ']';
            break;
        }
        case Value::Kind::Map: {
            out << '{';
            bool first = true;
            for (const auto& [key, el] : v.asMap()) {
                if (!first) out << ',';
                first = false;
                writeJsonString(out, key);
                out << ':';
                writeJson(out, el);
            }
            out << '}';
            break;
        }
    }
}

std::string Value::toJson() const {
    std::ostringstream out;
    writeJson(out, *this);
    return out.str();
}

std::string Value::display() const {
    switch (kind()) {
        case Kind::Null:   return "";
        case Kind::Bool:   return asBool() ? "true" : "false";
        case Kind::Int:    return std::to_string(asInt());
        case Kind::Float:  return formatFloat(asFloat());
        case Kind::String: return asString();
        default:           return toJson();
    }
}

bool Value::operator==(const Value& other) const {
    if (isNumber() && other.isNumber()) {
        if (kind() == Kind::Int && other.kind() == Kind::Int) return asInt() == other.asInt();
        return asFloat() == other.asFloat();
    }
    if (kind() != other.kind()) return false;

    switch (kind()) {
        case Kind::Null:   return true;
        case Kind::Bool:   return asBool() == other.asBool();
        case Kind::String: return asString() == other.asString();
        case Kind::List:   return asList() == other.asList();
        case Kind::Map:    return asMap() == other.asMap();
        default:           return false;
    }
}

} // namespace prism
