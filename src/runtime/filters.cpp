#include "runtime/ops.h"

#include <algorithm>
#include <cctype>

namespace prism {

static void expectArgs(const std::string& name, const std::vector<Value>& args, size_t count) {
    if (args.size() != count) {
        throw RenderError("filter '" + name + "' takes " + std::to_string(count) + " argument" +
                          (count == 1 ? "" : "s") + ", got " + std::to_string(args.size()));
    }
}

static std::string changeCase(std::string s, bool upper) {
    std::transform(s.begin(), s.end(), s.begin(), [upper](unsigned char c) {
        return static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
    });
    return s;
}

Value applyFilter(const std::string& name, const Value& input, const std::vector<Value>& args) {
    if (name == "upper") {
        expectArgs(name, args, 0);
        return Value(changeCase(input.display(), true));
    }
    if (name == "lower") {
        expectArgs(name, args, 0);
        return Value(changeCase(input.display(), false));
    }
    if (name == "trim") {
        expectArgs(name, args, 0);
        std::string s = input.display();
        auto begin = s.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) return Value(std::string());
        auto end = s.find_last_not_of(" \t\r\n");
        return Value(s.substr(begin, end - begin + 1));
    }
    if (name == "length") {
        expectArgs(name, args, 0);
        switch (input.kind()) {
            case Value::Kind::String: return Value(static_cast<int64_t>(input.asString().size()));
            case Value::Kind::List:   return Value(static_cast<int64_t>(input.asList().size()));
            case Value::Kind::Map:    return Value(static_cast<int64_t>(input.asMap().size()));
            case Value::Kind::Null:   return Value(0);
            default:
                throw RenderError(std::string("filter 'length' does not apply to ") + input.typeName());
        }
    }
    if (name == "default") {
        expectArgs(name, args, 1);
        return input.truthy() ? input : args[0];
    }
    if (name == "json") {
        expectArgs(name, args, 0);
        return Value(input.toJson());
    }
    throw RenderError("unknown filter '" + name + "'");
}

} // namespace prism
