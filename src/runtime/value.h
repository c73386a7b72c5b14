#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace prism {

// Immutable dynamic value flowing through render routines: prop and state
// values, expression results, bound attributes. Lists and maps are shared
// and never mutated after construction, so copies are cheap.
class Value {
public:
    using List = std::vector<Value>;
    using Map = std::map<std::string, Value>;

    enum class Kind { Null, Bool, Int, Float, String, List, Map };

    Value() = default;
    Value(bool b) : data_(b) {}
    Value(int i) : data_(static_cast<int64_t>(i)) {}
    Value(int64_t i) : data_(i) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(List list) : data_(std::make_shared<const List>(std::move(list))) {}
    Value(Map map) : data_(std::make_shared<const Map>(std::move(map))) {}

    Kind kind() const;
    const char* typeName() const;

    bool isNull() const { return kind() == Kind::Null; }
    bool isNumber() const { return kind() == Kind::Int || kind() == Kind::Float; }

    bool asBool() const { return std::get<bool>(data_); }
    int64_t asInt() const { return std::get<int64_t>(data_); }
    double asFloat() const;     // Int or Float
    const std::string& asString() const { return std::get<std::string>(data_); }
    const List& asList() const { return *std::get<std::shared_ptr<const List>>(data_); }
    const Map& asMap() const { return *std::get<std::shared_ptr<const Map>>(data_); }

    // null, false, 0, 0.0, "" and empty collections are falsy.
    bool truthy() const;

    // Text form used by interpolations: null renders as nothing, strings
    // as themselves, collections as JSON.
    std::string display() const;
    std::string toJson() const;

    // Deep equality; ints and floats compare numerically.
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, int64_t, double, std::string,
                 std::shared_ptr<const List>, std::shared_ptr<const Map>> data_;
};

} // namespace prism
