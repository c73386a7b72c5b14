#include "runtime/ops.h"

#include <cmath>
#include <cstdint>
#include <limits>

namespace prism {

static RenderError typeError(const char* op, const Value& a, const Value& b) {
    return RenderError(std::string("cannot apply '") + op + "' to " + a.typeName() + " and " +
                       b.typeName());
}

static bool bothInts(const Value& a, const Value& b) {
    return a.kind() == Value::Kind::Int && b.kind() == Value::Kind::Int;
}

// ─── Arithmetic ─────────────────────────────────────────────────────

static Value checked(bool overflowed, int64_t result) {
    if (overflowed) throw RenderError("integer overflow");
    return Value(result);
}

Value add(const Value& a, const Value& b) {
    if (a.kind() == Value::Kind::String || b.kind() == Value::Kind::String) {
        return Value(a.display() + b.display());
    }
    if (bothInts(a, b)) {
        int64_t r;
        return checked(__builtin_add_overflow(a.asInt(), b.asInt(), &r), r);
    }
    if (a.isNumber() && b.isNumber()) return Value(a.asFloat() + b.asFloat());
    if (a.kind() == Value::Kind::List && b.kind() == Value::Kind::List) {
        Value::List joined = a.asList();
        joined.insert(joined.end(), b.asList().begin(), b.asList().end());
        return Value(std::move(joined));
    }
    throw typeError("+", a, b);
}

Value sub(const Value& a, const Value& b) {
    if (bothInts(a, b)) {
        int64_t r;
        return checked(__builtin_sub_overflow(a.asInt(), b.asInt(), &r), r);
    }
    if (a.isNumber() && b.isNumber()) return Value(a.asFloat() - b.asFloat());
    throw typeError("-", a, b);
}

Value mul(const Value& a, const Value& b) {
    if (bothInts(a, b)) {
        int64_t r;
        return checked(__builtin_mul_overflow(a.asInt(), b.asInt(), &r), r);
    }
    if (a.isNumber() && b.isNumber()) return Value(a.asFloat() * b.asFloat());
    throw typeError("*", a, b);
}

Value div(const Value& a, const Value& b) {
    if (bothInts(a, b)) {
        if (b.asInt() == 0) throw RenderError("division by zero");
        if (a.asInt() == std::numeric_limits<int64_t>::min() && b.asInt() == -1) {
            throw RenderError("integer overflow");
        }
        return Value(a.asInt() / b.asInt());
    }
    if (a.isNumber() && b.isNumber()) {
        if (b.asFloat() == 0.0) throw RenderError("division by zero");
        return Value(a.asFloat() / b.asFloat());
    }
    throw typeError("/", a, b);
}

Value mod(const Value& a, const Value& b) {
    if (bothInts(a, b)) {
        if (b.asInt() == 0) throw RenderError("division by zero");
        // INT64_MIN % -1 traps on x86.
        if (b.asInt() == -1) return Value(int64_t{0});
        return Value(a.asInt() % b.asInt());
    }
    if (a.isNumber() && b.isNumber()) {
        if (b.asFloat() == 0.0) throw RenderError("division by zero");
        return Value(std::fmod(a.asFloat(), b.asFloat()));
    }
    throw typeError("%", a, b);
}

Value negate(const Value& v) {
    if (v.kind() == Value::Kind::Int) {
        if (v.asInt() == std::numeric_limits<int64_t>::min()) throw RenderError("integer overflow");
        return Value(-v.asInt());
    }
    if (v.kind() == Value::Kind::Float) return Value(-v.asFloat());
    throw RenderError(std::string("cannot negate ") + v.typeName());
}

Value logicalNot(const Value& v) {
    return Value(!v.truthy());
}

// ─── Comparison ─────────────────────────────────────────────────────

Value equal(const Value& a, const Value& b) {
    return Value(a == b);
}

Value notEqual(const Value& a, const Value& b) {
    return Value(a != b);
}

// -1, 0 or 1; only numbers with numbers and strings with strings.
static int compare(const char* op, const Value& a, const Value& b) {
    if (bothInts(a, b)) {
        return a.asInt() < b.asInt() ? -1 : (a.asInt() > b.asInt() ? 1 : 0);
    }
    if (a.isNumber() && b.isNumber()) {
        return a.asFloat() < b.asFloat() ? -1 : (a.asFloat() > b.asFloat() ? 1 : 0);
    }
    if (a.kind() == Value::Kind::String && b.kind() == Value::Kind::String) {
        int c = a.asString().compare(b.asString());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    throw typeError(op, a, b);
}

Value less(const Value& a, const Value& b)         { return Value(compare("<", a, b) < 0); }
Value greater(const Value& a, const Value& b)      { return Value(compare(">", a, b) > 0); }
Value lessEqual(const Value& a, const Value& b)    { return Value(compare("<=", a, b) <= 0); }
Value greaterEqual(const Value& a, const Value& b) { return Value(compare(">=", a, b) >= 0); }

// ─── Access ─────────────────────────────────────────────────────────

Value member(const Value& object, const std::string& name) {
    switch (object.kind()) {
        case Value::Kind::Map: {
            auto it = object.asMap().find(name);
            return it == object.asMap().end() ? Value() : it->second;
        }
        case Value::Kind::List:
            if (name == "length") return Value(static_cast<int64_t>(object.asList().size()));
            return Value();
        case Value::Kind::String:
            if (name == "length") return Value(static_cast<int64_t>(object.asString().size()));
            return Value();
        default:
            return Value();
    }
}

Value index(const Value& object, const Value& key) {
    if (object.kind() == Value::Kind::List && key.kind() == Value::Kind::Int) {
        const auto& list = object.asList();
        int64_t i = key.asInt();
        if (i < 0 || static_cast<size_t>(i) >= list.size()) return Value();
        return list[static_cast<size_t>(i)];
    }
    if (object.kind() == Value::Kind::Map && key.kind() == Value::Kind::String) {
        return member(object, key.asString());
    }
    if (object.isNull()) return Value();
    throw RenderError(std::string("cannot index ") + object.typeName() + " with " + key.typeName());
}

// ─── Render helpers ─────────────────────────────────────────────────

std::vector<std::pair<Value, Value>> iterate(const Value& iterable) {
    std::vector<std::pair<Value, Value>> items;
    switch (iterable.kind()) {
        case Value::Kind::Null:
            break;
        case Value::Kind::List: {
            int64_t i = 0;
            for (const auto& item : iterable.asList()) {
                items.emplace_back(Value(i++), item);
            }
            break;
        }
        case Value::Kind::Map:
            for (const auto& [key, item] : iterable.asMap()) {
                items.emplace_back(Value(key), item);
            }
            break;
        default:
            throw RenderError(std::string("cannot iterate over ") + iterable.typeName());
    }
    return items;
}

Value requireProp(const RenderInput& input, const std::string& name) {
    auto it = input.props.find(name);
    if (it == input.props.end()) {
        throw RenderError("missing required prop '" + name + "'");
    }
    return it->second;
}

Value propOr(const RenderInput& input, const std::string& name, const Value& fallback) {
    auto it = input.props.find(name);
    return it == input.props.end() ? fallback : it->second;
}

Value stateOr(const RenderInput& input, const std::string& name, const Value& fallback) {
    auto it = input.state.find(name);
    return it == input.state.end() ? fallback : it->second;
}

const std::vector<RenderNode>* findSlot(const RenderInput& input, const std::string& name) {
    auto it = input.slots.find(name);
    return it == input.slots.end() ? nullptr : &it->second;
}

void applyKey(std::vector<RenderNode>& nodes, size_t from, const Value& key) {
    for (size_t i = from; i < nodes.size(); ++i) {
        nodes[i].key = key;
    }
}

} // namespace prism
