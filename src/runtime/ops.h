#pragma once

#include "runtime/render_node.h"
#include "runtime/value.h"

#include <string>
#include <utility>
#include <vector>

namespace prism {

// ─── Expression operators ───────────────────────────────────────────
// Shared by the in-process render program and generated headers so both
// evaluate identically. Type errors raise RenderError.

inline bool truthy(const Value& v) { return v.truthy(); }

Value add(const Value& a, const Value& b);     // numbers, or string concatenation
Value sub(const Value& a, const Value& b);
Value mul(const Value& a, const Value& b);
Value div(const Value& a, const Value& b);
Value mod(const Value& a, const Value& b);
Value negate(const Value& v);
Value logicalNot(const Value& v);

Value equal(const Value& a, const Value& b);
Value notEqual(const Value& a, const Value& b);
Value less(const Value& a, const Value& b);
Value greater(const Value& a, const Value& b);
Value lessEqual(const Value& a, const Value& b);
Value greaterEqual(const Value& a, const Value& b);

// obj.name: map lookup, or `length` of a list or string. Null for
// anything absent.
Value member(const Value& object, const std::string& name);
// obj[i]: list position or map key. Null when out of range.
Value index(const Value& object, const Value& key);

Value applyFilter(const std::string& name, const Value& input, const std::vector<Value>& args);

// ─── Render helpers ─────────────────────────────────────────────────

// (index, item) pairs: lists in order with int positions, maps in key
// order with string keys, nothing for null.
std::vector<std::pair<Value, Value>> iterate(const Value& iterable);

Value requireProp(const RenderInput& input, const std::string& name);
Value propOr(const RenderInput& input, const std::string& name, const Value& fallback);
Value stateOr(const RenderInput& input, const std::string& name, const Value& fallback);
const std::vector<RenderNode>* findSlot(const RenderInput& input, const std::string& name);

// Attaches `key` to every node in `nodes` from position `from` on.
void applyKey(std::vector<RenderNode>& nodes, size_t from, const Value& key);

} // namespace prism
