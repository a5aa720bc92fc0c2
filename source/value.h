#pragma once

#include "nix-wasm.h"
#include "./arena.h"
#include "./call-scope.h"

#include <cstdint>
#include <string_view>

namespace nix_wasm {

using ValueId = nix_value_id;

enum class Type : uint32_t {
	integer = NIX_TYPE_INTEGER,
	float_ = NIX_TYPE_FLOAT,
	boolean = NIX_TYPE_BOOLEAN,
	string = NIX_TYPE_STRING,
	path = NIX_TYPE_PATH,
	null = NIX_TYPE_NULL,
	attrs = NIX_TYPE_ATTRS,
	list = NIX_TYPE_LIST,
	function = NIX_TYPE_FUNCTION
};

// Returns null for tags outside the enum
const char * typeName(Type type);

struct Value;
struct AttrEntry;
struct Attrset;

/* Handle for a value owned by the host.

	This is only a lookup key - it doesn't own anything, and is only valid during the call it came from (unless it's returned to the host).  Every accessor goes back to the host, so nothing is cached.
*/
struct Value {
	ValueId id = 0;

	Value() {}
	explicit Value(ValueId id) : id(id) {}

	// `getAttr()` returns an absent (zero) value for missing keys
	bool absent() const {
		return id == 0;
	}

	Type type(CallScope &scope) const;

	static Value makeInt(CallScope &scope, int64_t n);
	int64_t getInt(CallScope &scope) const;

	static Value makeFloat(CallScope &scope, double f);
	double getFloat(CallScope &scope) const;

	static Value makeBool(CallScope &scope, bool b);
	bool getBool(CallScope &scope) const;

	static Value makeNull(CallScope &scope);

	static Value makeString(CallScope &scope, std::string_view s);
	// Arena-backed copy of the string contents
	std::string_view getString(CallScope &scope) const;

	// This value is the base path
	Value makePath(CallScope &scope, std::string_view relative) const;
	std::string_view getPath(CallScope &scope) const;

	static Value makeList(CallScope &scope, Slice<const Value> items);
	Slice<Value> getList(CallScope &scope) const;

	static Value makeAttrset(CallScope &scope, Slice<const AttrEntry> attrs);
	// Names and values in the order the host reports them (not necessarily sorted or stable)
	Attrset getAttrset(CallScope &scope) const;
	Value getAttr(CallScope &scope, std::string_view name) const;
	bool hasAttr(CallScope &scope, std::string_view name) const;

	Value call(CallScope &scope, Slice<const Value> args) const;
	// Deferred application - the host creates a thunk
	Value lazyCall(CallScope &scope, Slice<const Value> args) const;

	// Contents of the file at this path
	std::string_view readFile(CallScope &scope) const;
};
// Lists of values are passed straight to the host as arrays of IDs
static_assert(sizeof(Value) == sizeof(ValueId), "Value must be layout-compatible with nix_value_id");

struct AttrEntry {
	std::string_view name;
	Value value;
};

struct Attrset {
	Slice<std::string_view> names;
	Slice<Value> values;
	size_t count = 0;
};

} // namespace
