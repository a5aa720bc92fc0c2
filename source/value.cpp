#include "./value.h"

namespace nix_wasm {

const char * typeName(Type type) {
	switch (type) {
		case Type::integer: return "an integer";
		case Type::float_: return "a float";
		case Type::boolean: return "a Boolean";
		case Type::string: return "a string";
		case Type::path: return "a path";
		case Type::null: return "null";
		case Type::attrs: return "a set";
		case Type::list: return "a list";
		case Type::function: return "a function";
	}
	return nullptr;
}

Type Value::type(CallScope &scope) const {
	return Type(scope.host.get_type(&scope.host, id));
}

//---------- Scalars ----------

Value Value::makeInt(CallScope &scope, int64_t n) {
	return Value{scope.host.make_int(&scope.host, n)};
}
int64_t Value::getInt(CallScope &scope) const {
	return scope.host.get_int(&scope.host, id);
}

Value Value::makeFloat(CallScope &scope, double f) {
	return Value{scope.host.make_float(&scope.host, f)};
}
double Value::getFloat(CallScope &scope) const {
	return scope.host.get_float(&scope.host, id);
}

Value Value::makeBool(CallScope &scope, bool b) {
	return Value{scope.host.make_bool(&scope.host, b ? 1 : 0)};
}
bool Value::getBool(CallScope &scope) const {
	return scope.host.get_bool(&scope.host, id) != 0;
}

Value Value::makeNull(CallScope &scope) {
	return Value{scope.host.make_null(&scope.host)};
}

//---------- Strings and paths ----------

Value Value::makeString(CallScope &scope, std::string_view s) {
	return Value{scope.host.make_string(&scope.host, s.data(), s.size())};
}
std::string_view Value::getString(CallScope &scope) const {
	auto &host = scope.host;
	ValueId valueId = id;
	// Strings can be whole documents, so ask for the length first
	return toStringView(scope.probeThenCopy<char>([&](char *ptr, size_t maxLength) {
		return host.copy_string(&host, valueId, ptr, maxLength);
	}));
}

Value Value::makePath(CallScope &scope, std::string_view relative) const {
	return Value{scope.host.make_path(&scope.host, id, relative.data(), relative.size())};
}
std::string_view Value::getPath(CallScope &scope) const {
	auto &host = scope.host;
	ValueId valueId = id;
	return toStringView(scope.stackProbeCopy<char, config::pathProbeBytes>([&](char *ptr, size_t maxLength) {
		return host.copy_path(&host, valueId, ptr, maxLength);
	}));
}

std::string_view Value::readFile(CallScope &scope) const {
	auto &host = scope.host;
	ValueId valueId = id;
	return toStringView(scope.stackProbeCopy<char, config::fileProbeBytes>([&](char *ptr, size_t maxLength) {
		return host.read_file(&host, valueId, ptr, maxLength);
	}));
}

//---------- Lists ----------

Value Value::makeList(CallScope &scope, Slice<const Value> items) {
	return Value{scope.host.make_list(&scope.host, (const ValueId *)items.ptr, items.length)};
}
Slice<Value> Value::getList(CallScope &scope) const {
	auto &host = scope.host;
	ValueId valueId = id;
	return scope.stackProbeCopy<Value, config::listProbeCount>([&](Value *ptr, size_t maxLength) {
		return host.copy_list(&host, valueId, (ValueId *)ptr, maxLength);
	});
}

//---------- Attribute sets ----------

Value Value::makeAttrset(CallScope &scope, Slice<const AttrEntry> attrs) {
	auto pairs = scope.makeArrayOrPanic<nix_attr_input>(attrs.length);
	for (size_t i = 0; i < attrs.length; ++i) {
		auto &attr = attrs[i];
		pairs[i] = {attr.name.data(), attr.name.size(), attr.value.id};
	}
	return Value{scope.host.make_attrset(&scope.host, pairs.ptr, pairs.length)};
}

Attrset Value::getAttrset(CallScope &scope) const {
	auto &host = scope.host;
	ValueId valueId = id;
	// The entries are only needed until the names are copied, but the arena can't give them back anyway
	auto entries = scope.stackProbeCopy<nix_attr_output, config::attrsetProbeCount>([&](nix_attr_output *ptr, size_t maxLength) {
		return host.copy_attrset(&host, valueId, ptr, maxLength);
	});

	Attrset result;
	result.count = entries.length;
	result.names = scope.makeArrayOrPanic<std::string_view>(entries.length);
	result.values = scope.makeArrayOrPanic<Value>(entries.length);
	for (size_t i = 0; i < entries.length; ++i) {
		auto &entry = entries[i];
		auto nameBuffer = scope.makeArrayOrPanic<char>(entry.name_len);
		if (entry.name_len) host.copy_attrname(&host, valueId, i, nameBuffer.ptr, entry.name_len);
		result.names[i] = toStringView(nameBuffer);
		result.values[i] = Value{entry.value};
	}
	return result;
}

Value Value::getAttr(CallScope &scope, std::string_view name) const {
	ValueId valueId = scope.host.get_attr(&scope.host, id, name.data(), name.size());
	if (valueId == 0) return Value{};
	return Value{valueId};
}

bool Value::hasAttr(CallScope &scope, std::string_view name) const {
	return !getAttr(scope, name).absent();
}

//---------- Functions ----------

Value Value::call(CallScope &scope, Slice<const Value> args) const {
	return Value{scope.host.call_function(&scope.host, id, (const ValueId *)args.ptr, args.length)};
}

Value Value::lazyCall(CallScope &scope, Slice<const Value> args) const {
	return Value{scope.host.make_app(&scope.host, id, (const ValueId *)args.ptr, args.length)};
}

} // namespace
