#include "./json.h"

#include <cmath>
#include <cstdint>

namespace nix_wasm { namespace json {

static unsigned char hexDigit(unsigned n) {
	return (unsigned char)(n < 10 ? '0' + n : 'a' + n - 10);
}

void encode(CallScope &scope, GrowableBuffer &writer, Value value) {
	auto type = value.type(scope);
	switch (type) {
		case Type::null:
			writer.writeRaw("null");
			return;
		case Type::boolean:
			writer.writeRaw(value.getBool(scope) ? "true" : "false");
			return;
		case Type::integer:
			writeInteger(writer, value.getInt(scope));
			return;
		case Type::float_:
			writeFloat(writer, value.getFloat(scope));
			return;
		case Type::string:
			writeString(writer, value.getString(scope));
			return;
		case Type::path:
			writeString(writer, value.getPath(scope));
			return;
		case Type::list: {
			auto items = value.getList(scope);
			writer.writeByte('[');
			for (size_t i = 0; i < items.length; ++i) {
				if (i > 0) writer.writeByte(',');
				encode(scope, writer, items[i]);
			}
			writer.writeByte(']');
			return;
		}
		case Type::attrs: {
			auto attrs = value.getAttrset(scope);
			writer.writeByte('{');
			for (size_t i = 0; i < attrs.count; ++i) {
				if (i > 0) writer.writeByte(',');
				writeString(writer, attrs.names[i]);
				writer.writeByte(':');
				encode(scope, writer, attrs.values[i]);
			}
			writer.writeByte('}');
			return;
		}
		case Type::function:
			scope.fatal("toJSON: cannot convert a function to JSON");
	}
	scope.fatalf("toJSON: unknown type tag %u", unsigned(type));
}

std::string_view encode(CallScope &scope, Value value) {
	GrowableBuffer writer{scope};
	encode(scope, writer, value);
	return writer.result();
}

void writeInteger(GrowableBuffer &writer, int64_t n) {
	if (n < 0) {
		writer.writeByte('-');
		// Can't be negated
		if (n == INT64_MIN) {
			writer.writeRaw("9223372036854775808");
			return;
		}
		n = -n;
	}
	if (n == 0) {
		writer.writeByte('0');
		return;
	}
	char digits[20];
	int count = 0;
	while (n > 0) {
		digits[count++] = char('0' + int(n%10));
		n /= 10;
	}
	while (count > 0) writer.writeByte((unsigned char)digits[--count]);
}

void writeFloat(GrowableBuffer &writer, double f) {
	if (std::isnan(f)) {
		writer.writeRaw("null");
		return;
	}
	if (std::isinf(f)) {
		writer.writeRaw(f > 0 ? "1e308" : "-1e308");
		return;
	}

	if (f < 0) {
		writer.writeByte('-');
		f = -f;
	}

	double fraction;
	if (f < 9223372036854775808.0) {
		auto integer = int64_t(f);
		fraction = f - double(integer);
		writeInteger(writer, integer);
	} else {
		// Too big for int64_t, but such doubles are always whole numbers
		char digits[320];
		int count = 0;
		double remaining = std::floor(f);
		while (remaining >= 1.0 && count < int(sizeof(digits))) {
			digits[count++] = char('0' + int(std::fmod(remaining, 10.0)));
			remaining = std::floor(remaining/10.0);
		}
		while (count > 0) writer.writeByte((unsigned char)digits[--count]);
		fraction = 0.0;
	}

	// Truncated (not rounded) to exactly 6 digits
	writer.writeByte('.');
	for (int i = 0; i < 6; ++i) {
		fraction *= 10.0;
		int digit = int(fraction);
		if (digit > 9) digit = 9;
		writer.writeByte((unsigned char)('0' + digit));
		fraction -= double(digit);
	}
}

void writeString(GrowableBuffer &writer, std::string_view s) {
	writer.writeByte('"');
	for (char c : s) {
		switch (c) {
			case '"': writer.writeRaw("\\\""); break;
			case '\\': writer.writeRaw("\\\\"); break;
			case '\b': writer.writeRaw("\\b"); break;
			case '\f': writer.writeRaw("\\f"); break;
			case '\n': writer.writeRaw("\\n"); break;
			case '\r': writer.writeRaw("\\r"); break;
			case '\t': writer.writeRaw("\\t"); break;
			default: {
				auto byte = (unsigned char)c;
				if (byte < 0x20) {
					writer.writeRaw("\\u00");
					writer.writeByte(hexDigit(byte >> 4));
					writer.writeByte(hexDigit(byte&0xF));
				} else {
					writer.writeByte(byte);
				}
			}
		}
	}
	writer.writeByte('"');
}

}} // namespace
