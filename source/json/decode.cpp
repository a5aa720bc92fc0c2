#include "./json.h"

#include <cmath>
#include <cstring>

namespace nix_wasm { namespace json {

namespace {

inline bool isDigit(char c) {
	return c >= '0' && c <= '9';
}

/* Recursive-descent parser over a byte cursor.

	`pos` only moves forwards, and stays within `[0, input.size()]` at every decision point.
*/
struct Decoder {
	CallScope &scope;
	std::string_view input;
	size_t pos = 0;

	Decoder(CallScope &scope, std::string_view input) : scope(scope), input(input) {}

	bool atEnd() const {
		return pos >= input.size();
	}
	bool next(char c) const {
		return pos < input.size() && input[pos] == c;
	}

	void skipWhitespace() {
		while (pos < input.size()) {
			char c = input[pos];
			if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
			++pos;
		}
	}

	[[noreturn]] void unexpectedCharacter() {
		auto c = (unsigned char)input[pos];
		if (c > ' ' && c < 0x7f) {
			scope.fatalf("fromJSON: unexpected character '%c' at offset %zu", char(c), pos);
		}
		scope.fatalf("fromJSON: unexpected byte 0x%02x at offset %zu", unsigned(c), pos);
	}

	Value value() {
		skipWhitespace();
		if (atEnd()) scope.fatal("fromJSON: unexpected end of input");

		char c = input[pos];
		switch (c) {
			case '"': return Value::makeString(scope, string());
			case '{': return object();
			case '[': return array();
			case 't':
				keyword("true");
				return Value::makeBool(scope, true);
			case 'f':
				keyword("false");
				return Value::makeBool(scope, false);
			case 'n':
				keyword("null");
				return Value::makeNull(scope);
			default:
				if (c == '-' || isDigit(c)) return number();
				unexpectedCharacter();
		}
	}

	void keyword(std::string_view word) {
		if (input.substr(pos, word.size()) != word) {
			scope.fatalf("fromJSON: invalid token at offset %zu", pos);
		}
		pos += word.size();
	}

	// Expects `pos` on the opening quote
	std::string_view string() {
		size_t start = ++pos;

		// Find the closing quote, and whether we need to decode anything
		bool hasEscapes = false;
		size_t end = start;
		while (end < input.size() && input[end] != '"') {
			if (input[end] == '\\') {
				hasEscapes = true;
				end += 2;
			} else {
				++end;
			}
		}
		if (end >= input.size()) scope.fatal("fromJSON: unterminated string");
		pos = end + 1;

		if (!hasEscapes) return input.substr(start, end - start);

		// Decoded text is never longer than the raw text
		auto buffer = scope.makeArrayOrPanic<char>(end - start);
		size_t length = 0;
		for (size_t i = start; i < end; ++i) {
			char c = input[i];
			if (c != '\\') {
				buffer[length++] = c;
				continue;
			}
			c = input[++i];
			switch (c) {
				case 'b': buffer[length++] = '\b'; break;
				case 'f': buffer[length++] = '\f'; break;
				case 'n': buffer[length++] = '\n'; break;
				case 'r': buffer[length++] = '\r'; break;
				case 't': buffer[length++] = '\t'; break;
				// `\" \\ \/`, and anything unrecognised (including `\u`), is copied as-is
				default: buffer[length++] = c;
			}
		}
		return {buffer.ptr, length};
	}

	Value number() {
		size_t start = pos;
		bool isFloat = false;

		if (next('-')) ++pos;
		while (pos < input.size() && isDigit(input[pos])) ++pos;

		if (next('.')) {
			isFloat = true;
			++pos;
			while (pos < input.size() && isDigit(input[pos])) ++pos;
		}
		if (next('e') || next('E')) {
			isFloat = true;
			++pos;
			if (next('+') || next('-')) ++pos;
			while (pos < input.size() && isDigit(input[pos])) ++pos;
		}

		auto literal = input.substr(start, pos - start);
		if (isFloat) return Value::makeFloat(scope, parseFloat(literal));
		return Value::makeInt(scope, parseInteger(literal));
	}

	// Copies into a block twice the size (capped at `limit`).  The old block is left for the scoped reset to release.
	template<class T>
	Slice<T> growItems(Slice<T> items, size_t limit) {
		size_t capacity = items.length*2;
		if (capacity < config::jsonInitialItems) capacity = config::jsonInitialItems;
		if (capacity > limit) capacity = limit;
		auto bigger = scope.makeArrayOrPanic<T>(capacity);
		if (items.length) std::memcpy(bigger.ptr, items.ptr, items.length*sizeof(T));
		return bigger;
	}

	Value array() {
		++pos; // '['
		skipWhitespace();
		if (next(']')) {
			++pos;
			return Value::makeList(scope, Slice<const Value>{});
		}

		// Children are finished with their scratch space by the time they return
		auto reset = scope.arena.scopedReset();
		Slice<Value> items;
		size_t count = 0;
		while (true) {
			if (count >= config::jsonMaxArrayItems) {
				scope.fatalf("fromJSON: array too large (more than %zu items)", config::jsonMaxArrayItems);
			}
			if (count == items.length) items = growItems(items, config::jsonMaxArrayItems);
			items[count++] = value();

			skipWhitespace();
			if (!next(',')) break;
			++pos;
		}

		if (!next(']')) scope.fatalf("fromJSON: expected ']' at offset %zu", pos);
		++pos;
		return Value::makeList(scope, items.prefix(count));
	}

	Value object() {
		++pos; // '{'
		skipWhitespace();
		if (next('}')) {
			++pos;
			return Value::makeAttrset(scope, Slice<const AttrEntry>{});
		}

		// Decoded key names live in here too, until the host has copied them
		auto reset = scope.arena.scopedReset();
		Slice<AttrEntry> entries;
		size_t count = 0;
		while (true) {
			if (count >= config::jsonMaxObjectEntries) {
				scope.fatalf("fromJSON: object too large (more than %zu entries)", config::jsonMaxObjectEntries);
			}

			skipWhitespace();
			if (!next('"')) scope.fatalf("fromJSON: expected string key at offset %zu", pos);
			auto name = string();

			skipWhitespace();
			if (!next(':')) scope.fatalf("fromJSON: expected ':' at offset %zu", pos);
			++pos;

			auto item = value();
			if (count == entries.length) entries = growItems(entries, config::jsonMaxObjectEntries);
			// Duplicate keys are passed through - the host decides what happens
			entries[count++] = {name, item};

			skipWhitespace();
			if (!next(',')) break;
			++pos;
		}

		if (!next('}')) scope.fatalf("fromJSON: expected '}' at offset %zu", pos);
		++pos;
		return Value::makeAttrset(scope, entries.prefix(count));
	}
};

} // namespace

Value decode(CallScope &scope, std::string_view input) {
	Decoder decoder{scope, input};
	Value result = decoder.value();

	decoder.skipWhitespace();
	if (!decoder.atEnd()) {
		scope.fatalf("fromJSON: unexpected trailing characters at offset %zu", decoder.pos);
	}
	return result;
}

int64_t parseInteger(std::string_view literal) {
	size_t i = 0;
	bool negative = false;
	if (i < literal.size() && literal[i] == '-') {
		negative = true;
		++i;
	}
	// Unsigned, so overflow wraps instead of being UB (and the minimum value comes out exact)
	uint64_t result = 0;
	for (; i < literal.size() && isDigit(literal[i]); ++i) {
		result = result*10 + uint64_t(literal[i] - '0');
	}
	if (negative) result = uint64_t(0) - result;
	return int64_t(result);
}

double parseFloat(std::string_view literal) {
	size_t i = 0;
	bool negative = false;
	if (i < literal.size() && literal[i] == '-') {
		negative = true;
		++i;
	}

	double result = 0.0;
	for (; i < literal.size() && isDigit(literal[i]); ++i) {
		result = result*10.0 + double(literal[i] - '0');
	}

	if (i < literal.size() && literal[i] == '.') {
		++i;
		double divisor = 10.0;
		for (; i < literal.size() && isDigit(literal[i]); ++i) {
			result += double(literal[i] - '0')/divisor;
			divisor *= 10.0;
		}
	}

	if (i < literal.size() && (literal[i] == 'e' || literal[i] == 'E')) {
		++i;
		bool negativeExponent = false;
		if (i < literal.size() && (literal[i] == '+' || literal[i] == '-')) {
			negativeExponent = (literal[i] == '-');
			++i;
		}
		unsigned exponent = 0;
		for (; i < literal.size() && isDigit(literal[i]); ++i) {
			if (exponent < 100000) exponent = exponent*10 + unsigned(literal[i] - '0');
		}

		// No overflow checks: big exponents end up as 0 or infinity
		if (result != 0.0) {
			double multiplier = 1.0;
			for (unsigned e = 0; e < exponent && !std::isinf(multiplier); ++e) {
				multiplier *= 10.0;
			}
			if (negativeExponent) {
				result /= multiplier;
			} else {
				result *= multiplier;
			}
		}
	}

	return negative ? -result : result;
}

}} // namespace
