#pragma once

#include "../call-scope.h"
#include "../growable-buffer.h"
#include "../value.h"

#include <cstdint>
#include <string_view>

namespace nix_wasm { namespace json {

// Parses a complete JSON document into host values.  Any syntax error is fatal.
Value decode(CallScope &scope, std::string_view input);

// Serialises `value` and everything reachable from it.  Functions are fatal.
void encode(CallScope &scope, GrowableBuffer &writer, Value value);
// Result lives in the arena
std::string_view encode(CallScope &scope, Value value);

//---------- Number and string helpers ----------

// Optional '-' then digits, stopping at the first non-digit.  Wraps on overflow.
int64_t parseInteger(std::string_view literal);
// Accepts what the decoder's number scanner accepts, including empty fraction/exponent digit runs
double parseFloat(std::string_view literal);

void writeInteger(GrowableBuffer &writer, int64_t n);
// Fixed six fractional digits.  NaN is `null`, infinities are +/-1e308
void writeFloat(GrowableBuffer &writer, double f);
// Quoted, with `"`, `\` and control characters escaped.  Other bytes pass through.
void writeString(GrowableBuffer &writer, std::string_view s);

}} // namespace
