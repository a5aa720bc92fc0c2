#pragma once

// Binds `nix_wasm_host` to the functions the evaluator provides in the `env` import module.  Only for wasm32 builds.

#include "nix-wasm.h"

#ifndef __wasm__
#	error env-host.hxx is only for WASM builds
#endif

static_assert(sizeof(nix_attr_input) == 12, "nix_attr_input must match the host's {ptr, len, value} layout");
static_assert(sizeof(nix_attr_output) == 8, "nix_attr_output must match the host's {value, len} layout");

#define NIX_WASM_IMPORT(name) __attribute__((import_module("env"), import_name(#name)))

extern "C" {
	NIX_WASM_IMPORT(get_type) nix_type nixImport_get_type(nix_value_id value);
	NIX_WASM_IMPORT(make_int) nix_value_id nixImport_make_int(int64_t value);
	NIX_WASM_IMPORT(get_int) int64_t nixImport_get_int(nix_value_id value);
	NIX_WASM_IMPORT(make_float) nix_value_id nixImport_make_float(double value);
	NIX_WASM_IMPORT(get_float) double nixImport_get_float(nix_value_id value);
	NIX_WASM_IMPORT(make_bool) nix_value_id nixImport_make_bool(int value);
	NIX_WASM_IMPORT(get_bool) int nixImport_get_bool(nix_value_id value);
	NIX_WASM_IMPORT(make_null) nix_value_id nixImport_make_null();
	NIX_WASM_IMPORT(make_string) nix_value_id nixImport_make_string(const char *ptr, size_t len);
	NIX_WASM_IMPORT(copy_string) size_t nixImport_copy_string(nix_value_id value, char *ptr, size_t max_len);
	NIX_WASM_IMPORT(make_path) nix_value_id nixImport_make_path(nix_value_id base, const char *ptr, size_t len);
	NIX_WASM_IMPORT(copy_path) size_t nixImport_copy_path(nix_value_id value, char *ptr, size_t max_len);
	NIX_WASM_IMPORT(make_list) nix_value_id nixImport_make_list(const nix_value_id *ptr, size_t len);
	NIX_WASM_IMPORT(copy_list) size_t nixImport_copy_list(nix_value_id value, nix_value_id *ptr, size_t max_len);
	NIX_WASM_IMPORT(make_attrset) nix_value_id nixImport_make_attrset(const nix_attr_input *ptr, size_t len);
	NIX_WASM_IMPORT(copy_attrset) size_t nixImport_copy_attrset(nix_value_id value, nix_attr_output *ptr, size_t max_len);
	NIX_WASM_IMPORT(copy_attrname) void nixImport_copy_attrname(nix_value_id value, size_t attr_idx, char *ptr, size_t len);
	NIX_WASM_IMPORT(get_attr) nix_value_id nixImport_get_attr(nix_value_id value, const char *ptr, size_t len);
	NIX_WASM_IMPORT(call_function) nix_value_id nixImport_call_function(nix_value_id fun, const nix_value_id *ptr, size_t len);
	NIX_WASM_IMPORT(make_app) nix_value_id nixImport_make_app(nix_value_id fun, const nix_value_id *ptr, size_t len);
	NIX_WASM_IMPORT(read_file) size_t nixImport_read_file(nix_value_id value, char *ptr, size_t max_len);
	NIX_WASM_IMPORT(panic) void nixImport_panic(const char *ptr, size_t len);
	NIX_WASM_IMPORT(warn) void nixImport_warn(const char *ptr, size_t len);
}

#undef NIX_WASM_IMPORT

namespace nix_wasm {

// The imports don't take a host argument, so each one gets a forwarding function
inline const nix_wasm_host envHost = {
	nullptr,
	[](const nix_wasm_host *, nix_value_id value) {
		return nixImport_get_type(value);
	},
	[](const nix_wasm_host *, int64_t value) {
		return nixImport_make_int(value);
	},
	[](const nix_wasm_host *, nix_value_id value) {
		return nixImport_get_int(value);
	},
	[](const nix_wasm_host *, double value) {
		return nixImport_make_float(value);
	},
	[](const nix_wasm_host *, nix_value_id value) {
		return nixImport_get_float(value);
	},
	[](const nix_wasm_host *, int value) {
		return nixImport_make_bool(value);
	},
	[](const nix_wasm_host *, nix_value_id value) {
		return nixImport_get_bool(value);
	},
	[](const nix_wasm_host *) {
		return nixImport_make_null();
	},
	[](const nix_wasm_host *, const char *ptr, size_t len) {
		return nixImport_make_string(ptr, len);
	},
	[](const nix_wasm_host *, nix_value_id value, char *ptr, size_t maxLen) {
		return nixImport_copy_string(value, ptr, maxLen);
	},
	[](const nix_wasm_host *, nix_value_id base, const char *ptr, size_t len) {
		return nixImport_make_path(base, ptr, len);
	},
	[](const nix_wasm_host *, nix_value_id value, char *ptr, size_t maxLen) {
		return nixImport_copy_path(value, ptr, maxLen);
	},
	[](const nix_wasm_host *, const nix_value_id *ptr, size_t len) {
		return nixImport_make_list(ptr, len);
	},
	[](const nix_wasm_host *, nix_value_id value, nix_value_id *ptr, size_t maxLen) {
		return nixImport_copy_list(value, ptr, maxLen);
	},
	[](const nix_wasm_host *, const nix_attr_input *ptr, size_t len) {
		return nixImport_make_attrset(ptr, len);
	},
	[](const nix_wasm_host *, nix_value_id value, nix_attr_output *ptr, size_t maxLen) {
		return nixImport_copy_attrset(value, ptr, maxLen);
	},
	[](const nix_wasm_host *, nix_value_id value, size_t index, char *ptr, size_t len) {
		nixImport_copy_attrname(value, index, ptr, len);
	},
	[](const nix_wasm_host *, nix_value_id value, const char *ptr, size_t len) {
		return nixImport_get_attr(value, ptr, len);
	},
	[](const nix_wasm_host *, nix_value_id fun, const nix_value_id *ptr, size_t len) {
		return nixImport_call_function(fun, ptr, len);
	},
	[](const nix_wasm_host *, nix_value_id fun, const nix_value_id *ptr, size_t len) {
		return nixImport_make_app(fun, ptr, len);
	},
	[](const nix_wasm_host *, nix_value_id value, char *ptr, size_t maxLen) {
		return nixImport_read_file(value, ptr, maxLen);
	},
	[](const nix_wasm_host *, const char *ptr, size_t len) {
		nixImport_panic(ptr, len);
	},
	[](const nix_wasm_host *, const char *ptr, size_t len) {
		nixImport_warn(ptr, len);
	}
};

} // namespace
