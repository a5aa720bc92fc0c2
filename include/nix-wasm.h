#pragma once

#ifdef __cplusplus
#include <cstddef>
#include <cstdint>
extern "C" {
#else
#include <stddef.h>
#include <stdint.h>
#endif

// Opaque handle naming a value owned by the host evaluator.  0 means "absent".
typedef uint32_t nix_value_id;

typedef enum nix_type {
	NIX_TYPE_INTEGER = 1,
	NIX_TYPE_FLOAT = 2,
	NIX_TYPE_BOOLEAN = 3,
	NIX_TYPE_STRING = 4,
	NIX_TYPE_PATH = 5,
	NIX_TYPE_NULL = 6,
	NIX_TYPE_ATTRS = 7,
	NIX_TYPE_LIST = 8,
	NIX_TYPE_FUNCTION = 9
} nix_type;

// On wasm32 this is the host's {name_ptr, name_len, value_id} triple
typedef struct nix_attr_input {
	const char *name;
	size_t name_len;
	nix_value_id value;
} nix_attr_input;

typedef struct nix_attr_output {
	nix_value_id value;
	uint32_t name_len;
} nix_attr_output;

/* Functions provided by the host evaluator.

	All `copy_*` functions (and `read_file`) follow the same convention: they return the full length of the data, and only copy it if `max_len` is large enough.  Calling with a null destination and zero capacity is a pure length query.
*/
typedef struct nix_wasm_host {
	void *host_data;

	nix_type (*get_type)(const struct nix_wasm_host *host, nix_value_id value);

	nix_value_id (*make_int)(const struct nix_wasm_host *host, int64_t value);
	int64_t (*get_int)(const struct nix_wasm_host *host, nix_value_id value);
	nix_value_id (*make_float)(const struct nix_wasm_host *host, double value);
	double (*get_float)(const struct nix_wasm_host *host, nix_value_id value);
	nix_value_id (*make_bool)(const struct nix_wasm_host *host, int value);
	int (*get_bool)(const struct nix_wasm_host *host, nix_value_id value);
	nix_value_id (*make_null)(const struct nix_wasm_host *host);

	nix_value_id (*make_string)(const struct nix_wasm_host *host, const char *ptr, size_t len);
	size_t (*copy_string)(const struct nix_wasm_host *host, nix_value_id value, char *ptr, size_t max_len);
	// `base` is a path value, and `ptr` is relative to it
	nix_value_id (*make_path)(const struct nix_wasm_host *host, nix_value_id base, const char *ptr, size_t len);
	size_t (*copy_path)(const struct nix_wasm_host *host, nix_value_id value, char *ptr, size_t max_len);

	nix_value_id (*make_list)(const struct nix_wasm_host *host, const nix_value_id *ptr, size_t len);
	size_t (*copy_list)(const struct nix_wasm_host *host, nix_value_id value, nix_value_id *ptr, size_t max_len);

	nix_value_id (*make_attrset)(const struct nix_wasm_host *host, const nix_attr_input *ptr, size_t len);
	size_t (*copy_attrset)(const struct nix_wasm_host *host, nix_value_id value, nix_attr_output *ptr, size_t max_len);
	void (*copy_attrname)(const struct nix_wasm_host *host, nix_value_id value, size_t attr_idx, char *ptr, size_t len);
	// Returns 0 if the attribute isn't present
	nix_value_id (*get_attr)(const struct nix_wasm_host *host, nix_value_id value, const char *ptr, size_t len);

	nix_value_id (*call_function)(const struct nix_wasm_host *host, nix_value_id fun, const nix_value_id *ptr, size_t len);
	nix_value_id (*make_app)(const struct nix_wasm_host *host, nix_value_id fun, const nix_value_id *ptr, size_t len);

	size_t (*read_file)(const struct nix_wasm_host *host, nix_value_id path, char *ptr, size_t max_len);

	// Terminates the current call - should not return
	void (*panic)(const struct nix_wasm_host *host, const char *ptr, size_t len);
	void (*warn)(const struct nix_wasm_host *host, const char *ptr, size_t len);
} nix_wasm_host;

// Registers the host used by the exported functions below.  On wasm32, the imported `env` functions are used unless this is called.
void nix_wasm_set_host(const nix_wasm_host *host);
const nix_wasm_host * nix_wasm_get_host();

// Module initialisation hook, called once by the host
void nix_wasm_init_v1();

// fromJSON ''{"x": [1, 2, 3], "y": null}''  =>  { x = [ 1 2 3 ]; y = null; }
nix_value_id fromJSON(nix_value_id arg);
// toJSON { x = [ 1 2 3 ]; y = null; }  =>  "{\"x\":[1,2,3],\"y\":null}"
nix_value_id toJSON(nix_value_id arg);

#ifdef __cplusplus
}
#endif
