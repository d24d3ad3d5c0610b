// SPDX-License-Identifier: MIT

#pragma once
#ifdef __cplusplus
extern "C" {
#endif

// Computes a post-selected distribution for a circuit in .lop text.
// options_json keys:
//   method   "ryser"|"glynn"|"naive"
//   threads  int (0 = default)
//   encoding "pairs=1:2,3:4;aux=0" (inputs/outputs: all encoded qubit states)
//   input    "|0,1,...>" (single input; without encoding, outputs are all Fock
//            states with the same photon count)
// Returns 0 on success, 2 bad arguments, 3 circuit error, 5 state error.
// *out_json must be freed with linopt_free().
int linopt_distribution_string(const char* circuit_text, const char* options_json, char** out_json);

// Same as linopt_distribution_string for a circuit file.
int linopt_distribution_file(const char* filepath, const char* options_json, char** out_json);

// Frees buffers allocated by the library.
void linopt_free(char* p);

// Returns the compiled library version string.
const char* linopt_version(void);

#ifdef __cplusplus
}
#endif
