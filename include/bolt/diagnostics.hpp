// Compilation errors and their JSON rendering.
#pragma once
#include <stdexcept>
#include <string>

#include "bolt/ast.hpp"

namespace bolt {

enum class ErrorKind {
    ArityViolation,       // E2001
    MissingRule,          // E2002
    MalformedImport,      // E2003
    UnknownArgumentType,  // E2004
};

const char* error_code(ErrorKind kind);

// Fatal for the current compilation; no partial output is produced.
struct codegen_error : std::runtime_error {
    ErrorKind kind;
    std::string code;
    std::string hint;
    int line = -1;
    int col = -1;

    codegen_error(ErrorKind k, const std::string& message, std::string hint_ = {}, int line_ = -1, int col_ = -1);
};

// Builds an error located at n (unknown location when n is null).
codegen_error make_error(ErrorKind kind, const node* n, const std::string& message, std::string hint = {});

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize a failed compilation to a compact JSON string.
std::string diagnostics_to_json(const codegen_error& e);

// If BOLT_DIAG_JSON=1 in the environment, print the diagnostic JSON to stderr.
void maybe_print_json(const codegen_error& e);

} // namespace bolt
