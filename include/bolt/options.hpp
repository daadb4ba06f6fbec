#pragma once
#include <string>

namespace bolt {

struct CodegenOptions {
    std::string prefix = "_bolt";   // prefix of every generated identifier
    int indentWidth = 4;            // spaces per block level
    bool lineTable = true;          // emit the source-position table when lines are tracked
    bool traceDispatch = false;     // [dbg][dispatch] lines on stderr
    bool traceCodegen = false;      // [dbg][codegen] lines on stderr
};

// [A-Za-z_][A-Za-z0-9_]*
bool is_identifier(const char* s);

// True when the variable is set to 1/t/T/y/Y.
bool flag_enabled(const char* name);

// Reads BOLT_PREFIX, BOLT_INDENT_WIDTH, BOLT_LINE_TABLE and the BOLT_DEBUG_* flags on top of the defaults.
CodegenOptions detectOptions();

} // namespace bolt
