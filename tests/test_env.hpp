#pragma once
#include <cstdlib>

// Test-only environment setters. An empty value unsets the variable.
inline void set_env(const char* name, const char* value){
    if(value && *value) setenv(name, value, 1);
    else unsetenv(name);
}

inline void clear_bolt_env(){
    for(const char* name : {"BOLT_PREFIX", "BOLT_INDENT_WIDTH", "BOLT_LINE_TABLE", "BOLT_DEBUG_DISPATCH",
                            "BOLT_DEBUG_CODEGEN", "BOLT_DIAG_JSON"})
        unsetenv(name);
}
