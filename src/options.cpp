#include "bolt/options.hpp"
#include <cctype>
#include <cstdlib>
#include <string>

namespace bolt {

bool is_identifier(const char* s){
    if(!s || !(std::isalpha((unsigned char)*s) || *s == '_')) return false;
    for(++s; *s; ++s)
        if(!(std::isalnum((unsigned char)*s) || *s == '_')) return false;
    return true;
}

bool flag_enabled(const char* name){
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}

CodegenOptions detectOptions(){
    CodegenOptions o{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    // Every generated name starts with the prefix, so it must be an identifier
    if (const char* v = get("BOLT_PREFIX"); v && is_identifier(v)) o.prefix = v;

    if (const char* v = get("BOLT_INDENT_WIDTH")) {
        char* end = nullptr;
        long w = std::strtol(v, &end, 10);
        if (end && *end == '\0' && w >= 1 && w <= 16) o.indentWidth = (int)w;
    }

    // Source-position table is on unless explicitly disabled
    if (const char* v = get("BOLT_LINE_TABLE")) o.lineTable = !(v[0]=='0' || v[0]=='n' || v[0]=='N' || v[0]=='f' || v[0]=='F');

    o.traceDispatch = flag_enabled("BOLT_DEBUG_DISPATCH");
    o.traceCodegen = flag_enabled("BOLT_DEBUG_CODEGEN");
    return o;
}

} // namespace bolt
