#include "bolt/diagnostics.hpp"
#include "bolt/options.hpp"
#include <cstdio>
#include <sstream>

namespace bolt {

const char* error_code(ErrorKind kind){
    switch(kind){
        case ErrorKind::ArityViolation: return "E2001";
        case ErrorKind::MissingRule: return "E2002";
        case ErrorKind::MalformedImport: return "E2003";
        case ErrorKind::UnknownArgumentType: return "E2004";
    }
    return "E2000";
}

codegen_error::codegen_error(ErrorKind k, const std::string& message, std::string hint_, int line_, int col_)
    : std::runtime_error(message), kind(k), code(error_code(k)), hint(std::move(hint_)), line(line_), col(col_) {}

codegen_error make_error(ErrorKind kind, const node* n, const std::string& message, std::string hint){
    int l = n ? n->location.line : -1;
    int c = n ? n->location.col : -1;
    std::string where = l >= 0 ? " (line " + std::to_string(l) + ")" : std::string();
    return codegen_error(kind, std::string(error_code(kind)) + ": " + message + where, std::move(hint), l, c);
}

std::string json_escape(const std::string& s){
    std::string out = "\"";
    out.reserve(s.size() + 2);
    for(char c : s){
        unsigned char u = static_cast<unsigned char>(c);
        switch(c){
            case '"':  out += "\\\""; continue;
            case '\\': out += "\\\\"; continue;
            case '\b': out += "\\b"; continue;
            case '\f': out += "\\f"; continue;
            case '\n': out += "\\n"; continue;
            case '\r': out += "\\r"; continue;
            case '\t': out += "\\t"; continue;
            default: break;
        }
        if(u < 0x20 || u == 0x7f){
            static const char hex[] = "0123456789abcdef";
            out += "\\u00";
            out += hex[u >> 4];
            out += hex[u & 0xf];
        } else {
            out += c;
        }
    }
    out += '"';
    return out;
}

std::string diagnostics_to_json(const codegen_error& e){
    std::ostringstream os;
    os<<"{\"success\":false,\"errors\":[{"
        "\"code\":"<<json_escape(e.code)
        <<",\"message\":"<<json_escape(e.what())
        <<",\"hint\":"<<json_escape(e.hint)
        <<",\"line\":"<<e.line
        <<",\"col\":"<<e.col
        <<"}]}";
    return os.str();
}

void maybe_print_json(const codegen_error& e){
    if(flag_enabled("BOLT_DIAG_JSON")){
        auto js=diagnostics_to_json(e);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace bolt
