#include "bolt/codegen/pyrepr.hpp"
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace bolt::codegen {

std::string py_str(std::string_view s){
    bool has_single = s.find('\'') != std::string_view::npos;
    bool has_double = s.find('"') != std::string_view::npos;
    char quote = (has_single && !has_double) ? '"' : '\'';
    std::string out(1, quote);
    for(char c : s){
        unsigned char u = static_cast<unsigned char>(c);
        if(c == quote || c == '\\'){ out += '\\'; out += c; }
        else if(c == '\n') out += "\\n";
        else if(c == '\r') out += "\\r";
        else if(c == '\t') out += "\\t";
        else if(u < 0x20 || u == 0x7f){ char buf[5]; std::snprintf(buf, sizeof(buf), "\\x%02x", u); out += buf; }
        else out += c;
    }
    out += quote;
    return out;
}

std::string py_float(double d){
    if(std::isnan(d)) return "float('nan')";
    if(std::isinf(d)) return d < 0 ? "float('-inf')" : "float('inf')";

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::scientific);
    std::string sci(buf, res.ptr);

    // sci looks like [-]D[.DDD]e(+|-)XX
    auto e = sci.find('e');
    int exponent = std::atoi(sci.c_str() + e + 1);
    if(exponent < -4 || exponent >= 16) return sci;

    std::string sign;
    std::string mantissa = sci.substr(0, e);
    if(!mantissa.empty() && mantissa[0] == '-'){ sign = "-"; mantissa.erase(0, 1); }
    std::string digits;
    for(char c : mantissa) if(c != '.') digits += c;

    std::string out;
    if(exponent >= 0){
        size_t int_len = (size_t)exponent + 1;
        if(digits.size() <= int_len){
            out = digits + std::string(int_len - digits.size(), '0') + ".0";
        } else {
            out = digits.substr(0, int_len) + "." + digits.substr(int_len);
        }
    } else {
        out = "0." + std::string((size_t)(-exponent - 1), '0') + digits;
    }
    return sign + out;
}

std::string py_repr(const leaf_value& v){
    struct V {
        std::string operator()(std::monostate) const { return "None"; }
        std::string operator()(bool b) const { return b ? "True" : "False"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { return py_float(d); }
        std::string operator()(const std::string& s) const { return py_str(s); }
    };
    return std::visit(V{}, v);
}

} // namespace bolt::codegen
