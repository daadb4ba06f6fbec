// Host-language (Python) literal rendering.
#pragma once
#include <string>
#include <string_view>

#include "bolt/ast.hpp"

namespace bolt::codegen {

// repr() of a str: single quotes unless the text contains ' and no ".
std::string py_str(std::string_view s);

// repr() of a float, including the 1e16 / 1e-05 exponent thresholds.
std::string py_float(double d);

// Literal for a leaf: None, True, False, ints, floats, strings.
std::string py_repr(const leaf_value& v);

} // namespace bolt::codegen
