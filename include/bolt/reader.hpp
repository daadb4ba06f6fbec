// Textual tree format used by fixtures and the command-line driver.
//
//   (command :identifier "if:condition:body"
//            :arguments [ (identifier :value "flag") (root :commands []) ])
//
// A form is `(kind :field value ...)`. Values are a nested form (one child),
// a vector of forms (child sequence), a string, an integer, a float, true,
// false or nil.
#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

#include "bolt/ast.hpp"

namespace bolt
{

    struct parse_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    // Parse a single form (entire input). When with_locations is false every
    // node gets an unknown location.
    node_ptr parse(std::string_view src, bool with_locations = true);

    std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return p ? to_string(*p) : std::string("nil"); }

} // namespace bolt
