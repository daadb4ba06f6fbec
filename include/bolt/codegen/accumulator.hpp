#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "bolt/ast.hpp"
#include "bolt/options.hpp"

namespace bolt::codegen {

// Runtime helpers the generated code may call. Each one is bound once to a
// local name in the header of the generated text.
enum class Helper {
    Replace,          // replace(node, **fields): shallow copy with overrides
    Children,         // children([...]): build an immutable child sequence
    Missing,          // sentinel for parameters that were not supplied
    GetAttribute,     // get_attribute(obj, 'name')
    Interpolate,      // interpolate_<converter>(value, node)
    Convert,          // convert:<argument parser>(value, node)
    SetLocation,      // set_location(value, node)
    ImportModule,     // import_module('ns:path')
    FromModuleImport, // from_module_import('ns:path', 'a', ...)
};

// Runtime lookup key of a helper ("replace", "interpolate_int", "convert:brigadier:integer").
std::string helper_key(Helper h, std::string_view qualifier = {});

// Fragments separated by sep, as in argument lists and literals.
std::string join(const std::vector<std::string>& xs, std::string_view sep = ", ");

// Lowercase, runs of non-alphanumerics collapsed to '_', no leading/trailing '_'.
std::string normalize_string(std::string_view s);

class Accumulator;

// Restores the previous indentation when it goes out of scope.
class ScopedIndent {
public:
    explicit ScopedIndent(Accumulator& acc);
    ~ScopedIndent();
    ScopedIndent(const ScopedIndent&) = delete;
    ScopedIndent& operator=(const ScopedIndent&) = delete;
private:
    Accumulator& acc_;
    std::string previous_;
};

// Mutable state of one compilation: output lines, indentation, reference
// table, helper header and fresh-name counter. Never shared between
// compilations.
class Accumulator {
public:
    explicit Accumulator(CodegenOptions options = {});

    const CodegenOptions& options() const { return options_; }

    // ------ Emission ------
    void statement(std::string_view code);
    [[nodiscard]] ScopedIndent block() { return ScopedIndent(*this); }
    const std::string& indentation() const { return indentation_; }
    std::string indent_unit() const { return std::string((size_t)options_.indentWidth, ' '); }

    // ------ References ------
    std::string make_ref(const node_ptr& n);
    std::string make_ref_slice(std::vector<node_ptr>::const_iterator first, std::vector<node_ptr>::const_iterator last);
    const std::vector<node_ptr>& refs() const { return refs_; }
    std::vector<node_ptr> release_refs() { return std::move(refs_); }

    // ------ Names and helpers ------
    std::string make_variable();
    std::string helper(Helper h, const std::vector<std::string>& args, std::string_view qualifier = {});
    std::string replace(const std::string& ref, const std::vector<std::pair<std::string, std::string>>& fields);
    std::string children(const std::vector<std::string>& items);
    std::string missing();

    std::string runtime() const { return options_.prefix + "_runtime"; }
    std::string commands() const { return runtime() + ".commands"; }

    // ------ Source positions ------
    // "\n#<line>\n" when n has a known line, "" otherwise.
    std::string lineno(const node* n) const;
    std::string lineno(const node_ptr& n) const { return lineno(n.get()); }

    std::string get_source() const;

    // ------ Buffer surgery for collectors ------
    size_t size() const { return lines_.size(); }
    std::vector<std::string> take_from(size_t index);
    void append(std::vector<std::string> lines);
    void reindent_from(size_t index);
    void insert_line(size_t index, std::string line);
    const std::vector<std::string>& lines() const { return lines_; }

private:
    friend class ScopedIndent;

    CodegenOptions options_;
    std::string indentation_;
    std::vector<node_ptr> refs_;
    std::vector<std::string> lines_;
    unsigned counter_ = 0;
    // runtime key -> local name, in first-use order
    std::vector<std::pair<std::string, std::string>> header_;
    std::unordered_map<std::string, size_t> header_index_;

    const std::string& bind(const std::string& key);
};

} // namespace bolt::codegen
