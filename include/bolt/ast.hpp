// Immutable, shareable syntax tree handed over by the parser pipeline.
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bolt
{

    enum class NodeKind : uint8_t
    {
        // Structure
        Root,
        Command,
        ResourceLocation,
        // Ordinary command arguments
        Word,
        Number,
        Boolean,
        String,
        Coordinate,
        Vector2,
        Vector3,
        Message,
        MessageText,
        Particle,
        DustParticleParameters,
        Json,
        Nbt,
        Selector,
        // Scripting
        Interpolation,
        ArgumentInterpolation,
        ExpressionBinary,
        ExpressionUnary,
        Value,
        Identifier,
        AssignmentTargetIdentifier,
        FormatString,
        Tuple,
        List,
        Dict,
        DictItem,
        Attribute,
        Lookup,
        Call,
        Assignment,
        FunctionSignature,
        FunctionSignatureArgument,
        ImportedIdentifier,
    };

    // Textual name used by the reader, the printer and diagnostics.
    const char *kind_name(NodeKind kind);
    std::optional<NodeKind> kind_from_name(std::string_view name);

    struct node;
    using node_ptr = std::shared_ptr<const node>;

    using leaf_value = std::variant<std::monostate, bool, int64_t, double, std::string>;

    struct children
    {
        std::vector<node_ptr> elems;
    };

    using field_value = std::variant<leaf_value, node_ptr, children>;

    struct field
    {
        std::string name;
        field_value value;
    };

    struct source_location
    {
        int line = -1;
        int col = -1;
        bool unknown() const { return line < 0; }
    };

    struct node
    {
        NodeKind kind;
        std::vector<field> fields;
        source_location location;

        const field_value *find(std::string_view name) const;
    };

    inline bool is_leaf(const field_value &v) { return std::holds_alternative<leaf_value>(v); }
    inline bool is_child(const field_value &v) { return std::holds_alternative<node_ptr>(v); }
    inline bool is_children(const field_value &v) { return std::holds_alternative<children>(v); }

    // Leaf equality; ints and doubles compare by numeric value.
    bool leaf_equal(const leaf_value &a, const leaf_value &b);

    // Structural deep equality. Locations are ignored unless ignore_location is false.
    bool equal(const node_ptr &a, const node_ptr &b, bool ignore_location = true);

    // ------ Field access ------

    // Leaf stored under name, or nullptr when the field is absent or not a leaf.
    const leaf_value *leaf(const node &n, std::string_view name);
    // String leaf stored under name, or the empty string.
    std::string leaf_string(const node &n, std::string_view name);
    // Single child stored under name; null when absent or nil.
    node_ptr child(const node &n, std::string_view name);
    // Child sequence stored under name; empty when absent.
    const std::vector<node_ptr> &children_of(const node &n, std::string_view name);

    inline int line(const node &n) { return n.location.line; }
    inline int col(const node &n) { return n.location.col; }

    // ------ Construction helpers ------

    inline field f_leaf(std::string name, leaf_value v) { return field{std::move(name), field_value{std::move(v)}}; }
    inline field f_str(std::string name, std::string v) { return f_leaf(std::move(name), leaf_value{std::move(v)}); }
    inline field f_child(std::string name, node_ptr n) { return field{std::move(name), field_value{std::move(n)}}; }
    inline field f_children(std::string name, std::vector<node_ptr> xs)
    {
        return field{std::move(name), field_value{children{std::move(xs)}}};
    }

    inline node_ptr make_node(NodeKind kind, std::vector<field> fields, source_location loc = {})
    {
        return std::make_shared<const node>(node{kind, std::move(fields), loc});
    }

} // namespace bolt
