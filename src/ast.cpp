// Node kind names, field accessors and structural equality.
#include "bolt/ast.hpp"
#include <array>
#include <utility>

namespace bolt {

namespace {

constexpr std::array<std::pair<NodeKind, const char*>, 37> kKindNames{{
	{NodeKind::Root, "root"},
	{NodeKind::Command, "command"},
	{NodeKind::ResourceLocation, "resource-location"},
	{NodeKind::Word, "word"},
	{NodeKind::Number, "number"},
	{NodeKind::Boolean, "boolean"},
	{NodeKind::String, "string"},
	{NodeKind::Coordinate, "coordinate"},
	{NodeKind::Vector2, "vector2"},
	{NodeKind::Vector3, "vector3"},
	{NodeKind::Message, "message"},
	{NodeKind::MessageText, "message-text"},
	{NodeKind::Particle, "particle"},
	{NodeKind::DustParticleParameters, "dust-particle-parameters"},
	{NodeKind::Json, "json"},
	{NodeKind::Nbt, "nbt"},
	{NodeKind::Selector, "selector"},
	{NodeKind::Interpolation, "interpolation"},
	{NodeKind::ArgumentInterpolation, "argument-interpolation"},
	{NodeKind::ExpressionBinary, "binary"},
	{NodeKind::ExpressionUnary, "unary"},
	{NodeKind::Value, "value"},
	{NodeKind::Identifier, "identifier"},
	{NodeKind::AssignmentTargetIdentifier, "target-identifier"},
	{NodeKind::FormatString, "format-string"},
	{NodeKind::Tuple, "tuple"},
	{NodeKind::List, "list"},
	{NodeKind::Dict, "dict"},
	{NodeKind::DictItem, "dict-item"},
	{NodeKind::Attribute, "attribute"},
	{NodeKind::Lookup, "lookup"},
	{NodeKind::Call, "call"},
	{NodeKind::Assignment, "assignment"},
	{NodeKind::FunctionSignature, "function-signature"},
	{NodeKind::FunctionSignatureArgument, "function-argument"},
	{NodeKind::ImportedIdentifier, "imported-identifier"},
	{NodeKind::Boolean, "bool"}, // reader alias
}};

const std::vector<node_ptr> kNoChildren;

} // namespace

const char* kind_name(NodeKind kind) {
	for (const auto& [k, name] : kKindNames)
		if (k == kind) return name;
	return "<unknown>";
}

std::optional<NodeKind> kind_from_name(std::string_view name) {
	for (const auto& [k, n] : kKindNames)
		if (name == n) return k;
	return std::nullopt;
}

const field_value* node::find(std::string_view name) const {
	for (const auto& f : fields)
		if (f.name == name) return &f.value;
	return nullptr;
}

bool leaf_equal(const leaf_value& a, const leaf_value& b) {
	auto as_number = [](const leaf_value& v, double& out) {
		if (std::holds_alternative<int64_t>(v)) { out = static_cast<double>(std::get<int64_t>(v)); return true; }
		if (std::holds_alternative<double>(v)) { out = std::get<double>(v); return true; }
		return false;
	};
	double x = 0, y = 0;
	if (as_number(a, x) && as_number(b, y)) return x == y;
	return a == b;
}

static bool equal_impl(const node_ptr& a, const node_ptr& b, bool ignore_location);

static bool field_equal(const field_value& a, const field_value& b, bool ignore_location) {
	if (a.index() != b.index()) return false;
	if (is_leaf(a)) return leaf_equal(std::get<leaf_value>(a), std::get<leaf_value>(b));
	if (is_child(a)) return equal_impl(std::get<node_ptr>(a), std::get<node_ptr>(b), ignore_location);
	const auto& le = std::get<children>(a).elems;
	const auto& re = std::get<children>(b).elems;
	if (le.size() != re.size()) return false;
	for (size_t i = 0; i < le.size(); ++i)
		if (!equal_impl(le[i], re[i], ignore_location)) return false;
	return true;
}

static bool equal_impl(const node_ptr& a, const node_ptr& b, bool ignore_location) {
	if (a.get() == b.get()) return true;
	if (!a || !b) return false;
	if (a->kind != b->kind) return false;
	if (!ignore_location && (a->location.line != b->location.line || a->location.col != b->location.col)) return false;
	if (a->fields.size() != b->fields.size()) return false;
	for (size_t i = 0; i < a->fields.size(); ++i) {
		if (a->fields[i].name != b->fields[i].name) return false;
		if (!field_equal(a->fields[i].value, b->fields[i].value, ignore_location)) return false;
	}
	return true;
}

bool equal(const node_ptr& a, const node_ptr& b, bool ignore_location) {
	return equal_impl(a, b, ignore_location);
}

const leaf_value* leaf(const node& n, std::string_view name) {
	auto* v = n.find(name);
	if (!v || !is_leaf(*v)) return nullptr;
	return &std::get<leaf_value>(*v);
}

std::string leaf_string(const node& n, std::string_view name) {
	auto* v = leaf(n, name);
	if (!v || !std::holds_alternative<std::string>(*v)) return {};
	return std::get<std::string>(*v);
}

node_ptr child(const node& n, std::string_view name) {
	auto* v = n.find(name);
	if (!v || !is_child(*v)) return nullptr;
	return std::get<node_ptr>(*v);
}

const std::vector<node_ptr>& children_of(const node& n, std::string_view name) {
	auto* v = n.find(name);
	if (!v || !is_children(*v)) return kNoChildren;
	return std::get<children>(*v).elems;
}

} // namespace bolt
