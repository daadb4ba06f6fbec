// Reader and printer for the textual tree format.
#include "bolt/reader.hpp"
#include <cctype>
#include <sstream>
#include <vector>

namespace bolt {

namespace detail {

struct reader {
	std::string_view d;
	size_t p = 0;
	int line = 1, col = 1;
	bool with_locations = true;
	explicit reader(std::string_view s, bool locations) : d(s), with_locations(locations) {}
	bool eof() const { return p >= d.size(); }
	char peek() const { return eof() ? '\0' : d[p]; }
	char get() {
		if (eof()) return '\0';
		char c = d[p++];
		if (c == '\n') { ++line; col = 1; }
		else ++col;
		return c;
	}
	void skip_ws() {
		while (!eof()) {
			char c = peek();
			if (c == ';') {
				while (!eof() && get() != '\n') continue;
				continue;
			}
			if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v' || c == ',') { get(); continue; }
			break;
		}
	}
	[[noreturn]] void fail(const std::string& msg) const {
		throw parse_error("line " + std::to_string(line) + ":" + std::to_string(col) + ": " + msg);
	}
};

inline bool is_digit(char c) { return c >= '0' && c <= '9'; }
inline bool is_word_start(char c) { return std::isalpha((unsigned char)c) || c == '_' || c == '-' || c == '*' || c == '?' || c == '!'; }
inline bool is_word_char(char c) { return is_word_start(c) || is_digit(c) || c == '.' || c == '/'; }

std::string read_word(reader& r) {
	std::string s;
	while (is_word_char(r.peek())) s += r.get();
	return s;
}

node_ptr parse_form(reader& r);

std::string parse_string(reader& r) {
	if (r.get() != '"') r.fail("expected \"");
	std::string out;
	while (true) {
		if (r.eof()) r.fail("unterminated string");
		char c = r.get();
		if (c == '"') break;
		if (c == '\\') {
			if (r.eof()) r.fail("bad escape");
			char e = r.get();
			switch (e) {
			case 'n': out += '\n'; break;
			case 'r': out += '\r'; break;
			case 't': out += '\t'; break;
			default: out += e; break;
			}
		} else {
			out += c;
		}
	}
	return out;
}

leaf_value parse_number(reader& r) {
	std::string num;
	if (r.peek() == '+' || r.peek() == '-') num += r.get();
	bool is_float = false;
	while (is_digit(r.peek())) num += r.get();
	if (r.peek() == '.') {
		is_float = true;
		num += r.get();
		while (is_digit(r.peek())) num += r.get();
	}
	if (r.peek() == 'e' || r.peek() == 'E') {
		is_float = true;
		num += r.get();
		if (r.peek() == '+' || r.peek() == '-') num += r.get();
		while (is_digit(r.peek())) num += r.get();
	}
	try {
		if (is_float) return leaf_value{std::stod(num)};
		return leaf_value{static_cast<int64_t>(std::stoll(num))};
	} catch (const std::exception&) {
		r.fail("invalid number '" + num + "'");
	}
}

field_value parse_value(reader& r) {
	r.skip_ws();
	char c = r.peek();
	if (c == '(') return field_value{parse_form(r)};
	if (c == '[') {
		r.get();
		children out;
		r.skip_ws();
		while (!r.eof() && r.peek() != ']') {
			if (r.peek() != '(') r.fail("child sequences may only contain forms");
			out.elems.push_back(parse_form(r));
			r.skip_ws();
		}
		if (r.get() != ']') r.fail("unterminated child sequence");
		return field_value{std::move(out)};
	}
	if (c == '"') return field_value{leaf_value{parse_string(r)}};
	if (is_digit(c) || ((c == '+' || c == '-') && r.p + 1 < r.d.size() && (is_digit(r.d[r.p + 1]) || r.d[r.p + 1] == '.')))
		return field_value{parse_number(r)};
	if (is_word_start(c)) {
		auto w = read_word(r);
		if (w == "nil") return field_value{leaf_value{}};
		if (w == "true") return field_value{leaf_value{true}};
		if (w == "false") return field_value{leaf_value{false}};
		r.fail("unexpected word '" + w + "'");
	}
	if (r.eof()) r.fail("unexpected end of input");
	r.fail(std::string("unexpected character '") + c + "'");
}

node_ptr parse_form(reader& r) {
	r.skip_ws();
	source_location loc;
	if (r.with_locations) loc = source_location{r.line, r.col};
	if (r.get() != '(') r.fail("expected (");
	r.skip_ws();
	auto head = read_word(r);
	if (head.empty()) r.fail("expected node kind");
	auto kind = kind_from_name(head);
	if (!kind) r.fail("unknown node kind '" + head + "'");
	std::vector<field> fields;
	r.skip_ws();
	while (!r.eof() && r.peek() != ')') {
		if (r.get() != ':') r.fail("expected :field in " + head);
		auto name = read_word(r);
		if (name.empty()) r.fail("empty field name in " + head);
		fields.push_back(field{std::move(name), parse_value(r)});
		r.skip_ws();
	}
	if (r.get() != ')') r.fail("unterminated form " + head);
	return make_node(*kind, std::move(fields), loc);
}

} // namespace detail

node_ptr parse(std::string_view src, bool with_locations) {
	detail::reader r(src, with_locations);
	auto n = detail::parse_form(r);
	r.skip_ws();
	if (!r.eof()) r.fail("unexpected trailing characters");
	return n;
}

static std::string escape_string(const std::string& s) {
	std::string out = "\"";
	for (char c : s) {
		switch (c) {
		case '"': out += "\\\""; break;
		case '\\': out += "\\\\"; break;
		case '\n': out += "\\n"; break;
		case '\r': out += "\\r"; break;
		case '\t': out += "\\t"; break;
		default: out += c; break;
		}
	}
	return out + '"';
}

static std::string leaf_to_string(const leaf_value& v) {
	struct V {
		std::string operator()(std::monostate) const { return "nil"; }
		std::string operator()(bool b) const { return b ? "true" : "false"; }
		std::string operator()(int64_t i) const { return std::to_string(i); }
		std::string operator()(double d) const {
			std::ostringstream oss;
			oss << d;
			auto s = oss.str();
			if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
			return s;
		}
		std::string operator()(const std::string& s) const { return escape_string(s); }
	};
	return std::visit(V{}, v);
}

std::string to_string(const node& n) {
	std::string out = "(";
	out += kind_name(n.kind);
	for (const auto& f : n.fields) {
		out += " :" + f.name + ' ';
		if (is_leaf(f.value)) {
			out += leaf_to_string(std::get<leaf_value>(f.value));
		} else if (is_child(f.value)) {
			out += to_string(std::get<node_ptr>(f.value));
		} else {
			out += '[';
			bool first = true;
			for (const auto& ch : std::get<children>(f.value).elems) {
				if (!first) out += ' ';
				first = false;
				out += to_string(ch);
			}
			out += ']';
		}
	}
	out += ')';
	return out;
}

} // namespace bolt
