#include "bolt/codegen/accumulator.hpp"
#include "bolt/codegen/pyrepr.hpp"
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace bolt::codegen {

namespace {

struct HelperSpec {
    Helper op;
    const char* key;
    bool qualified; // key is a prefix completed by the converter / parser name
};

constexpr HelperSpec kHelpers[] = {
    {Helper::Replace, "replace", false},
    {Helper::Children, "children", false},
    {Helper::Missing, "missing", false},
    {Helper::GetAttribute, "get_attribute", false},
    {Helper::Interpolate, "interpolate_", true},
    {Helper::Convert, "convert:", true},
    {Helper::SetLocation, "set_location", false},
    {Helper::ImportModule, "import_module", false},
    {Helper::FromModuleImport, "from_module_import", false},
};

} // namespace

std::string join(const std::vector<std::string>& xs, std::string_view sep){
    std::string out;
    for(size_t i = 0; i < xs.size(); ++i){
        if(i) out += sep;
        out += xs[i];
    }
    return out;
}

std::string helper_key(Helper h, std::string_view qualifier){
    for(auto& spec : kHelpers){
        if(spec.op != h) continue;
        std::string key = spec.key;
        if(spec.qualified) key += qualifier;
        return key;
    }
    return {};
}

std::string normalize_string(std::string_view s){
    std::string out;
    bool pending = false;
    for(char c : s){
        unsigned char u = static_cast<unsigned char>(c);
        if(std::isalnum(u)){
            if(pending && !out.empty()) out += '_';
            pending = false;
            out += (char)std::tolower(u);
        } else {
            pending = true;
        }
    }
    return out;
}

ScopedIndent::ScopedIndent(Accumulator& acc) : acc_(acc), previous_(acc.indentation_) {
    acc_.indentation_ += acc_.indent_unit();
}

ScopedIndent::~ScopedIndent(){ acc_.indentation_ = previous_; }

Accumulator::Accumulator(CodegenOptions options) : options_(std::move(options)) {}

void Accumulator::statement(std::string_view code){
    lines_.push_back(indentation_ + std::string(code));
}

std::string Accumulator::make_ref(const node_ptr& n){
    size_t index = refs_.size();
    refs_.push_back(n);
    return options_.prefix + "_refs[" + std::to_string(index) + "]";
}

std::string Accumulator::make_ref_slice(std::vector<node_ptr>::const_iterator first, std::vector<node_ptr>::const_iterator last){
    size_t start = refs_.size();
    refs_.insert(refs_.end(), first, last);
    size_t stop = refs_.size();
    return options_.prefix + "_refs[" + std::to_string(start) + ":" + std::to_string(stop) + "]";
}

std::string Accumulator::make_variable(){
    return options_.prefix + "_var" + std::to_string(counter_++);
}

const std::string& Accumulator::bind(const std::string& key){
    if(auto it = header_index_.find(key); it != header_index_.end()) return header_[it->second].second;
    header_index_.emplace(key, header_.size());
    header_.emplace_back(key, options_.prefix + "_helper_" + normalize_string(key));
    return header_.back().second;
}

std::string Accumulator::helper(Helper h, const std::vector<std::string>& args, std::string_view qualifier){
    const std::string& local = bind(helper_key(h, qualifier));
    return local + "(" + join(args) + ")";
}

std::string Accumulator::replace(const std::string& ref, const std::vector<std::pair<std::string, std::string>>& fields){
    std::vector<std::string> args{ref};
    for(auto& [name, expr] : fields) args.push_back(name + "=" + expr);
    return helper(Helper::Replace, args);
}

std::string Accumulator::children(const std::vector<std::string>& items){
    return helper(Helper::Children, {"[" + join(items) + "]"});
}

std::string Accumulator::missing(){
    return bind(helper_key(Helper::Missing));
}

std::string Accumulator::lineno(const node* n) const {
    if(n && !n->location.unknown()) return "\n#" + std::to_string(n->location.line) + "\n";
    return "";
}

std::string Accumulator::get_source() const {
    std::string text;
    for(auto& [key, local] : header_) text += local + " = " + runtime() + ".helpers[" + py_str(key) + "]\n";
    for(auto& l : lines_){ text += l; text += '\n'; }

    std::vector<std::string> out{std::string()}; // slot for the line table
    std::vector<int> generated{1};
    std::vector<int> original{1};
    bool tracked = false;

    std::istringstream in(text);
    std::string line;
    while(std::getline(in, line)){
        if(!line.empty() && line[0] == '#'){
            tracked = true;
            int current = std::atoi(line.c_str() + 1);
            if(original.back() != current){
                generated.push_back((int)out.size());
                original.push_back(current);
            }
        } else if(line.find_first_not_of(" \t") != std::string::npos){
            out.push_back(line);
        }
    }

    if(tracked && options_.lineTable){
        auto render = [](const std::vector<int>& xs){
            std::string s = "[";
            for(size_t i = 0; i < xs.size(); ++i){ if(i) s += ", "; s += std::to_string(xs[i]); }
            return s + "]";
        };
        out[0] = options_.prefix + "_lineno = " + render(generated) + ", " + render(original);
    } else {
        out.erase(out.begin());
    }
    return join(out, "\n");
}

std::vector<std::string> Accumulator::take_from(size_t index){
    std::vector<std::string> tail(lines_.begin() + (std::ptrdiff_t)index, lines_.end());
    lines_.erase(lines_.begin() + (std::ptrdiff_t)index, lines_.end());
    return tail;
}

void Accumulator::append(std::vector<std::string> lines){
    for(auto& l : lines) lines_.push_back(std::move(l));
}

void Accumulator::reindent_from(size_t index){
    auto unit = indent_unit();
    for(size_t i = index; i < lines_.size(); ++i) lines_[i] = unit + lines_[i];
}

void Accumulator::insert_line(size_t index, std::string line){
    lines_.insert(lines_.begin() + (std::ptrdiff_t)index, std::move(line));
}

} // namespace bolt::codegen
