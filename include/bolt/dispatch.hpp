#pragma once
#include "bolt/ast.hpp"
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace bolt {

// Rule-based dispatch over tree nodes.
//
// A rule is (node kind or any kind, field=literal constraints, handler). For a
// given node the engine picks the single best rule:
//   1. exact kind rules before any-kind rules
//   2. more constraints before fewer
//   3. later registration before earlier
// Handlers recurse by calling invoke() on the visitor they receive. That is the
// visitor the traversal started on, so every composed rule set applies at every
// depth of the tree.
//
// Handler signature: Result(Visitor&, const node_ptr&, Args...)

struct missing_rule_error : std::runtime_error {
    NodeKind kind;
    explicit missing_rule_error(NodeKind k)
        : std::runtime_error(std::string("no dispatch rule matches node kind '") + kind_name(k) + "'"), kind(k) {}
};

struct Constraint {
    std::string field;
    leaf_value value;
};

inline bool matches(const node& n, const std::vector<Constraint>& constraints){
    for(auto& c : constraints){
        auto* v = leaf(n, c.field);
        if(!v || !leaf_equal(*v, c.value)) return false;
    }
    return true;
}

enum class Fallback { Generic, None };

template <typename Result, typename... Args>
class Visitor {
public:
    using Handler = std::function<Result(Visitor&, const node_ptr&, Args...)>;

    struct Rule {
        std::optional<NodeKind> kind; // nullopt matches any kind
        std::vector<Constraint> constraints;
        Handler handler;
        std::string name;
        int priority = 0;   // number of constraints
        uint64_t seq = 0;   // registration order
        bool builtin = false;
    };

    // Fallback::Generic installs a least-specific rule that walks every child.
    explicit Visitor(Fallback fallback = Fallback::Generic){
        if(fallback == Fallback::Generic){
            Rule r; r.handler = &Visitor::visit_children; r.name = "generic"; r.builtin = true;
            insert(std::move(r));
        }
    }

    Visitor& add_rule(NodeKind kind, Handler h, std::string name = {}){
        return add_rule(kind, {}, std::move(h), std::move(name));
    }
    Visitor& add_rule(NodeKind kind, std::vector<Constraint> constraints, Handler h, std::string name = {}){
        Rule r; r.kind = kind; r.constraints = std::move(constraints); r.handler = std::move(h); r.name = std::move(name);
        insert(std::move(r)); return *this;
    }
    // Rule matching every node kind; loses against any exact-kind rule.
    Visitor& add_fallback(Handler h, std::string name = {}){
        Rule r; r.handler = std::move(h); r.name = std::move(name);
        insert(std::move(r)); return *this;
    }

    // Compose rule sets. Rules of each visitor are appended in their original
    // order after everything already registered, so they win ties.
    template <typename... Others>
    Visitor& extend(const Others&... others){
        (extend_one(others), ...);
        return *this;
    }

    const Rule* resolve(const node& n) const {
        if(auto it = by_kind_.find(n.kind); it != by_kind_.end()){
            for(auto& r : it->second) if(matches(n, r.constraints)) return &r;
        }
        for(auto& r : any_kind_) if(matches(n, r.constraints)) return &r;
        return nullptr;
    }

    // The handler is copied out of the registry, so it may add rules to the
    // visitor it receives. Such rules apply from the next invoke() on.
    Result invoke(const node_ptr& n, Args... args){
        const Rule* r = resolve(*n);
        if(!r) throw missing_rule_error(n->kind);
        if(trace_) std::fprintf(stderr, "[dbg][dispatch] %s -> %s\n", kind_name(n->kind), r->name.empty() ? "<anonymous>" : r->name.c_str());
        Handler handler = r->handler;
        return handler(*this, n, args...);
    }

    // Invoke every child of n in field order. Used by the generic fallback and
    // by handlers that only want to continue the traversal.
    static Result visit_children(Visitor& v, const node_ptr& n, Args... args){
        for(auto& f : n->fields){
            if(is_child(f.value)){
                if(auto& c = std::get<node_ptr>(f.value)) v.invoke(c, args...);
            } else if(is_children(f.value)){
                for(auto& c : std::get<children>(f.value).elems) v.invoke(c, args...);
            }
        }
        if constexpr (!std::is_void_v<Result>) return Result{};
    }

    size_t rule_count() const {
        size_t n = any_kind_.size();
        for(auto& [k, rules] : by_kind_) n += rules.size();
        return n;
    }

    void set_trace(bool on){ trace_ = on; }

private:
    std::unordered_map<NodeKind, std::vector<Rule>> by_kind_;
    std::vector<Rule> any_kind_;
    uint64_t next_seq_ = 0;
    bool trace_ = false;

    static bool before(const Rule& a, const Rule& b){
        if(a.priority != b.priority) return a.priority > b.priority;
        return a.seq > b.seq;
    }

    void insert(Rule r){
        r.seq = ++next_seq_;
        r.priority = (int)r.constraints.size();
        auto& bucket = r.kind ? by_kind_[*r.kind] : any_kind_;
        auto pos = std::lower_bound(bucket.begin(), bucket.end(), r, &Visitor::before);
        bucket.insert(pos, std::move(r));
    }

    // Copies first: other may be *this, and insert() grows the buckets.
    void extend_one(const Visitor& other){
        std::vector<Rule> rules;
        for(auto& r : other.any_kind_) if(!r.builtin) rules.push_back(r); // every visitor already has its own
        for(auto& [k, bucket] : other.by_kind_) for(auto& r : bucket) rules.push_back(r);
        std::sort(rules.begin(), rules.end(), [](const Rule& a, const Rule& b){ return a.seq < b.seq; });
        for(auto& r : rules) insert(std::move(r));
    }
};

} // namespace bolt
