#include "bolt/codegen/visit.hpp"
#include "bolt/diagnostics.hpp"
#include <cstdio>
#include <memory>
#include <utility>

namespace bolt::codegen {

std::optional<std::string> visit_single(CodegenVisitor& v, const node_ptr& n, Accumulator& acc, bool required){
    if(!n){
        if(required) throw make_error(ErrorKind::ArityViolation, nullptr, "missing required child", "this position cannot be empty");
        return std::nullopt;
    }
    auto result = v.invoke(n, acc);
    if(!result){
        // A static node in a required position stands for itself
        if(required) return acc.make_ref(n);
        return std::nullopt;
    }
    if(result->size() != 1)
        throw make_error(ErrorKind::ArityViolation, n.get(),
                         std::string("expected single result for ") + kind_name(n->kind) + ", got " + std::to_string(result->size()),
                         "expression positions take exactly one fragment");
    return std::move(result->front());
}

std::optional<std::string> visit_multiple(CodegenVisitor& v, const std::vector<node_ptr>& children, Accumulator& acc, CollectorKind kind){
    size_t current = 0;
    size_t index = acc.size();
    std::unique_ptr<ChildrenCollector> collector;

    for(size_t i = 0; i < children.size(); ++i){
        auto result = v.invoke(children[i], acc);
        if(!result) continue;
        if(!collector){
            collector = make_collector(kind, acc, index);
            if(acc.options().traceCodegen)
                std::fprintf(stderr, "[dbg][codegen] %s collector at line %zu (child %zu of %zu)\n", collector_name(kind), index, i, children.size());
        }

        // Static run goes in front of the code that computes this child
        auto lines = acc.take_from(index);
        collector->add_static(children.begin() + (std::ptrdiff_t)current, children.begin() + (std::ptrdiff_t)i);
        acc.append(std::move(lines));
        collector->add_dynamic(*result);

        current = i + 1;
        index = acc.size();
    }

    if(!collector) return std::nullopt;
    collector->add_static(children.begin() + (std::ptrdiff_t)current, children.end());
    return collector->flush();
}

std::optional<std::string> visit_generic(CodegenVisitor& v, const node_ptr& n, Accumulator& acc, CollectorKind kind){
    std::vector<std::pair<std::string, std::string>> to_replace;

    for(auto& f : n->fields){
        std::optional<std::string> result;
        if(is_children(f.value))
            result = visit_multiple(v, std::get<children>(f.value).elems, acc, kind);
        else if(is_child(f.value))
            result = visit_single(v, std::get<node_ptr>(f.value), acc);
        if(result) to_replace.emplace_back(f.name, std::move(*result));
    }

    if(to_replace.empty()) return std::nullopt;
    return acc.replace(acc.make_ref(n), to_replace);
}

void visit_body(CodegenVisitor& v, const node_ptr& body, Accumulator& acc, CollectorKind kind){
    if(!body) throw make_error(ErrorKind::ArityViolation, nullptr, "missing command body");
    auto result = visit_multiple(v, children_of(*body, "commands"), acc, kind);
    if(!result) acc.statement(acc.commands() + ".extend(" + acc.make_ref(body) + ".commands)");
}

} // namespace bolt::codegen
