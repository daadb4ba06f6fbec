#include "bolt/codegen/collect.hpp"
#include <cstdio>
#include <iterator>

namespace bolt::codegen {

const char* collector_name(CollectorKind kind){
    switch(kind){
        case CollectorKind::Generic: return "generic";
        case CollectorKind::Command: return "command";
        case CollectorKind::RootCommand: return "root-command";
    }
    return "?";
}

void ChildrenCollector::add_static(node_iter first, node_iter last){
    for(auto it = first; it != last; ++it) children_.push_back(acc_.make_ref(*it));
}

void ChildrenCollector::add_dynamic(const std::vector<std::string>& fragments){
    children_.insert(children_.end(), fragments.begin(), fragments.end());
}

std::string ChildrenCollector::flush(){
    return acc_.children(children_);
}

void CommandCollector::add_static(node_iter first, node_iter last){
    auto count = std::distance(first, last);
    if(count > 1){
        acc_.statement(acc_.commands() + ".extend(" + acc_.make_ref_slice(first, last) + ")");
    } else if(count == 1){
        acc_.statement(acc_.commands() + ".append(" + acc_.make_ref(*first) + ")");
    }
}

void CommandCollector::add_dynamic(const std::vector<std::string>& fragments){
    for(auto& f : fragments) acc_.statement(acc_.commands() + ".append(" + f + ")");
}

std::string CommandCollector::flush(){
    // A block must not end up empty when every child compiled to nothing
    if(acc_.size() == start_index_) acc_.statement("pass");
    return acc_.commands();
}

std::string RootCommandCollector::flush(){
    CommandCollector::flush();
    auto commands = acc_.make_variable();
    acc_.reindent_from(start_index_);
    acc_.insert_line(start_index_, acc_.indentation() + "with " + acc_.runtime() + ".scope() as " + commands + ":");
    if(acc_.options().traceCodegen)
        std::fprintf(stderr, "[dbg][codegen] root scope %s wraps %zu lines\n", commands.c_str(), acc_.size() - start_index_ - 1);
    return acc_.helper(Helper::Children, {commands});
}

std::unique_ptr<ChildrenCollector> make_collector(CollectorKind kind, Accumulator& acc, size_t start_index){
    switch(kind){
        case CollectorKind::Command: return std::make_unique<CommandCollector>(acc, start_index);
        case CollectorKind::RootCommand: return std::make_unique<RootCommandCollector>(acc, start_index);
        case CollectorKind::Generic: break;
    }
    return std::make_unique<ChildrenCollector>(acc, start_index);
}

} // namespace bolt::codegen
