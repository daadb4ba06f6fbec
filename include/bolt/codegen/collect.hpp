#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "bolt/ast.hpp"
#include "bolt/codegen/accumulator.hpp"

namespace bolt::codegen {

// Which collector visit_multiple creates for a list-valued field.
enum class CollectorKind {
    Generic,     // children([...]) expression
    Command,     // append/extend into the ambient command buffer
    RootCommand, // Command, wrapped in its own runtime scope
};

const char* collector_name(CollectorKind kind);

using node_iter = std::vector<node_ptr>::const_iterator;

// Batches unchanged children and spliced fragments for one list-valued field.
// Created on the first child that changes; start_index is the buffer position
// where the field's code begins.
class ChildrenCollector {
public:
    ChildrenCollector(Accumulator& acc, size_t start_index) : acc_(acc), start_index_(start_index) {}
    virtual ~ChildrenCollector() = default;

    virtual void add_static(node_iter first, node_iter last);
    virtual void add_dynamic(const std::vector<std::string>& fragments);
    virtual std::string flush();

protected:
    Accumulator& acc_;
    size_t start_index_;
    std::vector<std::string> children_;
};

// Nested command body: static runs become one extend, single statics and
// dynamic fragments become appends.
class CommandCollector : public ChildrenCollector {
public:
    using ChildrenCollector::ChildrenCollector;
    void add_static(node_iter first, node_iter last) override;
    void add_dynamic(const std::vector<std::string>& fragments) override;
    // The commands live in the runtime buffer; returns its expression.
    std::string flush() override;
};

// Top-level program: everything emitted since start_index runs inside a fresh
// runtime scope whose buffer becomes the result.
class RootCommandCollector : public CommandCollector {
public:
    using CommandCollector::CommandCollector;
    std::string flush() override;
};

std::unique_ptr<ChildrenCollector> make_collector(CollectorKind kind, Accumulator& acc, size_t start_index);

} // namespace bolt::codegen
