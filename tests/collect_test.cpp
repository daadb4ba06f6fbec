#include <cassert>
#include <iostream>
#include <string>
#include "bolt/codegen/collect.hpp"
#include "bolt/reader.hpp"

using namespace bolt;
using namespace bolt::codegen;

static node_ptr three_commands(){
    return parse("(root :commands [ (command :identifier \"a\") (command :identifier \"b\") (command :identifier \"c\") ])", false);
}

static void test_generic_collector(){
    auto root = three_commands();
    auto& xs = children_of(*root, "commands");
    Accumulator acc;
    auto c = make_collector(CollectorKind::Generic, acc, 0);
    c->add_static(xs.begin(), xs.begin() + 2);
    c->add_dynamic({"f"});
    c->add_static(xs.begin() + 2, xs.end());
    assert(c->flush() == "_bolt_helper_children([_bolt_refs[0], _bolt_refs[1], f, _bolt_refs[2]])");
    assert(acc.size() == 0);
    assert(acc.refs()[1] == xs[1]);
}

static void test_command_collector(){
    auto root = three_commands();
    auto& xs = children_of(*root, "commands");
    Accumulator acc;
    auto c = make_collector(CollectorKind::Command, acc, 0);
    c->add_static(xs.begin(), xs.begin() + 2);
    c->add_dynamic({"f", "g"});
    c->add_static(xs.begin() + 2, xs.end());
    c->add_static(xs.end(), xs.end());
    assert(c->flush() == "_bolt_runtime.commands");
    assert(acc.size() == 4);
    assert(acc.lines()[0] == "_bolt_runtime.commands.extend(_bolt_refs[0:2])");
    assert(acc.lines()[1] == "_bolt_runtime.commands.append(f)");
    assert(acc.lines()[2] == "_bolt_runtime.commands.append(g)");
    assert(acc.lines()[3] == "_bolt_runtime.commands.append(_bolt_refs[2])");

    // A block that ends up empty still needs a statement
    Accumulator empty;
    auto e = make_collector(CollectorKind::Command, empty, 0);
    e->add_dynamic({});
    (void)e->flush();
    assert(empty.size() == 1 && empty.lines()[0] == "pass");
}

static void test_root_collector(){
    auto root = three_commands();
    auto& xs = children_of(*root, "commands");
    Accumulator acc;
    acc.statement("before = 1");
    auto c = make_collector(CollectorKind::RootCommand, acc, 1);
    acc.statement("x = 1");
    c->add_static(xs.begin(), xs.begin() + 1);
    auto result = c->flush();
    assert(result == "_bolt_helper_children(_bolt_var0)");
    assert(acc.size() == 4);
    assert(acc.lines()[0] == "before = 1");
    assert(acc.lines()[1] == "with _bolt_runtime.scope() as _bolt_var0:");
    assert(acc.lines()[2] == "    x = 1");
    assert(acc.lines()[3] == "    _bolt_runtime.commands.append(_bolt_refs[0])");
    assert(std::string(collector_name(CollectorKind::RootCommand)) == "root-command");
}

void run_collect_tests(){
    std::cout << "[collect] generic...\n"; test_generic_collector();
    std::cout << "[collect] command...\n"; test_command_collector();
    std::cout << "[collect] root command...\n"; test_root_collector();
    std::cout << "Collector tests passed\n";
}
