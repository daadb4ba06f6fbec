#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include "bolt/dispatch.hpp"
#include "bolt/reader.hpp"

using namespace bolt;

namespace {

struct Collected {
    std::vector<std::string> kinds;
    std::vector<double> numbers;
    int sevens = 0;
};

using Walker = Visitor<void, Collected&>;
using Namer = Visitor<std::string>;

double number_of(const node& n){
    auto* v = leaf(n, "value");
    if(auto* i = std::get_if<int64_t>(v)) return (double)*i;
    return std::get<double>(*v);
}

const char* kParticle =
    "(command :identifier \"particle:particle:pos\" :arguments ["
    "  (particle :name (resource-location :path \"dust\")"
    "            :parameters (dust-particle-parameters :red (number :value 1.0) :green (number :value 0.5)"
    "                                                  :blue (number :value 7) :size (number :value 1.0)))"
    "  (vector3 :x (coordinate :value 7) :y (coordinate :value 7) :z (coordinate :value 7))])";

} // namespace

static void test_rule_specificity(){
    auto named = [](std::string name){ return [name](Namer&, const node_ptr&){ return name; }; };
    auto cmd_if = parse("(command :identifier \"if:condition:body\")");
    auto cmd_say = parse("(command :identifier \"say\")");

    Namer constrained_last(Fallback::None);
    constrained_last.add_rule(NodeKind::Command, named("any"), "any");
    constrained_last.add_rule(NodeKind::Command, {Constraint{"identifier", leaf_value{std::string("if:condition:body")}}}, named("if"), "if");
    assert(constrained_last.invoke(cmd_if) == "if");
    assert(constrained_last.invoke(cmd_say) == "any");

    // Specificity does not depend on registration order
    Namer constrained_first(Fallback::None);
    constrained_first.add_rule(NodeKind::Command, {Constraint{"identifier", leaf_value{std::string("if:condition:body")}}}, named("if"), "if");
    constrained_first.add_rule(NodeKind::Command, named("any"), "any");
    assert(constrained_first.invoke(cmd_if) == "if");
    assert(constrained_first.invoke(cmd_say) == "any");
    assert(constrained_first.resolve(*cmd_if)->name == "if");

    // Equal specificity: later registration wins. Exact kind beats wildcard.
    Namer ties(Fallback::None);
    ties.add_rule(NodeKind::Command, named("first"));
    ties.add_rule(NodeKind::Command, named("second"));
    ties.add_fallback(named("wildcard"));
    assert(ties.invoke(cmd_say) == "second");
    assert(ties.invoke(parse("(word :value \"x\")")) == "wildcard");
}

static void test_extend(){
    auto tree = parse(kParticle);

    Walker base;
    Walker numbers(Fallback::None);
    numbers.add_rule(NodeKind::Number, [](Walker&, const node_ptr& n, Collected& c){ c.numbers.push_back(number_of(*n)); }, "number");

    Walker foo(Fallback::None);
    foo.add_fallback([](Walker& v, const node_ptr& n, Collected& c){
        c.kinds.push_back(kind_name(n->kind));
        Walker::visit_children(v, n, c);
    }, "collect");
    foo.add_rule(NodeKind::Number, {Constraint{"value", leaf_value{int64_t{7}}}}, [](Walker&, const node_ptr&, Collected& c){ ++c.sevens; }, "seven");

    base.extend(numbers, foo);
    assert(base.rule_count() == 4);

    Collected c;
    base.invoke(tree, c);
    std::vector<std::string> kinds{"command", "particle", "resource-location", "dust-particle-parameters",
                                   "vector3", "coordinate", "coordinate", "coordinate"};
    assert(c.kinds == kinds);
    assert((c.numbers == std::vector<double>{1.0, 0.5, 1.0}));
    assert(c.sevens == 1);

    // The extended visitors keep their own rules
    Collected only_numbers;
    bool missing = false;
    try { numbers.invoke(tree, only_numbers); } catch(const missing_rule_error& e){ missing = e.kind == NodeKind::Command; }
    assert(missing);
}

static void test_extend_with_itself(){
    Walker walker;
    walker.add_rule(NodeKind::Number, [](Walker&, const node_ptr& n, Collected& c){ c.numbers.push_back(number_of(*n)); }, "number");
    walker.add_rule(NodeKind::Coordinate, [](Walker&, const node_ptr&, Collected& c){ c.kinds.push_back("coordinate"); }, "coordinate");
    walker.extend(walker);
    // builtin fallback is not duplicated, the two rules are
    assert(walker.rule_count() == 5);

    Collected c;
    walker.invoke(parse(kParticle), c);
    assert((c.numbers == std::vector<double>{1.0, 0.5, 7.0, 1.0}));
    assert(c.kinds.size() == 3);
}

static void test_rules_added_while_dispatching(){
    Walker walker;
    int added = 0;
    walker.add_rule(NodeKind::Coordinate, [&added](Walker& v, const node_ptr&, Collected& c){
        c.kinds.push_back("coordinate");
        // Grows the bucket holding the running rule
        for(int i = 0; i < 64; ++i)
            v.add_rule(NodeKind::Coordinate, {Constraint{"value", leaf_value{std::string("unused")}}},
                       [](Walker&, const node_ptr&, Collected& c){ ++c.sevens; });
        ++added;
    }, "coordinate");
    Collected c;
    walker.invoke(parse(kParticle), c);
    assert(added == 3);
    assert(c.kinds.size() == 3);
    assert(walker.rule_count() == 2 + 3 * 64);
    assert(c.sevens == 0);
    walker.invoke(parse("(coordinate :value \"unused\")"), c);
    assert(c.sevens == 1);
    assert(c.kinds.size() == 3);
}

static void test_generic_fallback(){
    auto tree = parse(kParticle);
    Walker counter;
    int coordinates = 0;
    counter.add_rule(NodeKind::Coordinate, [&coordinates](Walker&, const node_ptr&, Collected&){ ++coordinates; });
    Collected c;
    counter.invoke(tree, c);
    assert(coordinates == 3);
    assert(c.kinds.empty());
}

static void test_results_flow_up(){
    using Summer = Visitor<double>;
    Summer sum;
    sum.add_rule(NodeKind::Number, [](Summer&, const node_ptr& n){ return number_of(*n); });
    sum.add_rule(NodeKind::DustParticleParameters, [](Summer& v, const node_ptr& n){
        double total = 0;
        for(auto& f : n->fields) total += v.invoke(std::get<node_ptr>(f.value));
        return total;
    });
    sum.add_rule(NodeKind::Command, [](Summer& v, const node_ptr& n){
        auto particle = children_of(*n, "arguments").front();
        return v.invoke(child(*particle, "parameters"));
    });
    assert(sum.invoke(parse(kParticle)) == 9.5);
    // Builtin fallback returns a default result
    assert(sum.invoke(parse("(word :value \"x\")")) == 0.0);
}

static void test_missing_rule(){
    Namer bare(Fallback::None);
    assert(bare.rule_count() == 0);
    bool thrown = false;
    try { (void)bare.invoke(parse("(json :value \"{}\")")); }
    catch(const missing_rule_error& e){
        thrown = true;
        assert(e.kind == NodeKind::Json);
        assert(std::string(e.what()).find("'json'") != std::string::npos);
    }
    assert(thrown);
}

void run_dispatch_tests(){
    std::cout << "[dispatch] rule specificity...\n"; test_rule_specificity();
    std::cout << "[dispatch] extend...\n"; test_extend();
    std::cout << "[dispatch] extend with itself...\n"; test_extend_with_itself();
    std::cout << "[dispatch] rules added while dispatching...\n"; test_rules_added_while_dispatching();
    std::cout << "[dispatch] generic fallback...\n"; test_generic_fallback();
    std::cout << "[dispatch] results...\n"; test_results_flow_up();
    std::cout << "[dispatch] missing rule...\n"; test_missing_rule();
    std::cout << "Dispatch tests passed\n";
}
