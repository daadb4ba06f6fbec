#include <cassert>
#include <iostream>
#include <string>
#include "codegen_fixture.hpp"

using namespace bolt;
using namespace bolt::codegen;

static void test_error_codes(){
    assert(std::string(error_code(ErrorKind::ArityViolation)) == "E2001");
    assert(std::string(error_code(ErrorKind::MissingRule)) == "E2002");
    assert(std::string(error_code(ErrorKind::MalformedImport)) == "E2003");
    assert(std::string(error_code(ErrorKind::UnknownArgumentType)) == "E2004");

    auto n = parse("\n(word :value \"x\")");
    auto e = make_error(ErrorKind::ArityViolation, n.get(), "bad arity", "fix it");
    assert(e.code == "E2001");
    assert(e.line == 2 && e.col == 1);
    assert(std::string(e.what()) == "E2001: bad arity (line 2)");
    auto unknown = make_error(ErrorKind::MalformedImport, nullptr, "no location");
    assert(unknown.line == -1 && std::string(unknown.what()) == "E2003: no location");
}

static void test_compile_errors(){
    // Required operand missing
    assert(compile_error_code("(root :commands [(command :identifier \"if:condition:body\")])") == "E2001");
    // Body missing
    assert(compile_error_code("(root :commands [(command :identifier \"while:condition:body\" :arguments [(identifier :value \"x\")])])") == "E2001");
    // Unknown argument parser
    assert(compile_error_code("(root :commands [(command :identifier \"give:targets:item\" :arguments ["
                              "(argument-interpolation :parser \"demo:unknown\" :value (identifier :value \"i\"))])])") == "E2004");
    // Registered parsers compile
    assert(compile_error_code("(root :commands [(command :identifier \"give:targets:item\" :arguments ["
                              "(argument-interpolation :parser \"minecraft:item_stack\" :value (identifier :value \"i\"))])])").empty());
}

static void test_driver_errors(){
    // A root rule producing two fragments
    CodegenVisitor split(Fallback::None);
    split.add_rule(NodeKind::Root, [](CodegenVisitor&, const node_ptr&, Accumulator&) -> CompileResult {
        return Fragments{"a", "b"};
    });
    Codegen two(CodegenOptions{});
    two.extend(split);
    std::string code;
    try { (void)two(parse("(root :commands [])")); } catch(const codegen_error& e){ code = e.code; }
    assert(code == "E2001");

    // A rule delegating to a rule set that cannot handle the node
    CodegenVisitor delegate(Fallback::None);
    delegate.add_rule(NodeKind::Json, [](CodegenVisitor&, const node_ptr& n, Accumulator& acc) -> CompileResult {
        CodegenVisitor bare(Fallback::None);
        return bare.invoke(n, acc);
    });
    Codegen missing(CodegenOptions{});
    missing.extend(delegate);
    code.clear();
    std::string message;
    try { (void)missing(parse("(root :commands [(command :identifier \"data\" :arguments [(json :value \"{}\")])])")); }
    catch(const codegen_error& e){ code = e.code; message = e.what(); }
    assert(code == "E2002");
    assert(contains(message, "'json'"));
}

static void test_json(){
    assert(json_escape("a\"b\\c\n") == "\"a\\\"b\\\\c\\n\"");
    assert(json_escape(std::string("\x01\t")) == "\"\\u0001\\t\"");
    auto e = make_error(ErrorKind::MalformedImport, parse("(word :value \"x\")").get(), "from-import without any name", "name one");
    auto js = diagnostics_to_json(e);
    assert(contains(js, "\"success\":false"));
    assert(contains(js, "\"code\":\"E2003\""));
    assert(contains(js, "\"message\":\"E2003: from-import without any name (line 1)\""));
    assert(contains(js, "\"hint\":\"name one\""));
    assert(contains(js, "\"line\":1,\"col\":1"));
}

void run_diagnostics_tests(){
    std::cout << "[diagnostics] error codes...\n"; test_error_codes();
    std::cout << "[diagnostics] compile errors...\n"; test_compile_errors();
    std::cout << "[diagnostics] driver errors...\n"; test_driver_errors();
    std::cout << "[diagnostics] json...\n"; test_json();
    std::cout << "Diagnostics tests passed\n";
}
