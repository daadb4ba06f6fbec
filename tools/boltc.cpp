#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include "bolt/codegen.hpp"
#include "bolt/diagnostics.hpp"
#include "bolt/reader.hpp"

using namespace bolt;

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path);
    if(!ifs) return false;
    std::stringstream ss; ss << ifs.rdbuf(); out = ss.str();
    return true;
}

int main(int argc, char** argv){
    if(argc < 2){ std::cerr << "usage: boltc <tree-file> [--no-lines]\n"; return 1; }
    std::string file = argv[1];
    CodegenOptions options = detectOptions();
    for(int i = 2; i < argc; ++i){
        if(std::strcmp(argv[i], "--no-lines") == 0) options.lineTable = false;
        else { std::cerr << "unknown option: " << argv[i] << "\n"; return 1; }
    }

    std::string src;
    if(!read_file(file, src)){ std::cerr << "failed to read file: " << file << "\n"; return 1; }

    node_ptr root;
    try {
        root = parse(src, options.lineTable);
    } catch(const parse_error& e){
        std::cerr << "parse error: " << e.what() << "\n";
        return 2;
    }

    Codegen codegen(options);
    CodegenResult result;
    try {
        result = codegen(root);
    } catch(const codegen_error& e){
        maybe_print_json(e);
        std::cerr << e.what() << "\n";
        if(!e.hint.empty()) std::cerr << "hint: " << e.hint << "\n";
        return 3;
    }

    if(!result.source){
        std::cout << "# static\n";
        return 0;
    }
    std::cout << *result.source << "\n";
    std::cout << "# output: " << *result.output << "\n";
    for(size_t i = 0; i < result.refs.size(); ++i)
        std::cout << "# ref[" << i << "] = " << to_string(result.refs[i]) << "\n";
    return 0;
}
