#include <iostream>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include "toon/toon.hpp"
#include "toon/diagnostics_json.hpp"

using namespace toon;

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str();
    return true;
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: toon_check <toon-file> [--json] [--tree] [--tokens]\n"; return 1; }
    bool json=false, tree=false, tokens=false;
    for(int i=2;i<argc;++i){
        std::string a = argv[i];
        if(a=="--json") json=true;
        else if(a=="--tree") tree=true;
        else if(a=="--tokens") tokens=true;
        else { std::cerr << "unknown option: " << a << "\n"; return 1; }
    }
    std::string src;
    if(!read_file(argv[1], src)){ std::cerr << "failed to read file: " << argv[1] << "\n"; return 1; }

    ParserOptions opts;
    try { opts = options_from_env(); opts.validate(); }
    catch(const std::invalid_argument& e){ std::cerr << e.what() << "\n"; return 1; }

    ParseResult r;
    if(!try_parse(src, r, opts)){ std::cerr << to_string(r.errors().front()) << "\n"; return 3; }

    if(tokens) for(const auto& t : r.tokens()) std::cout << to_string(t) << "\n";
    if(json) std::cout << diagnostics_to_json(r) << "\n";
    else {
        for(const auto& e : r.errors()){
            std::cerr << argv[1] << ":" << e.line << ":" << e.column << ": " << to_string(e) << "\n";
            if(!e.hint.empty()) std::cerr << "  hint: " << e.hint << "\n";
        }
    }
    if(tree) std::cout << to_debug_string(r.document());
    return r.is_success() ? 0 : 2;
}
