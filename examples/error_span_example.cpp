// Parse a document with mistakes and print each diagnostic under its source line.
#include <iostream>
#include <string>
#include <string_view>
#include "toon/toon.hpp"

using namespace toon;

static std::string_view line_at(std::string_view src, int line){
    size_t start = 0;
    for(int l = 1; l < line; ++l){
        size_t nl = src.find('\n', start);
        if(nl == std::string_view::npos) return {};
        start = nl + 1;
    }
    size_t end = src.find_first_of("\r\n", start);
    return src.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
}

int main(int argc, char** argv){
    const char* src = R"TOON(service:
  name: billing
  port 8080
  replicas[3]: a,b
users[2]{id,name}:
  1,Ada
  2
tags[2|]: x|y
)TOON";
    std::string owned;
    if(argc > 1) owned = argv[1];
    std::string_view text = argc > 1 ? std::string_view(owned) : std::string_view(src);

    ParseResult r;
    if(!try_parse(text, r, options_from_env())){
        std::cerr << to_string(r.errors().front()) << "\n";
        return 2;
    }
    for(const auto& e : r.errors()){
        std::string_view ln = line_at(text, e.line);
        std::cout << e.code << " (" << error_category(e.code) << "): " << e.message << "\n";
        std::cout << "  " << e.line << " | " << ln << "\n";
        std::string marker(static_cast<size_t>(e.column > 0 ? e.column - 1 : 0), ' ');
        marker += std::string(e.length ? e.length : 1, '^');
        std::cout << "  " << std::string(std::to_string(e.line).size(), ' ') << " | " << marker << "\n";
        if(!e.hint.empty()) std::cout << "  hint: " << e.hint << "\n";
    }
    std::cout << "\n" << to_debug_string(r.document());
    return r.is_success() ? 0 : 1;
}
