#include "toon/diagnostics_json.hpp"
#include <sstream>
#include <cstdlib>
#include <cstdio>

namespace toon {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string diagnostics_to_json(const ParseResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.is_success()?"true":"false")<<",\"errors\":[";
    const auto& errs = r.errors();
    for(size_t i=0;i<errs.size(); ++i){
        const auto &e=errs[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(e.code)
            <<",\"message\":"<<json_escape(e.message)
            <<",\"hint\":"<<json_escape(e.hint)
            <<",\"line\":"<<e.line
            <<",\"col\":"<<e.column
            <<",\"position\":"<<e.position
            <<",\"length\":"<<e.length
            <<"}";
    }
    os<<"],\"tokens\":"<<r.tokens().size()<<"}";
    return os.str();
}

static bool env_enabled(const char* name){
    const char* env = std::getenv(name);
    return env && env[0]=='1';
}

void maybe_print_json(const ParseResult& r){
    if(env_enabled("TOON_DIAG_JSON")){
        auto js=diagnostics_to_json(r);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

void maybe_trace_tokens(const token_list& tokens){
    if(!env_enabled("TOON_TRACE_TOKENS")) return;
    for(const auto& t: tokens) std::fprintf(stderr, "%s\n", to_string(t).c_str());
}

} // namespace toon
