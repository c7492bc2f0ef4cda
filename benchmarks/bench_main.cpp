#include "toon/toon.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_parse; size_t bytes; size_t tokens; size_t errors; };

static RunResult bench_case(const std::string &doc, int reps){
    RunResult out{0.0, doc.size(), 0, 0};
    auto opts = toon::options_from_env(toon::ParserOptions::unlimited());
    auto t0 = Clock::now();
    for(int i = 0; i < reps; ++i){
        auto r = toon::parse(doc, opts);
        out.tokens = r.tokens().size();
        out.errors = r.errors().size();
    }
    auto t1 = Clock::now();
    out.ms_parse = std::chrono::duration<double, std::milli>(t1 - t0).count() / reps;
    return out;
}

static std::string table_doc(int rows){
    std::string s = "users[" + std::to_string(rows) + "]{id,name,email,active}:\n";
    for(int i = 0; i < rows; ++i)
        s += "  " + std::to_string(i) + ",User " + std::to_string(i) + ",user" + std::to_string(i) + "@example.com,true\n";
    return s;
}

static std::string nested_doc(int sections){
    std::string s;
    for(int i = 0; i < sections; ++i){
        s += "section" + std::to_string(i) + ":\n";
        s += "  title: Section number " + std::to_string(i) + "\n";
        s += "  tags[3|]: alpha|beta|gamma\n";
        s += "  limits:\n    min: -1.5\n    max: 2.5e3\n";
        s += "  items[2]:\n    - name: first\n      ok: true\n    - name: \"second, quoted\"\n      ok: null\n";
    }
    return s;
}

static std::string broken_doc(int lines){
    std::string s;
    for(int i = 0; i < lines; ++i)
        s += (i % 3 == 0) ? "key" + std::to_string(i) + " missing colon\n"
                          : "key" + std::to_string(i) + ": value " + std::to_string(i) + "\n";
    return s;
}

int main(){
    struct Case { const char* name; std::string doc; int reps; };
    std::vector<Case> cases;
    cases.push_back({"table_10k", table_doc(10000), 20});
    cases.push_back({"nested_2k", nested_doc(2000), 20});
    cases.push_back({"recovery_10k", broken_doc(10000), 20});

    std::cout << "name,ms_parse,bytes,tokens,errors\n";
    for(const auto &c : cases){
        auto r = bench_case(c.doc, c.reps);
        std::cout << c.name << "," << r.ms_parse << "," << r.bytes << "," << r.tokens << "," << r.errors << "\n";
    }
    return 0;
}
