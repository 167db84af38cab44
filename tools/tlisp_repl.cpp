#include <iostream>
#include <fstream>
#include <string>
#include <cctype>
#include "tlisp/session.hpp"

using namespace tlisp;

// Net '(' minus ')' outside strings and comments; lets a form span several lines.
static int paren_balance(const std::string& text){
    int depth=0; bool in_str=false, esc=false, in_comment=false;
    for(char c : text){
        if(in_comment){ if(c=='\n') in_comment=false; continue; }
        if(in_str){ if(esc) esc=false; else if(c=='\\') esc=true; else if(c=='"') in_str=false; continue; }
        if(c==';') in_comment=true;
        else if(c=='"') in_str=true;
        else if(c=='(') ++depth;
        else if(c==')') --depth;
    }
    return depth;
}

static bool is_blank(const std::string& s){
    for(char c : s){ if(c==';') return true; if(!std::isspace(static_cast<unsigned char>(c))) return false; }
    return true;
}

static int run_stream(Session& session, std::istream& in, bool interactive){
    int failures=0;
    std::string pending, line;
    if(interactive) std::cout << "tlisp> " << std::flush;
    while(std::getline(in, line)){
        if(pending.empty() && (line=="exit" || line=="quit")) break;
        pending += line; pending += '\n';
        if(is_blank(pending)){ pending.clear(); if(interactive) std::cout << "tlisp> " << std::flush; continue; }
        if(paren_balance(pending) > 0){ if(interactive) std::cout << "  ...> " << std::flush; continue; }
        auto r = session.run(pending);
        pending.clear();
        std::cout << Session::render(r) << "\n";
        if(!r.success) ++failures;
        if(interactive) std::cout << "tlisp> " << std::flush;
    }
    if(!pending.empty() && !is_blank(pending)){
        auto r = session.run(pending);
        std::cout << Session::render(r) << "\n";
        if(!r.success) ++failures;
    }
    return failures;
}

int main(int argc, char** argv){
    Session session(std::cout);
    if(argc>1){
        std::string path = argv[1];
        std::ifstream in(path);
        if(!in){ std::cerr << "failed to read file: " << path << "\n"; return 1; }
        int failures = run_stream(session, in, false);
        if(in.bad()){ std::cerr << "failed to read file: " << path << "\n"; return 1; }
        return failures ? 2 : 0;
    }
    std::cout << "tlisp - typed Lisp interpreter\nType 'exit' or 'quit' to leave.\n";
    run_stream(session, std::cin, true);
    return 0;
}
