#pragma once
#include <string>
#include <vector>
#include "tlisp/ast.hpp"
#include "tlisp/types.hpp"

namespace tlisp::pegtl_front {

// Operand stacks filled by the actions. Every list form records a mark on
// entry and folds everything above it into one node when its rule matches.
struct build_state {
    struct mark { size_t exprs; size_t types; size_t names; };

    std::vector<ExprPtr> exprs;
    std::vector<Type> types;
    std::vector<std::string> names;
    std::vector<mark> marks;
    std::vector<size_t> type_marks; // fn(...) -> T under construction
    std::vector<SourcePos> opens;   // position of each unfinished '('
    std::string str;                // string literal being unescaped
    bool trace{false};

    void push_mark(){ marks.push_back(mark{exprs.size(), types.size(), names.size()}); }
    mark pop_mark(){ mark m = marks.back(); marks.pop_back(); return m; }
    SourcePos pop_open(){ SourcePos p = opens.back(); opens.pop_back(); return p; }

    std::vector<ExprPtr> take_exprs(size_t from){
        std::vector<ExprPtr> out(exprs.begin() + static_cast<std::ptrdiff_t>(from), exprs.end());
        exprs.resize(from);
        return out;
    }
    std::vector<Type> take_types(size_t from){
        std::vector<Type> out(types.begin() + static_cast<std::ptrdiff_t>(from), types.end());
        types.resize(from);
        return out;
    }
    std::vector<std::string> take_names(size_t from){
        std::vector<std::string> out(names.begin() + static_cast<std::ptrdiff_t>(from), names.end());
        names.resize(from);
        return out;
    }
};

} // namespace tlisp::pegtl_front
