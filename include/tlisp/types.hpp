// Static type vocabulary shared by the parser, type checker and session.
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tlisp
{

    enum class BaseType
    {
        I32,
        I64,
        F64,
        Bool,
        String
    };

    // Closed union over the base types, function types and the inferred
    // marker `_`. Equality is structural.
    struct Type
    {
        enum class Kind
        {
            Base,
            Function,
            Inferred
        } kind{Kind::Inferred};
        BaseType base{};                 // Base
        std::vector<Type> params;        // Function
        std::shared_ptr<const Type> ret; // Function

        static Type make_base(BaseType b)
        {
            Type t;
            t.kind = Kind::Base;
            t.base = b;
            return t;
        }
        static Type inferred() { return Type{}; }
        static Type function(std::vector<Type> params, Type ret)
        {
            Type t;
            t.kind = Kind::Function;
            t.params = std::move(params);
            t.ret = std::make_shared<const Type>(std::move(ret));
            return t;
        }

        bool is_inferred() const { return kind == Kind::Inferred; }
        bool is_function() const { return kind == Kind::Function; }
        bool is_base(BaseType b) const { return kind == Kind::Base && base == b; }
        const Type &return_type() const { return *ret; }
    };

    inline Type i32_type() { return Type::make_base(BaseType::I32); }
    inline Type i64_type() { return Type::make_base(BaseType::I64); }
    inline Type f64_type() { return Type::make_base(BaseType::F64); }
    inline Type bool_type() { return Type::make_base(BaseType::Bool); }
    inline Type string_type() { return Type::make_base(BaseType::String); }

    bool operator==(const Type &a, const Type &b);
    inline bool operator!=(const Type &a, const Type &b) { return !(a == b); }

    // Display form: i32, i64, f64, bool, String, _, fn(i32, i64) -> bool
    std::string to_string(const Type &t);

    // Base type names and `_`; function types are only produced by the parser.
    std::optional<Type> type_from_name(std::string_view name);

} // namespace tlisp
