#include "tlisp/types.hpp"

namespace tlisp
{

    bool operator==(const Type &a, const Type &b)
    {
        if (a.kind != b.kind)
            return false;
        switch (a.kind)
        {
        case Type::Kind::Base:
            return a.base == b.base;
        case Type::Kind::Inferred:
            return true;
        case Type::Kind::Function:
            if (a.params.size() != b.params.size())
                return false;
            for (size_t i = 0; i < a.params.size(); ++i)
                if (a.params[i] != b.params[i])
                    return false;
            return *a.ret == *b.ret;
        }
        return false;
    }

    static const char *base_name(BaseType b)
    {
        switch (b)
        {
        case BaseType::I32:
            return "i32";
        case BaseType::I64:
            return "i64";
        case BaseType::F64:
            return "f64";
        case BaseType::Bool:
            return "bool";
        case BaseType::String:
            return "String";
        }
        return "?";
    }

    std::string to_string(const Type &t)
    {
        switch (t.kind)
        {
        case Type::Kind::Base:
            return base_name(t.base);
        case Type::Kind::Inferred:
            return "_";
        case Type::Kind::Function:
        {
            std::string s = "fn(";
            for (size_t i = 0; i < t.params.size(); ++i)
            {
                if (i)
                    s += ", ";
                s += to_string(t.params[i]);
            }
            s += ") -> ";
            s += to_string(*t.ret);
            return s;
        }
        }
        return "<bad-type>";
    }

    std::optional<Type> type_from_name(std::string_view name)
    {
        if (name == "i32")
            return i32_type();
        if (name == "i64")
            return i64_type();
        if (name == "f64")
            return f64_type();
        if (name == "bool")
            return bool_type();
        if (name == "String")
            return string_type();
        if (name == "_")
            return Type::inferred();
        return std::nullopt;
    }

} // namespace tlisp
