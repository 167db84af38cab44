// Lexically scoped name tables. One template serves both the static
// (name -> Type) and the runtime (name -> Value) environments.
#pragma once
#include <algorithm>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "tlisp/types.hpp"

namespace tlisp {

template<typename T>
class Environment : public std::enable_shared_from_this<Environment<T>> {
public:
    using Ptr = std::shared_ptr<Environment>;
    using Bindings = std::unordered_map<std::string, T>;

    Environment() = default;
    explicit Environment(Ptr parent): parent_(std::move(parent)){}

    static Ptr make_root(){ return std::make_shared<Environment>(); }

    // New empty scope whose parent is this one. The parent is kept alive by the child.
    Ptr extend(){ return std::make_shared<Environment>(this->shared_from_this()); }

    // Nearest binding walking outward through the parent chain.
    const T* lookup(const std::string& name) const {
        for(const Environment* e = this; e; e = e->parent_.get()){
            auto it = e->vars_.find(name);
            if(it != e->vars_.end()) return &it->second;
        }
        return nullptr;
    }

    // Insert or overwrite in this scope only.
    void define(const std::string& name, T value){ vars_.insert_or_assign(name, std::move(value)); }

    bool contains_local(const std::string& name) const { return vars_.count(name) != 0; }

    const Bindings& bindings() const { return vars_; }
    void restore(Bindings snapshot){ vars_ = std::move(snapshot); }

    // Detached root holding every binding visible from here, inner shadows
    // winning. Later changes to this chain do not reach the copy.
    Ptr snapshot() const {
        auto copy = make_root();
        for(const Environment* e = this; e; e = e->parent_.get())
            for(auto& kv : e->vars_) copy->vars_.emplace(kv.first, kv.second);
        return copy;
    }

    const Ptr& parent() const { return parent_; }

    size_t depth() const {
        size_t d = 0;
        for(const Environment* e = parent_.get(); e; e = e->parent_.get()) ++d;
        return d;
    }

    // Every name reachable from this scope, sorted, inner shadows collapsed.
    std::vector<std::string> visible_names() const {
        std::unordered_set<std::string> seen;
        std::vector<std::string> out;
        for(const Environment* e = this; e; e = e->parent_.get())
            for(auto& kv : e->vars_) if(seen.insert(kv.first).second) out.push_back(kv.first);
        std::sort(out.begin(), out.end());
        return out;
    }

private:
    Ptr parent_;
    Bindings vars_;
};

using TypeEnv = Environment<Type>;
using TypeEnvPtr = std::shared_ptr<TypeEnv>;

} // namespace tlisp
