// Fixed operator table installed in both root environments.
#pragma once
#include <iosfwd>
#include "tlisp/types.hpp"
#include "tlisp/value.hpp"

namespace tlisp {

// Binds the static signature of every built-in.
void install_builtin_types(TypeEnv& env);

// Binds every built-in operation; print/println write to `out`, which must
// outlive the environment.
void install_builtins(ValueEnv& env, std::ostream& out);

} // namespace tlisp
