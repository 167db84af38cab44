// POSIX / Windows shim for setting the environment from tests.
#include "test_env.hpp"
#include <cstdlib>

int set_test_env(const char* name, const char* value)
{
    if (!name) return -1;
#if defined(_WIN32)
    std::string assignment = std::string(name) + "=" + (value ? value : "");
    return _putenv(assignment.c_str());
#else
    if (!value || !*value) {
        // Unset when empty
        return ::unsetenv(name);
    }
    return ::setenv(name, value, 1);
#endif
}

ScopedEnv::ScopedEnv(const char* name, const char* value): name_(name), had_old_(false)
{
    if (const char* old = std::getenv(name)) { old_ = old; had_old_ = true; }
    set_test_env(name, value);
}

ScopedEnv::~ScopedEnv()
{
    set_test_env(name_.c_str(), had_old_ ? old_.c_str() : nullptr);
}
