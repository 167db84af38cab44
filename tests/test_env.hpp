#pragma once

// Test-only environment helpers for the TLISP_* switches read by detect_options().
#include <string>

// Sets NAME to VALUE, or unsets it when VALUE is null or empty.
int set_test_env(const char* name, const char* value);

// Restores the previous value of one variable on scope exit.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    std::string name_;
    std::string old_;
    bool had_old_;
};
