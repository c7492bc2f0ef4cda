#include "test_env.hpp"

#include <cstdlib>

int set_test_env(const char* name, const char* value)
{
    if (!name || !*name) return -1;
#if defined(_WIN32)
    return ::_putenv_s(name, value ? value : "");
#else
    if (!value || !*value) {
        return ::unsetenv(name);
    }
    return ::setenv(name, value, 1);
#endif
}

scoped_env::scoped_env(const char* name, const char* value) : name_(name)
{
    if (const char* old = std::getenv(name)) previous_ = old;
    set_test_env(name, value);
}

scoped_env::~scoped_env()
{
    set_test_env(name_.c_str(), previous_ ? previous_->c_str() : nullptr);
}
