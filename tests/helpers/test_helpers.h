#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <string>
#include <cstdlib>

namespace test_helpers {

// Set environment variable (RAII wrapper)
class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::string& value)
        : name_(name) {
        const char* old = getenv(name.c_str());
        if (old) {
            old_value_ = old;
            had_value_ = true;
        }
        setenv(name.c_str(), value.c_str(), 1);
    }

    ~ScopedEnv() {
        if (had_value_) {
            setenv(name_.c_str(), old_value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::string old_value_;
    bool had_value_ = false;
};

// Unset environment variable for the scope, restoring it afterwards
class ScopedUnsetEnv {
public:
    explicit ScopedUnsetEnv(const std::string& name) : name_(name) {
        const char* old = getenv(name.c_str());
        if (old) {
            old_value_ = old;
            had_value_ = true;
        }
        unsetenv(name.c_str());
    }

    ~ScopedUnsetEnv() {
        if (had_value_) {
            setenv(name_.c_str(), old_value_.c_str(), 1);
        }
    }

private:
    std::string name_;
    std::string old_value_;
    bool had_value_ = false;
};

} // namespace test_helpers

#endif // TEST_HELPERS_H
