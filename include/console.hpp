#pragma once

#include <ostream>
#include <streambuf>

namespace v2n {

// Sends everything written to std::cout to another stream for the lifetime of
// the object, so a program can keep stdout for its machine-readable result.
class ScopedStdoutRedirect {
public:
    explicit ScopedStdoutRedirect(std::ostream& target);
    ~ScopedStdoutRedirect();

    ScopedStdoutRedirect(const ScopedStdoutRedirect&) = delete;
    ScopedStdoutRedirect& operator=(const ScopedStdoutRedirect&) = delete;

private:
    std::streambuf* saved_;
};

} // namespace v2n
