#include "console.hpp"
#include <iostream>

namespace v2n {

ScopedStdoutRedirect::ScopedStdoutRedirect(std::ostream& target) {
    std::cout.flush();
    saved_ = std::cout.rdbuf(target.rdbuf());
}

ScopedStdoutRedirect::~ScopedStdoutRedirect() {
    std::cout.flush();
    std::cout.rdbuf(saved_);
}

} // namespace v2n
