#include "Tool/FatalError.hpp"

#include <cstdlib>
#include <iostream>

namespace lfc {

void fatal(const char* where, const char* what) noexcept {
    std::cerr << "[FATAL] " << where << ": " << what << std::endl;
    std::abort();
}

} // namespace lfc
