#pragma once

#include <mutex>

namespace healthopt {

// Serializes progress lines written to stderr by concurrent runs.
inline std::mutex& log_mutex() {
    static std::mutex mu;
    return mu;
}

}  // namespace healthopt
