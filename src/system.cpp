#include "histax/system.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace histax::system {

bool env_flag(const char *name) {
    const char *env = std::getenv(name);
    if (env == nullptr)
        return false;

    std::string value(env);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

bool trace_requested() {
    // Check environment variable once (thread-safe static init per C++11)
    static const bool env_trace = env_flag("HISTAX_TRACE");
    return env_trace;
}

} // namespace histax::system
