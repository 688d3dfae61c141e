#include "sandbox/limits.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"

namespace runner {
using namespace std;

void check_source_size(const string &source, const resource_limits &limits) {
    if (source.size() > limits.max_source_bytes)
        throw source_too_large(source.size(), limits.max_source_bytes);
}

string format_wall_limit(const resource_limits &limits) {
    return fmt::format("{:g}", limits.max_wall_time_ms / 1000.0);
}

int64_t cpu_limit_seconds(const resource_limits &limits) {
    return (limits.max_wall_time_ms + 999) / 1000 + 1;
}

}  // namespace runner
