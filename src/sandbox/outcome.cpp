#include "sandbox/outcome.hpp"
#include <fmt/core.h>

namespace runner {
using namespace std;

const char STDOUT_TRUNCATED_SENTINEL[] = "\n[Output truncated - exceeded limit]";
const char STDERR_TRUNCATED_SENTINEL[] = "\n[Error output truncated - exceeded limit]";

string execution_outcome::effective_stderr() const {
    if (launch_error) return "Execution error: " + *launch_error;
    return stderr_text;
}

string timeout_message(const string &limit_seconds) {
    return fmt::format("Error: Execution timeout ({} seconds exceeded)", limit_seconds);
}

}  // namespace runner
