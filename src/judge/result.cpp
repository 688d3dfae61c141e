#include "judge/result.hpp"
#include <algorithm>

namespace runner {
using namespace std;

run_result aggregate(const execution_outcome &outcome, vector<test_verdict> verdicts, int64_t execution_time_ms) {
    run_result result;
    result.success = true;
    result.stdout_text = outcome.stdout_text;
    result.stderr_text = outcome.effective_stderr();
    result.all_passed = all_of(verdicts.begin(), verdicts.end(), [](const test_verdict &verdict) {
        return verdict.passed;
    });
    result.test_results = move(verdicts);
    result.execution_time_ms = execution_time_ms;
    return result;
}

}  // namespace runner
