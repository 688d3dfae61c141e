#include "server/run_service.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "common/utils.hpp"
#include "judge/evaluator.hpp"

namespace runner::server {
using namespace std;

run_service::run_service(const configuration &config, execution_backend &backend)
    : cfg(config), executor(backend, config.limits) {}

run_result run_service::run(const run_request &request) const {
    check_source_size(request.code, cfg.limits);

    elapsed_time timer;
    execution_outcome outcome = executor.execute(request.code);
    int64_t execution_time_ms = timer.duration<chrono::milliseconds>().count();

    run_result result = aggregate(outcome, evaluate(request.code, outcome, request.tests), execution_time_ms);

    size_t passed = count_if(result.test_results.begin(), result.test_results.end(), [](const test_verdict &verdict) {
        return verdict.passed;
    });
    LOG(INFO) << "Executed " << request.code.size() << " bytes of code"
              << ", tests: " << passed << "/" << request.tests.size() << " passed"
              << (outcome.timed_out ? ", timed out" : "")
              << (outcome.launch_error ? ", launch failed" : "")
              << ", time: " << execution_time_ms << "ms";
    return result;
}

}  // namespace runner::server
