#include "sandbox/executor.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace runner {
using namespace std;

execution_unit::~execution_unit() {}

execution_backend::~execution_backend() {}

static execution_outcome failed_outcome(const string &message, const elapsed_time &timer) {
    execution_outcome outcome;
    outcome.launch_error = message;
    outcome.duration_ms = timer.duration<chrono::milliseconds>().count();
    return outcome;
}

sandbox_executor::sandbox_executor(execution_backend &backend, const resource_limits &limits)
    : backend(backend), limits(limits) {}

execution_outcome sandbox_executor::execute(const string &source) const {
    elapsed_time timer;
    unique_ptr<execution_unit> unit;
    try {
        unit = backend.launch(source);
    } catch (launch_error &ex) {
        LOG(WARNING) << "Unable to launch execution unit: " << ex.what();
        return failed_outcome(ex.what(), timer);
    }

    // 无论 wait 正常返回、超时还是抛出异常，执行单元都必须被回收
    defer { backend.cleanup(*unit); };

    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(limits.max_wall_time_ms);
    try {
        execution_outcome outcome = backend.wait(*unit, deadline);
        if (outcome.timed_out)
            LOG(WARNING) << "Execution unit killed after " << outcome.duration_ms << "ms (wall-time limit " << limits.max_wall_time_ms << "ms)";
        if (outcome.truncated_stdout || outcome.truncated_stderr)
            LOG(INFO) << "Output truncated at " << limits.max_output_bytes << " bytes";
        return outcome;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Execution unit failed while running: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        try {
            backend.kill(*unit);
        } catch (std::exception &kill_ex) {
            LOG(ERROR) << "Unable to kill execution unit: " << kill_ex.what();
        }
        return failed_outcome(ex.what(), timer);
    }
}

}  // namespace runner
