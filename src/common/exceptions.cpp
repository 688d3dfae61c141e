#include "common/exceptions.hpp"
#include <fmt/core.h>
#include <boost/exception/diagnostic_information.hpp>

namespace runner {
using namespace std;

runner_exception::runner_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *runner_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const runner_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error(const string &message)
    : runner_exception(message) {}

launch_error::launch_error(const string &message)
    : runner_exception(message) {}

source_too_large::source_too_large(size_t size, size_t limit)
    : runner_exception(fmt::format("Code exceeds maximum size ({} bytes)", limit)), size(size), limit(limit) {}

bad_request::bad_request(const string &message)
    : runner_exception(message) {}

}  // namespace runner
