#include "config.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "common/utils.hpp"

namespace runner {
using namespace std;
namespace po = boost::program_options;

const char VERSION[] = "code-runner 1.0.0";

/**
 * @brief 按 命令行参数 > 环境变量 > 默认值 的顺序读取配置项
 */
template <typename T>
static void read_option(const po::variables_map &vm, const char *option, const char *env, T &target) {
    if (vm.count(option)) {
        target = vm[option].as<T>();
    } else if (getenv(env)) {
        try {
            target = get_env_as<T>(env, target);
        } catch (boost::bad_lexical_cast &) {
            throw po::invalid_option_value(get_env(env, ""));
        }
    }
}

static bool env_flag(const char *env) {
    string value = boost::algorithm::to_lower_copy(get_env(env, ""));
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

optional<configuration> parse_configuration(int argc, const char *const argv[]) {
    po::options_description desc("code-runner options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("host", po::value<string>(), "set the address to listen on, default to 0.0.0.0. You can either pass it from environ HOST")
        ("port", po::value<unsigned short>(), "set the port to listen on, default to 8080. You can either pass it from environ PORT")
        ("max-wall-time-ms", po::value<int64_t>(), "set wall time limit in milliseconds of user programs, default to 2000. You can either pass it from environ MAX_WALL_TIME_MS")
        ("max-output-bytes", po::value<size_t>(), "set the maximum bytes kept for stdout and stderr each, default to 1048576(1MB). You can either pass it from environ MAX_OUTPUT_BYTES")
        ("max-source-bytes", po::value<size_t>(), "set the maximum size of submitted code, default to 102400(100KB). You can either pass it from environ MAX_SOURCE_BYTES")
        ("max-memory-bytes", po::value<size_t>(), "set address space limit of user programs, 0 to disable, default to 536870912(512MB). You can either pass it from environ MAX_MEMORY_BYTES")
        ("max-processes", po::value<size_t>(), "set RLIMIT_NPROC of user programs, 0 to disable, default to 0. You can either pass it from environ MAX_PROCESSES")
        ("interpreter", po::value<string>(), "set the interpreter running user programs, default to python3. You can either pass it from environ PYTHON")
        ("scratch-dir", po::value<string>(), "set the directory to create scratch directories of user programs in, default to system temporary directory. You can either pass it from environ SCRATCHDIR")
        ("run-user", po::value<string>(), "set run user when running as root. You can either pass it from environ RUNUSER")
        ("isolate-network", "run user programs in a separate network namespace if possible (default)")
        ("no-isolate-network", "do not create network namespaces for user programs")
        ("strict-isolation", "refuse to run user programs if isolation cannot be established. You can either pass it from environ STRICT_ISOLATION")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    configuration config;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);

        if (vm.count("help")) {
            cout << "code-runner: run untrusted Python code and evaluate tests against it" << endl
                 << "Usage: " << argv[0] << " [options]" << endl;
            cout << desc << endl;
            return nullopt;
        }

        if (vm.count("version")) {
            cout << VERSION << endl;
            return nullopt;
        }

        read_option(vm, "host", "HOST", config.host);
        read_option(vm, "port", "PORT", config.port);
        read_option(vm, "max-wall-time-ms", "MAX_WALL_TIME_MS", config.limits.max_wall_time_ms);
        read_option(vm, "max-output-bytes", "MAX_OUTPUT_BYTES", config.limits.max_output_bytes);
        read_option(vm, "max-source-bytes", "MAX_SOURCE_BYTES", config.limits.max_source_bytes);
        read_option(vm, "max-memory-bytes", "MAX_MEMORY_BYTES", config.limits.max_memory_bytes);
        read_option(vm, "max-processes", "MAX_PROCESSES", config.limits.max_processes);
        read_option(vm, "interpreter", "PYTHON", config.sandbox.interpreter);

        string scratch_dir;
        read_option(vm, "scratch-dir", "SCRATCHDIR", scratch_dir);
        config.sandbox.scratch_dir = scratch_dir.empty() ? filesystem::temp_directory_path() : filesystem::path(scratch_dir);

        string run_user;
        read_option(vm, "run-user", "RUNUSER", run_user);
        if (!run_user.empty()) config.sandbox.run_user = run_user;

        if (vm.count("isolate-network") && vm.count("no-isolate-network"))
            throw po::error("--isolate-network and --no-isolate-network cannot be used together");
        config.sandbox.isolate_network = !vm.count("no-isolate-network");
        config.sandbox.strict_isolation = vm.count("strict-isolation") || env_flag("STRICT_ISOLATION");

        if (config.limits.max_wall_time_ms <= 0)
            throw po::validation_error(po::validation_error::invalid_option_value, "max-wall-time-ms");
        if (config.limits.max_output_bytes == 0)
            throw po::validation_error(po::validation_error::invalid_option_value, "max-output-bytes");
        if (config.limits.max_source_bytes == 0)
            throw po::validation_error(po::validation_error::invalid_option_value, "max-source-bytes");
        if (config.sandbox.interpreter.empty())
            throw po::validation_error(po::validation_error::invalid_option_value, "interpreter");
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        throw;
    }

    return config;
}

}  // namespace runner
