#include <glog/logging.h>
#include <sys/stat.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "sandbox/process_backend.hpp"
#include "server/http_server.hpp"
#include "server/run_service.hpp"
using namespace std;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    optional<runner::configuration> config;
    try {
        config = runner::parse_configuration(argc, argv);
    } catch (boost::program_options::error&) {
        return EXIT_FAILURE;
    }
    if (!config) return EXIT_SUCCESS;

    // 临时目录只允许当前用户访问
    umask(0077);

    CHECK(filesystem::is_directory(config->sandbox.scratch_dir))
        << "Scratch directory " << config->sandbox.scratch_dir << " does not exist";

    try {
        runner::process_backend backend(config->limits, config->sandbox);
        runner::server::run_service service(*config, backend);
        runner::server::http_server server(*config, service);

        LOG(INFO) << "Wall time limit: " << config->limits.max_wall_time_ms << "ms"
                  << ", output limit: " << config->limits.max_output_bytes << " bytes"
                  << ", source limit: " << config->limits.max_source_bytes << " bytes"
                  << ", interpreter: " << config->sandbox.interpreter;
        server.run();
    } catch (runner::runner_exception& ex) {
        LOG(ERROR) << ex;
        return EXIT_FAILURE;
    } catch (std::exception& ex) {
        LOG(ERROR) << "Unable to start service: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
