#include "local.file.hh"
#include "logger.hh"
#include "s3.backend.hh"
#include "upload.common.hh"
#include "upload.config.hh"
#include "upload.errors.hh"
#include "upload.orchestrator.hh"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace po = boost::program_options;

namespace {
enum ExitCode
{
    ExitCode_Success = 0,
    ExitCode_ConfigurationError = 1,
    ExitCode_LocalFileError = 2,
    ExitCode_BackendError = 3,
    ExitCode_InternalError = 4,
};

int
exit_code_for(ObjUploadStatusCode code)
{
    switch (code) {
        case ObjUploadStatusCode_Success:
            return ExitCode_Success;
        case ObjUploadStatusCode_InvalidArgument:
        case ObjUploadStatusCode_InvalidSettings:
            return ExitCode_ConfigurationError;
        case ObjUploadStatusCode_FileNotFound:
        case ObjUploadStatusCode_IOError:
            return ExitCode_LocalFileError;
        case ObjUploadStatusCode_BackendError:
            return ExitCode_BackendError;
        default:
            return ExitCode_InternalError;
    }
}

po::options_description
make_options()
{
    po::options_description options("Usage: objupload [options]\n\n"
                                    "Uploads a file to an S3-compatible "
                                    "bucket. Credentials are read from the\n"
                                    "ACCESS_KEY and ACCESS_SECRET environment "
                                    "variables.\n\nOptions");

    // clang-format off
    options.add_options()
      ("help,h", "print this message and exit")
      ("config,c", po::value<std::string>(), "JSON config file")
      ("endpoint", po::value<std::string>(), "S3 endpoint")
      ("bucket", po::value<std::string>(), "bucket name")
      ("object", po::value<std::string>(), "object name")
      ("file", po::value<std::string>(), "file path")
      ("part-size", po::value<uint64_t>(),
       "size threshold and part size in bytes, 5 MiB to 5 GiB (default 1 GiB)")
      ("split", po::value<std::string>(), "part split policy: fixed or even")
      ("concurrency", po::value<uint32_t>(), "parts uploaded at once, 1 to 64")
      ("retries", po::value<uint32_t>(), "retries of a failed transfer")
      ("no-abort", "keep the parts of a failed multipart upload")
      ("log-level", po::value<std::string>(),
       "debug, info, warning, error or none")
      ("quiet,q", "do not print progress");
    // clang-format on

    return options;
}

[[nodiscard]]
bool
apply_options(const po::variables_map& vm, objupload::UploadConfig& config)
{
    if (vm.count("config") &&
        !objupload::load_config_file(vm["config"].as<std::string>(), config)) {
        return false;
    }

    if (vm.count("endpoint")) {
        config.s3.endpoint = objupload::trim(vm["endpoint"].as<std::string>());
    }
    if (vm.count("bucket")) {
        config.s3.bucket_name =
          objupload::trim(vm["bucket"].as<std::string>());
    }
    if (vm.count("object")) {
        config.object_key = objupload::trim(vm["object"].as<std::string>());
    }
    if (vm.count("file")) {
        config.file_path = objupload::trim(vm["file"].as<std::string>());
    }
    if (vm.count("part-size")) {
        config.part_size = vm["part-size"].as<uint64_t>();
    }
    if (vm.count("split") &&
        !objupload::parse_part_split(vm["split"].as<std::string>(),
                                     config.part_split)) {
        return false;
    }
    if (vm.count("concurrency")) {
        config.max_concurrency = vm["concurrency"].as<uint32_t>();
    }
    if (vm.count("retries")) {
        config.max_retries = vm["retries"].as<uint32_t>();
    }
    if (vm.count("no-abort")) {
        config.abort_on_failure = false;
    }
    if (vm.count("log-level") &&
        !objupload::parse_log_level(vm["log-level"].as<std::string>(),
                                    config.log_level)) {
        return false;
    }
    if (vm.count("quiet")) {
        config.show_progress = false;
    }

    return true;
}

void
read_credentials(objupload::UploadConfig& config)
{
    if (const char* env = std::getenv("ACCESS_KEY")) {
        config.s3.access_key_id = objupload::trim(env);
    }
    if (const char* env = std::getenv("ACCESS_SECRET")) {
        config.s3.secret_access_key = objupload::trim(env);
    }
}
} // namespace

int
main(int argc, char* argv[])
{
    const auto options = make_options();

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, options), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "error: " << e.what() << "\n\n" << options << std::endl;
        return ExitCode_ConfigurationError;
    }

    if (vm.count("help")) {
        std::cout << options << std::endl;
        return ExitCode_Success;
    }

    objupload::UploadConfig config;
    if (!apply_options(vm, config)) {
        std::cerr << "error: invalid configuration" << std::endl;
        return ExitCode_ConfigurationError;
    }
    read_credentials(config);

    Logger::set_log_level(config.log_level);

    if (!objupload::validate_config(config)) {
        std::cerr << "missing parameters" << std::endl;
        return ExitCode_ConfigurationError;
    }

    std::shared_ptr<objupload::ProgressReporter> reporter;
    if (config.show_progress) {
        reporter = std::make_shared<objupload::ConsoleProgressReporter>(std::cout);
    }

    try {
        // a missing file must be reported before any backend call
        {
            objupload::LocalFile source(config.file_path);
        }

        auto pool = std::make_shared<objupload::S3ConnectionPool>(
          config.max_concurrency,
          config.s3.endpoint,
          config.s3.access_key_id,
          config.s3.secret_access_key);
        auto backend = std::make_shared<objupload::S3Backend>(
          config.s3.bucket_name, pool);

        objupload::UploadOrchestrator orchestrator(config, backend, reporter);
        const auto result = orchestrator.upload();

        LOG_DEBUG("Uploaded ",
                  objupload::format_bytes(result.size),
                  " to ",
                  result.object_key);
    } catch (const objupload::UploadError& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return exit_code_for(e.code());
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return ExitCode_InternalError;
    }

    std::cout << "upload success!" << std::endl;
    return ExitCode_Success;
}
