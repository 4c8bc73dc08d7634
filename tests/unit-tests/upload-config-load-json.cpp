#include "unit.test.macros.hh"
#include "upload.config.hh"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {
void
write_file(const fs::path& path, const std::string& contents)
{
    std::ofstream ofs(path, std::ios::trunc);
    ofs << contents;
}
} // namespace

int
main()
{
    int retval = 1;

    const auto base_dir = fs::temp_directory_path() / TEST;
    const auto config_path = base_dir / "config.json";

    try {
        fs::create_directories(base_dir);

        write_file(config_path, R"({
    // where to put it
    "endpoint": "http://localhost:9000",
    "bucket": " my-bucket ",
    "object": "backups/data.bin",
    "file": "/data/data.bin",
    "part_size": 67108864,
    "split": "even",
    "concurrency": 8,
    "retries": 2,
    "abort_on_failure": false,
    "log_level": "warning",
    "progress": false
})");

        objupload::UploadConfig config;
        CHECK(objupload::load_config_file(config_path.string(), config));
        EXPECT_STR_EQ(config.s3.endpoint.c_str(), "http://localhost:9000");
        EXPECT_STR_EQ(config.s3.bucket_name.c_str(), "my-bucket");
        EXPECT_STR_EQ(config.object_key.c_str(), "backups/data.bin");
        EXPECT_STR_EQ(config.file_path.c_str(), "/data/data.bin");
        EXPECT_EQ(uint64_t, config.part_size, 64ull << 20);
        EXPECT_EQ(int, config.part_split, ObjUploadPartSplit_EvenByCount);
        EXPECT_EQ(uint32_t, config.max_concurrency, 8);
        EXPECT_EQ(uint32_t, config.max_retries, 2);
        CHECK(!config.abort_on_failure);
        EXPECT_EQ(int, config.log_level, LogLevel_Warning);
        CHECK(!config.show_progress);

        // credentials never come from the file
        CHECK(config.s3.access_key_id.empty());
        CHECK(config.s3.secret_access_key.empty());

        // keys that are absent keep their values
        write_file(config_path, R"({ "retries": 5 })");
        CHECK(objupload::load_config_file(config_path.string(), config));
        EXPECT_EQ(uint32_t, config.max_retries, 5);
        EXPECT_EQ(uint32_t, config.max_concurrency, 8);

        Logger::set_log_level(LogLevel_None);

        const char* invalid[] = {
            R"({ "access_key": "key" })",
            R"({ "part_size": -1 })",
            R"({ "part_size": "1GiB" })",
            R"({ "concurrency": 4294967296 })",
            R"({ "split": "random" })",
            R"({ "log_level": "verbose" })",
            R"({ "abort_on_failure": 1 })",
            R"([ "endpoint" ])",
            R"({ "endpoint": )",
        };
        for (const auto* contents : invalid) {
            write_file(config_path, contents);
            objupload::UploadConfig scratch;
            EXPECT(!objupload::load_config_file(config_path.string(), scratch),
                   "Expected config to be rejected: ",
                   contents);
        }

        objupload::UploadConfig scratch;
        CHECK(!objupload::load_config_file(
          (base_dir / "missing.json").string(), scratch));

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Exception: ", e.what());
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
