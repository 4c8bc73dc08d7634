#include "mock.storage.backend.hh"
#include "unit.test.macros.hh"
#include "upload.session.hh"

#include <chrono>
#include <exception>
#include <thread>

namespace fs = std::filesystem;
using State = objupload::UploadSession::State;

int
main()
{
    int retval = 1;

    const auto base_dir = fs::temp_directory_path() / TEST;
    const auto file_path = base_dir / "data.bin";

    try {
        Logger::set_log_level(LogLevel_None);

        fs::create_directories(base_dir);
        write_test_file(file_path, 200);

        const auto parts =
          objupload::plan_parts(200, 100, ObjUploadPartSplit_FixedSize);
        objupload::ObjectProgress object_progress(200);

        auto backend = std::make_shared<MockStorageBackend>();
        backend->fail_part(1);

        // every retry would wait 0.1 s, 0.2 s, 0.4 s, ... 10 s
        objupload::UploadSession session(backend, "object", 10);
        session.initiate();

        std::exception_ptr error;
        const auto start = std::chrono::steady_clock::now();
        std::thread worker([&] {
            try {
                objupload::LocalFile file(file_path.string());
                std::vector<uint8_t> buffer;
                session.upload_part(
                  file, parts[0], buffer, nullptr, object_progress);
            } catch (...) {
                error = std::current_exception();
            }
        });

        // another part gives up while this one backs off
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        session.abandon();
        worker.join();
        const auto elapsed = std::chrono::steady_clock::now() - start;

        CHECK(error);
        EXPECT_UPLOAD_ERROR(ObjUploadStatusCode_InvariantViolation,
                            std::rethrow_exception(error));
        CHECK(session.state() == State::Abandoned);
        EXPECT(elapsed < std::chrono::seconds(1),
               "Retrying part took ",
               std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)
                 .count(),
               " ms after the session was abandoned");
        EXPECT(session.part_attempts() <= 2,
               "Expected at most 2 attempts, got ",
               session.part_attempts());
        CHECK(session.completed_parts().empty());

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Exception: ", e.what());
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
