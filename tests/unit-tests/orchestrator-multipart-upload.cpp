#include "mock.storage.backend.hh"
#include "unit.test.macros.hh"
#include "upload.orchestrator.hh"

namespace fs = std::filesystem;
using State = objupload::UploadSession::State;

int
main()
{
    int retval = 1;

    const auto base_dir = fs::temp_directory_path() / TEST;
    const auto file_path = base_dir / "data.bin";

    try {
        fs::create_directories(base_dir);
        write_test_file(file_path, 250);

        objupload::UploadConfig config;
        config.part_size = 100;

        auto backend = std::make_shared<MockStorageBackend>();
        auto reporter = std::make_shared<RecordingReporter>();
        objupload::UploadOrchestrator orchestrator(config, backend, reporter);

        const auto result = orchestrator.upload(file_path.string(), "object");
        CHECK(result.strategy == objupload::UploadStrategy::Multipart);
        EXPECT_EQ(size_t, result.part_count, 3);
        EXPECT_EQ(uint64_t, result.size, 250);

        EXPECT_EQ(size_t, backend->create_calls, 1);
        EXPECT_EQ(size_t, backend->complete_calls, 1);
        EXPECT_EQ(size_t, backend->abort_calls, 0);
        EXPECT_EQ(size_t, backend->put_calls, 0);

        // sequential, in part order
        EXPECT_EQ(size_t, backend->part_attempts.size(), 3);
        for (auto i = 0; i < 3; ++i) {
            EXPECT_EQ(uint32_t, backend->part_attempts[i], i + 1);
        }

        EXPECT_EQ(size_t, backend->parts.at(1).size(), 100);
        EXPECT_EQ(size_t, backend->parts.at(2).size(), 100);
        EXPECT_EQ(size_t, backend->parts.at(3).size(), 50);

        EXPECT_EQ(size_t, backend->completed_with.size(), 3);
        for (auto i = 0; i < 3; ++i) {
            EXPECT_EQ(uint32_t, backend->completed_with[i].number, i + 1);
            EXPECT_STR_EQ(backend->completed_with[i].etag.c_str(),
                          ("etag-" + std::to_string(i + 1)).c_str());
        }
        CHECK(is_test_data(backend->object_data, 250));

        const auto session = orchestrator.last_session();
        CHECK(session);
        EXPECT(session->state() == State::Completed,
               "Unexpected state ",
               objupload::to_string(session->state()));
        EXPECT_EQ(size_t, session->part_attempts(), 3);

        // every part starts and completes once; the object total only grows
        uint64_t object_consumed = 0;
        for (uint32_t number = 1; number <= 3; ++number) {
            const auto events = reporter->events_for(number);
            EXPECT_EQ(int, events.front().phase, ObjUploadProgressPhase_Started);
            EXPECT_EQ(int, events.back().phase, ObjUploadProgressPhase_Completed);
            for (const auto& event : events) {
                CHECK(event.phase != ObjUploadProgressPhase_Failed);
                EXPECT_EQ(uint64_t, event.object_total_bytes, 250);
            }
        }
        for (const auto& event : reporter->events) {
            EXPECT(event.object_consumed_bytes >= object_consumed,
                   "Object progress went from ",
                   object_consumed,
                   " to ",
                   event.object_consumed_bytes);
            object_consumed = event.object_consumed_bytes;
        }
        EXPECT_EQ(uint64_t, object_consumed, 250);

        // the same file split evenly
        config.part_split = ObjUploadPartSplit_EvenByCount;
        backend = std::make_shared<MockStorageBackend>();
        objupload::UploadOrchestrator even(config, backend, nullptr);
        even.upload(file_path.string(), "object");
        EXPECT_EQ(size_t, backend->parts.at(1).size(), 83);
        EXPECT_EQ(size_t, backend->parts.at(2).size(), 83);
        EXPECT_EQ(size_t, backend->parts.at(3).size(), 84);
        CHECK(is_test_data(backend->object_data, 250));

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Exception: ", e.what());
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
