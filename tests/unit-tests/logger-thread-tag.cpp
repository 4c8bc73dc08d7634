#include "unit.test.macros.hh"

#include <string>
#include <thread>

namespace {
std::string
thread_tag(const std::string& message)
{
    const auto begin = message.find(" [T");
    EXPECT(begin != std::string::npos, "No thread tag in: ", message);

    const auto end = message.find(']', begin);
    EXPECT(end != std::string::npos, "Unterminated thread tag in: ", message);

    return message.substr(begin + 3, end - begin - 3);
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        // messages are formatted and returned even when nothing is printed
        Logger::set_log_level(LogLevel_None);

        const std::string first = LOG_INFO("first");
        const std::string second = LOG_WARNING("second");
        CHECK(first.find("[INFO] ") != std::string::npos);
        CHECK(second.find("[WARNING] ") != std::string::npos);
        CHECK(first.find("logger-thread-tag.cpp") != std::string::npos);
        CHECK(first.ends_with(": first"));

        const auto main_tag = thread_tag(first);
        EXPECT_STR_EQ(thread_tag(second).c_str(), main_tag.c_str());

        std::string worker_a, worker_b;
        {
            std::thread a([&worker_a] { worker_a = LOG_DEBUG("part 1"); });
            a.join();
            std::thread b([&worker_b] { worker_b = LOG_DEBUG("part 2"); });
            b.join();
        }

        const auto tag_a = thread_tag(worker_a);
        const auto tag_b = thread_tag(worker_b);
        EXPECT(tag_a != main_tag, "Worker shares the tag ", main_tag);
        EXPECT(tag_b != main_tag, "Worker shares the tag ", main_tag);
        EXPECT(tag_a != tag_b, "Workers share the tag ", tag_a);

        // the main thread keeps its number
        EXPECT_STR_EQ(thread_tag(LOG_ERROR("third")).c_str(), main_tag.c_str());

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Exception: ", e.what());
    }

    return retval;
}
