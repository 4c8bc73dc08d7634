#include "progress.hh"
#include "unit.test.macros.hh"

#include <sstream>

namespace {
bool
contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        std::ostringstream out;
        auto reporter = std::make_shared<objupload::ConsoleProgressReporter>(out);
        objupload::ObjectProgress object_progress(200);

        {
            objupload::ProgressTracker tracker(
              reporter, object_progress, 0, 200);
            tracker.start();
            tracker.update(50);
            tracker.complete();
        }

        std::string text = out.str();
        EXPECT(contains(text, "started, consumed bytes: 0, total bytes: 200.\n"),
               "Unexpected output: ",
               text);
        EXPECT(contains(text,
                        "\ruploading consumed bytes: 50, total bytes: 200, 25%."),
               "Unexpected output: ",
               text);
        EXPECT(!contains(text, "object:"), "Unexpected output: ", text);
        EXPECT(
          contains(text, "\ncompleted, consumed bytes: 200, total bytes: 200."),
          "Unexpected output: ",
          text);

        out.str("");
        objupload::ObjectProgress multipart_progress(400);
        {
            objupload::ProgressTracker tracker(
              reporter, multipart_progress, 2, 100);
            tracker.start();
            tracker.update(100);
            tracker.fail();
        }

        text = out.str();
        EXPECT(contains(text, "part 2 started, consumed bytes: 0"),
               "Unexpected output: ",
               text);
        EXPECT(contains(text, "100%. object: 25%."),
               "Unexpected output: ",
               text);
        EXPECT(contains(text, "\npart 2 failed, consumed bytes: 100"),
               "Unexpected output: ",
               text);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Exception: ", e.what());
    }

    return retval;
}
