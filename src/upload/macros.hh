#pragma once

#include "logger.hh"
#include "upload.errors.hh"

#include <stdexcept>

#define EXPECT(e, ...)                                                         \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw std::runtime_error(__err);                                   \
        }                                                                      \
    } while (0)
#define CHECK(e) EXPECT(e, "Expression evaluated as false:\n\t", #e)

#define EXPECT_STATUS(e, code, ...)                                            \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw objupload::UploadError(code, __err);                         \
        }                                                                      \
    } while (0)

#define EXPECT_VALID_ARGUMENT(e, ...)                                          \
    do {                                                                       \
        if (!(e)) {                                                            \
            LOG_ERROR(__VA_ARGS__);                                            \
            return ObjUploadStatusCode_InvalidArgument;                        \
        }                                                                      \
    } while (0)
