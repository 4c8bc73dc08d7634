#pragma once

#include "objupload.types.h"

#include <stdexcept>
#include <string>

namespace objupload {
/**
 * @brief An upload failure of a known kind.
 * @details The status code tells a configuration error, a local file error,
 * a remote store rejection and a bookkeeping defect apart.
 */
class UploadError : public std::runtime_error
{
  public:
    UploadError(ObjUploadStatusCode code, const std::string& what);

    ObjUploadStatusCode code() const noexcept { return code_; }

  private:
    ObjUploadStatusCode code_;
};

/**
 * @brief Get a human-readable description of a status code.
 * @param code The status code.
 * @return The description. Never null.
 */
const char*
status_message(ObjUploadStatusCode code) noexcept;
} // namespace objupload
