#pragma once

#include <cstdint>
#include <fstream>
#include <span>
#include <string>
#include <string_view>

namespace objupload {
/**
 * @brief A local file opened for reading, closed on destruction.
 * @details Reads are positioned: every read_at seeks first, so parts may be
 * read in any order. The handle has a single cursor; readers on different
 * threads must each open their own LocalFile.
 */
class LocalFile
{
  public:
    /**
     * @brief Open a file and take its size.
     * @throws UploadError with ObjUploadStatusCode_FileNotFound if the file
     * does not exist, or ObjUploadStatusCode_IOError if it is not a regular
     * file or cannot be opened.
     */
    explicit LocalFile(std::string_view path);

    LocalFile(const LocalFile&) = delete;
    LocalFile& operator=(const LocalFile&) = delete;

    const std::string& path() const noexcept { return path_; }
    uint64_t size() const noexcept { return size_; }

    /**
     * @brief Fill @p buf with the bytes starting at @p offset.
     * @throws UploadError with ObjUploadStatusCode_IOError if the range is
     * out of bounds or the read comes up short.
     */
    void read_at(uint64_t offset, std::span<uint8_t> buf);

    /**
     * @brief Position the file at its start and hand out the stream.
     * @throws UploadError with ObjUploadStatusCode_IOError on seek failure.
     */
    std::istream& rewind();

  private:
    std::string path_;
    uint64_t size_;
    std::ifstream file_;
};
} // namespace objupload
