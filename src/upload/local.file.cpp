#include "local.file.hh"
#include "macros.hh"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

objupload::LocalFile::LocalFile(std::string_view path)
  : path_{ path }
  , size_{ 0 }
{
    std::error_code ec;
    const auto status = fs::status(path_, ec);
    EXPECT_STATUS(status.type() != fs::file_type::not_found,
                  ObjUploadStatusCode_FileNotFound,
                  "file not exists [",
                  path_,
                  "]");
    EXPECT_STATUS(!ec,
                  ObjUploadStatusCode_IOError,
                  "Failed to stat file ",
                  path_,
                  ": ",
                  ec.message());
    EXPECT_STATUS(fs::is_regular_file(status),
                  ObjUploadStatusCode_IOError,
                  "Not a regular file: ",
                  path_);

    size_ = fs::file_size(path_, ec);
    EXPECT_STATUS(!ec,
                  ObjUploadStatusCode_IOError,
                  "Failed to get size of file ",
                  path_,
                  ": ",
                  ec.message());

    file_.open(path_, std::ios::binary | std::ios::in);
    EXPECT_STATUS(file_.is_open(),
                  ObjUploadStatusCode_IOError,
                  "Failed to open file ",
                  path_);
}

void
objupload::LocalFile::read_at(uint64_t offset, std::span<uint8_t> buf)
{
    EXPECT_STATUS(offset <= size_ && buf.size() <= size_ - offset,
                  ObjUploadStatusCode_IOError,
                  "Cannot read ",
                  buf.size(),
                  " bytes at offset ",
                  offset,
                  " of ",
                  path_,
                  ", file size is ",
                  size_);

    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    EXPECT_STATUS(file_.good(),
                  ObjUploadStatusCode_IOError,
                  "Failed to seek to offset ",
                  offset,
                  " of ",
                  path_);

    file_.read(reinterpret_cast<char*>(buf.data()),
               static_cast<std::streamsize>(buf.size()));
    EXPECT_STATUS(file_.gcount() == static_cast<std::streamsize>(buf.size()),
                  ObjUploadStatusCode_IOError,
                  "Short read at offset ",
                  offset,
                  " of ",
                  path_,
                  ": expected ",
                  buf.size(),
                  " bytes, got ",
                  file_.gcount());
}

std::istream&
objupload::LocalFile::rewind()
{
    file_.clear();
    file_.seekg(0, std::ios::beg);
    EXPECT_STATUS(file_.good(),
                  ObjUploadStatusCode_IOError,
                  "Failed to seek to start of ",
                  path_);

    return file_;
}
