#pragma once

#include "objupload.types.h"

#include <cstdint>
#include <vector>

namespace objupload {
/// @brief A contiguous byte range of the source file, uploaded as one part.
struct Part
{
    uint32_t number; // 1-based
    uint64_t offset;
    uint64_t size;
};

/// @brief Most parts a multipart upload may have.
constexpr uint64_t max_part_count = 10000;

/// @brief Smallest part an S3 store accepts, other than the last one.
constexpr uint64_t min_s3_part_size = 5ULL << 20;

/// @brief Largest part, or single-request object, an S3 store accepts.
constexpr uint64_t max_s3_part_size = 5ULL << 30;

/**
 * @brief Cut a file into parts.
 * @details The parts are ordered by number, numbered 1..n without gaps, and
 * their ranges cover [0, @p file_size) exactly. With
 * ObjUploadPartSplit_FixedSize every part but the last is @p part_size bytes.
 * With ObjUploadPartSplit_EvenByCount there are ceil(file_size/part_size)
 * parts of floor(file_size/n) bytes, the last one also taking the remainder.
 * @param file_size Size of the file in bytes. Must be nonzero.
 * @param part_size The part size threshold. Must be nonzero.
 * @param split How to cut the parts.
 * @return The parts.
 * @throws std::runtime_error if @p file_size or @p part_size is zero, or if
 * @p split is not a valid policy.
 */
std::vector<Part>
plan_parts(uint64_t file_size, uint64_t part_size, ObjUploadPartSplit split);

/**
 * @brief Number of parts plan_parts would produce.
 */
uint64_t
part_count(uint64_t file_size, uint64_t part_size);
} // namespace objupload
