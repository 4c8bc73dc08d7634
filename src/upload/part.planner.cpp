#include "macros.hh"
#include "part.planner.hh"
#include "upload.common.hh"

uint64_t
objupload::part_count(uint64_t file_size, uint64_t part_size)
{
    return ceil_div(file_size, part_size);
}

std::vector<objupload::Part>
objupload::plan_parts(uint64_t file_size,
                      uint64_t part_size,
                      ObjUploadPartSplit split)
{
    EXPECT(file_size > 0, "Cannot plan parts for an empty file.");
    EXPECT(part_size > 0, "Part size must be positive.");

    const auto n_parts = part_count(file_size, part_size);

    uint64_t stride;
    switch (split) {
        case ObjUploadPartSplit_FixedSize:
            stride = part_size;
            break;
        case ObjUploadPartSplit_EvenByCount:
            stride = file_size / n_parts;
            break;
        default:
            throw std::runtime_error("Invalid part split: " +
                                     std::to_string(split));
    }

    std::vector<Part> parts;
    parts.reserve(n_parts);

    for (uint64_t i = 0; i < n_parts; ++i) {
        const uint64_t offset = i * stride;
        const uint64_t size =
          (i == n_parts - 1) ? file_size - offset : stride;

        parts.push_back({ .number = static_cast<uint32_t>(i + 1),
                          .offset = offset,
                          .size = size });
    }

    return parts;
}
