#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "../core/utils.h"

// Concatenates part files into the destination strictly in range order.
// A part is deleted only after it was copied completely. On failure the
// destination is left partially written and the remaining parts stay on disk.
class PartMerger
{
public:
    Status merge(const std::string& destinationPath, const std::vector<RangeSpec>& ranges);

    std::int64_t bytesMerged() const { return merged; }

private:
    std::int64_t merged = 0;
};
