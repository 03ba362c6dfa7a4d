#include "PartMerger.h"
#include "PartFile.h"

#include <algorithm>
#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;

Status PartMerger::merge(const std::string& destinationPath, const std::vector<RangeSpec>& ranges) {
    merged = 0;

    std::vector<RangeSpec> ordered(ranges);
    std::sort(ordered.begin(), ordered.end(), [](const RangeSpec& a, const RangeSpec& b) {
        return a.index < b.index;
        });

    std::ofstream out(destinationPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
        return Status::failure(ErrorKind::IOError, "cannot open " + destinationPath + " for writing");

    char buffer[kChunkSize];

    for (const auto& range : ordered) {
        const std::string partPath = partFilePath(destinationPath, range.start);

        const std::int64_t partSize = PartFile::existingSize(partPath);
        if (partSize < 0)
            return Status::failure(ErrorKind::MissingPart, "part file " + partPath + " is missing");

        if (partSize != range.length()) {
            return Status::failure(ErrorKind::MissingPart,
                "part file " + partPath + " has " + std::to_string(partSize) +
                " bytes, expected " + std::to_string(range.length()));
        }

        {
            std::ifstream in(partPath, std::ios::binary);
            if (!in.is_open())
                return Status::failure(ErrorKind::IOError, "cannot open " + partPath + " for reading");

            std::int64_t copied = 0;
            while (in) {
                in.read(buffer, sizeof(buffer));
                const std::streamsize n = in.gcount();
                if (n <= 0)
                    break;

                out.write(buffer, n);
                if (!out)
                    return Status::failure(ErrorKind::IOError, "write to " + destinationPath + " failed");
                copied += n;
            }

            if (in.bad() || copied != partSize)
                return Status::failure(ErrorKind::IOError, "read from " + partPath + " failed");

            merged += copied;
        }

        out.flush();
        if (!out)
            return Status::failure(ErrorKind::IOError, "flush of " + destinationPath + " failed");

        std::error_code ec;
        fs::remove(partPath, ec);
        if (ec)
            return Status::failure(ErrorKind::IOError, "cannot delete " + partPath + ": " + ec.message());
    }

    out.close();
    if (!out)
        return Status::failure(ErrorKind::IOError, "close of " + destinationPath + " failed");

    return Status::success();
}
