#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

// Sequential writer for one range's part file. Owned by a single fetcher.
class PartFile
{
public:
    explicit PartFile(const std::string& path);
    ~PartFile();

    PartFile(const PartFile&) = delete;
    PartFile& operator=(const PartFile&) = delete;

    // Length of the file on disk, -1 when it does not exist
    static std::int64_t existingSize(const std::string& path);

    bool open(bool append);

    // Returns once every byte is handed to the OS with write(2), so any later
    // reader of the path, a resumed fetch included, sees it. flush() fsyncs.
    bool write(const char* data, std::size_t size);
    bool flush();
    void close();

    const std::string& path() const { return filePath; }

private:
    std::string filePath;
    int fileHandle = -1;
};
