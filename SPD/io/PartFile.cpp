#include "PartFile.h"

#include <filesystem>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#include <sys/stat.h>
#else
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#endif

namespace fs = std::filesystem;

PartFile::PartFile(const std::string& path)
    : filePath(path) {
}

PartFile::~PartFile() {
    close();
}

std::int64_t PartFile::existingSize(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return -1;

    auto size = fs::file_size(path, ec);
    if (ec)
        return -1;
    return static_cast<std::int64_t>(size);
}

bool PartFile::open(bool append) {
#ifdef _WIN32
    int flags = _O_BINARY | _O_WRONLY | _O_CREAT | (append ? _O_APPEND : _O_TRUNC);
    int mode = _S_IREAD | _S_IWRITE;
    fileHandle = _open(filePath.c_str(), flags, mode);
#else
    int flags = O_WRONLY | O_CREAT | (append ? O_APPEND : O_TRUNC);
    int mode = 0644;
    fileHandle = ::open(filePath.c_str(), flags, mode);
#endif

    return fileHandle >= 0;
}

bool PartFile::write(const char* data, std::size_t size) {
    if (fileHandle < 0)
        return false;

    while (size > 0) {
#ifdef _WIN32
        int n = _write(fileHandle, data, static_cast<unsigned int>(size));
#else
        ssize_t n = ::write(fileHandle, data, size);
        if (n < 0 && errno == EINTR)
            continue;
#endif
        if (n <= 0)
            return false;

        data += n;
        size -= static_cast<std::size_t>(n);
    }

    return true;
}

bool PartFile::flush() {
    if (fileHandle < 0)
        return false;
#ifdef _WIN32
    return _commit(fileHandle) == 0;
#else
    return fsync(fileHandle) == 0;
#endif
}

void PartFile::close() {
    if (fileHandle >= 0) {
#ifdef _WIN32
        _close(fileHandle);
#else
        ::close(fileHandle);
#endif
        fileHandle = -1;
    }
}
