#include "utils.h"

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None: return "None";
    case ErrorKind::InvalidConfiguration: return "InvalidConfiguration";
    case ErrorKind::UnsupportedSource: return "UnsupportedSource";
    case ErrorKind::TransportError: return "TransportError";
    case ErrorKind::IOError: return "IOError";
    case ErrorKind::MissingPart: return "MissingPart";
    case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string partFilePath(const std::string& outputPath, std::int64_t rangeStart) {
    return outputPath + ".part" + std::to_string(rangeStart);
}
