// ==============================================================================
// error.cpp - Фатальные ошибки выполнения
// ==============================================================================

#include "wsformat/error.hpp"

#include <utility>

namespace wsformat {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::FileNotFound:
        return "file-not-found";
    case ErrorKind::DirectoryUnreadable:
        return "directory-unreadable";
    case ErrorKind::DirectoryEntryUnreadable:
        return "directory-entry-unreadable";
    case ErrorKind::FileUnreadable:
        return "file-unreadable";
    case ErrorKind::FileUnwritable:
        return "file-unwritable";
    case ErrorKind::InvalidExcludePattern:
        return "invalid-exclude-pattern";
    case ErrorKind::InvalidConfiguration:
        return "invalid-configuration";
    }
    return "unknown";
}

std::string format_error_message(ErrorKind kind, const std::string& subject,
                                 const std::string& detail) {
    std::string message;
    switch (kind) {
    case ErrorKind::FileNotFound:
        message = "File not found " + subject + ".";
        break;
    case ErrorKind::DirectoryUnreadable:
        message = "Failed to read directory " + subject + ".";
        break;
    case ErrorKind::DirectoryEntryUnreadable:
        message = "Failed to read an entry in directory " + subject + ".";
        break;
    case ErrorKind::FileUnreadable:
        message = "Cannot read " + subject;
        break;
    case ErrorKind::FileUnwritable:
        message = "Cannot write " + subject;
        break;
    case ErrorKind::InvalidExcludePattern:
        message = "Invalid regular expression " + subject + ".";
        break;
    case ErrorKind::InvalidConfiguration:
        message = "Invalid configuration file " + subject + ".";
        break;
    }

    if (!detail.empty()) {
        message += " - " + detail;
    }
    return message;
}

Error::Error(ErrorKind kind, std::string subject, std::string detail)
    : std::runtime_error(format_error_message(kind, subject, detail)),
      kind_(kind),
      subject_(std::move(subject)),
      detail_(std::move(detail)) {}

}  // namespace wsformat
