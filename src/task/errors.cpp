#include "shareup/task/errors.hpp"

namespace shareup::task {

const char* to_string(UploadError error) noexcept {
    switch (error) {
        case UploadError::Cancelled: return "cancelled";
        case UploadError::ConnectionFailed: return "connection failed";
        case UploadError::FileNotFound: return "file not found";
        case UploadError::ServerNotFound: return "server not found";
        case UploadError::DirectoryDownloaded: return "target is a directory";
        case UploadError::UploadFailed: return "upload failed";
    }
    return "unknown";
}

bool is_retryable(UploadError error) noexcept {
    return error == UploadError::ConnectionFailed || error == UploadError::UploadFailed;
}

} // namespace shareup::task
