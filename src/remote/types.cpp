#include "shareup/remote/types.hpp"

#include <sstream>

namespace shareup::remote {
namespace {

std::vector<std::string> split_segments(const std::string& text) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : text) {
        if (c == '/' || c == '\\') {
            if (!current.empty()) {
                segments.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        segments.push_back(std::move(current));
    }
    return segments;
}

std::string join(const std::vector<std::string>& parts) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            oss << '/';
        }
        oss << parts[i];
    }
    return oss.str();
}

} // namespace

const char* to_string(ChannelErrorCode code) noexcept {
    switch (code) {
        case ChannelErrorCode::NotFound: return "not found";
        case ChannelErrorCode::AccessDenied: return "access denied";
        case ChannelErrorCode::ConnectionFailed: return "connection failed";
        case ChannelErrorCode::InvalidHandle: return "invalid handle";
        case ChannelErrorCode::IoError: return "i/o error";
        case ChannelErrorCode::IsDirectory: return "is a directory";
    }
    return "unknown";
}

RemotePath::RemotePath(std::string volume, std::vector<std::string> directories)
    : volume_(std::move(volume)), directories_(std::move(directories)) {}

Result<RemotePath> RemotePath::parse(const std::string& text) {
    auto segments = split_segments(text);
    if (segments.empty()) {
        return Err<RemotePath>(std::string("Remote path has no volume: '") + text + "'");
    }
    std::string volume = std::move(segments.front());
    segments.erase(segments.begin());
    return Ok(RemotePath(std::move(volume), std::move(segments)));
}

std::string RemotePath::directory_path() const {
    return join(directories_);
}

std::string RemotePath::to_string() const {
    if (directories_.empty()) {
        return volume_;
    }
    return volume_ + "/" + directory_path();
}

Result<RemoteFileRef> RemoteFileRef::make(RemotePath path, std::string name) {
    if (name.empty() || name == "." || name == "..") {
        return Err<RemoteFileRef>(std::string("Invalid remote file name: '") + name + "'");
    }
    if (name.find_first_of("/\\") != std::string::npos) {
        return Err<RemoteFileRef>(std::string("Remote file name contains a separator: '") + name + "'");
    }
    if (path.volume().empty()) {
        return Err<RemoteFileRef>(std::string("Remote path has no volume"));
    }
    return Ok(RemoteFileRef(std::move(path), std::move(name)));
}

std::string RemoteFileRef::upload_path() const {
    const auto dir = path_.directory_path();
    return dir.empty() ? name_ : dir + "/" + name_;
}

RemoteFileRef RemoteFileRef::with_suffix(const std::string& suffix) const {
    return RemoteFileRef(path_, name_ + suffix);
}

} // namespace shareup::remote
