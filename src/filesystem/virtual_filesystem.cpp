#include "filesystem/virtual_filesystem.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace pysandbox::filesystem {
namespace {

FileResult Failure(const std::string& action, const std::string& path, const std::string& reason) {
    FileResult result{};
    result.error = "Failed to " + action + " file " + path + ": " + reason;
    return result;
}

std::string LastErrno() {
    return errno != 0 ? std::strerror(errno) : std::string("unknown error");
}

}  // namespace

VirtualFilesystem::VirtualFilesystem(std::filesystem::path base_dir)
    : base_dir_(std::move(base_dir)) {}

std::filesystem::path VirtualFilesystem::Resolve(const std::string& path) const {
    std::filesystem::path target(path);
    if (target.is_relative() && !base_dir_.empty()) {
        return base_dir_ / target;
    }
    return target;
}

FileResult VirtualFilesystem::WriteFile(const std::string& path, const std::string& content) const {
    if (path.empty()) {
        return Failure("write", path, "path is required");
    }
    const auto target = Resolve(path);

    const auto parent = target.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Failure("write", path, ec.message());
        }
    }
    std::error_code status_ec;
    if (std::filesystem::is_directory(target, status_ec)) {
        return Failure("write", path, "is a directory");
    }

    errno = 0;
    std::ofstream file(target, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Failure("write", path, LastErrno());
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (file.fail()) {
        return Failure("write", path, LastErrno());
    }

    FileResult result{};
    result.ok = true;
    return result;
}

FileResult VirtualFilesystem::ReadFile(const std::string& path) const {
    if (path.empty()) {
        return Failure("read", path, "path is required");
    }
    const auto target = Resolve(path);

    std::error_code ec;
    if (!std::filesystem::exists(target, ec)) {
        return Failure("read", path, "no such file or directory");
    }
    if (std::filesystem::is_directory(target, ec)) {
        return Failure("read", path, "is a directory");
    }

    errno = 0;
    std::ifstream file(target, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return Failure("read", path, LastErrno());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Failure("read", path, LastErrno());
    }

    FileResult result{};
    result.ok = true;
    result.content = buffer.str();
    return result;
}

}  // namespace pysandbox::filesystem
