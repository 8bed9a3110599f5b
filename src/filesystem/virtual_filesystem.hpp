#pragma once

#include <filesystem>
#include <string>

namespace pysandbox::filesystem {

struct FileResult {
    bool ok = false;
    std::string content;
    // "Failed to write file <path>: <reason>" style, empty when ok.
    std::string error;
};

// The interpreter's view of the filesystem. Files persist for the life of
// the worker and are overwritten in place.
class VirtualFilesystem {
public:
    // Relative paths resolve against base_dir; empty means the process's
    // working directory.
    explicit VirtualFilesystem(std::filesystem::path base_dir = {});

    FileResult WriteFile(const std::string& path, const std::string& content) const;
    FileResult ReadFile(const std::string& path) const;

private:
    std::filesystem::path Resolve(const std::string& path) const;

    std::filesystem::path base_dir_;
};

}  // namespace pysandbox::filesystem
