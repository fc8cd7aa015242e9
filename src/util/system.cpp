// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <util/system.h>
#include <util/logging.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <sys/stat.h>
#include <errno.h>
#include <cstring>

bool EnsureDirExists(const std::string& path) {
    std::filesystem::path fs_path(path);
    std::filesystem::path parent = fs_path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            LogPrintf(ALL, ERROR, "Failed to create directory %s (%s)",
                      parent.string().c_str(), ec.message().c_str());
            return false;
        }
    }

    // Create atomically and verify afterwards instead of check-then-create
    int mkdir_result = mkdir(path.c_str(), 0755);
    bool created = (mkdir_result == 0);

    if (mkdir_result != 0 && errno != EEXIST) {
        LogPrintf(ALL, ERROR, "Failed to create directory %s (%s)", path.c_str(), strerror(errno));
        return false;
    }

    // lstat does not follow symlinks
    struct stat info;
    if (lstat(path.c_str(), &info) != 0) {
        LogPrintf(ALL, ERROR, "Cannot access directory %s", path.c_str());
        return false;
    }

    if (S_ISLNK(info.st_mode)) {
        LogPrintf(ALL, ERROR, "%s is a symlink - not allowed as an output directory", path.c_str());
        return false;
    }

    if (!S_ISDIR(info.st_mode)) {
        LogPrintf(ALL, ERROR, "%s exists but is not a directory", path.c_str());
        return false;
    }

    if (created) {
        LogPrintf(ALL, DEBUG, "Created directory: %s", path.c_str());
    }
    return true;
}

bool ReadFileBytes(const std::string& path, std::string& contents) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    contents.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}
