// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_UTIL_SYSTEM_H
#define STVFUZZ_UTIL_SYSTEM_H

#include <string>

/**
 * Ensure a directory exists, creating it (and missing parents) if necessary
 *
 * The final path component is verified after creation: it must be a real
 * directory, not a symlink or a regular file.
 *
 * @param path Directory path to create
 * @return true if directory exists or was created successfully
 */
bool EnsureDirExists(const std::string& path);

/**
 * Read a whole file as raw bytes
 *
 * @param path File to read
 * @param[out] contents File contents
 * @return false if the file could not be opened or read
 */
bool ReadFileBytes(const std::string& path, std::string& contents);

#endif // STVFUZZ_UTIL_SYSTEM_H
