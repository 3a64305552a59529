// file LockArtifact.hpp:

#pragma once

#include <filesystem>
#include <system_error>

/**
 * @brief Location of the lock directory a dot-lock VFS leaves next to a database file.
 *
 * @param[in] databasePath Path of the database file
 * @return "<databasePath>.lock"
 */
std::filesystem::path LockArtifactPath(const std::filesystem::path& databasePath);

/**
 * @brief Remove the lock directory left behind for a database file.
 *
 * A missing lock directory is not an error.
 *
 * @param[in] databasePath Path of the database file
 * @return Empty error code on success, the filesystem error otherwise
 */
std::error_code RemoveLockArtifact(const std::filesystem::path& databasePath);
