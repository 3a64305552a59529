// file LockArtifact.cpp

#include "LockArtifact/LockArtifact.hpp"

namespace fs = std::filesystem;

namespace
{
constexpr const char* LockArtifactSuffix = ".lock";
}

fs::path LockArtifactPath(const fs::path& databasePath)
{
    fs::path lockPath = databasePath;
    lockPath += LockArtifactSuffix;
    return lockPath;
}

std::error_code RemoveLockArtifact(const fs::path& databasePath)
{
    std::error_code errorCode;
    const fs::path lockPath = LockArtifactPath(databasePath);

    if (false == fs::exists(lockPath, errorCode))
    {
        return errorCode;
    }

    fs::remove_all(lockPath, errorCode);
    return errorCode;
}
