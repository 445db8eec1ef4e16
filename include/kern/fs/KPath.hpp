#pragma once

#include "kern/status/Expected.hpp"
#include "kern/status/Status.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace kern::fs {

/// Permission sets accepted by KPath::mkdir().
enum class FilesystemMode : unsigned {
    AllRwx = 0777,
    AllRw = 0666,
    OwnerRwxOthersRx = 0755,
    OnlyOwnerRwx = 0700,
    OwnerRwOthersR = 0644,
    OnlyOwnerRw = 0600,
    AllR = 0444,
    OnlyOwnerR = 0400,
    OwnerRwxGroupRx = 0750,
    OwnerGroupRwx = 0770
};

bool isValidFilesystemMode(unsigned mode);

/**
 * @brief Exception-free wrapper around std::filesystem::path.
 *
 * Queries return AStatusOrElse<T>, mutations return Status. Internally the
 * throwing std::filesystem overloads run under invokeWithStatus(), so a
 * filesystem_error surfaces as the matching canonical code (NotFound,
 * PermissionDenied, ...) instead of escaping.
 */
class KPath {
public:
    KPath() = default;
    KPath(std::filesystem::path path);
    KPath(const std::string& path);
    KPath(const char* path);

    const std::filesystem::path& path() const { return filePath; }
    std::string toString() const { return filePath.string(); }

    std::string name() const;
    std::string stem() const;
    std::string suffix() const;
    KPath parent() const;

    KPath operator/(std::string_view child) const;

    AStatusOrElse<bool> exists() const;
    AStatusOrElse<bool> isFile() const;
    AStatusOrElse<bool> isDir() const;

    /**
     * @brief Create the directory.
     * @param mode     Permissions applied to the new directory.
     * @param parents  Create missing parents as well.
     * @param existOk  An existing directory is not an error.
     * @return AlreadyExists when the path exists and @p existOk is false,
     *         NotFound when the parent is missing and @p parents is false.
     */
    Status mkdir(FilesystemMode mode = FilesystemMode::AllRwx, bool parents = false,
                 bool existOk = false) const;

    /// Remove the directory; @p recursive also removes its contents.
    Status rmdir(bool recursive = false) const;

    /**
     * @brief Create an empty file, or refresh the modification time of an existing one.
     * @return AlreadyExists when the path exists and @p existOk is false,
     *         NotFound when the parent directory is missing.
     */
    Status touch(FilesystemMode mode = FilesystemMode::AllRw, bool existOk = true) const;

    AStatusOrElse<std::string> readText() const;
    Status writeText(std::string_view text) const;

    /// Remove a file. A missing file is only an error when @p missingOk is false.
    Status unlink(bool missingOk = false) const;

    /// Directory entries, sorted by path.
    AStatusOrElse<std::vector<KPath>> iterdir() const;

    friend bool operator==(const KPath& lhs, const KPath& rhs) { return lhs.filePath == rhs.filePath; }
    friend bool operator!=(const KPath& lhs, const KPath& rhs) { return !(lhs == rhs); }

private:
    std::filesystem::path filePath;
};

std::ostream& operator<<(std::ostream& os, const KPath& path);

} // namespace kern::fs
