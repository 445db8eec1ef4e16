#include "kern/fs/KPath.hpp"

#include "kern/log/Check.hpp"
#include "kern/status/UseStatus.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace kern::fs {

namespace stdfs = std::filesystem;

namespace {

Status openFailure(std::string_view action, const stdfs::path& path) {
    const int err = errno;
    const std::string context = std::string(action) + " " + path.string();
    if (err != 0) {
        return Status::fromErrorCode(std::error_code(err, std::generic_category()), context);
    }
    return unavailableError(context);
}

} // namespace

bool isValidFilesystemMode(unsigned mode) {
    switch (static_cast<FilesystemMode>(mode)) {
        case FilesystemMode::AllRwx:
        case FilesystemMode::AllRw:
        case FilesystemMode::OwnerRwxOthersRx:
        case FilesystemMode::OnlyOwnerRwx:
        case FilesystemMode::OwnerRwOthersR:
        case FilesystemMode::OnlyOwnerRw:
        case FilesystemMode::AllR:
        case FilesystemMode::OnlyOwnerR:
        case FilesystemMode::OwnerRwxGroupRx:
        case FilesystemMode::OwnerGroupRwx:
            return true;
    }
    return false;
}

KPath::KPath(stdfs::path path)
: filePath(std::move(path)) {}

KPath::KPath(const std::string& path)
: filePath(path) {}

KPath::KPath(const char* path)
: filePath(path ? path : "") {}

std::string KPath::name() const {
    return filePath.filename().string();
}

std::string KPath::stem() const {
    return filePath.stem().string();
}

std::string KPath::suffix() const {
    return filePath.extension().string();
}

KPath KPath::parent() const {
    return KPath(filePath.parent_path());
}

KPath KPath::operator/(std::string_view child) const {
    return KPath(filePath / stdfs::path(std::string(child)));
}

AStatusOrElse<bool> KPath::exists() const {
    return invokeWithStatus([this] { return stdfs::exists(filePath); });
}

AStatusOrElse<bool> KPath::isFile() const {
    return invokeWithStatus([this] { return stdfs::is_regular_file(filePath); });
}

AStatusOrElse<bool> KPath::isDir() const {
    return invokeWithStatus([this] { return stdfs::is_directory(filePath); });
}

Status KPath::mkdir(FilesystemMode mode, bool parents, bool existOk) const {
    KERN_DCHECK(isValidFilesystemMode(static_cast<unsigned>(mode)), "unsupported filesystem mode");

    return invokeWithStatus([&]() -> Status {
        if (stdfs::exists(filePath)) {
            if (existOk && stdfs::is_directory(filePath)) {
                return Status();
            }
            return alreadyExistsError("Directory already exists: " + filePath.string());
        }

        if (parents) {
            stdfs::create_directories(filePath);
        } else {
            // Throws no_such_file_or_directory when the parent is missing.
            stdfs::create_directory(filePath);
        }
        stdfs::permissions(filePath, static_cast<stdfs::perms>(mode), stdfs::perm_options::replace);
        return Status();
    });
}

Status KPath::rmdir(bool recursive) const {
    return invokeWithStatus([&]() -> Status {
        if (!stdfs::exists(filePath)) {
            return notFoundError("Directory not found: " + filePath.string());
        }
        if (!stdfs::is_directory(filePath)) {
            return invalidArgumentError("Not a directory: " + filePath.string());
        }
        if (recursive) {
            stdfs::remove_all(filePath);
        } else {
            stdfs::remove(filePath);
        }
        return Status();
    });
}

Status KPath::touch(FilesystemMode mode, bool existOk) const {
    KERN_DCHECK(isValidFilesystemMode(static_cast<unsigned>(mode)), "unsupported filesystem mode");

    return invokeWithStatus([&]() -> Status {
        if (stdfs::exists(filePath)) {
            if (!existOk) {
                return alreadyExistsError("File already exists: " + filePath.string());
            }
            stdfs::last_write_time(filePath, stdfs::file_time_type::clock::now());
            return Status();
        }

        errno = 0;
        std::ofstream out(filePath, std::ios::out | std::ios::app | std::ios::binary);
        if (!out.is_open()) {
            return openFailure("cannot create", filePath);
        }
        out.close();
        stdfs::permissions(filePath, static_cast<stdfs::perms>(mode), stdfs::perm_options::replace);
        return Status();
    });
}

AStatusOrElse<std::string> KPath::readText() const {
    return invokeWithStatus([this]() -> AStatusOrElse<std::string> {
        if (!stdfs::exists(filePath)) {
            return failure(notFoundError("File not found: " + filePath.string()));
        }
        errno = 0;
        std::ifstream in(filePath, std::ios::in | std::ios::binary);
        if (!in.is_open()) {
            return failure(openFailure("cannot open", filePath));
        }
        in.exceptions(std::ios::badbit);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    });
}

Status KPath::writeText(std::string_view text) const {
    return invokeWithStatus([&]() -> Status {
        errno = 0;
        std::ofstream out(filePath, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out.is_open()) {
            return openFailure("cannot open", filePath);
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.flush();
        if (!out) {
            return dataLossError("short write to " + filePath.string());
        }
        return Status();
    });
}

Status KPath::unlink(bool missingOk) const {
    return invokeWithStatus([&]() -> Status {
        if (!stdfs::exists(filePath)) {
            if (missingOk) {
                return Status();
            }
            return notFoundError("File not found: " + filePath.string());
        }
        if (stdfs::is_directory(filePath)) {
            return invalidArgumentError("Is a directory: " + filePath.string());
        }
        stdfs::remove(filePath);
        return Status();
    });
}

AStatusOrElse<std::vector<KPath>> KPath::iterdir() const {
    return invokeWithStatus([this] {
        std::vector<KPath> entries;
        for (const auto& entry : stdfs::directory_iterator(filePath)) {
            entries.emplace_back(entry.path());
        }
        std::sort(entries.begin(), entries.end(),
                  [](const KPath& a, const KPath& b) { return a.path() < b.path(); });
        return entries;
    });
}

std::ostream& operator<<(std::ostream& os, const KPath& path) {
    return os << path.toString();
}

} // namespace kern::fs
