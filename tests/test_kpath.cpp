#include "kern/fs/KPath.hpp"
#include "TestSupport.hpp"

#include <filesystem>
#include <sstream>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

using kern::StatusCode;
using kern::fs::FilesystemMode;
using kern::fs::KPath;

namespace {

KPath scratchRoot() {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("kern_test_kpath_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    return KPath(dir);
}

} // namespace

static void testPathParts() {
    const KPath path("/var/data/report.final.csv");
    ASSERT_EQ(path.name(), std::string("report.final.csv"), "name");
    ASSERT_EQ(path.stem(), std::string("report.final"), "stem");
    ASSERT_EQ(path.suffix(), std::string(".csv"), "suffix");
    ASSERT_EQ(path.parent(), KPath("/var/data"), "parent");
    ASSERT_EQ(KPath("/var") / "data", KPath("/var/data"), "join");

    std::ostringstream os;
    os << path;
    ASSERT_EQ(os.str(), std::string("/var/data/report.final.csv"), "stream operator");
}

static void testModes() {
    ASSERT_TRUE(kern::fs::isValidFilesystemMode(0755), "0755 valid");
    ASSERT_TRUE(kern::fs::isValidFilesystemMode(0600), "0600 valid");
    ASSERT_TRUE(!kern::fs::isValidFilesystemMode(0123), "0123 invalid");
}

static void testMkdirAndRmdir() {
    const KPath root = scratchRoot();

    ASSERT_EQ(*root.exists(), false, "scratch root starts absent");
    ASSERT_TRUE(root.mkdir(FilesystemMode::OnlyOwnerRwx).ok(), "mkdir creates the directory");
    ASSERT_EQ(*root.isDir(), true, "created path is a directory");

    struct stat info {};
    ASSERT_EQ(::stat(root.toString().c_str(), &info), 0, "stat the new directory");
    ASSERT_EQ(static_cast<unsigned>(info.st_mode & 0777), 0700u, "mode applied");

    const auto again = root.mkdir();
    ASSERT_EQ(again.code(), StatusCode::AlreadyExists, "existing directory reported");
    ASSERT_CONTAINS(again.message(), "Directory already exists", "already exists message");
    ASSERT_TRUE(root.mkdir(FilesystemMode::AllRwx, false, true).ok(), "existOk tolerates the directory");

    const KPath nested = root / "a" / "b";
    ASSERT_EQ(nested.mkdir().code(), StatusCode::NotFound, "missing parent without parents=true");
    ASSERT_TRUE(nested.mkdir(FilesystemMode::AllRwx, true).ok(), "parents=true creates the chain");

    const KPath a = root / "a";
    ASSERT_EQ(a.rmdir().code(), StatusCode::FailedPrecondition, "non-empty directory needs recursive");
    ASSERT_TRUE(a.rmdir(true).ok(), "recursive rmdir");
    ASSERT_EQ(*a.exists(), false, "tree removed");

    const auto missing = a.rmdir();
    ASSERT_EQ(missing.code(), StatusCode::NotFound, "rmdir of a missing directory");
    ASSERT_CONTAINS(missing.message(), "Directory not found", "not found message");

    ASSERT_TRUE(root.rmdir(true).ok(), "cleanup");
}

static void testFiles() {
    const KPath root = scratchRoot();
    ASSERT_TRUE(root.mkdir().ok(), "scratch root created");

    const KPath file = root / "notes.txt";
    ASSERT_EQ(file.readText().error().code(), StatusCode::NotFound, "reading a missing file");

    ASSERT_TRUE(file.writeText("line one\nline two\n").ok(), "write text");
    ASSERT_EQ(*file.isFile(), true, "file created");
    const auto text = file.readText();
    ASSERT_TRUE(text.has_value(), "read text");
    if (text) {
        ASSERT_EQ(*text, std::string("line one\nline two\n"), "content round trip");
    }

    ASSERT_TRUE(file.writeText("replaced").ok(), "overwrite");
    ASSERT_EQ(*file.readText(), std::string("replaced"), "write truncates");

    ASSERT_EQ(file.rmdir().code(), StatusCode::InvalidArgument, "rmdir on a file");
    ASSERT_EQ(root.unlink().code(), StatusCode::InvalidArgument, "unlink on a directory");

    ASSERT_TRUE(file.unlink().ok(), "unlink file");
    ASSERT_EQ(file.unlink().code(), StatusCode::NotFound, "unlink missing file");
    ASSERT_TRUE(file.unlink(true).ok(), "missingOk tolerates absence");

    ASSERT_TRUE(root.rmdir(true).ok(), "cleanup");
}

static void testTouch() {
    const KPath root = scratchRoot();
    ASSERT_TRUE(root.mkdir().ok(), "scratch root created");

    const KPath file = root / "marker";
    ASSERT_TRUE(file.touch(FilesystemMode::OnlyOwnerRw).ok(), "touch creates the file");
    ASSERT_EQ(*file.isFile(), true, "regular file created");
    ASSERT_EQ(*file.readText(), std::string(), "new file is empty");

    struct stat info {};
    ASSERT_EQ(::stat(file.toString().c_str(), &info), 0, "stat the new file");
    ASSERT_EQ(static_cast<unsigned>(info.st_mode & 0777), 0600u, "mode applied");

    ASSERT_TRUE(file.writeText("keep").ok(), "write content");
    ASSERT_TRUE(file.touch().ok(), "existing file tolerated by default");
    ASSERT_EQ(*file.readText(), std::string("keep"), "touch keeps the content");

    const auto refused = file.touch(FilesystemMode::AllRw, false);
    ASSERT_EQ(refused.code(), StatusCode::AlreadyExists, "existOk=false reports the file");
    ASSERT_CONTAINS(refused.message(), "File already exists", "already exists message");

    ASSERT_EQ((root / "missing" / "marker").touch().code(), StatusCode::NotFound,
              "missing parent directory");

    ASSERT_TRUE(root.rmdir(true).ok(), "cleanup");
}

static void testIterdir() {
    const KPath root = scratchRoot();
    ASSERT_TRUE(root.mkdir().ok(), "scratch root created");
    ASSERT_TRUE((root / "c.txt").writeText("c").ok(), "c");
    ASSERT_TRUE((root / "a.txt").writeText("a").ok(), "a");
    ASSERT_TRUE((root / "b").mkdir().ok(), "b");

    const auto entries = root.iterdir();
    ASSERT_TRUE(entries.has_value(), "iterdir succeeds");
    if (entries && entries->size() == 3) {
        ASSERT_EQ((*entries)[0].name(), std::string("a.txt"), "sorted first");
        ASSERT_EQ((*entries)[1].name(), std::string("b"), "sorted second");
        ASSERT_EQ((*entries)[2].name(), std::string("c.txt"), "sorted third");
    } else {
        ASSERT_TRUE(false, "three entries expected");
    }

    const auto missing = (root / "nope").iterdir();
    ASSERT_TRUE(!missing.has_value(), "iterdir of a missing directory fails");
    if (!missing) {
        ASSERT_EQ(missing.error().code(), StatusCode::NotFound, "translated from filesystem_error");
    }

    ASSERT_TRUE(root.rmdir(true).ok(), "cleanup");
}

int main() {
    testPathParts();
    testModes();
    testMkdirAndRmdir();
    testFiles();
    testTouch();
    testIterdir();
    return kern::test::finish("KPath tests");
}
