#include "kern/kern.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

using namespace kern;

namespace {

// Exception-based arithmetic standing in for a third-party routine.
float legacyDivide(int a, int b) {
    if (b == 0) {
        throw ZeroDivisionError("Division by zero!");
    }
    return static_cast<float>(a) / static_cast<float>(b);
}

AStatusOrElse<float> divide(int a, int b) {
    if (b == 0) {
        return failure(zeroDivisionError("Division by zero!"));
    }
    return static_cast<float>(a) / static_cast<float>(b);
}

void report(const char* label, const StatusOr<float>& result) {
    if (result.ok()) {
        log::logInfof(label, " = ", result.val());
    } else {
        log::logWarningf(label, " failed: ", result.status());
    }
}

Status probeScratchDirectory() {
    const fs::KPath scratch = fs::KPath(std::filesystem::temp_directory_path()) / "kern_demo";

    Status status = scratch.mkdir(fs::FilesystemMode::OwnerRwxOthersRx, true, true);
    if (!status.ok()) {
        return status;
    }
    status = (scratch / "hello.txt").writeText("hello from kern\n");
    if (!status.ok()) {
        return status;
    }

    const auto entries = scratch.iterdir();
    if (!entries) {
        return entries.error();
    }
    for (const auto& entry : *entries) {
        KERN_LOG_INFO("  ", entry.name());
    }

    // Removing a non-empty directory without recursion is refused.
    const Status refused = scratch.rmdir();
    log::logInfof("non-recursive rmdir: ", refused);

    return scratch.rmdir(true);
}

} // namespace

int main(int argc, char** argv) {
    const std::string logDir = argc > 1 ? argv[1] : std::string();
    const Status logStatus = log::initLogging(
        "kern_demo", logDir.empty() ? std::nullopt : std::optional<std::string>(logDir));
    if (!logStatus.ok()) {
        std::cerr << "logging unavailable: " << logStatus << '\n';
        return 1;
    }

    // Native AStatusOrElse contract.
    report("divide(6, 3)", divide(6, 3));
    report("divide(5, 0)", divide(5, 0));

    // The same operation adapted from exception-raising code.
    auto safeDivide = useStatus(legacyDivide);
    report("safeDivide(6, 3)", safeDivide(6, 3));
    report("safeDivide(5, 0)", safeDivide(5, 0));

    auto safeStoi = useStatus([](const std::string& text) { return std::stoi(text); });
    const StatusOr<int> parsed = safeStoi("forty-two");
    if (!parsed.ok()) {
        log::logWarningf("stoi: ", parsed.status());
    }

    const Status probe = probeScratchDirectory();
    if (!probe.ok()) {
        log::logErrorf("filesystem probe failed: ", probe);
        log::shutdownLogging();
        return 1;
    }

    log::logInfo("done");
    log::shutdownLogging();
    return 0;
}
