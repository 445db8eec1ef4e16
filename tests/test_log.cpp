#include "kern/log/Log.hpp"
#include "kern/log/LogConfig.hpp"
#include "kern/log/LogFormatter.hpp"
#include "kern/log/LogSinks.hpp"
#include "kern/fs/KPath.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <unistd.h>

using kern::log::LogRecord;
using kern::log::LogSeverity;

namespace {

struct CapturedRecord {
    LogSeverity severity;
    std::string message;
    std::string file;
    int line;
};

// Collects records in memory; the returned vector stays valid after the sink is replaced.
std::shared_ptr<std::vector<CapturedRecord>> captureInto(kern::log::LogSink& sink) {
    auto records = std::make_shared<std::vector<CapturedRecord>>();
    auto guard = std::make_shared<std::mutex>();
    sink = [records, guard](const LogRecord& record) {
        std::lock_guard lock(*guard);
        records->push_back(CapturedRecord{record.severity, std::string(record.message),
                                          record.location.file ? record.location.file : "",
                                          record.location.line});
    };
    return records;
}

std::filesystem::path scratchDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("kern_test_log_" + std::to_string(::getpid()) + "_" + name);
    std::filesystem::remove_all(dir);
    return dir;
}

struct EarlyRecord {
    bool delivered = false;
    std::string message;
};

EarlyRecord& earlyRecord() {
    static EarlyRecord record;
    return record;
}

// Runs during static initialization, in no particular order relative to Log.cpp.
const bool g_loggedDuringStaticInit = [] {
    kern::log::setLogSink([](const LogRecord& record) {
        earlyRecord().delivered = true;
        earlyRecord().message = std::string(record.message);
    });
    kern::log::logInfo("from a static initializer");
    kern::log::resetLogSink();
    return true;
}();

} // namespace

static void testStaticInitLogging() {
    ASSERT_TRUE(g_loggedDuringStaticInit, "initializer ran");
    ASSERT_TRUE(earlyRecord().delivered, "record emitted before main reached the sink");
    ASSERT_EQ(earlyRecord().message, std::string("from a static initializer"), "early message kept");
}

static void testSinkReceivesRecords() {
    kern::log::LogSink sink;
    auto records = captureInto(sink);
    kern::log::setLogSink(sink);

    kern::log::logInfo("plain info");
    kern::log::logWarningf("value=", 12, " unit=", "ms");
    KERN_LOG_ERROR("code ", 7);
    kern::log::resetLogSink();

    ASSERT_EQ(records->size(), std::size_t(3), "three records captured");
    if (records->size() == 3) {
        ASSERT_EQ((*records)[0].severity, LogSeverity::Info, "info severity");
        ASSERT_EQ((*records)[0].message, std::string("plain info"), "info message");
        ASSERT_EQ((*records)[1].severity, LogSeverity::Warning, "warning severity");
        ASSERT_EQ((*records)[1].message, std::string("value=12 unit=ms"), "arguments concatenated");
        ASSERT_EQ((*records)[2].severity, LogSeverity::Error, "error severity");
        ASSERT_CONTAINS((*records)[2].file, "test_log.cpp", "macro records the file");
        ASSERT_TRUE((*records)[2].line > 0, "macro records the line");
    }

    kern::log::logInfo("after reset");
    ASSERT_EQ(records->size(), std::size_t(3), "reset sink no longer receives records");
}

static void testMinSeverity() {
    kern::log::LogSink sink;
    auto records = captureInto(sink);
    kern::log::setLogSink(sink);

    {
        kern::log::LogConfig::ScopedOverride quiet(LogSeverity::Warning);
        ASSERT_TRUE(kern::log::LogConfig::minSeverity() == LogSeverity::Warning, "override applied");
        kern::log::logInfo("dropped");
        kern::log::logWarning("kept");
    }
    {
        kern::log::LogConfig::ScopedOverride silent(LogSeverity::Fatal);
        kern::log::logError("dropped too");
        kern::log::emit(LogSeverity::Fatal, "fatal always passes");
    }
    kern::log::logInfo("back to normal");
    kern::log::resetLogSink();

    ASSERT_TRUE(kern::log::LogConfig::minSeverity() == LogSeverity::Info, "override restored");
    ASSERT_EQ(records->size(), std::size_t(3), "filtered records dropped");
    if (records->size() == 3) {
        ASSERT_EQ((*records)[0].message, std::string("kept"), "warning passes");
        ASSERT_EQ((*records)[1].severity, LogSeverity::Fatal, "fatal passes");
        ASSERT_EQ((*records)[2].message, std::string("back to normal"), "info passes again");
    }
}

static void testSeverityNames() {
    ASSERT_EQ(kern::log::toString(LogSeverity::Info), std::string_view("INFO"), "info");
    ASSERT_EQ(kern::log::toString(LogSeverity::Fatal), std::string_view("FATAL"), "fatal");
    ASSERT_EQ(kern::log::severityLetter(LogSeverity::Warning), 'W', "warning letter");
    ASSERT_EQ(kern::log::severityLetter(LogSeverity::Error), 'E', "error letter");
}

static void testFormatter() {
    std::tm parts{};
    parts.tm_year = 2024 - 1900;
    parts.tm_mon = 2;
    parts.tm_mday = 5;
    parts.tm_hour = 7;
    parts.tm_min = 8;
    parts.tm_sec = 9;
    parts.tm_isdst = -1;
    const auto timestamp = std::chrono::system_clock::from_time_t(std::mktime(&parts)) +
                           std::chrono::microseconds(123);

    const LogRecord record{LogSeverity::Info, "hello",
                           kern::log::SourceLocation{"/src/app/main.cpp", 42, "main"}, timestamp};

    const kern::log::LogFormatter glogStyle;
    ASSERT_EQ(glogStyle.format(record), std::string("I20240305 07:08:09.000123 [main.cpp:42] hello"),
              "default glog-style prefix");

    const kern::log::LogFormatter custom("[%severity%] %L|%q ");
    const LogRecord warning{LogSeverity::Warning, "careful", record.location, timestamp};
    ASSERT_EQ(custom.format(warning), std::string("[W] 42|%q careful"), "custom pattern, unknown token kept");

    const LogRecord anonymous{LogSeverity::Info, "hello", kern::log::SourceLocation{}, timestamp};
    ASSERT_EQ(glogStyle.format(anonymous), std::string("I20240305 07:08:09.000123 hello"),
              "no location group without a call site");
    const kern::log::LogFormatter tagged("[%severity%] [%F:%L] ");
    ASSERT_EQ(tagged.format(anonymous), std::string("[I] hello"), "only the location group is dropped");
    ASSERT_EQ(tagged.format(record), std::string("[I] [main.cpp:42] hello"), "location group kept with a call site");

    const kern::log::LogFormatter bare("");
    ASSERT_EQ(bare.format(record), std::string("hello"), "empty pattern leaves only the message");
}

static void testFatalLogTerminates() {
    const auto outcome = kern::test::runInChild([] {
        KERN_LOG_FATAL("disk ", 3, " vanished");
    });
    ASSERT_TRUE(outcome.aborted, "KERN_LOG_FATAL aborts");
    ASSERT_EQ(outcome.records.size(), std::size_t(1), "exactly one record");
    ASSERT_EQ(outcome.countSeverity("FATAL"), std::size_t(1), "record is fatal");
    if (!outcome.records.empty()) {
        ASSERT_CONTAINS(outcome.records.front(), "FATAL|disk 3 vanished|", "message reported");
        ASSERT_CONTAINS(outcome.records.front(), "test_log.cpp:", "call site reported");
    }

    const auto viaFunction = kern::test::runInChild([] {
        kern::log::LogConfig::setMinSeverity(LogSeverity::Fatal);
        kern::log::logFatalf("code=", 9);
    });
    ASSERT_TRUE(viaFunction.aborted, "logFatalf aborts");
    ASSERT_EQ(viaFunction.countSeverity("FATAL"), std::size_t(1), "fatal record delivered under any threshold");
}

static void testDebugLogging() {
    kern::log::LogSink sink;
    auto records = captureInto(sink);
    kern::log::setLogSink(sink);

    int evaluations = 0;
    KERN_DLOG_INFO("info ", ++evaluations);
    KERN_DLOG_WARNING("warning ", ++evaluations);
    KERN_DLOG_ERROR("error ", ++evaluations);
    kern::log::resetLogSink();

#ifdef NDEBUG
    ASSERT_EQ(records->size(), std::size_t(0), "debug logging compiled out");
    ASSERT_EQ(evaluations, 0, "arguments not evaluated");
#else
    ASSERT_EQ(records->size(), std::size_t(3), "debug logging active");
    ASSERT_EQ(evaluations, 3, "arguments evaluated once each");
    if (records->size() == 3) {
        ASSERT_EQ((*records)[1].severity, LogSeverity::Warning, "severity kept");
        ASSERT_EQ((*records)[2].message, std::string("error 3"), "message built");
        ASSERT_CONTAINS((*records)[0].file, "test_log.cpp", "call site captured");
    }
#endif
}

static void testFileSink() {
    const auto dir = scratchDir("file");
    std::filesystem::create_directories(dir);
    const auto path = (dir / "sink.log").string();

    auto fileSink = kern::log::makeFileSink(path);
    ASSERT_TRUE(fileSink.ok(), "file sink opens");
    if (fileSink.ok()) {
        kern::log::setLogSink(fileSink.val());
        kern::log::logInfo("to the file");
        kern::log::logError("also to the file");
        kern::log::resetLogSink();

        const auto text = kern::fs::KPath(path).readText();
        ASSERT_TRUE(text.has_value(), "log file readable");
        if (text) {
            ASSERT_CONTAINS(*text, "[INFO] to the file\n", "info line written");
            ASSERT_CONTAINS(*text, "[ERROR] also to the file\n", "error line written");
        }
    }

    const auto onDirectory = kern::log::makeFileSink(dir.string());
    ASSERT_TRUE(!onDirectory.ok(), "directory is not a log file");

    std::filesystem::remove_all(dir);
}

static void testTee() {
    kern::log::LogSink first;
    kern::log::LogSink second;
    auto firstRecords = captureInto(first);
    auto secondRecords = captureInto(second);

    kern::log::setLogSink(kern::log::teeSinks(first, second));
    kern::log::logWarning("both");
    kern::log::resetLogSink();

    ASSERT_EQ(firstRecords->size(), std::size_t(1), "first sink fed");
    ASSERT_EQ(secondRecords->size(), std::size_t(1), "second sink fed");
}

static void testInitLogging() {
    const auto rejected = kern::log::initLogging("");
    ASSERT_EQ(rejected.code(), kern::StatusCode::InvalidArgument, "empty program name rejected");

    const auto dir = scratchDir("init");
    const auto status = kern::log::initLogging("kern_test", dir.string());
    ASSERT_TRUE(status.ok(), "initLogging succeeds: " + status.toString());
    ASSERT_TRUE(std::filesystem::is_directory(dir), "log directory created");

    kern::log::logInfo("initialised");

    const auto otherDir = scratchDir("init_again");
    ASSERT_TRUE(kern::log::initLogging("other", otherDir.string()).ok(), "second call is OK");
    ASSERT_TRUE(!std::filesystem::exists(otherDir), "second call does nothing");

    kern::log::shutdownLogging();

    const auto text = kern::fs::KPath((dir / "kern_test.log").string()).readText();
    ASSERT_TRUE(text.has_value(), "program log file exists");
    if (text) {
        ASSERT_CONTAINS(*text, "[INFO] initialised", "record appended to the program log");
    }

    std::filesystem::remove_all(dir);
}

int main() {
    testStaticInitLogging();
    testSinkReceivesRecords();
    testMinSeverity();
    testSeverityNames();
    testFormatter();
    testFatalLogTerminates();
    testDebugLogging();
    testFileSink();
    testTee();
    testInitLogging();
    return kern::test::finish("Log tests");
}
