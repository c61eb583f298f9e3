#include "test_common.h"

using namespace filechunker;

static size_t count_containing(const std::string &needle) {
    size_t n = 0;
    for (const auto &entry : Logger::instance().getLogs())
        if (entry.message.find(needle) != std::string::npos) ++n;
    return n;
}

int main() {
    auto &logger = Logger::instance();

    logger.setLevel(LogLevel::LOG_WARNING);
    logger.clearLogs();
    Logger::logInfo("hidden %d", 1);
    Logger::logWarning("shown %d", 2);
    Logger::logError(std::string("shown as string"));
    if (count_containing("hidden") != 0) return fail(64, "info below threshold recorded");
    if (count_containing("shown 2") != 1 || count_containing("shown as string") != 1) return fail(65, "warnings and errors kept");

    // Quiet mode drops per-chunk lines only
    logger.setLevel(LogLevel::LOG_INFO);
    logger.setQuietMode(true);
    logger.clearLogs();
    Logger::logInfo("Wrote chunk %d/%d: x (1 bytes)", 1, 2);
    Logger::logInfo("Successfully created %d chunks", 2);
    logger.setQuietMode(false);
    if (count_containing("Wrote chunk") != 0) return fail(66, "quiet mode");
    if (count_containing("Successfully created") != 1) return fail(67, "summary kept in quiet mode");

    // History keeps only the newest entries
    logger.setLevel(LogLevel::LOG_WARNING);
    logger.clearLogs();
    for (size_t i = 0; i < Logger::kMaxHistory + 50; ++i) Logger::logWarning("entry %zu", i);
    {
        auto history = logger.getLogs();
        if (history.size() != Logger::kMaxHistory) return fail(71, "history not capped: " + std::to_string(history.size()));
        if (history.front().message != "entry 50") return fail(72, "oldest entries dropped first: " + history.front().message);
        if (history.back().message != "entry " + std::to_string(Logger::kMaxHistory + 49)) return fail(73, "newest entry kept");
    }
    logger.clearLogs();

    TempDir dir("logger");
    auto file = dir / "run.log";
    if (!logger.setLogFile(file.string())) return fail(68, "open log file");
    Logger::logWarning("to file %s", "ok");
    logger.closeLogFile();
    auto text = read_file(file);
    std::string content(text.begin(), text.end());
    if (content.find("[WARNING] to file ok") == std::string::npos) return fail(69, "file line: " + content);
    if (logger.setLogFile((dir / "no" / "such" / "dir.log").string())) return fail(70, "unopenable log file");

    std::cout << "[TEST] OK logger" << std::endl;
    return 0;
}
