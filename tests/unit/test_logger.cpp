#include "Logger.h"
#include "LoggerMacros.h"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace PeerBeam;

namespace {

std::vector<std::string> readLines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

bool contains(const std::vector<std::string>& lines, const std::string& needle) {
    for (const auto& line : lines) {
        if (line.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

void test_singleton() {
    std::cout << "Running test_singleton..." << std::endl;
    Logger& logger1 = Logger::instance();
    Logger& logger2 = Logger::instance();
    assert(&logger1 == &logger2);
    std::cout << "test_singleton passed." << std::endl;
}

void test_parse_level() {
    std::cout << "Running test_parse_level..." << std::endl;
    LogLevel level = LogLevel::INFO;
    assert(Logger::parseLevel("debug", level) && level == LogLevel::DEBUG);
    assert(Logger::parseLevel("WARN", level) && level == LogLevel::WARN);
    assert(Logger::parseLevel("Error", level) && level == LogLevel::ERROR);
    assert(Logger::parseLevel("critical", level) && level == LogLevel::CRITICAL);
    assert(!Logger::parseLevel("verbose", level));
    assert(level == LogLevel::CRITICAL);
    std::cout << "test_parse_level passed." << std::endl;
}

void test_file_logging() {
    std::cout << "Running test_file_logging..." << std::endl;
    std::string logFile = "test_peerbeam_log.txt";
    std::filesystem::remove(logFile);

    Logger& logger = Logger::instance();
    logger.setConsoleOutput(false);
    logger.setLogFile(logFile);
    logger.setLevel(LogLevel::DEBUG);

    logger.info("Test info message", "TransferSender");
    logger.error("Test error message");

    auto lines = readLines(logFile);
    assert(contains(lines, "[INFO] [TransferSender] Test info message"));
    assert(contains(lines, "[ERROR] [PeerBeam] Test error message"));

    logger.setLogFile("");
    std::filesystem::remove(logFile);
    std::cout << "test_file_logging passed." << std::endl;
}

void test_level_filtering() {
    std::cout << "Running test_level_filtering..." << std::endl;
    std::string logFile = "test_peerbeam_filter.txt";
    std::filesystem::remove(logFile);

    Logger& logger = Logger::instance();
    logger.setConsoleOutput(false);
    logger.setLogFile(logFile);
    logger.setLevel(LogLevel::WARN);
    assert(!logger.isDebugEnabled());
    assert(!logger.isInfoEnabled());

    int evaluated = 0;
    auto expensive = [&evaluated]() {
        ++evaluated;
        return std::string("expensive debug detail");
    };
    LOG_DEBUG_COMP_IF(expensive(), "ChunkCodec");
    LOG_INFO_COMP_IF(expensive(), "ChunkCodec");
    assert(evaluated == 0);

    LOG_WARN_COMP("dropped stray frame", "TransferReceiver");
    logger.debug("hidden debug line");

    auto lines = readLines(logFile);
    assert(contains(lines, "[WARN] [TransferReceiver] dropped stray frame"));
    assert(!contains(lines, "hidden debug line"));
    assert(!contains(lines, "expensive debug detail"));

    logger.setLogFile("");
    logger.setLevel(LogLevel::INFO);
    std::filesystem::remove(logFile);
    std::cout << "test_level_filtering passed." << std::endl;
}

void test_rotation() {
    std::cout << "Running test_rotation..." << std::endl;
    std::filesystem::path dir = "test_peerbeam_rotation";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    std::string logFile = (dir / "rotating.log").string();

    Logger& logger = Logger::instance();
    logger.setConsoleOutput(false);
    logger.setMaxFileSize(1);
    logger.setLogFile(logFile);
    logger.setLevel(LogLevel::INFO);

    std::string payload(4096, 'x');
    for (int i = 0; i < 300; ++i) {
        logger.info(payload, "Rotation");
    }

    size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        (void)entry;
        ++files;
    }
    assert(files >= 2);

    logger.setLogFile("");
    logger.setMaxFileSize(100);
    logger.setConsoleOutput(true);
    std::filesystem::remove_all(dir);
    std::cout << "test_rotation passed." << std::endl;
}

int main() {
    try {
        test_singleton();
        test_parse_level();
        test_file_logging();
        test_level_filtering();
        test_rotation();
        std::cout << "All Logger tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
