//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sinks, environment configuration and static member definitions.
//==========================================================================================================

#include "logging/Logger.h"

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return;
    }
    std::time_t nowTime = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm buf{};
    ::localtime_r(&nowTime, &buf);
    sLogFile << "\n=== oidc_token log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
    sLogFile.flush();
}

void Logger::configureFromEnv() {
    const std::string level = GetEnvOrDefault("OIDC_LOG_LEVEL", "");
    if (!level.empty()) {
        setLogLevelFromString(level);
    }
    const std::string file = GetEnvOrDefault("OIDC_LOG_FILE", "");
    if (!file.empty()) {
        setLogFile(file);
    }
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    // Sink selection is read once per process.
    static const bool colorEnabled = GetEnvFlag("OIDC_LOG_COLOR", true);
    static const bool useStderr = GetEnvFlag("OIDC_LOG_STDERR", false);

    std::ostringstream oss;
    if (colorEnabled) {
        const char* reset = "\033[0m";
        const char* labelColor = (::strncmp(level, "ERROR", 5) == 0) ? "\033[38;5;88m" /* burgundy */
                               : (::strncmp(level, "WARN", 4) == 0) ? "\033[33m"      /* yellow */
                                                                     : "\033[35m";    /* purple */
        oss << "[" << labelColor << level << reset << "] ";
    } else {
        oss << "[" << level << "] ";
    }
    oss << file << ":" << line << ": " << msg << '\n';
    const std::string logMessage = oss.str();

    std::lock_guard<std::mutex> lock(sLogMutex);
    std::ostream& console = useStderr ? std::cerr : std::cout;
    console << logMessage;
    console.flush();
    if (sLogFile.is_open()) {
        sLogFile << logMessage;
        sLogFile.flush();
    }
}
