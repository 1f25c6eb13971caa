#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

using namespace std;

namespace logging
{
    enum class LogLevel
    {
        ERROR = 0,   // Most important - always show
        WARNING = 1, // Important - usually show
        INFO = 2,    // Normal - sometimes show
        DEBUG = 3    // Least important - rarely show
    };

    // Global settings (shared by every translation unit)
    inline LogLevel globalLogLevel = LogLevel::INFO;
    inline bool showTimestamp = false;
    inline bool enableFileLogging = false;
    inline string logFilePath = "logs/openarchery.log";
    inline uintmax_t maxLogFileBytes = 10 * 1024 * 1024; // rotate at 10 MB
    inline int logBackupCount = 3;                        // openarchery.log.1 .. .3
    inline mutex logMutex;

    // Set the global log level
    inline void setLogLevel(LogLevel level)
    {
        globalLogLevel = level;
    }

    // Enable/disable console timestamps
    inline void setShowTimestamp(bool show)
    {
        showTimestamp = show;
    }

    // Parse a level name as used in config files ("error", "warning", "info", "debug")
    inline bool parseLogLevel(const string &name, LogLevel &level)
    {
        string lower = name;
        transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c)
                  { return static_cast<char>(std::tolower(c)); });

        if (lower == "error")
            level = LogLevel::ERROR;
        else if (lower == "warning" || lower == "warn")
            level = LogLevel::WARNING;
        else if (lower == "info")
            level = LogLevel::INFO;
        else if (lower == "debug")
            level = LogLevel::DEBUG;
        else
            return false;
        return true;
    }

    // Enable/disable file logging
    inline void setFileLogging(bool enable, const string &filepath = "logs/openarchery.log",
                               uintmax_t maxBytes = 10 * 1024 * 1024, int backups = 3)
    {
        lock_guard<mutex> lock(logMutex);
        enableFileLogging = enable;
        logFilePath = filepath;
        maxLogFileBytes = maxBytes;
        logBackupCount = backups;

        if (enable)
        {
            error_code ec;
            filesystem::path parent = filesystem::path(logFilePath).parent_path();
            if (!parent.empty())
                filesystem::create_directories(parent, ec);

            ofstream logFile(logFilePath, ios::app);
            if (logFile.is_open())
            {
                logFile << "\n========== OpenArchery Session Started ==========\n";
            }
            else
            {
                cerr << "Cannot open log file " << logFilePath << ", file logging disabled" << endl;
                enableFileLogging = false;
            }
        }
    }

    // Get current timestamp as string
    inline string getCurrentTimestamp()
    {
        auto now = chrono::system_clock::now();
        auto time_t = chrono::system_clock::to_time_t(now);
        auto ms = chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()) % 1000;

        tm local{};
        localtime_r(&time_t, &local);

        stringstream ss;
        ss << put_time(&local, "%Y-%m-%d %H:%M:%S");
        ss << '.' << setfill('0') << setw(3) << ms.count();
        return ss.str();
    }

    // Convert log level to string
    inline string logLevelToString(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::WARNING:
            return "WARN";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::DEBUG:
            return "DEBUG";
        default:
            return "UNKNOWN";
        }
    }

// Helper macros to highlight values in log messages (cyan)
#define log_string(value) ("\033[36m" + std::to_string(value) + "\033[0m")
#define log_string_src(value) ("\033[36m" + std::string(value) + "\033[0m")

    // Extract module name from function signature
    // "void SessionManager::stopDetection()" -> "SESSIONMANAGER"
    inline string extractModuleName(const string &function)
    {
        if (function.find("logging::") != string::npos ||
            function.find("extractModuleName") != string::npos)
        {
            return "SYSTEM";
        }

        size_t parenPos = function.find('(');
        string signature = (parenPos != string::npos) ? function.substr(0, parenPos) : function;

        size_t colonPos = signature.rfind("::");
        if (colonPos != string::npos)
        {
            // Qualifier directly in front of the function name
            size_t startPos = signature.rfind("::", colonPos == 0 ? 0 : colonPos - 1);
            startPos = (startPos == string::npos) ? 0 : startPos + 2;

            size_t spacePos = signature.rfind(' ', colonPos);
            if (spacePos != string::npos && spacePos + 1 > startPos)
            {
                startPos = spacePos + 1;
            }

            string moduleName = signature.substr(startPos, colonPos - startPos);
            transform(moduleName.begin(), moduleName.end(), moduleName.begin(), [](unsigned char c)
                      { return static_cast<char>(std::toupper(c)); });
            return moduleName.empty() ? "SYSTEM" : moduleName;
        }

        return "SYSTEM";
    }

    // Strip ANSI color codes (for file logging)
    inline string stripColorCodes(const string &text)
    {
        string result = text;
        size_t pos = 0;

        while ((pos = result.find("\033[", pos)) != string::npos)
        {
            size_t endPos = result.find('m', pos);
            if (endPos != string::npos)
            {
                result.erase(pos, endPos - pos + 1);
            }
            else
            {
                break; // Malformed escape sequence
            }
        }

        return result;
    }

    // Rotate openarchery.log -> openarchery.log.1 -> ... once it exceeds the size limit
    // Caller must hold logMutex
    inline void rotateLogFileIfNeeded()
    {
        error_code ec;
        uintmax_t size = filesystem::file_size(logFilePath, ec);
        if (ec || size < maxLogFileBytes)
            return;

        for (int i = logBackupCount - 1; i >= 1; i--)
        {
            string from = logFilePath + "." + to_string(i);
            string to = logFilePath + "." + to_string(i + 1);
            if (filesystem::exists(from, ec))
                filesystem::rename(from, to, ec);
        }

        if (logBackupCount > 0)
            filesystem::rename(logFilePath, logFilePath + ".1", ec);
        else
            filesystem::remove(logFilePath, ec);
    }

    // Main logging function
    inline void log(const string &message, LogLevel level = LogLevel::INFO, const string &moduleName = "SYSTEM")
    {
        if (level > globalLogLevel)
            return;

        string timestamp = getCurrentTimestamp();
        string levelStr = logLevelToString(level);

        string timestampColor = "\033[32m"; // Green for timestamp
        string bracketColor = "\033[37m";   // White for brackets
        string moduleColor = "\033[90m";    // Gray for module name
        string levelColor = "";
        string resetCode = "\033[0m";

        switch (level)
        {
        case LogLevel::ERROR:
            levelColor = "\033[91m"; // Bright red
            break;
        case LogLevel::WARNING:
            levelColor = "\033[33m"; // Orange
            break;
        case LogLevel::INFO:
            levelColor = "\033[92m"; // Lime green
            break;
        case LogLevel::DEBUG:
            levelColor = "\033[34m"; // Blue
            break;
        }

        string consoleMessage = "";

        if (showTimestamp)
        {
            consoleMessage += bracketColor + "[" + timestampColor + timestamp + bracketColor + "]" + resetCode;
        }

        consoleMessage += bracketColor + "[" + levelColor + levelStr + bracketColor + "]";
        consoleMessage += bracketColor + "[" + moduleColor + moduleName + bracketColor + "]" + resetCode;
        consoleMessage += " - " + message;

        lock_guard<mutex> lock(logMutex);
        cout << consoleMessage << endl;

        // File logging (always with timestamp, NO colors)
        if (enableFileLogging)
        {
            rotateLogFileIfNeeded();

            ofstream logFile(logFilePath, ios::app);
            if (logFile.is_open())
            {
                logFile << "[" << timestamp << "][" << levelStr << "][" << moduleName << "] - " << stripColorCodes(message) << endl;
            }
        }
    }

    inline void error(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::ERROR, module);
    }

    inline void warning(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::WARNING, module);
    }

    inline void info(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::INFO, module);
    }

    inline void debug(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::DEBUG, module);
    }

// Macros that auto-detect the module name
#define LOG_ERROR(message) logging::log(message, logging::LogLevel::ERROR, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_WARNING(message) logging::log(message, logging::LogLevel::WARNING, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_INFO(message) logging::log(message, logging::LogLevel::INFO, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_DEBUG(message) logging::log(message, logging::LogLevel::DEBUG, logging::extractModuleName(__PRETTY_FUNCTION__))

#define log_error(message) LOG_ERROR(message)
#define log_warning(message) LOG_WARNING(message)
#define log_info(message) LOG_INFO(message)
#define log_debug(message) LOG_DEBUG(message)

}
