#pragma once
#include <string>
#include <mutex>

const std::string RED = "\033[31m";
const std::string GREEN = "\033[32m";
const std::string YELLOW = "\033[33m";
const std::string RESET = "\033[0m";

class Logger {
    public:
        static void logStatus(const std::string& message);
        static void logWarning(const std::string& message);
        static void logError(const std::string& heading, const std::string& message);
        static void setQuiet(bool quiet);
    protected:
        static std::string timestamp();
        static std::mutex outputLock;
        static bool quiet;
};
