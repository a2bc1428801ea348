#include <iostream>
#include <ctime>
#include "logger.hpp"
using namespace std;

std::mutex Logger::outputLock;
bool Logger::quiet = false;

string Logger::timestamp() {
    std::time_t now = std::time(nullptr);
    char buf[32];
    std::tm tm;
    localtime_r(&now, &tm);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return string(buf);
}

void Logger::setQuiet(bool q) {
    std::lock_guard<std::mutex> lock(outputLock);
    quiet = q;
}

void Logger::logStatus(const string& message) {
    std::lock_guard<std::mutex> lock(outputLock);
    if (quiet) return;
    cout << "[" << timestamp() << "] " << message << endl;
}

void Logger::logWarning(const string& message) {
    std::lock_guard<std::mutex> lock(outputLock);
    if (quiet) return;
    cout << "[" << timestamp() << "] " << YELLOW << "[WARN] " << RESET << message << endl;
}

void Logger::logError(const string& heading, const string& message) {
    std::lock_guard<std::mutex> lock(outputLock);
    cerr << "[" << timestamp() << "] " << heading << " " << message << endl;
}
