#include "Logging.h"
#include <iostream>
#include <chrono>
#include <ctime>
#include <algorithm>
#include <cctype>

namespace lanprobe {

Logger& Logger::instance(){ static Logger inst; return inst; }

const char* Logger::prefix(LogLevel lvl){
    switch(lvl){
        case LogLevel::Error: return "[ERROR] ";
        case LogLevel::Warn: return "[WARN] ";
        case LogLevel::Info: return "[INFO] ";
        case LogLevel::Debug: return "[DEBUG] ";
        case LogLevel::Trace: return "[TRACE] ";
    }
    return "";
}

void Logger::log(LogLevel lvl, const std::string& msg){
    if(static_cast<int>(lvl) > static_cast<int>(level_.load())) return;
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{}; gmtime_r(&now, &tm);
    char ts[32]; std::strftime(ts, sizeof(ts), "%Y-%m-%dT%H:%M:%SZ", &tm);
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << ts << ' ' << prefix(lvl) << msg << '\n';
}

std::optional<LogLevel> parse_log_level(const std::string& name){
    std::string s = name; std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    if(s=="error") return LogLevel::Error;
    if(s=="warn" || s=="warning") return LogLevel::Warn;
    if(s=="info") return LogLevel::Info;
    if(s=="debug") return LogLevel::Debug;
    if(s=="trace") return LogLevel::Trace;
    return std::nullopt;
}

}
