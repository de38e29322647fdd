#include "Logging.h"
#include "JsonUtil.h"
#include <iostream>
#include <algorithm>
#include <chrono>

namespace link_scope {

Logger& Logger::instance(){
    static Logger logger;
    return logger;
}

const char* Logger::prefix(LogLevel lvl){
    switch(lvl){
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "?";
}

void Logger::log(LogLevel lvl, const std::string& msg){
    if(static_cast<int>(lvl) > static_cast<int>(level_.load())) return;
    std::string ts = jsonutil::time_to_iso(std::chrono::system_clock::now());
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << ts << " [" << prefix(lvl) << "] " << msg << "\n";
}

bool parse_log_level(const std::string& name, LogLevel& out){
    std::string s = name; std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    if(s=="error") { out = LogLevel::Error; return true; }
    if(s=="warn" || s=="warning") { out = LogLevel::Warn; return true; }
    if(s=="info") { out = LogLevel::Info; return true; }
    if(s=="debug") { out = LogLevel::Debug; return true; }
    if(s=="trace") { out = LogLevel::Trace; return true; }
    return false;
}

}
