#pragma once

#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>

namespace qtop {

enum class LogLevel : std::uint8_t { kInfo = 1, kWarn = 2, kError = 3 };

// Operator-facing logger. Info lines are printed verbatim (they are the
// verifier's user-visible output); warnings and errors carry a prefix.
class Logger {
   public:
    explicit Logger(std::ostream& os = std::cout, LogLevel min_level = LogLevel::kInfo) : os_(os), min_(min_level) {}

    void log(LogLevel lvl, const std::string& msg) {
        if (static_cast<std::uint8_t>(lvl) < static_cast<std::uint8_t>(min_)) return;
        std::lock_guard<std::mutex> g(mu_);
        os_ << prefix(lvl) << msg << "\n";
        os_.flush();
    }

    void info(const std::string& msg) { log(LogLevel::kInfo, msg); }
    void warn(const std::string& msg) { log(LogLevel::kWarn, msg); }
    void error(const std::string& msg) { log(LogLevel::kError, msg); }

   private:
    static const char* prefix(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::kWarn:
                return "WARN: ";
            case LogLevel::kError:
                return "ERROR: ";
            default:
                return "";
        }
    }

    std::mutex mu_;
    std::ostream& os_;
    LogLevel min_;
};

}  // namespace qtop
