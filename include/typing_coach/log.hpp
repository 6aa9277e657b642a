#pragma once

#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace tc::core {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error,
};

[[nodiscard]] LogLevel parseLogLevel(const std::string& text);

class Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level);
    [[nodiscard]] LogLevel level() const;
    [[nodiscard]] bool enabled(LogLevel level) const;

    // Redirects output; passing nullptr restores std::cerr.
    void setSink(std::ostream* sink);

    void write(LogLevel level, const char* component, const std::string& message);

private:
    Logger();

    mutable std::mutex mutex_;
    LogLevel level_;
    std::ostream* sink_;
};

namespace detail {

inline void append(std::ostringstream&) {}

template <typename Head, typename... Tail>
void append(std::ostringstream& out, const Head& head, const Tail&... tail) {
    out << head;
    append(out, tail...);
}

}  // namespace detail

template <typename... Parts>
void log(LogLevel level, const char* component, const Parts&... parts) {
    auto& logger = Logger::instance();
    if (!logger.enabled(level)) return;
    std::ostringstream out;
    detail::append(out, parts...);
    logger.write(level, component, out.str());
}

template <typename... Parts>
void logDebug(const char* component, const Parts&... parts) {
    log(LogLevel::Debug, component, parts...);
}

template <typename... Parts>
void logInfo(const char* component, const Parts&... parts) {
    log(LogLevel::Info, component, parts...);
}

template <typename... Parts>
void logWarn(const char* component, const Parts&... parts) {
    log(LogLevel::Warn, component, parts...);
}

template <typename... Parts>
void logError(const char* component, const Parts&... parts) {
    log(LogLevel::Error, component, parts...);
}

}  // namespace tc::core
