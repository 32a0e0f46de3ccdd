#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace slog {
enum class Severity { Debug, Info, Warning, Error, Fatal };

// Colors are only used if stderr is a terminal
void init(Severity severity = Severity::Info, bool color = true);
void setLogLevel(Severity severity);
bool isEnabled(Severity severity);

namespace detail {
    // We use a custom string buf, so we can preallocate and clear to reuse the same buffer
    class StringStreamBuf : public std::streambuf {
    public:
        StringStreamBuf(size_t initialSize);

        std::streamsize xsputn(const char* s, std::streamsize n) override;
        int_type overflow(int_type ch) override;

        void clear();
        std::string& string();

    private:
        std::string str_;
    };

    std::string_view severityPrefix(Severity severity);

    void writeLine(const std::string& line);

    // Thread-safe. Calculations are pure and may be run from several threads by a caller.
    template <typename... Args>
    void log(Severity severity, Args&&... args)
    {
        if (!isEnabled(severity)) {
            return;
        }
        thread_local StringStreamBuf buf(1024);
        thread_local std::ostream os(&buf);
        buf.clear();
        (os << severityPrefix(severity) << ... << args) << "\n";
        writeLine(buf.string());
    }
}

template <typename... Args>
void debug(Args&&... args)
{
    detail::log(Severity::Debug, std::forward<Args>(args)...);
}

template <typename... Args>
void info(Args&&... args)
{
    detail::log(Severity::Info, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(Args&&... args)
{
    detail::log(Severity::Warning, std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args)
{
    detail::log(Severity::Error, std::forward<Args>(args)...);
}

template <typename... Args>
void fatal(Args&&... args)
{
    detail::log(Severity::Fatal, std::forward<Args>(args)...);
}
}
