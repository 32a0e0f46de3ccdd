#include "log.hpp"

#include <array>
#include <atomic>
#include <ctime>
#include <mutex>

#include <unistd.h>

namespace slog {
namespace {
    std::atomic<Severity>& currentLogLevel()
    {
        static std::atomic<Severity> severity { Severity::Info };
        return severity;
    }

    std::atomic<bool>& colorEnabled()
    {
        static std::atomic<bool> color { false };
        return color;
    }

    std::mutex& writeMutex()
    {
        static std::mutex mutex;
        return mutex;
    }

    std::string currentDateTime()
    {
        const auto t = std::time(nullptr);
        std::tm tm {};
        ::localtime_r(&t, &tm);
        std::array<char, 32> buf;
        const auto n = std::strftime(buf.data(), buf.size(), "%F %T", &tm);
        return std::string(buf.data(), n);
    }
}

void setLogLevel(Severity severity)
{
    currentLogLevel().store(severity);
}

bool isEnabled(Severity severity)
{
    return static_cast<int>(severity) >= static_cast<int>(currentLogLevel().load());
}

void init(Severity severity, bool color)
{
    setLogLevel(severity);
    colorEnabled().store(color && ::isatty(STDERR_FILENO));
}

namespace detail {
    StringStreamBuf::StringStreamBuf(size_t initialSize)
        : str_(initialSize, 0)
    {
        str_.resize(0);
    }

    std::streamsize StringStreamBuf::xsputn(const char* s, std::streamsize n)
    {
        str_.append(s, n);
        return n;
    }

    StringStreamBuf::int_type StringStreamBuf::overflow(int_type ch)
    {
        if (!traits_type::eq_int_type(ch, traits_type::eof())) {
            str_.push_back(traits_type::to_char_type(ch));
        }
        return ch;
    }

    void StringStreamBuf::clear()
    {
        str_.clear();
    }

    std::string& StringStreamBuf::string()
    {
        return str_;
    }

    std::string_view severityPrefix(Severity severity)
    {
        static constexpr std::array plain { "[DEBUG] ", "[INFO] ", "[WARNING] ", "[ERROR] ",
            "[FATAL] " };
        static constexpr std::array colored { "[\x1b[2mDEBUG\x1b[0m] ", "[\x1b[32mINFO\x1b[0m] ",
            "[\x1b[33mWARNING\x1b[0m] ", "[\x1b[31mERROR\x1b[0m] ", "[\x1b[1;31mFATAL\x1b[0m] " };
        const auto idx = static_cast<size_t>(severity);
        if (idx >= plain.size()) {
            return "[INVALID] ";
        }
        return colorEnabled().load() ? colored[idx] : plain[idx];
    }

    void writeLine(const std::string& line)
    {
        const auto stamped = "[" + currentDateTime() + "] " + line;
        std::lock_guard<std::mutex> lock(writeMutex());
        size_t written = 0;
        while (written < stamped.size()) {
            const auto n = ::write(STDERR_FILENO, stamped.data() + written, stamped.size() - written);
            if (n <= 0) {
                // Nowhere left to report this
                return;
            }
            written += static_cast<size_t>(n);
        }
    }
}
}
