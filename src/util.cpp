#include "util.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>

#include <sys/stat.h>

#include "log.hpp"

std::optional<std::string> getEnv(const std::string& name)
{
    const auto val = ::getenv(name.c_str());
    if (!val) {
        return std::nullopt;
    }
    return std::string(val);
}

std::optional<std::string> readFile(const std::string& path)
{
    auto f = std::unique_ptr<FILE, decltype(&std::fclose)>(
        std::fopen(path.c_str(), "rb"), &std::fclose);
    if (!f) {
        slog::error("Could not open file: '", path, "'");
        return std::nullopt;
    }

    const auto fd = ::fileno(f.get());
    if (fd == -1) {
        slog::error("Could not retrieve file descriptor for file: '", path, "'");
        return std::nullopt;
    }

    struct ::stat st;
    if (::fstat(fd, &st)) {
        slog::error("Could not stat file: '", path, "'");
        return std::nullopt;
    }

    // fopen-ing a directory in read-only mode will not fail and report a bogus size
    if (!S_ISREG(st.st_mode)) {
        slog::error("'", path, "' is not a regular file");
        return std::nullopt;
    }

    if (std::fseek(f.get(), 0, SEEK_END) != 0) {
        slog::error("Error seeking to end of file: '", path, "'");
        return std::nullopt;
    }
    const auto size = std::ftell(f.get());
    if (size < 0) {
        slog::error("Error getting size of file: '", path, "'");
        return std::nullopt;
    }
    if (std::fseek(f.get(), 0, SEEK_SET) != 0) {
        slog::error("Error seeking to start of file: '", path, "'");
        return std::nullopt;
    }
    std::string buf(size, '\0');
    if (std::fread(buf.data(), 1, size, f.get()) != static_cast<size_t>(size)) {
        slog::error("Error reading file: '", path, "'");
        return std::nullopt;
    }
    return buf;
}
