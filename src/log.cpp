// log.cpp

#include "log.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cinttypes>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

using namespace sof;

namespace
{
    using write_func_ptr = void(*)(const log::content&, log::loc);

    constexpr const char error_message[] = "<log error>";

    constexpr const std::array<const char*, 5> levels =
    {
        "debug",
        "info",
        "success",
        "warn",
        "error"
    };

    std::mutex _logmtx;
    std::ofstream _stream;
    std::ostream* _current = nullptr;

    class timestamp
    {
        char buff[64];

    public:
        timestamp()
        {
            using namespace std::chrono;
            system_clock::time_point stp(system_clock::now());
            microseconds us = duration_cast<microseconds>(stp.time_since_epoch());
            std::tm tm;
            std::time_t time = duration_cast<seconds>(us).count();
            localtime_r(&time, &tm);
            size_t tm_sz = std::strftime(buff, sizeof(buff), "%T", &tm);
            if (!tm_sz)
            {
                *buff = 0;
                return;
            }
            int written = snprintf(buff + tm_sz, sizeof(buff) - tm_sz, ".%06" PRId64,
                static_cast<int64_t>(us.count() % microseconds::period::den));
            if (written < 0 || static_cast<unsigned>(written) >= sizeof(buff) - tm_sz)
                *buff = 0;
        }

        explicit operator bool() const
        {
            return *buff;
        }

        friend std::ostream& operator<<(std::ostream& os, const timestamp& ts)
        {
            return os << ts.buff;
        }
    };

    std::ostream& operator<<(std::ostream& os, log::loc at)
    {
        std::ios::fmtflags flags(os.flags());
        os << at.file << ":" << std::left << std::setw(3) << at.line;
        os.flags(flags);
        return os;
    }

    void write_single(std::ostream& os, log::level lvl, const log::content& cnt, log::loc at)
    {
        timestamp ts;
        if (ts && cnt && at)
            os << ts << ": " << at << " " << levels[lvl] << ": " << cnt.msg << "\n";
        else
            os << error_message << "\n";
    }

    template<log::level lvl, bool to_file, bool duplicate>
    void write_impl(const log::content& cnt, log::loc at)
    {
        static_assert(to_file || !duplicate,
            "If not writing to file, cannot duplicate to stderr");

        if constexpr (to_file && duplicate)
        {
            std::ostringstream oss;
            write_single(oss, lvl, cnt, at);
            _stream << oss.str();
            std::cerr << oss.str();
        }
        else if constexpr (to_file)
            write_single(_stream, lvl, cnt, at);
        else
            write_single(std::cerr, lvl, cnt, at);
    }

    void do_nothing(const log::content&, log::loc) {}

    std::array<write_func_ptr, 5> funcs =
    {
        do_nothing,
        do_nothing,
        do_nothing,
        do_nothing,
        do_nothing
    };

    template<bool to_file, bool dup, log::level... lvl>
    void set_funcs()
    {
        ((funcs[lvl] = write_impl<lvl, to_file, dup>), ...);
    }

    static_assert(funcs.size() == log::error + 1);
    static_assert(levels.size() == log::error + 1);
}

namespace sof
{
    log::loc::operator bool() const
    {
        return file && line;
    }

    log::content::content(const char* fmt, ...) :
        msg()
    {
        va_list args;
        va_list args_copy;
        va_start(args, fmt);
        va_copy(args_copy, args);
        int bufsz = std::vsnprintf(nullptr, 0, fmt, args);
        va_end(args);
        if (bufsz < 0)
        {
            va_end(args_copy);
            return;
        }
        msg.resize(static_cast<size_t>(bufsz) + 1);
        bufsz = std::vsnprintf(msg.data(), msg.size(), fmt, args_copy);
        va_end(args_copy);
        if (bufsz < 0)
            msg.clear();
        else
            msg.resize(static_cast<size_t>(bufsz));
    }

    log::content::operator bool() const
    {
        return !msg.empty();
    }

    void log::init(bool quiet, bool verbose, const std::string& path)
    {
        static std::once_flag oflag;
        std::call_once(oflag, [](bool quiet, bool verbose, const std::string& path)
            {
                if (quiet)
                {
                    _stream.setstate(std::ios::badbit);
                    _current = &_stream;
                }
                else if (!path.empty())
                {
                    _stream.open(path);
                    if (!_stream)
                    {
                        std::string msg("Error opening log file ");
                        msg.append(path).append(": ").append(std::strerror(errno));
                        throw std::runtime_error(msg);
                    }
                    _current = &_stream;
                    set_funcs<true, false, debug, info, success, warning>();
                    set_funcs<true, true, error>();
                }
                else if (verbose)
                {
                    _current = &std::cerr;
                    set_funcs<false, false, debug, info, success, warning, error>();
                }
                else
                {
                    _current = &std::cerr;
                    set_funcs<false, false, warning, error>();
                }
            }, quiet, verbose, path);
    }

    bool log::enabled(level lvl)
    {
        return funcs[lvl] != do_nothing;
    }

    std::ostream& log::stream()
    {
        if (!_current)
        {
            _stream.setstate(std::ios::badbit);
            return _stream;
        }
        return *_current;
    }

    void log::write(level lvl, const content& cnt, loc at)
    {
        std::scoped_lock lock(_logmtx);
        (*funcs[lvl])(cnt, at);
    }
}
