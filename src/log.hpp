// log.hpp

#pragma once

#include <iosfwd>
#include <string>

namespace sof
{
    class log
    {
    private:
        log() = default;

    public:
        enum level
        {
            debug,
            info,
            success,
            warning,
            error
        };

        struct loc
        {
            const char* file;
            int line;
            explicit operator bool() const;
        };

        struct content
        {
            std::string msg;

            content(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

            explicit operator bool() const;
        };

        // quiet: nothing is written
        // path: every level to the file, errors duplicated to stderr
        // verbose: every level to stderr
        // otherwise warnings and errors to stderr
        static void init(bool quiet = false, bool verbose = false,
            const std::string& path = "");

        static bool enabled(level lvl);

        static std::ostream& stream();

        static void write(level lvl, const content& cnt, loc at);

    #define logline(lvl, ...) \
        write((lvl), { __VA_ARGS__ }, { __FILE__, __LINE__ })
    };
}
