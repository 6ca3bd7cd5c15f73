// cmdargs.hpp

#pragma once

#include "output.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace sof
{
    struct log_args
    {
        bool quiet;
        bool verbose;
        std::string path;
    };

    struct arguments
    {
        bool help;
        std::string object_file;
        // exactly one of the two is set unless help was requested
        std::optional<std::string> struct_name;
        std::optional<std::filesystem::path> config;

        // values given on the command line take precedence over the config
        std::optional<output_format> format;
        std::optional<std::string> package;
        std::optional<std::string> header;

        std::optional<std::filesystem::path> output;
        std::filesystem::path output_dir;
        std::optional<std::filesystem::path> debug_dump;
        log_args logargs;
    };

    std::ostream& operator<<(std::ostream& os, const arguments& a);

    void print_usage(std::ostream& os, const char* program);

    std::optional<arguments> parse_arguments(int argc, char* const argv[]);
}
