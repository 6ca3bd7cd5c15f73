// config.hpp

#pragma once

#include "output.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace sof
{
    namespace cfg
    {
        enum class errc : uint32_t;
    }
}

namespace std
{
    template<> struct is_error_code_enum<sof::cfg::errc> : std::true_type {};
}

namespace sof
{
    namespace cfg
    {
        struct config_entry;

        enum class errc : uint32_t
        {
            config_io_error = 1,
            config_not_found,
            config_out_of_mem,
            config_bad_format,
            config_no_config,
            config_invalid_package,
            config_invalid_format,
            config_no_structs,
            structs_empty,
            struct_no_name,
            struct_invalid_name,
            struct_invalid_output,
            struct_already_exists,
            struct_output_already_exists,
        };

        struct exception : std::system_error
        {
            using system_error::system_error;
        };

        std::error_code make_error_code(errc) noexcept;
        const std::error_category& config_category() noexcept;

        struct struct_t
        {
            std::string name;
            std::optional<std::filesystem::path> output;

            explicit struct_t(const config_entry&);

            // explicit output, or the struct name with the format's extension
            std::filesystem::path output_path(output_format) const;
        };

        class config_t
        {
        private:
            struct impl;
            std::shared_ptr<const impl> _impl;

        public:
            explicit config_t(std::istream&);

            const std::optional<std::string>& package() const noexcept;
            const std::optional<std::string>& header() const noexcept;
            const std::optional<output_format>& format() const noexcept;
            const std::vector<struct_t>& structs() const noexcept;

            // output file of every struct in order, relative ones placed under dir;
            // throws errc::struct_output_already_exists if two name the same file
            std::vector<std::filesystem::path> output_paths(output_format,
                const std::filesystem::path& dir) const;
        };

        std::ostream& operator<<(std::ostream&, const struct_t&);
        std::ostream& operator<<(std::ostream&, const config_t&);
    }
}
