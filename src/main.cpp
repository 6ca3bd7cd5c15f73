// main.cpp

#include "cmdargs.hpp"
#include "config.hpp"
#include "layout.hpp"
#include "log.hpp"
#include "output.hpp"
#include "util.hpp"
#include "dbg/dump.hpp"
#include "dbg/error.hpp"
#include "dbg/index.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

using namespace sof;

static void handle_exception(std::string_view program)
{
    try
    {
        throw;
    }
    catch (const cfg::exception& e)
    {
        std::cerr << program << ": config: " << e.what() << "\n";
    }
    catch (const dbg::exception& e)
    {
        std::cerr << program << ": " << e.what() << "\n";
    }
    catch (const std::exception& e)
    {
        std::cerr << program << ": " << e.what() << "\n";
    }
    catch (...)
    {
        std::cerr << program << ": unknown exception\n";
    }
}

static bool write_file(std::string_view program,
    const std::filesystem::path& path, const std::string& contents)
{
    std::ofstream file(path);
    if (!file)
    {
        std::cerr << program << ": error opening output file '" << path.native()
            << "': " << strerror(errno) << "\n";
        return false;
    }
    file << contents;
    file.close();
    if (!file)
    {
        std::cerr << program << ": error writing output file '" << path.native() << "'\n";
        return false;
    }
    log::logline(log::success, "wrote %s", path.c_str());
    return true;
}

static int run_single(std::string_view program, const arguments& args,
    const dbg::debug_info_index& index)
{
    auto layout = extract_layout(index, *args.struct_name);
    if (!layout)
    {
        std::cerr << program << ": " << layout.error() << "\n";
        return 1;
    }

    output_options opts;
    opts.format = args.format.value_or(output_format::java);
    opts.package = args.package;
    opts.header = args.header;

    std::ostringstream contents;
    write_layout(contents, *layout, opts);
    if (args.output)
        return write_file(program, *args.output, contents.str()) ? 0 : 1;
    std::cout << contents.str() << std::flush;
    return std::cout ? 0 : 1;
}

static int run_batch(std::string_view program, const arguments& args,
    const dbg::debug_info_index& index)
{
    std::ifstream is(*args.config);
    if (!is)
    {
        std::cerr << program << ": error opening config file '" << args.config->native()
            << "': " << strerror(errno) << "\n";
        return 1;
    }
    cfg::config_t config(is);
    if (log::enabled(log::debug))
        log::stream() << config << std::endl;

    std::vector<std::string> names;
    for (const auto& s : config.structs())
        names.push_back(s.name);
    auto layouts = extract_layouts(index, names);
    if (!layouts)
    {
        std::cerr << program << ": " << layouts.error() << "\n";
        return 1;
    }

    output_options opts;
    opts.format = args.format ? *args.format : config.format().value_or(output_format::java);
    opts.package = args.package ? args.package : config.package();
    opts.header = args.header ? args.header : config.header();

    // everything is rendered before the first file is written
    std::vector<std::filesystem::path> paths = config.output_paths(opts.format, args.output_dir);
    std::vector<std::pair<std::filesystem::path, std::string>> files;
    for (size_t i = 0; i < layouts->size(); i++)
    {
        std::ostringstream contents;
        write_layout(contents, (*layouts)[i], opts);
        files.emplace_back(std::move(paths[i]), contents.str());
    }
    for (const auto& [path, contents] : files)
        if (!write_file(program, path, contents))
            return 1;
    return 0;
}

int main(int argc, char* argv[])
{
    std::string_view program = program_name(argc > 0 ? argv[0] : nullptr);
    try
    {
        std::optional<arguments> args = parse_arguments(argc, argv);
        if (!args)
            return 1;
        if (args->help)
        {
            print_usage(std::cout, argv[0]);
            return 0;
        }
        log::init(args->logargs.quiet, args->logargs.verbose, args->logargs.path);
        if (log::enabled(log::debug))
            log::stream() << *args << std::endl;

        dbg::debug_info_index index(args->object_file);
        log::logline(log::info,
            "%s: %zu compilation units, %zu structs (%zu named), %zu typedefs",
            args->object_file.c_str(),
            index.compilation_units().size(),
            index.struct_count(),
            index.named_struct_count(),
            index.typedef_count());

        if (args->debug_dump)
        {
            std::ofstream dump(*args->debug_dump);
            if (!dump)
            {
                std::cerr << program << ": error opening debug dump file '"
                    << args->debug_dump->native() << "': " << strerror(errno) << "\n";
                return 1;
            }
            dump << dbg::debug_dump{ index };
        }

        if (args->config)
            return run_batch(program, *args, index);
        return run_single(program, *args, index);
    }
    catch (...)
    {
        handle_exception(program);
        return 1;
    }
}
