// cmdargs.cpp

#include "cmdargs.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <getopt.h>

using namespace sof;

namespace {
struct parameter {
  inline static const auto pad = std::setw(26);

  const char *text;

  friend std::ostream &operator<<(std::ostream &os, const parameter &p) {
    os << "  " << std::left << pad << p.text;
    return os;
  }
};

std::optional<std::string> read_file(std::string_view program,
                                     const std::string &path) {
  std::ifstream file(path);
  if (!file) {
    std::cerr << program << ": error opening header file '" << path
              << "': " << strerror(errno) << "\n";
    return std::nullopt;
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    std::cerr << program << ": error reading header file '" << path << "'\n";
    return std::nullopt;
  }
  return contents.str();
}

template <typename T> std::string or_na(const std::optional<T> &x) {
  if (!x)
    return "n/a";
  std::ostringstream oss;
  oss << *x;
  return oss.str();
}
} // namespace

std::ostream &sof::operator<<(std::ostream &os, const arguments &args) {
  os << "object: " << args.object_file;
  os << ", struct: " << or_na(args.struct_name);
  os << ", config: " << or_na(args.config);
  os << ", format: " << or_na(args.format);
  os << ", package: " << or_na(args.package);
  os << ", output: " << or_na(args.output);
  os << ", output dir: " << args.output_dir;
  return os;
}

void sof::print_usage(std::ostream &os, const char *program) {
  os << "Usage:\n\n";
  os << program << " <options> [--] <object-file> <struct-name>\n";
  os << program << " <options> -c <config> [--] <object-file>\n\n";

  std::ios::fmtflags flags(os.flags());

  os << "options:\n";

  os << parameter{"-h, --help"} << "print this message and exit"
     << "\n";

  os << parameter{"-c, --config <file>"}
     << "(optional) read the list of structs from XML file <file>; "
     << "every struct is written to its own output file"
     << "\n";

  os << parameter{"-o, --output <file>"}
     << "(optional) write the generated class to <file> (default: stdout)"
     << "\n";

  os << parameter{"-d, --output-dir <dir>"}
     << "(optional) directory for relative output files of --config "
     << "(default: current directory)"
     << "\n";

  os << parameter{"-f, --format <fmt>"}
     << "(optional) 'java' or 'json', "
     << "overwrites config value (default: java)"
     << "\n";

  os << parameter{"-p, --package <name>"}
     << "(optional) Java package of the generated class, "
     << "overwrites config value"
     << "\n";

  os << parameter{"--header <file>"}
     << "(optional) prepend the contents of <file> to every output, "
     << "overwrites config value"
     << "\n";

  os << parameter{"-q, --quiet"} << "suppress all log messages (default: off)"
     << "\n";

  os << parameter{"-v, --verbose"}
     << "log debug and info messages as well (default: off)"
     << "\n";

  os << parameter{"-l, --log <file>"}
     << "(optional) write log to <file> (default: stderr)"
     << "\n";

  os << parameter{"--debug-dump <file>"}
     << "(optional) dump the indexed debug info in JSON format to <file>"
     << "\n";

  os.flush();
  os.flags(flags);
}

std::optional<arguments> sof::parse_arguments(int argc, char *const argv[]) {
  int c;
  int option_index = 0;
  bool quiet = false;
  bool verbose = false;
  std::string logpath;
  std::string header_path;

  arguments args{};
  args.output_dir = ".";

  std::string_view program = program_name(argc > 0 ? argv[0] : nullptr);
  auto argument_error = [program, argv](const std::string &msg) {
    std::cerr << program << ": " << msg << "\n";
    print_usage(std::cerr, argv[0]);
    return std::nullopt;
  };

  struct option long_options[] = {
      {"help", no_argument, nullptr, 'h'},
      {"config", required_argument, nullptr, 'c'},
      {"output", required_argument, nullptr, 'o'},
      {"output-dir", required_argument, nullptr, 'd'},
      {"format", required_argument, nullptr, 'f'},
      {"package", required_argument, nullptr, 'p'},
      {"quiet", no_argument, nullptr, 'q'},
      {"verbose", no_argument, nullptr, 'v'},
      {"log", required_argument, nullptr, 'l'},
      {"header", required_argument, nullptr, 0x100},
      {"debug-dump", required_argument, nullptr, 0x101},
      {nullptr, 0, nullptr, 0}};

  // full rescan, parse_arguments may run more than once per process
  optind = 0;
  while ((c = getopt_long(argc, argv, "hc:o:d:f:p:qvl:", long_options,
                          &option_index)) != -1) {
    switch (c) {
    case 0x100:
      header_path = optarg;
      if (header_path.empty())
        return argument_error(std::string("--") +
                              long_options[option_index].name +
                              " cannot be empty");
      break;
    case 0x101:
      if (!*optarg)
        return argument_error(std::string("--") +
                              long_options[option_index].name +
                              " cannot be empty");
      args.debug_dump = optarg;
      break;
    case 'c':
      args.config = optarg;
      break;
    case 'o':
      args.output = optarg;
      break;
    case 'd':
      args.output_dir = optarg;
      break;
    case 'f':
      if (!(args.format = parse_output_format(optarg)))
        return argument_error(std::string("-f/--format: unknown format '") +
                              optarg + "', must be 'java' or 'json'");
      break;
    case 'p':
      if (!is_package_name(optarg))
        return argument_error(std::string("-p/--package: invalid package '") +
                              optarg +
                              "', must be a dot-separated list of identifiers");
      args.package = optarg;
      break;
    case 'l':
      logpath = optarg;
      break;
    case 'q':
      quiet = true;
      break;
    case 'v':
      verbose = true;
      break;
    case 'h':
      args.help = true;
      return args;
    case '?':
    default:
      // getopt already printed an error message
      print_usage(std::cerr, argv[0]);
      return std::nullopt;
    }
  }

  int positional = argc - optind;
  if (positional == 0)
    return argument_error("missing object file");
  args.object_file = argv[optind];

  if (args.config) {
    if (positional != 1)
      return argument_error("no struct name allowed with -c/--config");
    if (args.output)
      return argument_error("both -c/--config and -o/--output provided");
  } else {
    if (positional < 2)
      return argument_error("missing struct name");
    if (positional > 2)
      return argument_error("too many arguments");
    args.struct_name = argv[optind + 1];
    if (args.struct_name->empty())
      return argument_error("struct name cannot be empty");
  }

  if (quiet && !logpath.empty())
    return argument_error("both -q/--quiet and -l/--log provided");

  if (!header_path.empty()) {
    if (!(args.header = read_file(program, header_path)))
      return std::nullopt;
  }

  args.logargs = {quiet, verbose, std::move(logpath)};
  return args;
}
