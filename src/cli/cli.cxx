#include "cli.hxx"

#include <bitumen/archive-reader.hxx>
#include <bitumen/archive-writer.hxx>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <string>
#include <system_error>

namespace bitumen::cli {
namespace {
namespace fs = std::filesystem;
namespace io = boost::iostreams;
namespace logging = boost::log;
namespace po = boost::program_options;

fs::path default_output(const fs::path &root) {
  auto normal = root.lexically_normal();
  if (!normal.has_filename())
    normal = normal.parent_path();
  const auto name = normal.filename();
  if (name.empty() || name == "." || name == "..")
    return "archive.bit";
  return fs::path(name) += ".bit";
}

/// @brief true if @p path would end up inside the tree rooted at @p root.
bool is_within(const fs::path &path, const fs::path &root) {
  const auto target = fs::weakly_canonical(path);
  const auto base = fs::weakly_canonical(root);
  auto t = target.begin();
  for (auto b = base.begin(); b != base.end(); ++b, ++t) {
    if (b->empty())
      continue;
    if (t == target.end() || *t != *b)
      return false;
  }
  return true;
}

int create(const Options &options) {
  if (is_within(options.output, options.input))
    throw po::error("output " + options.output.string() +
                    " must not be inside the archived tree");

  io::stream<io::file_sink> out(options.output.string(),
                                std::ios::binary | std::ios::trunc);
  if (!out.is_open())
    throw ArchiveError("cannot create " + options.output.string());

  try {
    ArchiveWriter writer(out);
    writer.append_tree(options.input);
    out.flush();
    if (!out)
      throw ArchiveError("failed to write " + options.output.string());
    out.close();
    BOOST_LOG_TRIVIAL(info) << "wrote " << writer.entries_written()
                            << " entries (" << writer.bytes_written()
                            << " bytes) to " << options.output;
  } catch (const std::exception &) {
    // A partial archive is indistinguishable from a short valid one.
    std::error_code ignored;
    fs::remove(options.output, ignored);
    throw;
  }
  return 0;
}

int list(const Options &options, std::ostream &report) {
  io::stream<io::file_source> in(options.input.string(), std::ios::binary);
  if (!in.is_open())
    throw ArchiveError("cannot open " + options.input.string());

  const auto summary = read_archive(in, [&report](const ArchiveEntry &entry) {
    report << describe(entry) << '\n';
  });
  return summary.clean() ? 0 : 2;
}
} // unnamed namespace

std::optional<Options> parse_options(int argc, const char *const argv[],
                                     std::ostream &help) {
  Options options;
  std::string command;
  std::string input;
  std::string output;

  po::options_description visible(
      "Usage: bitumen create <root> [-o <archive>]\n"
      "       bitumen list <archive>\n\n"
      "Options");
  visible.add_options()("help,h", "show this message")(
      "output,o", po::value<std::string>(&output),
      "archive to write (default: <root name>.bit)")(
      "log-level",
      po::value<logging::trivial::severity_level>(&options.log_level)
          ->default_value(logging::trivial::warning, "warning"),
      "trace, debug, info, warning, error or fatal");

  po::options_description hidden;
  hidden.add_options()("command", po::value<std::string>(&command))(
      "path", po::value<std::string>(&input));

  po::positional_options_description positional;
  positional.add("command", 1).add("path", 1);

  po::options_description all;
  all.add(visible).add(hidden);

  po::variables_map vm;
  po::store(po::command_line_parser(argc, argv)
                .options(all)
                .positional(positional)
                .run(),
            vm);
  if (vm.count("help")) {
    help << visible << '\n';
    return std::nullopt;
  }
  po::notify(vm);

  if (command == "create")
    options.command = Options::Command::Create;
  else if (command == "list")
    options.command = Options::Command::List;
  else if (command.empty())
    throw po::error("missing command");
  else
    throw po::error("unknown command '" + command + "'");

  if (input.empty())
    throw po::error("missing path");
  options.input = input;

  if (options.command == Options::Command::Create)
    options.output = output.empty() ? default_output(options.input)
                                    : fs::path(output);
  else if (!output.empty())
    throw po::error("--output only applies to create");

  return options;
}

void configure_logging(logging::trivial::severity_level level) {
  namespace expr = logging::expressions;
  logging::add_console_log(std::clog,
                           logging::keywords::format =
                               (expr::stream << "[" << logging::trivial::severity
                                             << "] " << expr::smessage));
  logging::core::get()->set_filter(logging::trivial::severity >= level);
}

int run(const Options &options, std::ostream &report) {
  switch (options.command) {
  case Options::Command::Create:
    return create(options);
  case Options::Command::List:
    return list(options, report);
  }
  return 1;
}
} // namespace bitumen::cli
