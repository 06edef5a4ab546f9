#pragma once

#include <boost/log/trivial.hpp>

#include <filesystem>
#include <optional>
#include <ostream>

namespace bitumen::cli {
/**
 * @struct Options
 * @brief Parsed command line of the bitumen tool.
 */
struct Options {
  enum class Command { Create, List };

  Command command = Command::List;
  std::filesystem::path input;  /**< @brief Tree root or archive to list. */
  std::filesystem::path output; /**< @brief Archive to create. */
  boost::log::trivial::severity_level log_level =
      boost::log::trivial::warning;
};

/**
 * @brief Parse the command line.
 *
 * @param argc Argument count as passed to main().
 * @param argv Argument vector as passed to main().
 * @param help Receives the usage text when --help is given.
 * @return std::optional<Options> Empty when help was printed.
 * @throws boost::program_options::error on invalid input.
 */
std::optional<Options> parse_options(int argc, const char *const argv[],
                                     std::ostream &help);

/// @brief Route Boost.Log to stderr and drop records below @p level.
void configure_logging(boost::log::trivial::severity_level level);

/**
 * @brief Run the selected command.
 *
 * @param report Receives one line per listed entry.
 * @return int Process exit code: 0 on success, 2 if listing stopped on a
 * corrupt or truncated entry.
 */
int run(const Options &options, std::ostream &report);
} // namespace bitumen::cli
