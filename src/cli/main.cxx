#include "cli.hxx"

#include <boost/log/trivial.hpp>
#include <boost/program_options/errors.hpp>

#include <exception>
#include <iostream>

int main(int argc, char *argv[]) {
  try {
    const auto options = bitumen::cli::parse_options(argc, argv, std::cout);
    if (!options)
      return 0;
    bitumen::cli::configure_logging(options->log_level);
    return bitumen::cli::run(*options, std::cout);
  } catch (const boost::program_options::error &e) {
    std::cerr << "bitumen: " << e.what() << "\nTry 'bitumen --help'.\n";
    return 1;
  } catch (const std::exception &e) {
    BOOST_LOG_TRIVIAL(error) << e.what();
    return 1;
  }
}
