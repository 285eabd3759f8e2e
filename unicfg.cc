//  unicfg
//  Universal Configuration Language evaluator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the unicfg authors
#include "unicfg.hh"

namespace {

  constexpr int EXIT_DOCUMENT_ERROR = 1;
  constexpr int EXIT_USAGE_ERROR = 2;

  const char* USAGE = "unicfg [--max-depth N] [--base-dir DIR] [FILE|-]";

  int usage_error( const std::string& msg ) {
    std::cerr << "[unicfg] usage: " << msg << "\n"
      << "[unicfg] usage: " << USAGE << "\n";
    return EXIT_USAGE_ERROR;
  }

}

int main( int argc, char* argv[] ) {
  unicfg::Options options;
  std::string input = "-";
  bool have_input = false;

  for ( int i = 1; i < argc; ++i ) {
    const std::string arg = argv[ i ];
    if ( arg == "-h" || arg == "--help" ) {
      std::cout << "Usage: " << USAGE << "\n\n"
        << "Evaluates a configuration document (FILE, or standard input when\n"
        << "FILE is absent or '-') and prints the result as YAML.\n\n"
        << "  --max-depth N   nesting limit for values and includes"
        << " (default " << unicfg::Options::DEFAULT_MAX_DEPTH << ")\n"
        << "  --base-dir DIR  include directory for standard input"
        << " (default: working directory)\n";
      return 0;
    }
    else if ( arg == "--max-depth" || arg == "--base-dir" ) {
      if ( i + 1 >= argc ) return usage_error( "missing value for " + arg );
      const std::string value = argv[ ++i ];
      if ( arg == "--base-dir" ) {
        options.base_dir = value;
        continue;
      }
      try {
        size_t used = 0;
        const int depth = std::stoi( value, &used );
        if ( used != value.size() || depth <= 0 ) throw std::invalid_argument( value );
        options.max_depth = depth;
      }
      catch ( const std::exception& ) {
        return usage_error( "invalid --max-depth value: " + value );
      }
    }
    else if ( arg.size() > 1 && arg.front() == '-' ) {
      return usage_error( "unknown option " + arg );
    }
    else {
      if ( have_input ) return usage_error( "more than one input given" );
      input = arg;
      have_input = true;
    }
  }

  try {
    unicfg::Parser parser( options );
    const unicfg::ordered_node doc = input == "-"
      ? parser.parse( std::cin ) : parser.parse_file( input );
    std::cout << unicfg::to_yaml( doc );
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[unicfg] error: " << ex.what() << "\n";
    return EXIT_DOCUMENT_ERROR;
  }
}
