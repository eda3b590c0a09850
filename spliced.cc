#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "spliced.hh"

namespace {

  struct Args {
    std::string file;
    bool strict = false;
    bool trace = false;
    bool help = false;
  };

  void print_usage( const char* argv0 ) {
    std::cerr
      << "Usage: " << argv0 << " [--strict] [--trace] [--file <path>]\n"
      << "\n"
      << "Resolves the inputs of a node document (read from stdin unless\n"
      << "--file is given) and prints a YAML report to stdout.\n"
      << "\n"
      << "  --strict     Abort on the first unresolvable entry.\n"
      << "  --trace      Log resolution events to stderr.\n"
      << "  --file       Read the document from this path.\n"
      << "  -h, --help   Show this help message.\n"
      << "\n"
      << "Exit status: 0 clean, 2 resolution errors or schema violations,\n"
      << "1 fatal error.\n";
  }

  Args parse_args( int argc, char** argv ) {
    Args args;
    for ( int i = 1; i < argc; ++i ) {
      const std::string tok = argv[ i ];
      if ( tok == "-h" || tok == "--help" ) {
        args.help = true;
      }
      else if ( tok == "--strict" ) {
        args.strict = true;
      }
      else if ( tok == "--trace" ) {
        args.trace = true;
      }
      else if ( tok == "--file" ) {
        if ( i + 1 >= argc ) {
          throw std::runtime_error( "--file expects a value" );
        }
        args.file = argv[ ++i ];
      }
      else {
        throw std::runtime_error( "Unknown argument '" + tok + "'" );
      }
    }
    return args;
  }

} // anonymous namespace

int main( int argc, char** argv ) {
  try {
    const Args args = parse_args( argc, argv );
    if ( args.help ) {
      print_usage( argv[0] );
      return 0;
    }

    spliced::NodeDocument doc;
    if ( args.file.empty() ) {
      doc = spliced::NodeDocument::load( std::cin );
    }
    else {
      std::ifstream in( args.file );
      if ( !in ) {
        throw std::runtime_error( "Cannot open '" + args.file + "'" );
      }
      doc = spliced::NodeDocument::load( in );
    }

    spliced::DeferredRegistry registry;
    spliced::register_builtin_resolvers( registry );

    spliced::ResolveOptions options;
    options.strict = args.strict;
    options.trace = args.trace ? &std::cerr : nullptr;

    const spliced::NodeReport report
      = spliced::run_document( doc, registry, options );
    std::cout << spliced::ordered_node::serialize( report.to_node() );
    return report.clean() ? 0 : 2;
  } catch (const std::exception& ex) {
    std::cerr << "[spliced] error: " << ex.what() << "\n";
    return 1;
  }
}
