#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "xapdoc.hh"

namespace {

  void print_usage( const char* argv0 ) {
    std::cout << "Usage: " << argv0 << " [options]\n"
      << "Merges the layered XAP definitions and writes one Markdown document\n"
      << "per version plus an index.\n\n"
      << "  --config FILE       YAML configuration file\n"
      << "  --root DIR          project root (default: .)\n"
      << "  --definitions DIR   definitions directory, relative to root\n"
      << "  --output DIR        output directory, relative to root\n"
      << "  --merged FILE       also write the final merged definitions\n"
      << "  --verbose           debug logging\n"
      << "  --help              show this message\n";
  }

  // Command-line overrides, applied on top of the configuration file
  struct Options {
    std::string config_file;
    std::vector< std::pair< std::string, std::string > > overrides;
    bool verbose = false;
    bool help = false;
  };

  Options parse_args( int argc, char** argv ) {
    Options opts;
    for ( int i = 1; i < argc; ++i ) {
      const std::string arg = argv[ i ];
      if ( arg == "--help" || arg == "-h" ) { opts.help = true; continue; }
      if ( arg == "--verbose" || arg == "-v" ) { opts.verbose = true; continue; }

      if ( arg != "--config" && arg != "--root" && arg != "--definitions"
        && arg != "--output" && arg != "--merged" )
      {
        xapdoc::internal::throw_error( xapdoc::ErrorKind::Config, arg,
          "unknown option" );
      }
      if ( i + 1 >= argc ) {
        xapdoc::internal::throw_error( xapdoc::ErrorKind::Config, arg,
          "option requires a value" );
      }
      const std::string value = argv[ ++i ];
      if ( arg == "--config" ) opts.config_file = value;
      else opts.overrides.emplace_back( arg, value );
    }
    return opts;
  }

  xapdoc::Config build_config( const Options& opts ) {
    xapdoc::Config cfg;
    if ( !opts.config_file.empty() ) {
      cfg = xapdoc::load_config( opts.config_file );
    }
    for ( const auto& [flag, value] : opts.overrides ) {
      if ( flag == "--root" ) cfg.root = value;
      else if ( flag == "--definitions" ) cfg.definitions_dir = value;
      else if ( flag == "--output" ) cfg.output_dir = value;
      else if ( flag == "--merged" ) cfg.merged_output = value;
    }
    return cfg;
  }

} // namespace

int main( int argc, char** argv ) {
  try {
    const Options opts = parse_args( argc, argv );
    if ( opts.help ) {
      print_usage( argv[0] );
      return EXIT_SUCCESS;
    }
    if ( opts.verbose ) spdlog::set_level( spdlog::level::debug );

    const xapdoc::Config cfg = build_config( opts );

    xapdoc::DirectoryLayerSource source( cfg.definitions_path(),
      cfg.layer_prefix, cfg.layer_extensions );
    xapdoc::FileSink sink( cfg.output_path() );
    xapdoc::Generator generator( cfg, source, sink );

    const xapdoc::RunResult result = generator.run();
    if ( const auto* err = std::get_if< xapdoc::GenerateError >(&result) ) {
      // Diagnostic dump of the cumulative definitions at the failure point
      if ( !err->dump.empty() ) std::cout << err->dump;
      if ( !err->layer.empty() ) {
        SPDLOG_CRITICAL( "Aborted while processing layer {}", err->layer );
      }
      return EXIT_FAILURE;
    }

    const auto& summary = std::get< xapdoc::RunSummary >( result );
    xapdoc::write_merged( cfg, summary );
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    SPDLOG_CRITICAL( "[xapdoc] error: {}", ex.what() );
    return EXIT_FAILURE;
  }
}
