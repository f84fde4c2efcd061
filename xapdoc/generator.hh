//  XAPDOC  Layered XAP definition merger & documentation generator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the xapdoc authors
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "xapdoc/assembler.hh"
#include "xapdoc/config.hh"
#include "xapdoc/error.hh"
#include "xapdoc/io.hh"
#include "xapdoc/merger.hh"
#include "xapdoc/node.hh"
#include "xapdoc/renderers.hh"

namespace xapdoc {

  // Outcome of a successful run
  struct RunSummary {
    std::vector< LayerDocument > documents;
    std::string index_filename;
    // Cumulative tree after the last layer
    ordered_node merged;
  };

  using RunResult = std::variant< RunSummary, GenerateError >;

  // Write the merged tree of a successful run to cfg.merged_output_path().
  // Returns false, writing nothing, when no merged output is configured.
  bool write_merged( const Config& cfg, const RunSummary& summary );

  // Sequential driver: for every layer, parse -> merge -> refresh rendered
  // sections -> assemble -> write; then write the index. The first failure
  // ends the run; documents already written are left in place.
  class Generator {
  public:
    Generator( Config cfg, LayerSource& source, DocumentSink& sink )
      : cfg_( std::move(cfg) ), source_( source ), sink_( sink ),
        merger_( cfg_.reset_token ), assembler_( cfg_ ) {}

    RunResult run();

  private:
    Config cfg_;
    LayerSource& source_;
    DocumentSink& sink_;
    Merger merger_;
    DocumentAssembler assembler_;

    // Per-run state
    struct RunState {
      std::optional< ordered_node > cumulative;
      std::vector< LayerDocument > documents;
      std::string current_layer;
    };

    void process_layer( const LayerInput& input, RunState& state );
    GenerateError fail( ErrorKind kind, const std::string& message,
      const RunState& state ) const;
  };

} // namespace xapdoc

inline void xapdoc::Generator::process_layer( const LayerInput& input,
  RunState& state )
{
  state.current_layer = input.stem;

  // A layer that fails to parse is never merged
  const ordered_node layer = parse_layer( input );
  state.cumulative = merger_.merge( state.cumulative, layer );
  SPDLOG_INFO( "Merged layer {} ({})", input.stem, input.origin );

  ordered_node& tree = *state.cumulative;
  try {
    const auto refreshed = refresh_rendered_sections( tree, cfg_ );
    for ( const auto& section : refreshed ) {
      SPDLOG_DEBUG( "Refreshed section {} for {}", section, input.stem );
    }
  }
  catch ( const fkyaml::exception& ex ) {
    internal::throw_error( ErrorKind::Render, input.stem,
      "rendering documentation sections failed", std::string( ex.what() ) );
  }

  const LayerDocument doc = assembler_.describe( input.stem );
  const std::string text = assembler_.assemble( tree );
  sink_.write( doc.filename, text );
  state.documents.push_back( doc );
  SPDLOG_INFO( "Wrote {}", doc.filename );
}

inline xapdoc::GenerateError xapdoc::Generator::fail( ErrorKind kind,
  const std::string& message, const RunState& state ) const
{
  GenerateError err{ kind, message, state.current_layer,
    state.cumulative ? internal::to_yaml( *state.cumulative )
      : std::string() };
  SPDLOG_ERROR( "{}: {}", to_string(err.kind), err.message );
  return err;
}

inline xapdoc::RunResult xapdoc::Generator::run() {
  RunState state;

  try {
    const std::vector< LayerInput > inputs = source_.layers();
    SPDLOG_DEBUG( "Discovered {} definition layer(s)", inputs.size() );

    for ( const auto& input : inputs ) {
      process_layer( input, state );
    }

    state.current_layer.clear();
    sink_.write( cfg_.index_filename,
      assembler_.build_index(state.documents) );
    SPDLOG_INFO( "Wrote {} ({} version(s))", cfg_.index_filename,
      state.documents.size() );
  }
  catch ( const Error& ex ) {
    return fail( ex.kind(), ex.what(), state );
  }
  catch ( const fkyaml::exception& ex ) {
    return fail( ErrorKind::Structure, ex.what(), state );
  }

  RunSummary summary{ std::move( state.documents ), cfg_.index_filename,
    state.cumulative ? *state.cumulative : ordered_node::mapping() };
  return summary;
}

inline bool xapdoc::write_merged( const Config& cfg,
  const RunSummary& summary )
{
  const auto path = cfg.merged_output_path();
  if ( path.empty() ) return false;
  write_text_file( path, internal::to_yaml(summary.merged) );
  SPDLOG_INFO( "Wrote merged definitions to {}", path.string() );
  return true;
}
