//  XAPDOC  Layered XAP definition merger & documentation generator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the xapdoc authors
#pragma once

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "xapdoc/error.hh"
#include "xapdoc/node.hh"

namespace xapdoc {

  // Every tunable name, path and token used by the merger, the renderers,
  // the assembler and the run driver. Nothing reads process-wide state; a
  // Config is passed to each of them explicitly.
  struct Config {

    // Locations (definitions_dir and output_dir are relative to root
    // unless absolute)
    std::filesystem::path root = ".";
    std::filesystem::path definitions_dir = "data/xap";
    std::filesystem::path output_dir = "docs";

    // Layer naming
    std::string layer_prefix = "xap_";
    std::vector< std::string > layer_extensions = {
      ".yaml", ".yml", ".json", ".hjson"
    };
    std::string document_extension = ".md";

    // Index document
    std::string index_filename = "xap_protocol.md";
    std::string index_title = "XAP Protocol Reference";
    std::string index_entry_label = "XAP Version";

    // Merge sentinel
    std::string reset_token = "!reset!";

    // Document structure
    std::string documentation_key = "documentation";
    std::string order_key = "order";

    // Rendered sections: source key -> reserved documentation key
    std::string type_docs_key = "type_docs";
    std::string type_docs_section = "!type_docs!";
    std::string term_definitions_key = "term_definitions";
    std::string term_definitions_section = "!term_definitions!";
    std::string response_flags_key = "response_flags";
    std::string response_flags_section = "!response_flags!";
    std::string response_flags_bits_key = "bits";

    // Optional YAML dump of the final cumulative tree (empty: disabled)
    std::filesystem::path merged_output;

    std::filesystem::path definitions_path() const {
      return resolve( definitions_dir );
    }

    std::filesystem::path output_path() const {
      return resolve( output_dir );
    }

    std::filesystem::path merged_output_path() const {
      if ( merged_output.empty() ) return merged_output;
      return resolve( merged_output );
    }

  private:
    std::filesystem::path resolve( const std::filesystem::path& p ) const {
      if ( p.is_absolute() ) return p;
      return root / p;
    }
  };

  // Apply the entries of a parsed YAML mapping onto an existing Config.
  // Unknown keys and wrongly typed values are rejected.
  void apply_config_node( Config& cfg, const ordered_node& node,
    const std::string& origin );

  Config load_config( const std::filesystem::path& path );
  Config load_config_text( const std::string& text,
    const std::string& origin = "<config>" );

} // namespace xapdoc

inline void xapdoc::apply_config_node( Config& cfg, const ordered_node& node,
  const std::string& origin )
{
  using internal::key_string;
  using internal::throw_error;
  using internal::to_native_checked;

  // An empty file leaves every default in place
  if ( node.is_null() ) return;
  if ( !node.is_mapping() ) {
    throw_error( ErrorKind::Config, origin,
      "configuration root must be a mapping" );
  }

  auto as_string = [&]( const std::string& key, const ordered_node& v )
    -> std::string
  {
    if ( !v.is_string() ) {
      throw_error( ErrorKind::Config, origin,
        "value for '" + key + "' must be a string" );
    }
    return to_native_checked< std::string >( v );
  };

  for ( const auto& [mk, mv] : node.map_items() ) {
    const std::string k = key_string( mk );

    if ( k == "root" ) cfg.root = as_string( k, mv );
    else if ( k == "definitions_dir" ) cfg.definitions_dir = as_string( k, mv );
    else if ( k == "output_dir" ) cfg.output_dir = as_string( k, mv );
    else if ( k == "layer_prefix" ) cfg.layer_prefix = as_string( k, mv );
    else if ( k == "layer_extensions" ) {
      if ( !mv.is_sequence() ) {
        throw_error( ErrorKind::Config, origin,
          "value for '" + k + "' must be a sequence of strings" );
      }
      std::vector< std::string > exts;
      for ( const auto& e : mv ) exts.push_back( as_string(k, e) );
      cfg.layer_extensions = exts;
    }
    else if ( k == "document_extension" ) {
      cfg.document_extension = as_string( k, mv );
    }
    else if ( k == "index_filename" ) cfg.index_filename = as_string( k, mv );
    else if ( k == "index_title" ) cfg.index_title = as_string( k, mv );
    else if ( k == "index_entry_label" ) {
      cfg.index_entry_label = as_string( k, mv );
    }
    else if ( k == "reset_token" ) cfg.reset_token = as_string( k, mv );
    else if ( k == "documentation_key" ) {
      cfg.documentation_key = as_string( k, mv );
    }
    else if ( k == "order_key" ) cfg.order_key = as_string( k, mv );
    else if ( k == "type_docs_key" ) cfg.type_docs_key = as_string( k, mv );
    else if ( k == "type_docs_section" ) {
      cfg.type_docs_section = as_string( k, mv );
    }
    else if ( k == "term_definitions_key" ) {
      cfg.term_definitions_key = as_string( k, mv );
    }
    else if ( k == "term_definitions_section" ) {
      cfg.term_definitions_section = as_string( k, mv );
    }
    else if ( k == "response_flags_key" ) {
      cfg.response_flags_key = as_string( k, mv );
    }
    else if ( k == "response_flags_section" ) {
      cfg.response_flags_section = as_string( k, mv );
    }
    else if ( k == "response_flags_bits_key" ) {
      cfg.response_flags_bits_key = as_string( k, mv );
    }
    else if ( k == "merged_output" ) cfg.merged_output = as_string( k, mv );
    else {
      throw_error( ErrorKind::Config, origin,
        "unknown configuration key '" + k + "'" );
    }
  }

  if ( cfg.reset_token.empty() ) {
    throw_error( ErrorKind::Config, origin, "reset_token must not be empty" );
  }
}

inline xapdoc::Config xapdoc::load_config_text( const std::string& text,
  const std::string& origin )
{
  ordered_node node;
  try {
    node = ordered_node::deserialize( text );
  }
  catch ( const fkyaml::exception& ex ) {
    internal::throw_error( ErrorKind::Config, origin,
      "configuration is not valid YAML", std::string( ex.what() ) );
  }

  Config cfg;
  apply_config_node( cfg, node, origin );
  return cfg;
}

inline xapdoc::Config xapdoc::load_config(
  const std::filesystem::path& path )
{
  std::ifstream in( path );
  if ( !in ) {
    internal::throw_error( ErrorKind::Config, path.string(),
      "cannot open configuration file" );
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return load_config_text( ss.str(), path.string() );
}
