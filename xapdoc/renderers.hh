//  XAPDOC  Layered XAP definition merger & documentation generator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the xapdoc authors
#pragma once

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "xapdoc/config.hh"
#include "xapdoc/error.hh"
#include "xapdoc/node.hh"

namespace xapdoc {

  // Placeholder used for bits the definitions leave undefined
  inline const std::string UNDEFINED_FLAG = "-";

  // Number of bits in the response flags byte
  inline constexpr int RESPONSE_FLAG_BITS = 8;

  // Pure renderers: node in, Markdown table text out
  std::string render_definition_table( const ordered_node& defs );
  std::string render_response_flags( const ordered_node& bits );

  // Normalize `bits` to string keys and fill every undefined bit with the
  // placeholder record, in place
  void fill_response_flag_defaults( ordered_node& bits );

  // Tree updaters. Each reads one top-level source key of the cumulative
  // tree and writes the matching reserved documentation section.
  void update_type_docs( ordered_node& tree, const Config& cfg );
  void update_term_definitions( ordered_node& tree, const Config& cfg );
  void update_response_flags( ordered_node& tree, const Config& cfg );

  // Run every updater whose source key is present in the tree. Returns the
  // reserved section keys that were refreshed.
  std::vector< std::string > refresh_rendered_sections( ordered_node& tree,
    const Config& cfg );

namespace internal {

  // Write rendered text under documentation[section], creating the
  // documentation mapping if the tree does not have one yet
  inline void store_section( ordered_node& tree, const Config& cfg,
    const std::string& section, const std::string& text )
  {
    if ( !tree.contains(cfg.documentation_key) ) {
      tree[ cfg.documentation_key ] = ordered_node::mapping();
    }
    ordered_node& doc = tree[ cfg.documentation_key ];
    if ( !doc.is_mapping() ) {
      throw_error( ErrorKind::Render, cfg.documentation_key,
        "must be a mapping to receive '" + section + "'" );
    }
    doc[ section ] = make_node_from( text );
  }

  // Fetch a required string field of a response flag record
  inline std::string flag_field( const ordered_node& record,
    const std::string& bit, const std::string& field )
  {
    const ordered_node* v = find_entry( record, field );
    if ( v == nullptr ) {
      throw_error( ErrorKind::Render, "bits." + bit,
        "response flag record is missing '" + field + "'" );
    }
    return to_string_any( *v );
  }

} // namespace xapdoc::internal

} // namespace xapdoc

inline std::string xapdoc::render_definition_table( const ordered_node& defs )
{
  using internal::key_string;
  using internal::to_string_any;

  std::vector< std::pair< std::string, std::string > > rows;
  for ( const auto& [mk, mv] : defs.map_items() ) {
    rows.emplace_back( key_string(mk), to_string_any(mv) );
  }

  // Ascending by name, byte-wise
  std::sort( rows.begin(), rows.end(),
    []( const auto& a, const auto& b ) { return a.first < b.first; } );

  std::ostringstream oss;
  oss << "| Name | Definition |\n";
  oss << "| -- | -- |\n";
  for ( std::size_t i = 0; i < rows.size(); ++i ) {
    if ( i ) oss << '\n';
    oss << "| _" << rows[ i ].first << "_ | " << rows[ i ].second << " |";
  }
  oss << '\n';
  return oss.str();
}

inline void xapdoc::fill_response_flag_defaults( ordered_node& bits ) {
  using internal::key_string;
  using internal::make_node_from;

  ordered_node filled = ordered_node::mapping();
  for ( const auto& [mk, mv] : bits.map_items() ) {
    filled[ key_string(mk) ] = mv;
  }

  for ( int n = 0; n < RESPONSE_FLAG_BITS; ++n ) {
    const std::string key = std::to_string( n );
    if ( filled.contains(key) ) continue;
    ordered_node placeholder = ordered_node::mapping();
    placeholder[ "name" ] = make_node_from( UNDEFINED_FLAG );
    placeholder[ "description" ] = make_node_from( UNDEFINED_FLAG );
    filled[ key ] = placeholder;
  }

  bits = filled;
}

inline std::string xapdoc::render_response_flags( const ordered_node& bits ) {
  std::ostringstream header;
  std::ostringstream dividers;
  std::ostringstream names;
  std::ostringstream descriptions;

  header << '|';
  dividers << '|';
  names << '|';

  // Bit 7 is the leftmost column
  for ( int n = RESPONSE_FLAG_BITS - 1; n >= 0; --n ) {
    const std::string bit = std::to_string( n );
    const ordered_node* record = internal::find_entry( bits, bit );
    if ( record == nullptr || !record->is_mapping() ) {
      internal::throw_error( ErrorKind::Render, "bits." + bit,
        "response flag must be a mapping with 'name' and 'description'" );
    }

    const std::string name = internal::flag_field( *record, bit, "name" );
    header << " Bit " << n << " |";
    dividers << "--|";
    names << ' ' << name << " |";

    if ( name != UNDEFINED_FLAG ) {
      descriptions << "\n* `Bit " << n << "`: "
        << internal::flag_field( *record, bit, "description" );
    }
  }

  std::ostringstream oss;
  oss << header.str() << '\n'
    << dividers.str() << '\n'
    << names.str() << '\n'
    << descriptions.str() << '\n';
  return oss.str();
}

inline void xapdoc::update_type_docs( ordered_node& tree, const Config& cfg ) {
  const ordered_node& defs = tree.at( cfg.type_docs_key );
  if ( !defs.is_mapping() ) {
    internal::throw_error( ErrorKind::Render, cfg.type_docs_key,
      "must be a mapping of type name to description" );
  }
  internal::store_section( tree, cfg, cfg.type_docs_section,
    render_definition_table(defs) );
}

inline void xapdoc::update_term_definitions( ordered_node& tree,
  const Config& cfg )
{
  const ordered_node& defs = tree.at( cfg.term_definitions_key );
  if ( !defs.is_mapping() ) {
    internal::throw_error( ErrorKind::Render, cfg.term_definitions_key,
      "must be a mapping of term to description" );
  }
  internal::store_section( tree, cfg, cfg.term_definitions_section,
    render_definition_table(defs) );
}

inline void xapdoc::update_response_flags( ordered_node& tree,
  const Config& cfg )
{
  ordered_node& flags = tree[ cfg.response_flags_key ];
  if ( !flags.is_mapping() || !flags.contains(cfg.response_flags_bits_key) ) {
    internal::throw_error( ErrorKind::Render, cfg.response_flags_key,
      "must be a mapping containing '" + cfg.response_flags_bits_key + "'" );
  }

  ordered_node& bits = flags[ cfg.response_flags_bits_key ];
  if ( !bits.is_mapping() ) {
    internal::throw_error( ErrorKind::Render,
      cfg.response_flags_key + '.' + cfg.response_flags_bits_key,
      "must be a mapping of bit index to flag record" );
  }

  // Defaults persist in the cumulative tree for later layers
  fill_response_flag_defaults( bits );

  const std::string text = render_response_flags( bits );
  internal::store_section( tree, cfg, cfg.response_flags_section, text );
}

inline std::vector< std::string > xapdoc::refresh_rendered_sections(
  ordered_node& tree, const Config& cfg )
{
  std::vector< std::string > refreshed;
  if ( !tree.is_mapping() ) return refreshed;

  if ( tree.contains(cfg.type_docs_key) ) {
    update_type_docs( tree, cfg );
    refreshed.push_back( cfg.type_docs_section );
  }
  if ( tree.contains(cfg.term_definitions_key) ) {
    update_term_definitions( tree, cfg );
    refreshed.push_back( cfg.term_definitions_section );
  }
  if ( tree.contains(cfg.response_flags_key) ) {
    update_response_flags( tree, cfg );
    refreshed.push_back( cfg.response_flags_section );
  }
  return refreshed;
}
