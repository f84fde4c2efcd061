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
#include "xapdoc/version.hh"

namespace xapdoc {

  // One produced per-layer document
  struct LayerDocument {
    std::string stem;
    std::string version;
    std::string filename;
  };

  // Concatenates the ordered documentation sections of a cumulative tree
  // into one document, and builds the index over all produced documents
  class DocumentAssembler {
  public:
    inline explicit DocumentAssembler( Config cfg ) : cfg_( std::move(cfg) ) {}

    // Document naming for a layer stem
    LayerDocument describe( const std::string& stem ) const;

    // Sections listed in documentation.order, each trimmed and followed by a
    // blank line. The whole text is built before returning, so a missing
    // section produces no partial output.
    std::string assemble( const ordered_node& tree ) const;

    // Title line, then one entry per document, newest version first
    std::string build_index( std::vector< LayerDocument > docs ) const;

  private:
    Config cfg_;
  };

} // namespace xapdoc

inline xapdoc::LayerDocument xapdoc::DocumentAssembler::describe(
  const std::string& stem ) const
{
  return LayerDocument{ stem, version_of_stem( stem, cfg_.layer_prefix ),
    stem + cfg_.document_extension };
}

inline std::string xapdoc::DocumentAssembler::assemble(
  const ordered_node& tree ) const
{
  using internal::throw_error;

  const std::string& doc_key = cfg_.documentation_key;
  const std::string order_path = doc_key + '.' + cfg_.order_key;

  if ( !tree.is_mapping() || !tree.contains(doc_key)
    || !tree.at(doc_key).is_mapping() )
  {
    throw_error( ErrorKind::MissingSection, doc_key,
      "definitions have no documentation mapping" );
  }
  const ordered_node& doc = tree.at( doc_key );

  if ( !doc.contains(cfg_.order_key) || !doc.at(cfg_.order_key).is_sequence() )
  {
    throw_error( ErrorKind::MissingSection, order_path,
      "documentation order must be a sequence of section keys" );
  }
  const ordered_node& order = doc.at( cfg_.order_key );

  std::ostringstream out;
  for ( std::size_t i = 0; i < order.size(); ++i ) {
    const std::string section = internal::to_string_any( order.at(i) );
    const ordered_node* text = internal::find_entry( doc, section );
    if ( text == nullptr ) {
      std::ostringstream where;
      where << order_path << '[' << i << ']';
      throw_error( ErrorKind::MissingSection, where.str(),
        "no documentation section '" + section + "'" );
    }
    out << internal::trim( internal::to_string_any(*text) ) << "\n\n";
  }
  return out.str();
}

inline std::string xapdoc::DocumentAssembler::build_index(
  std::vector< LayerDocument > docs ) const
{
  std::sort( docs.begin(), docs.end(),
    []( const LayerDocument& a, const LayerDocument& b ) {
      const int c = compare_versions( a.version, b.version );
      if ( c != 0 ) return c > 0;
      return a.filename > b.filename;
    } );

  std::ostringstream out;
  out << "# " << cfg_.index_title << "\n\n";
  for ( const auto& d : docs ) {
    out << "* [" << cfg_.index_entry_label << ' ' << d.version << "]("
      << d.filename << ")\n";
  }
  return out.str();
}
