//  XAPDOC  Layered XAP definition merger & documentation generator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the xapdoc authors
#pragma once

// Standard library includes
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

// fmt, as bundled with spdlog
#include <spdlog/fmt/fmt.h>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace xapdoc {

  // Specialized version of the fkYAML basic_node template. The choice of
  // fkyaml::ordered_map preserves the authored key order of every layer,
  // which in turn fixes the key order of the cumulative tree.
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

namespace internal {

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  // Shortest text that reads back as the same double, always carrying a
  // decimal point or exponent so it is not mistaken for an integer
  inline std::string format_float( double d ) {
    if ( std::isnan(d) ) return "nan";
    if ( std::isinf(d) ) return d < 0 ? "-inf" : "inf";
    std::string s = fmt::format( "{}", d );
    if ( s.find_first_of(".eE") == std::string::npos ) s += ".0";
    return s;
  }

  // Display form of a node. Booleans read True/False and floats use their
  // shortest form, matching how definition values are shown in the tables.
  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "True" : "False";
    if ( n.is_float_number() ) {
      return format_float( to_native_checked< double >(n) );
    }
    if ( n.is_null() ) return std::string();

    // Not a scalar, so fall back to serialization
    return ordered_node::serialize( n );
  }

  // Mapping keys are always addressed by their string form, so that an
  // integer key such as `3:` and a quoted "3" name the same entry
  inline std::string key_string( const ordered_node& key ) {
    return to_string_any( key );
  }

  // True if the node is the literal reset sentinel string
  inline bool is_reset_token( const ordered_node& n,
    const std::string& token )
  {
    return n.is_string() && to_native_checked< std::string >( n ) == token;
  }

  // Copy of a mapping with one key dropped (order of the rest preserved)
  inline ordered_node without_key( const ordered_node& m,
    const std::string& key )
  {
    if ( !m.is_mapping() ) return m;
    ordered_node out = ordered_node::mapping();
    for ( const auto& [mk, mv] : m.map_items() ) {
      const std::string k = key_string( mk );
      if ( k == key ) continue;
      out[ k ] = mv;
    }
    return out;
  }

  // Copy of a sequence with its first element dropped
  inline ordered_node drop_first( const ordered_node& seq ) {
    std::vector< ordered_node > kept;
    if ( seq.size() > 1 ) kept.reserve( seq.size() - 1 );
    for ( std::size_t i = 1; i < seq.size(); ++i ) {
      kept.push_back( seq.at(i) );
    }
    return make_node_from( kept );
  }

  // Concatenation of two sequences into a new one
  inline ordered_node concat_sequences( const ordered_node& head,
    const ordered_node& tail )
  {
    std::vector< ordered_node > out;
    out.reserve( head.size() + tail.size() );
    for ( std::size_t i = 0; i < head.size(); ++i ) out.push_back( head.at(i) );
    for ( std::size_t i = 0; i < tail.size(); ++i ) out.push_back( tail.at(i) );
    return make_node_from( out );
  }

  // Look up a mapping entry by string key, tolerating non-string keys in the
  // mapping itself. Returns nullptr when the key is absent.
  inline const ordered_node* find_entry( const ordered_node& m,
    const std::string& key )
  {
    if ( !m.is_mapping() ) return nullptr;
    for ( const auto& [mk, mv] : m.map_items() ) {
      if ( key_string(mk) == key ) return &mv;
    }
    return nullptr;
  }

  inline bool has_entry( const ordered_node& m, const std::string& key ) {
    return find_entry( m, key ) != nullptr;
  }

  // Strip leading and trailing whitespace
  inline std::string trim( const std::string& s ) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while ( b < e && std::isspace(static_cast< unsigned char >(s[b])) ) ++b;
    while ( e > b && std::isspace(static_cast< unsigned char >(s[e - 1])) ) --e;
    return s.substr( b, e - b );
  }

  // Double-quoted YAML scalar with every special character escaped
  inline std::string quote_scalar( const std::string& s ) {
    std::string out = "\"";
    for ( char c : s ) {
      switch ( c ) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        default:
          if ( static_cast< unsigned char >(c) < 0x20 ) {
            char buf[ 8 ];
            std::snprintf( buf, sizeof(buf), "\\x%02x",
              static_cast< unsigned >( static_cast< unsigned char >(c) ) );
            out += buf;
          }
          else out += c;
      }
    }
    out += '"';
    return out;
  }

  // Flow-style YAML emitter. Every string is quoted, so reserved keys such
  // as "!type_docs!" and placeholder values such as "-" keep their meaning.
  inline void emit_flow( const ordered_node& n, std::ostringstream& oss ) {
    if ( n.is_mapping() ) {
      oss << '{';
      bool first = true;
      for ( const auto& [mk, mv] : n.map_items() ) {
        if ( !first ) oss << ", ";
        first = false;
        emit_flow( mk, oss );
        oss << ": ";
        emit_flow( mv, oss );
      }
      oss << '}';
    }
    else if ( n.is_sequence() ) {
      oss << '[';
      for ( std::size_t i = 0; i < n.size(); ++i ) {
        if ( i ) oss << ", ";
        emit_flow( n.at(i), oss );
      }
      oss << ']';
    }
    else if ( n.is_string() ) {
      oss << quote_scalar( to_native_checked< std::string >(n) );
    }
    else if ( n.is_integer() ) {
      oss << to_native_checked< std::int64_t >( n );
    }
    else if ( n.is_boolean() ) {
      oss << ( n.get_value< bool >() ? "true" : "false" );
    }
    else if ( n.is_float_number() ) {
      const double d = to_native_checked< double >( n );
      if ( std::isnan(d) ) oss << ".nan";
      else if ( std::isinf(d) ) oss << ( d < 0 ? "-.inf" : ".inf" );
      else oss << format_float( d );
    }
    else {
      oss << "null";
    }
  }

  // YAML text that deserializes back to a tree equal to `n`. The block
  // serializer is used when its output survives the trip; otherwise the
  // tree is written in fully quoted flow style.
  inline std::string to_yaml( const ordered_node& n ) {
    try {
      std::string text = ordered_node::serialize( n );
      if ( ordered_node::deserialize(text) == n ) return text;
    }
    catch ( const fkyaml::exception& ) {
      // Block output unreadable; the flow form below is used instead
    }
    std::ostringstream oss;
    emit_flow( n, oss );
    oss << '\n';
    return oss.str();
  }

} // namespace xapdoc::internal

} // namespace xapdoc
