//  XAPDOC  Layered XAP definition merger & documentation generator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the xapdoc authors
#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace xapdoc {

namespace internal {

  inline constexpr const char* VERSION_DELIMITERS = ".-_";

  // Split a version string on any of VERSION_DELIMITERS
  inline std::vector< std::string > split_version( const std::string& v ) {
    std::vector< std::string > segs;
    std::string cur;
    for ( char c : v ) {
      if ( std::string( VERSION_DELIMITERS ).find(c) != std::string::npos ) {
        segs.push_back( cur );
        cur.clear();
      }
      else {
        cur += c;
      }
    }
    segs.push_back( cur );
    return segs;
  }

  inline bool all_digits( const std::string& s ) {
    return !s.empty() && std::all_of( s.begin(), s.end(),
      []( char c ) { return std::isdigit( static_cast<unsigned char>(c) ); } );
  }

  // Numeric comparison of two digit strings of any length
  inline int compare_numeric( const std::string& a, const std::string& b ) {
    std::size_t ia = a.find_first_not_of( '0' );
    std::size_t ib = b.find_first_not_of( '0' );
    const std::string na = ( ia == std::string::npos ) ? "" : a.substr( ia );
    const std::string nb = ( ib == std::string::npos ) ? "" : b.substr( ib );
    if ( na.size() != nb.size() ) return na.size() < nb.size() ? -1 : 1;
    return na.compare( nb ) < 0 ? -1 : ( na == nb ? 0 : 1 );
  }

} // namespace xapdoc::internal

  // Three-way comparison of version strings: negative if a < b, zero if
  // equal, positive if a > b. Segments that are both numeric compare as
  // numbers, so "0.10.0" sorts after "0.9.0".
  inline int compare_versions( const std::string& a, const std::string& b ) {
    const auto sa = internal::split_version( a );
    const auto sb = internal::split_version( b );
    const std::size_t n = std::min( sa.size(), sb.size() );
    for ( std::size_t i = 0; i < n; ++i ) {
      int c = 0;
      if ( internal::all_digits(sa[i]) && internal::all_digits(sb[i]) ) {
        c = internal::compare_numeric( sa[i], sb[i] );
      }
      else {
        const int r = sa[ i ].compare( sb[i] );
        c = ( r < 0 ) ? -1 : ( r > 0 ? 1 : 0 );
      }
      if ( c != 0 ) return c;
    }
    if ( sa.size() == sb.size() ) return 0;
    return sa.size() < sb.size() ? -1 : 1;
  }

  // Display version of a layer: its stem with the layer prefix removed
  inline std::string version_of_stem( const std::string& stem,
    const std::string& prefix )
  {
    if ( !prefix.empty() && stem.rfind(prefix, 0) == 0 ) {
      return stem.substr( prefix.size() );
    }
    return stem;
  }

} // namespace xapdoc
