//  XAPDOC  Layered XAP definition merger & documentation generator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the xapdoc authors
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "xapdoc/node.hh"

namespace xapdoc {

  // Folds an ordered sequence of partial definition trees into one tree.
  //
  // Later layers override plain values, append to sequences and merge
  // mappings key by key. A sequence whose first element is the reset token
  // replaces the earlier sequence with the rest of its elements. A mapping
  // that contains the reset token as a key replaces the earlier mapping
  // (with the token key removed).
  //
  // Merging never modifies its inputs: every call returns a fresh tree.
  class Merger {
  public:

    static constexpr const char* DEFAULT_RESET_TOKEN = "!reset!";

    inline explicit Merger( std::string reset_token = DEFAULT_RESET_TOKEN )
      : reset_token_( std::move(reset_token) ) {}

    // Merge one incoming layer onto an optional existing tree
    ordered_node merge( const std::optional< ordered_node >& existing,
      const ordered_node& incoming ) const;

    // Left fold of merge() over the layers, first to last
    ordered_node merge_all( const std::vector< ordered_node >& layers ) const;

    const std::string& reset_token() const { return reset_token_; }

  private:

    std::string reset_token_;

    ordered_node merge_mappings( const ordered_node& existing,
      const ordered_node& incoming ) const;

    ordered_node merge_entry( const ordered_node* existing,
      const ordered_node& incoming ) const;

    bool starts_with_reset( const ordered_node& seq ) const;
  };

} // namespace xapdoc

inline xapdoc::ordered_node xapdoc::Merger::merge(
  const std::optional< ordered_node >& existing,
  const ordered_node& incoming ) const
{
  // First layer: a copy of the incoming tree, verbatim
  if ( !existing ) return incoming;

  // Only mappings merge structurally at the top level
  if ( !existing->is_mapping() || !incoming.is_mapping() ) return incoming;

  return merge_mappings( *existing, incoming );
}

inline xapdoc::ordered_node xapdoc::Merger::merge_all(
  const std::vector< ordered_node >& layers ) const
{
  std::optional< ordered_node > result;
  for ( const auto& layer : layers ) {
    result = merge( result, layer );
  }
  return result ? *result : ordered_node::mapping();
}

inline bool xapdoc::Merger::starts_with_reset( const ordered_node& seq ) const
{
  // Only the first element is inspected. An empty sequence never resets.
  if ( !seq.is_sequence() || seq.size() == 0 ) return false;
  return internal::is_reset_token( seq.at(0), reset_token_ );
}

inline xapdoc::ordered_node xapdoc::Merger::merge_mappings(
  const ordered_node& existing, const ordered_node& incoming ) const
{
  using internal::key_string;

  // Start from a copy of the existing entries (keys normalized to strings)
  ordered_node result = ordered_node::mapping();
  for ( const auto& [mk, mv] : existing.map_items() ) {
    result[ key_string(mk) ] = mv;
  }

  // Apply incoming entries in their authored order
  for ( const auto& [mk, mv] : incoming.map_items() ) {
    const std::string k = key_string( mk );
    if ( result.contains(k) ) {
      const ordered_node prior = result.at( k );
      result[ k ] = merge_entry( &prior, mv );
    }
    else {
      result[ k ] = merge_entry( nullptr, mv );
    }
  }
  return result;
}

inline xapdoc::ordered_node xapdoc::Merger::merge_entry(
  const ordered_node* existing, const ordered_node& incoming ) const
{
  // Key absent from the existing tree: value set directly regardless of type
  if ( existing == nullptr ) return incoming;

  if ( incoming.is_mapping() ) {
    // The reset key discards everything merged so far for this key
    if ( internal::has_entry(incoming, reset_token_) ) {
      return internal::without_key( incoming, reset_token_ );
    }

    // A mapping arriving over a non-mapping has nothing to merge into
    ordered_node merged = existing->is_mapping()
      ? merge_mappings( *existing, incoming ) : incoming;
    if ( internal::has_entry(merged, reset_token_) ) {
      merged = internal::without_key( merged, reset_token_ );
    }
    return merged;
  }

  if ( incoming.is_sequence() ) {
    if ( starts_with_reset(incoming) ) return internal::drop_first( incoming );
    if ( existing->is_sequence() ) {
      return internal::concat_sequences( *existing, incoming );
    }
    return incoming;
  }

  // Scalars (and null) replace outright
  return incoming;
}
