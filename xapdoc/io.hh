//  XAPDOC  Layered XAP definition merger & documentation generator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the xapdoc authors
#pragma once

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "xapdoc/error.hh"
#include "xapdoc/node.hh"
#include "xapdoc/version.hh"

namespace xapdoc {

  // One unparsed layer: the stem names its output document, the origin is
  // used in diagnostics
  struct LayerInput {
    std::string stem;
    std::string origin;
    std::string text;
  };

  // Supplies the layers in ascending version order
  class LayerSource {
  public:
    virtual ~LayerSource() = default;
    virtual std::vector< LayerInput > layers() = 0;
  };

  // Accepts finished documents by file name. Writing an existing name
  // replaces its content.
  class DocumentSink {
  public:
    virtual ~DocumentSink() = default;
    virtual void write( const std::string& filename,
      const std::string& text ) = 0;
  };

  // Layers read from `<dir>/<prefix>*<ext>` files
  class DirectoryLayerSource : public LayerSource {
  public:
    DirectoryLayerSource( std::filesystem::path dir, std::string prefix,
      std::vector< std::string > extensions )
      : dir_( std::move(dir) ), prefix_( std::move(prefix) ),
        extensions_( std::move(extensions) ) {}

    std::vector< LayerInput > layers() override;

    // Matching files, sorted ascending by version
    std::vector< std::filesystem::path > discover() const;

  private:
    std::filesystem::path dir_;
    std::string prefix_;
    std::vector< std::string > extensions_;
  };

  // Documents written as files under one directory
  class FileSink : public DocumentSink {
  public:
    explicit FileSink( std::filesystem::path dir ) : dir_( std::move(dir) ) {}

    void write( const std::string& filename, const std::string& text ) override;

    const std::filesystem::path& directory() const { return dir_; }

  private:
    std::filesystem::path dir_;
  };

  // Parse one layer. The root must be a mapping; an empty document is an
  // empty mapping.
  ordered_node parse_layer( const LayerInput& input );

  // Write a whole file, replacing existing content
  void write_text_file( const std::filesystem::path& path,
    const std::string& text );

} // namespace xapdoc

inline std::vector< std::filesystem::path >
  xapdoc::DirectoryLayerSource::discover() const
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if ( !fs::is_directory(dir_, ec) ) {
    internal::throw_error( ErrorKind::Input, dir_.string(),
      "definitions directory does not exist" );
  }

  std::vector< fs::path > found;
  fs::directory_iterator it( dir_, ec );
  if ( ec ) {
    internal::throw_error( ErrorKind::Input, dir_.string(),
      "cannot list definitions directory", ec.message() );
  }
  for ( ; it != fs::directory_iterator(); it.increment(ec) ) {
    if ( ec ) {
      internal::throw_error( ErrorKind::Input, dir_.string(),
        "cannot list definitions directory", ec.message() );
    }
    if ( !it->is_regular_file(ec) ) continue;
    const fs::path& p = it->path();
    const std::string stem = p.stem().string();
    if ( stem.rfind(prefix_, 0) != 0 ) continue;
    const std::string ext = p.extension().string();
    if ( std::find(extensions_.begin(), extensions_.end(), ext)
      == extensions_.end() ) continue;
    found.push_back( p );
  }

  // Ascending by version, ties broken by stem for a stable order
  std::sort( found.begin(), found.end(),
    [&]( const fs::path& a, const fs::path& b ) {
      const std::string sa = a.stem().string();
      const std::string sb = b.stem().string();
      const int c = compare_versions( version_of_stem(sa, prefix_),
        version_of_stem(sb, prefix_) );
      if ( c != 0 ) return c < 0;
      return a.filename().string() < b.filename().string();
    } );

  return found;
}

inline std::vector< xapdoc::LayerInput >
  xapdoc::DirectoryLayerSource::layers()
{
  std::vector< LayerInput > out;
  for ( const auto& p : discover() ) {
    std::ifstream in( p, std::ios::binary );
    if ( !in ) {
      internal::throw_error( ErrorKind::Input, p.string(),
        "cannot open definitions file" );
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out.push_back( LayerInput{ p.stem().string(), p.string(), ss.str() } );
  }
  return out;
}

inline xapdoc::ordered_node xapdoc::parse_layer( const LayerInput& input ) {
  ordered_node dom;
  try {
    dom = ordered_node::deserialize( input.text );
  }
  catch ( const fkyaml::exception& ex ) {
    internal::throw_error( ErrorKind::InputParse, input.origin,
      "layer is not valid structured data", std::string( ex.what() ) );
  }

  if ( dom.is_null() ) return ordered_node::mapping();
  if ( !dom.is_mapping() ) {
    internal::throw_error( ErrorKind::InputParse, input.origin,
      "layer root must be a mapping" );
  }
  return dom;
}

inline void xapdoc::write_text_file( const std::filesystem::path& path,
  const std::string& text )
{
  std::error_code ec;
  if ( path.has_parent_path() ) {
    std::filesystem::create_directories( path.parent_path(), ec );
    if ( ec ) {
      internal::throw_error( ErrorKind::Output, path.parent_path().string(),
        "cannot create output directory", ec.message() );
    }
  }

  std::ofstream out( path, std::ios::binary | std::ios::trunc );
  if ( !out ) {
    internal::throw_error( ErrorKind::Output, path.string(),
      "cannot open output file" );
  }
  out << text;
  out.flush();
  if ( !out ) {
    internal::throw_error( ErrorKind::Output, path.string(),
      "failed writing output file" );
  }
}

inline void xapdoc::FileSink::write( const std::string& filename,
  const std::string& text )
{
  write_text_file( dir_ / filename, text );
}
