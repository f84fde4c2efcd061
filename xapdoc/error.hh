//  XAPDOC  Layered XAP definition merger & documentation generator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the xapdoc authors
#pragma once

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace xapdoc {

  // Categories of run-terminating failures
  enum class ErrorKind {
    Config,         // bad configuration file or command line
    Input,          // layer discovery failed (missing directory, unreadable)
    InputParse,     // a layer is not valid structured data
    Render,         // a rendered section's source key is malformed
    MissingSection, // documentation order names a section that has no text
    Output,         // a document could not be written
    Structure       // a tree operation rejected the shape of a node
  };

  inline const char* to_string( ErrorKind kind ) {
    switch ( kind ) {
      case ErrorKind::Config: return "ConfigError";
      case ErrorKind::Input: return "InputError";
      case ErrorKind::InputParse: return "InputParseError";
      case ErrorKind::Render: return "RenderError";
      case ErrorKind::MissingSection: return "MissingSectionError";
      case ErrorKind::Output: return "OutputError";
      case ErrorKind::Structure: return "StructuralMergeError";
    }
    return "Error";
  }

  class Error : public std::runtime_error {
  public:
    Error( ErrorKind kind, const std::string& msg )
      : std::runtime_error( msg ), kind_( kind ) {}

    ErrorKind kind() const { return kind_; }

  private:
    ErrorKind kind_;
  };

  // Typed failure handed back to the run driver's caller. The dump holds the
  // cumulative tree (as YAML that reads back to the same tree) at the moment of failure, or is
  // empty when no layer had been merged yet.
  struct GenerateError {
    ErrorKind kind;
    std::string message;
    std::string layer;
    std::string dump;
  };

namespace internal {

  // Compose "<where>: message (hint)" and throw it as an Error
  [[noreturn]] inline void throw_error( ErrorKind kind,
    const std::string& where, const std::string& msg,
    const std::optional< std::string >& hint = std::nullopt )
  {
    std::ostringstream oss;
    if ( !where.empty() ) oss << where << ": ";
    oss << msg;
    if ( hint && !hint->empty() ) {
      oss << " (" << *hint << ')';
    }
    throw Error( kind, oss.str() );
  }

} // namespace xapdoc::internal

} // namespace xapdoc
