//  unicfg
//  Universal Configuration Language evaluator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the unicfg authors
#pragma once

// Standard library includes
#include <sstream>
#include <stdexcept>
#include <string>

namespace unicfg {

  enum class ErrorKind { Syntax, Reference, Type, Inclusion };

  inline const char* kind_name( ErrorKind kind ) {
    switch ( kind ) {
      case ErrorKind::Syntax: return "syntax error";
      case ErrorKind::Reference: return "reference error";
      case ErrorKind::Type: return "type error";
      case ErrorKind::Inclusion: return "inclusion error";
    }
    return "error";
  }

  // Root of the error family. what() reports the bare detail until the
  // document assembler stamps the error with the logical line and section
  // in which it escaped, after which it reads
  // "line 7 [Network.HTTP]: Cannot resolve reference: port".
  class Error : public std::runtime_error {
  public:
    Error( ErrorKind kind, const std::string& detail )
      : std::runtime_error( detail ), kind_( kind ), detail_( detail ),
      message_( detail ) {}

    const char* what() const noexcept override { return message_.c_str(); }

    ErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

    // Logical (post-include) line number, 0 when not yet located
    size_t line() const { return line_; }

    // Only the innermost location is kept
    void locate( size_t line, const std::string& section ) {
      if ( line_ != 0 ) return;
      line_ = line;
      std::ostringstream oss;
      oss << "line " << line;
      if ( !section.empty() ) oss << " [" << section << ']';
      oss << ": " << detail_;
      message_ = oss.str();
    }

  private:
    ErrorKind kind_;
    std::string detail_;
    std::string message_;
    size_t line_ = 0;
  };

  // Malformed lines, parentheses, literals, references, includes, misplaced
  // [Defaults] block, runaway nesting
  class SyntaxError : public Error {
  public:
    explicit SyntaxError( const std::string& detail )
      : Error( ErrorKind::Syntax, detail ) {}
  };

  // Unresolvable paths, missing keys, bad indices
  class ReferenceError : public Error {
  public:
    explicit ReferenceError( const std::string& detail )
      : Error( ErrorKind::Reference, detail ) {}
  };

  // Failed conversions, non-numeric operands, division by zero
  class TypeError : public Error {
  public:
    explicit TypeError( const std::string& detail )
      : Error( ErrorKind::Type, detail ) {}
  };

  // Missing or circular include targets, missing top-level file
  class InclusionError : public Error {
  public:
    explicit InclusionError( const std::string& detail )
      : Error( ErrorKind::Inclusion, detail ) {}
  };

} // namespace unicfg
