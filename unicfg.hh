//  unicfg
//  Universal Configuration Language evaluator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the unicfg authors
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "unicfg_error.hh"
#include "unicfg_eval.hh"
#include "unicfg_source.hh"
#include "unicfg_text.hh"
#include "unicfg_value.hh"

namespace unicfg {

namespace internal {

  inline const std::string DEFAULTS_SECTION = "defaults";
  inline const std::string INCLUDE_KEYWORD = "include";

  // Path-keyed fallback values collected from the trailing [Defaults] block.
  // A path written twice keeps its first position and its latest value.
  struct DefaultsTable {
    std::vector< std::pair< std::string, ordered_node > > entries;

    inline void set( const std::string& path, const ordered_node& value );
  };

  // A trimmed line is an include directive when it starts with the keyword
  // followed by whitespace or a quote and is not an assignment to a key
  // named "include"
  inline bool is_include_directive( const std::string& trimmed ) {
    const size_t n = INCLUDE_KEYWORD.size();
    if ( trimmed.compare(0, n, INCLUDE_KEYWORD) != 0 ) return false;
    if ( trimmed.size() <= n ) return false;
    if ( is_quote_char(trimmed[n]) ) return true;
    if ( !std::isspace(static_cast< unsigned char >(trimmed[n])) ) return false;
    const std::string rest = trim( trimmed.substr(n) );
    return rest.empty() || rest.front() != '=';
  }

  // Lines without '=' that only carry structural punctuation are leftovers
  // of structured values and are skipped
  inline bool looks_like_fragment( const std::string& trimmed ) {
    return trimmed.find_first_of( "[]{},\"'" ) != std::string::npos;
  }

} // namespace unicfg::internal

  class Parser {
  public:
    // Constructor optionally takes non-default parse options
    inline explicit Parser( Options options = Options() )
      : options_( std::move(options) ), session_() {}

    // Evaluate a whole document. Includes resolve against
    // options().base_dir.
    ordered_node parse( const std::string& text );
    ordered_node parse( std::istream& in );

    // Evaluate the document stored at `path`. Includes resolve against the
    // directory containing it.
    ordered_node parse_file( const std::string& path );

    const Options& options() const { return options_; }

  private:

    // Wraps internal state refreshed upon each call to parse(...)
    struct ParseSession {

      // Document being assembled
      ordered_node doc = ordered_node::mapping();

      // Current section, e.g., ["Network", "HTTP", "CORS"]
      internal::SectionPath section;

      // Entries of the trailing [Defaults] block
      internal::DefaultsTable defaults;
      bool in_defaults = false;

      // Include base directory for this call
      std::string base_dir;

      // Normalized paths of the files being expanded (cycle detection)
      std::vector< std::string > include_stack;
    };

    Options options_;

    // Other internal state used during a call to parse(...)
    ParseSession session_;

    // Processing stages
    ordered_node run( const std::string& text, const std::string& base_dir,
      const std::optional< std::string >& top_level_file );
    std::vector< std::string > expand_includes(
      const std::vector< std::string >& lines );
    void assemble( const std::vector< std::string >& lines );
    void apply_defaults();

    // Line handlers return the index of the next unconsumed line
    size_t assemble_line( const std::vector< std::string >& lines, size_t i );
    size_t assemble_key_value( const std::vector< std::string >& lines,
      size_t i );

    void set_section( const std::string& name );
    ordered_node evaluate( const std::string& value_text );

    // Write `value` at `segs`, creating intermediate mappings and replacing
    // any non-mapping value found along the way
    void store_at( const std::vector< std::string >& segs,
      const ordered_node& value );

  }; // class Parser

  // Convenience wrappers using a fresh parser per call
  inline ordered_node parse( const std::string& text,
    const Options& options = Options() )
  {
    Parser parser( options );
    return parser.parse( text );
  }

  inline ordered_node parse_file( const std::string& path,
    const Options& options = Options() )
  {
    Parser parser( options );
    return parser.parse_file( path );
  }

} // namespace unicfg

inline void unicfg::internal::DefaultsTable::set( const std::string& path,
  const ordered_node& value )
{
  for ( auto& entry : entries ) {
    if ( entry.first == path ) {
      entry.second = value;
      return;
    }
  }
  entries.emplace_back( path, value );
}

inline unicfg::ordered_node unicfg::Parser::parse( const std::string& text ) {
  return this->run( text, options_.base_dir, std::nullopt );
}

// Read from an input stream until end-of-file, then apply full processing
// on the resulting string
inline unicfg::ordered_node unicfg::Parser::parse( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return this->parse( ss.str() );
}

inline unicfg::ordered_node unicfg::Parser::parse_file(
  const std::string& path )
{
  std::error_code ec;
  std::filesystem::path full = std::filesystem::absolute( path, ec );
  if ( ec ) full = std::filesystem::path( path );
  full = full.lexically_normal();

  const std::string base_dir = full.parent_path().string();
  const std::optional< std::string > content
    = options_.reader( full.filename().string(), base_dir );
  if ( !content ) throw InclusionError( "File not found: " + path );

  return this->run( *content, base_dir, full.string() );
}

// Main implementation: preprocess, expand includes, assemble, then fill
// defaults
inline unicfg::ordered_node unicfg::Parser::run( const std::string& text,
  const std::string& base_dir,
  const std::optional< std::string >& top_level_file )
{
  // Rebuild default session state for this call
  session_ = ParseSession();
  session_.base_dir = base_dir;
  if ( top_level_file ) session_.include_stack.push_back( *top_level_file );

  // 1) Comments out, line structure kept
  std::vector< std::string > lines
    = internal::split_lines( internal::strip_comments(text) );

  // 2) Splice included documents in place of their directives
  lines = this->expand_includes( lines );

  // 3) Sections, keys and values; collects the [Defaults] block
  this->assemble( lines );

  // 4) Fill absent or null keys from the [Defaults] block
  this->apply_defaults();

  return session_.doc;
}

// Every include resolves against the base directory of the top-level
// document, including includes nested inside included files
inline std::vector< std::string > unicfg::Parser::expand_includes(
  const std::vector< std::string >& lines )
{
  static const std::regex directive(
    R"(include\s+(?:"([^"]+)"|'([^']+)'))" );

  std::vector< std::string > out;
  out.reserve( lines.size() );

  for ( const auto& line : lines ) {
    const std::string trimmed = internal::trim( line );
    if ( !internal::is_include_directive(trimmed) ) {
      out.push_back( line );
      continue;
    }

    std::smatch m;
    if ( !std::regex_match(trimmed, m, directive) ) {
      throw SyntaxError( "Invalid include syntax: " + trimmed );
    }
    const std::string target = m[1].matched ? m[1].str() : m[2].str();
    const std::string identity = ( std::filesystem::path(session_.base_dir)
      / target ).lexically_normal().string();

    auto& stack = session_.include_stack;
    if ( std::find(stack.begin(), stack.end(), identity) != stack.end() ) {
      throw InclusionError( "Circular include: " + target );
    }
    if ( static_cast< int >(stack.size()) >= options_.max_depth ) {
      std::ostringstream oss;
      oss << "Include nesting deeper than " << options_.max_depth
        << " at: " << target;
      throw InclusionError( oss.str() );
    }

    const std::optional< std::string > content
      = options_.reader( target, session_.base_dir );
    if ( !content ) throw InclusionError( "Include file not found: " + target );

    stack.push_back( identity );
    const std::vector< std::string > included = this->expand_includes(
      internal::split_lines(internal::strip_comments(*content)) );
    stack.pop_back();

    out.insert( out.end(), included.begin(), included.end() );
  }
  return out;
}

// Errors escaping a line are stamped with its logical (post-include) line
// number and the section in effect
inline void unicfg::Parser::assemble( const std::vector< std::string >& lines )
{
  size_t i = 0;
  while ( i < lines.size() ) {
    const size_t first = i;
    try {
      i = this->assemble_line( lines, i );
    }
    catch ( Error& e ) {
      e.locate( first + 1, internal::join_path(session_.section) );
      throw;
    }
  }
}

inline size_t unicfg::Parser::assemble_line(
  const std::vector< std::string >& lines, size_t i )
{
  const std::string line = internal::trim( lines[i] );
  if ( line.empty() ) return i + 1;

  if ( line.front() == '[' && line.back() == ']' ) {
    // Nothing may follow the [Defaults] block
    if ( session_.in_defaults ) {
      throw SyntaxError( "Defaults section must be at the end of the file,"
        " found section header: " + line );
    }
    const std::string name = internal::trim( line.substr(1, line.size() - 2) );
    if ( internal::iequals(name, internal::DEFAULTS_SECTION) ) {
      session_.in_defaults = true;
    } else {
      this->set_section( name );
    }
    return i + 1;
  }

  return this->assemble_key_value( lines, i );
}

inline void unicfg::Parser::set_section( const std::string& name ) {
  if ( name.empty() ) throw SyntaxError( "Empty section name" );

  internal::SectionPath path;
  for ( const auto& seg : internal::split_segments(name) ) {
    const std::string s = internal::trim( seg );
    if ( s.empty() ) {
      throw SyntaxError( "Empty segment in section name: [" + name + "]" );
    }
    path.push_back( s );
  }
  session_.section = path;
}

inline size_t unicfg::Parser::assemble_key_value(
  const std::vector< std::string >& lines, size_t i )
{
  const std::string line = internal::trim( lines[i] );

  const size_t eq = internal::find_unquoted( line, '=' );
  if ( eq == std::string::npos ) {
    if ( internal::looks_like_fragment(line) ) return i + 1;
    throw SyntaxError( "Invalid syntax: line without equals sign: " + line );
  }

  const std::string key = internal::trim( line.substr(0, eq) );
  if ( key.empty() ) throw SyntaxError( "Missing key before '=': " + line );

  std::string value_text = internal::trim( line.substr(eq + 1) );
  size_t next = i + 1;

  // Structured values may continue over the following non-blank lines until
  // their brackets and braces balance
  if ( !value_text.empty()
    && (value_text.front() == '{' || value_text.front() == '[') )
  {
    int balance = internal::structure_balance( value_text );
    while ( balance > 0 && next < lines.size() ) {
      const std::string cont = internal::trim( lines[next++] );
      if ( cont.empty() ) continue;
      value_text += '\n' + cont;
      balance += internal::structure_balance( cont );
    }
    if ( balance > 0 ) {
      throw SyntaxError( "Unterminated structured value for key '" + key
        + "': " + internal::trim(lines[i]) );
    }
  }

  const ordered_node value = this->evaluate( value_text );

  if ( session_.in_defaults ) {
    // Left side is a literal dotted path, not scoped by the section
    session_.defaults.set( key, value );
  } else {
    internal::SectionPath path = session_.section;
    path.push_back( key );
    this->store_at( path, value );
  }
  return next;
}

inline unicfg::ordered_node unicfg::Parser::evaluate(
  const std::string& value_text )
{
  internal::EvalContext ctx{ session_.doc, session_.section, options_.env,
    options_.max_depth };
  return internal::parse_value( value_text, ctx );
}

inline void unicfg::Parser::store_at( const std::vector< std::string >& segs,
  const ordered_node& value )
{
  ordered_node* cur = &session_.doc;
  for ( size_t i = 0; i + 1 < segs.size(); ++i ) {
    const std::string& seg = segs[ i ];
    if ( !cur->contains(seg) || !cur->at(seg).is_mapping() ) {
      ( *cur )[ seg ] = ordered_node::mapping();
    }
    cur = &( *cur )[ seg ];
  }
  ( *cur )[ segs.back() ] = value;
}

// A default lands where the document has no value or only null
inline void unicfg::Parser::apply_defaults() {
  for ( const auto& [path, value] : session_.defaults.entries ) {
    const ordered_node* existing = find_path( session_.doc, path );
    if ( existing && !existing->is_null() ) continue;

    const std::vector< std::string > segs = internal::split_segments( path );
    for ( const auto& seg : segs ) {
      if ( seg.empty() ) {
        throw SyntaxError( "Invalid path in defaults section: " + path );
      }
    }
    this->store_at( segs, value );
  }
}
