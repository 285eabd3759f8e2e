//  unicfg
//  Universal Configuration Language evaluator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the unicfg authors
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <regex>
#include <string>
#include <vector>

namespace unicfg::internal {

  inline constexpr char BLOCK_COMMENT_OPEN[] = "/*";
  inline constexpr char BLOCK_COMMENT_CLOSE[] = "*/";
  inline constexpr char LINE_COMMENT[] = "//";
  inline constexpr char OPERATOR_CHARS[] = "+-*/%";

  inline bool is_quote_char( char c ) { return c == '"' || c == '\''; }

  inline bool is_operator_char( char c ) {
    return c != '\0' && std::string( OPERATOR_CHARS ).find( c )
      != std::string::npos;
  }

  inline std::string trim( const std::string& s ) {
    const char* ws = " \t\r\n\f\v";
    const size_t b = s.find_first_not_of( ws );
    if ( b == std::string::npos ) return "";
    const size_t e = s.find_last_not_of( ws );
    return s.substr( b, e - b + 1 );
  }

  inline std::string to_lower( std::string s ) {
    std::transform( s.begin(), s.end(), s.begin(), []( unsigned char c ) {
      return static_cast< char >( std::tolower(c) );
    } );
    return s;
  }

  inline bool iequals( const std::string& a, const std::string& b ) {
    return to_lower( a ) == to_lower( b );
  }

  // Tracks whether a left-to-right scan sits inside a quoted span. Double
  // and single quotes are independent kinds; a backslash inside a quoted
  // span escapes the next character, so \" does not close a "..." span.
  struct QuoteState {
    char quote = 0;
    bool escaped = false;

    bool in_quotes() const { return quote != 0; }

    // Consume one character. Returns true when the character is ordinary
    // text outside any quoted span (quote delimiters themselves are not).
    bool step( char c ) {
      if ( quote ) {
        if ( escaped ) escaped = false;
        else if ( c == '\\' ) escaped = true;
        else if ( c == quote ) quote = 0;
        return false;
      }
      if ( is_quote_char(c) ) {
        quote = c;
        return false;
      }
      return true;
    }
  };

  // Position of the first `ch` outside quotes, or npos
  inline size_t find_unquoted( const std::string& s, char ch,
    size_t from = 0 )
  {
    QuoteState qs;
    for ( size_t i = 0; i < s.size(); ++i ) {
      if ( qs.step(s[i]) && i >= from && s[i] == ch ) return i;
    }
    return std::string::npos;
  }

  inline bool contains_operator( const std::string& s ) {
    QuoteState qs;
    for ( char c : s ) {
      if ( qs.step(c) && is_operator_char(c) ) return true;
    }
    return false;
  }

  // Position of the delimiter closing the one at `open_pos` ('(', '[' or
  // '{'), ignoring delimiters inside quotes. npos when unmatched.
  inline size_t matching_close( const std::string& s, size_t open_pos ) {
    const char open = s[ open_pos ];
    const char close = open == '(' ? ')' : open == '[' ? ']' : '}';
    QuoteState qs;
    int depth = 0;
    for ( size_t i = open_pos; i < s.size(); ++i ) {
      if ( !qs.step(s[i]) ) continue;
      if ( s[i] == open ) ++depth;
      else if ( s[i] == close && --depth == 0 ) return i;
    }
    return std::string::npos;
  }

  // True when the whole of `s` is one balanced open...close span
  inline bool is_wrapped( const std::string& s, char open ) {
    if ( s.size() < 2 || s.front() != open ) return false;
    return matching_close( s, 0 ) == s.size() - 1;
  }

  // True when `s` is exactly one quoted literal: the match of the opening
  // quote is the last character
  inline bool is_complete_quoted( const std::string& s ) {
    if ( s.size() < 2 || !is_quote_char(s.front()) ) return false;
    QuoteState qs;
    for ( size_t i = 0; i < s.size(); ++i ) {
      qs.step( s[i] );
      if ( !qs.in_quotes() ) return i == s.size() - 1;
    }
    return false;
  }

  // Net count of opening minus closing brackets and braces outside quotes
  inline int structure_balance( const std::string& line ) {
    QuoteState qs;
    int balance = 0;
    for ( char c : line ) {
      if ( !qs.step(c) ) continue;
      if ( c == '[' || c == '{' ) ++balance;
      else if ( c == ']' || c == '}' ) --balance;
    }
    return balance;
  }

  // Split on `sep` at nesting depth zero, outside quotes. Segments are
  // trimmed and empty segments dropped.
  inline std::vector< std::string > split_top_level( const std::string& s,
    char sep )
  {
    std::vector< std::string > parts;
    std::string current;
    QuoteState qs;
    int depth = 0;
    for ( char c : s ) {
      if ( qs.step(c) ) {
        if ( c == '[' || c == '{' || c == '(' ) ++depth;
        else if ( c == ']' || c == '}' || c == ')' ) --depth;
        else if ( c == sep && depth == 0 ) {
          if ( !trim(current).empty() ) parts.push_back( trim(current) );
          current.clear();
          continue;
        }
      }
      current += c;
    }
    if ( !trim(current).empty() ) parts.push_back( trim(current) );
    return parts;
  }

  // Resolve \n \t \r \\ \" \' escapes; any other backslash stays literal
  inline std::string unescape( const std::string& s ) {
    std::string out;
    out.reserve( s.size() );
    for ( size_t i = 0; i < s.size(); ++i ) {
      if ( s[i] == '\\' && i + 1 < s.size() ) {
        const char next = s[ i + 1 ];
        switch ( next ) {
          case 'n': out += '\n'; ++i; continue;
          case 't': out += '\t'; ++i; continue;
          case 'r': out += '\r'; ++i; continue;
          case '\\': case '"': case '\'': out += next; ++i; continue;
          default: break;
        }
      }
      out += s[i];
    }
    return out;
  }

  // Decimal numbers only: -?digits(.digits)?, no exponent form
  inline bool is_decimal_number( const std::string& s ) {
    static const std::regex number( R"(-?[0-9]+(\.[0-9]+)?)" );
    return std::regex_match( s, number );
  }

  // Remove /* ... */ block comments (non-greedy, not nested; newlines inside
  // are kept so line numbers survive) and then // line comments that start
  // outside quotes
  inline std::string strip_comments( const std::string& text ) {
    std::string no_blocks;
    no_blocks.reserve( text.size() );
    size_t pos = 0;
    while ( pos < text.size() ) {
      const size_t open = text.find( BLOCK_COMMENT_OPEN, pos );
      if ( open == std::string::npos ) {
        no_blocks.append( text, pos, std::string::npos );
        break;
      }
      no_blocks.append( text, pos, open - pos );
      const size_t close = text.find( BLOCK_COMMENT_CLOSE, open + 2 );
      const size_t end = close == std::string::npos ? text.size() : close + 2;
      no_blocks.append( static_cast< size_t >( std::count(
        text.begin() + open, text.begin() + end, '\n') ), '\n' );
      pos = end;
    }

    std::string out;
    out.reserve( no_blocks.size() );
    QuoteState qs;
    bool in_line_comment = false;
    for ( size_t i = 0; i < no_blocks.size(); ++i ) {
      const char c = no_blocks[ i ];
      if ( c == '\n' ) {
        // Quote state never carries across physical lines
        qs = QuoteState();
        in_line_comment = false;
        out += c;
        continue;
      }
      if ( in_line_comment ) continue;
      if ( qs.step(c) && no_blocks.compare(i, 2, LINE_COMMENT) == 0 ) {
        in_line_comment = true;
        continue;
      }
      out += c;
    }
    return out;
  }

  inline std::vector< std::string > split_lines( const std::string& text ) {
    std::vector< std::string > lines;
    size_t start = 0;
    while ( true ) {
      const size_t nl = text.find( '\n', start );
      if ( nl == std::string::npos ) {
        lines.push_back( text.substr(start) );
        break;
      }
      lines.push_back( text.substr(start, nl - start) );
      start = nl + 1;
    }
    return lines;
  }

} // namespace unicfg::internal
