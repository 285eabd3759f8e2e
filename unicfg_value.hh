//  unicfg
//  Universal Configuration Language evaluator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the unicfg authors
#pragma once

// Standard library includes
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include <fkYAML/node.hpp>

namespace unicfg {

  // Specialized version of the fkYAML basic_node template used as the value
  // type for every evaluated configuration value. fkyaml::ordered_map keeps
  // keys in the order they were first assigned, so a rendered document reads
  // in the same order as its source.
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

  inline constexpr char PATH_DELIMITER = '.';

  // Integral values below this magnitude render without a fractional part
  inline constexpr double MAX_EXACT_INTEGRAL = 1e15;

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

  // Divide a dotted path string by PATH_DELIMITER instances
  inline std::vector< std::string > split_segments( const std::string& path ) {
    std::vector< std::string > segs;
    size_t start = 0;
    while ( true ) {
      size_t pos = path.find( PATH_DELIMITER, start );
      if ( pos == std::string::npos ) {
        segs.push_back( path.substr(start) );
        break;
      }
      segs.push_back( path.substr(start, pos - start) );
      start = pos + 1;
    }
    return segs;
  }

  // Connects path segments into a full path string with PATH_DELIMITER
  inline std::string join_path( const std::vector< std::string >& segs ) {
    std::string s;
    for ( size_t i = 0; i < segs.size(); ++i ) {
      if ( i ) s += PATH_DELIMITER;
      s += segs[ i ];
    }
    return s;
  }

  // Shortest decimal text that reads back as the same double
  inline std::string shortest_decimal( double v ) {
    std::string text;
    for ( int precision = 15; precision <= 17; ++precision ) {
      std::ostringstream oss;
      oss << std::setprecision( precision ) << v;
      text = oss.str();
      if ( std::stod(text) == v ) break;
    }
    return text;
  }

  inline std::string quote_string( const std::string& s ) {
    std::string out = "\"";
    for ( char c : s ) {
      switch ( c ) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        default: out += c;
      }
    }
    out += '"';
    return out;
  }

  inline bool is_integral( double v ) {
    return std::isfinite( v ) && std::trunc( v ) == v
      && std::fabs( v ) < MAX_EXACT_INTEGRAL;
  }

} // namespace unicfg::internal

  // Value constructors. Numbers are always stored as float nodes; whether a
  // number is integral only matters when it is converted or rendered.
  inline ordered_node make_null() { return ordered_node(); }

  inline ordered_node make_bool( bool b ) {
    return internal::make_node_from( b );
  }

  inline ordered_node make_number( double d ) {
    return internal::make_node_from( d );
  }

  inline ordered_node make_string( const std::string& s ) {
    return internal::make_node_from( s );
  }

  inline ordered_node make_sequence( const std::vector< ordered_node >& items ) {
    if ( items.empty() ) return ordered_node::sequence();
    return internal::make_node_from( items );
  }

  inline bool is_number( const ordered_node& n ) {
    return n.is_float_number() || n.is_integer();
  }

  inline double number_value( const ordered_node& n ) {
    if ( n.is_integer() ) {
      return static_cast< double >(
        internal::to_native_checked< std::int64_t >( n ) );
    }
    return internal::to_native_checked< double >( n );
  }

  inline std::string string_value( const ordered_node& n ) {
    return internal::to_native_checked< std::string >( n );
  }

  inline bool bool_value( const ordered_node& n ) {
    return n.get_value< bool >();
  }

  // Canonical decimal text of a number: integral values carry no ".0"
  inline std::string number_text( double v ) {
    if ( internal::is_integral(v) ) {
      return std::to_string( static_cast< long long >(v) );
    }
    if ( std::isnan(v) ) return "nan";
    if ( std::isinf(v) ) return v < 0 ? "-inf" : "inf";
    return internal::shortest_decimal( v );
  }

  // Canonical text form of any value. Strings render bare at the top level
  // and quoted when nested inside a sequence or mapping.
  inline std::string canonical_text( const ordered_node& n,
    bool nested = false )
  {
    if ( n.is_null() ) return "null";
    if ( n.is_boolean() ) return bool_value( n ) ? "true" : "false";
    if ( is_number(n) ) return number_text( number_value(n) );
    if ( n.is_string() ) {
      const std::string s = string_value( n );
      return nested ? internal::quote_string( s ) : s;
    }
    std::string out;
    if ( n.is_sequence() ) {
      out += '[';
      for ( size_t i = 0; i < n.size(); ++i ) {
        if ( i ) out += ", ";
        out += canonical_text( n.at(i), true );
      }
      out += ']';
      return out;
    }
    out += '{';
    bool first = true;
    for ( const auto& [mk, mv] : n.map_items() ) {
      if ( !first ) out += ", ";
      first = false;
      out += internal::quote_string( mk.get_value< std::string >() );
      out += ": ";
      out += canonical_text( mv, true );
    }
    out += '}';
    return out;
  }

  // Look up the value at a dotted path. Every segment but the last must name
  // a mapping. Returns nullptr when any segment is missing.
  inline const ordered_node* find_path( const ordered_node& doc,
    const std::string& dotted )
  {
    const ordered_node* cur = &doc;
    for ( const auto& seg : internal::split_segments(dotted) ) {
      if ( !cur->is_mapping() || !cur->contains(seg) ) return nullptr;
      cur = &cur->at( seg );
    }
    return cur;
  }

namespace internal {

  // Rewrites integer nodes (as produced by fkYAML when it parses embedded
  // object literals) into float nodes so every number shares one
  // representation.
  inline ordered_node normalize_numbers( const ordered_node& n ) {
    if ( n.is_integer() ) return make_number( number_value(n) );
    if ( n.is_sequence() ) {
      std::vector< ordered_node > out;
      out.reserve( n.size() );
      for ( size_t i = 0; i < n.size(); ++i ) {
        out.push_back( normalize_numbers(n.at(i)) );
      }
      return make_sequence( out );
    }
    if ( n.is_mapping() ) {
      ordered_node out = ordered_node::mapping();
      for ( const auto& [mk, mv] : n.map_items() ) {
        out[ mk.get_value< std::string >() ] = normalize_numbers( mv );
      }
      return out;
    }
    return n;
  }

  // Inverse direction for rendering: integral float nodes become integer
  // nodes so the serializer does not print "5.0"
  inline ordered_node integral_numbers_as_integers( const ordered_node& n ) {
    if ( n.is_float_number() ) {
      const double v = number_value( n );
      if ( is_integral(v) ) {
        return make_node_from( static_cast< std::int64_t >(v) );
      }
      return n;
    }
    if ( n.is_sequence() ) {
      std::vector< ordered_node > out;
      out.reserve( n.size() );
      for ( size_t i = 0; i < n.size(); ++i ) {
        out.push_back( integral_numbers_as_integers(n.at(i)) );
      }
      return make_sequence( out );
    }
    if ( n.is_mapping() ) {
      ordered_node out = ordered_node::mapping();
      for ( const auto& [mk, mv] : n.map_items() ) {
        out[ mk.get_value< std::string >() ]
          = integral_numbers_as_integers( mv );
      }
      return out;
    }
    return n;
  }

} // namespace unicfg::internal

  // Render a document as YAML text
  inline std::string to_yaml( const ordered_node& doc ) {
    return ordered_node::serialize(
      internal::integral_numbers_as_integers(doc) );
  }

} // namespace unicfg
