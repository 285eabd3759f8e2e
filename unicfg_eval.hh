//  unicfg
//  Universal Configuration Language evaluator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the unicfg authors
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "unicfg_error.hh"
#include "unicfg_source.hh"
#include "unicfg_text.hh"
#include "unicfg_value.hh"

// Value evaluation: the value parser, expression evaluator, reference
// resolver and type converter. These call each other recursively, so they
// live together as free functions over ordered_node sharing one EvalContext.
namespace unicfg::internal {

  using SectionPath = std::vector< std::string >;

  inline const std::string TYPE_INT = "int";
  inline const std::string TYPE_FLOAT = "float";
  inline const std::string TYPE_STRING = "string";
  inline const std::string TYPE_BOOL = "bool";

  // Marks an operand token standing in for an already-evaluated
  // parenthesized sub-expression
  inline constexpr char SLOT_MARK = '\x1f';

  // Everything evaluation may read: the document assembled so far, the
  // section path in effect, the environment collaborator and the nesting
  // budget. Evaluation never writes to the document.
  struct EvalContext {
    const ordered_node& doc;
    const SectionPath& section;
    const EnvLookup& env;
    int max_depth;
    int depth = 0;
  };

  [[noreturn]] inline void throw_depth_exceeded( const EvalContext& ctx,
    const std::string& fragment )
  {
    std::ostringstream oss;
    oss << "Maximum nesting depth (" << ctx.max_depth
      << ") exceeded while evaluating: " << fragment;
    throw SyntaxError( oss.str() );
  }

  // Scoped nesting counter; throws once ctx.max_depth is exceeded
  class DepthGuard {
  public:
    DepthGuard( EvalContext& ctx, const std::string& fragment ) : ctx_( ctx ) {
      if ( ctx_.depth >= ctx_.max_depth ) throw_depth_exceeded( ctx_, fragment );
      ++ctx_.depth;
    }
    ~DepthGuard() { --ctx_.depth; }

    DepthGuard( const DepthGuard& ) = delete;
    DepthGuard& operator=( const DepthGuard& ) = delete;

  private:
    EvalContext& ctx_;
  };

  inline ordered_node parse_value( const std::string& text,
    EvalContext& ctx );
  inline ordered_node evaluate_expression( const std::string& text,
    EvalContext& ctx );

  // ------------------------------------------------------------------
  // Lexical classification
  // ------------------------------------------------------------------

  // Name inside an exact $ENV{NAME} match
  inline std::optional< std::string > env_reference_name(
    const std::string& text )
  {
    static const std::regex env( R"(\$ENV\{([^}]+)\})" );
    std::smatch m;
    if ( std::regex_match(text, m, env) ) return m[1].str();
    return std::nullopt;
  }

  // ident ( '.' ident | '[' accessor ']' )*
  inline bool is_reference( const std::string& text ) {
    static const std::regex ref(
      R"([A-Za-z_][A-Za-z0-9_]*)"
      R"((?:\.[A-Za-z_][A-Za-z0-9_]*)"
      R"(|\[\s*(?:"(?:[^"\\]|\\.)*"|'(?:[^'\\]|\\.)*'|[^\]"']*)\s*\])*)" );
    return std::regex_match( text, ref );
  }

  inline bool is_simple_literal( const std::string& raw ) {
    const std::string s = trim( raw );
    if ( is_complete_quoted(s) ) return true;
    if ( is_wrapped(s, '[') || is_wrapped(s, '{') ) return true;
    const std::string lower = to_lower( s );
    if ( lower == "null" || lower == "true" || lower == "false" ) return true;
    return is_decimal_number( s );
  }

  // Lower-cased conversion target when the last '.'-segment names one
  inline std::optional< std::string > conversion_suffix(
    const std::string& text )
  {
    const size_t dot = text.rfind( PATH_DELIMITER );
    if ( dot == std::string::npos ) return std::nullopt;
    const std::string suffix = to_lower( trim(text.substr(dot + 1)) );
    if ( suffix == TYPE_INT || suffix == TYPE_FLOAT
      || suffix == TYPE_STRING || suffix == TYPE_BOOL ) return suffix;
    return std::nullopt;
  }

  // ------------------------------------------------------------------
  // Type converter
  // ------------------------------------------------------------------

  inline std::optional< double > parse_numeric_string( const std::string& s ) {
    const std::string t = trim( s );
    if ( !is_decimal_number(t) ) return std::nullopt;
    try {
      return std::stod( t );
    }
    catch ( const std::out_of_range& ) {
      return std::nullopt;
    }
  }

  // Decimal literal as written in a document
  inline double parse_number_literal( const std::string& s ) {
    if ( auto d = parse_numeric_string(s) ) return *d;
    throw SyntaxError( "Numeric literal out of range: " + s );
  }

  inline ordered_node convert_type( const ordered_node& value,
    const std::string& target )
  {
    const std::string shown = canonical_text( value );

    if ( target == TYPE_INT ) {
      if ( is_number(value) ) return make_number( std::trunc(number_value(value)) );
      if ( value.is_null() ) return make_number( 0 );
      if ( value.is_string() ) {
        if ( auto d = parse_numeric_string(string_value(value)) ) {
          return make_number( std::trunc(*d) );
        }
      }
      throw TypeError( "Cannot convert '" + shown + "' to int" );
    }

    if ( target == TYPE_FLOAT ) {
      if ( is_number(value) ) return make_number( number_value(value) );
      if ( value.is_null() ) return make_number( 0.0 );
      if ( value.is_string() ) {
        if ( auto d = parse_numeric_string(string_value(value)) ) {
          return make_number( *d );
        }
      }
      throw TypeError( "Cannot convert '" + shown + "' to float" );
    }

    if ( target == TYPE_STRING ) {
      return make_string( shown );
    }

    if ( target == TYPE_BOOL ) {
      if ( value.is_boolean() ) return value;
      if ( is_number(value) ) return make_bool( number_value(value) != 0 );
      if ( value.is_null() ) return make_bool( false );
      if ( value.is_string() ) {
        const std::string lower = to_lower( string_value(value) );
        if ( lower == "true" || lower == "yes" || lower == "1" ) {
          return make_bool( true );
        }
        if ( lower == "false" || lower == "no" || lower == "0" ) {
          return make_bool( false );
        }
        throw TypeError( "Cannot convert string '" + shown + "' to bool" );
      }
      throw TypeError( "Cannot convert '" + shown + "' to bool" );
    }

    throw TypeError( "Unknown target type: " + target );
  }

  // ------------------------------------------------------------------
  // Reference resolver
  // ------------------------------------------------------------------

  // Follow mapping keys from `root`. nullptr when any segment is missing or
  // an intermediate value is not a mapping.
  inline const ordered_node* walk_path( const ordered_node& root,
    const std::vector< std::string >& segs )
  {
    const ordered_node* cur = &root;
    for ( const auto& seg : segs ) {
      if ( !cur->is_mapping() || !cur->contains(seg) ) return nullptr;
      cur = &cur->at( seg );
    }
    return cur;
  }

  // Absolute lookup first, then the same segments below the section path
  inline const ordered_node* lookup_dotted( const ordered_node& doc,
    const SectionPath& section, const std::string& dotted )
  {
    const std::vector< std::string > segs = split_segments( dotted );
    if ( const ordered_node* hit = walk_path(doc, segs) ) return hit;
    if ( section.empty() ) return nullptr;

    SectionPath relative = section;
    relative.insert( relative.end(), segs.begin(), segs.end() );
    return walk_path( doc, relative );
  }

  inline const ordered_node& apply_accessor( const ordered_node& cur,
    const std::string& accessor, const std::string& ref )
  {
    static const std::regex index( R"(-?[0-9]+)" );
    if ( std::regex_match(accessor, index) ) {
      if ( !cur.is_sequence() ) {
        throw ReferenceError( "Attempted to index a non-array value with ["
          + accessor + "]: " + ref );
      }
      long long i = -1;
      try {
        i = std::stoll( accessor );
      }
      catch ( const std::out_of_range& ) {
        i = -1;
      }
      if ( i < 0 || static_cast< size_t >(i) >= cur.size() ) {
        throw ReferenceError( "Array index out of bounds: " + accessor
          + " in " + ref );
      }
      return cur.at( static_cast< size_t >(i) );
    }

    const std::string key = is_complete_quoted( accessor )
      ? unescape( accessor.substr(1, accessor.size() - 2) ) : accessor;
    if ( !cur.is_mapping() ) {
      throw ReferenceError( "Attempted to access key '" + key
        + "' on a non-object value: " + ref );
    }
    if ( !cur.contains(key) ) {
      throw ReferenceError( "Object key not found: '" + key + "' in " + ref );
    }
    return cur.at( key );
  }

  // Resolve a reference against the document. The result depends only on
  // (doc, section, ref).
  inline ordered_node resolve_reference( const ordered_node& doc,
    const SectionPath& section, const std::string& ref )
  {
    const size_t first_bracket = ref.find( '[' );
    if ( first_bracket == std::string::npos ) {
      if ( const ordered_node* hit = lookup_dotted(doc, section, ref) ) {
        return *hit;
      }
      throw ReferenceError( "Cannot resolve reference: " + ref );
    }

    // Complex form: base name, then alternating [accessor] and .name steps
    const std::string base = ref.substr( 0, first_bracket );
    const ordered_node* cur = lookup_dotted( doc, section, base );
    if ( !cur ) {
      throw ReferenceError( "Cannot resolve reference: " + base
        + " (in " + ref + ")" );
    }

    size_t i = first_bracket;
    while ( i < ref.size() ) {
      if ( ref[i] == '[' ) {
        const size_t close = matching_close( ref, i );
        if ( close == std::string::npos ) {
          throw SyntaxError( "Mismatched brackets in reference: " + ref );
        }
        const std::string accessor = trim( ref.substr(i + 1, close - i - 1) );
        if ( accessor.empty() ) {
          throw SyntaxError( "Empty accessor in reference: " + ref );
        }
        cur = &apply_accessor( *cur, accessor, ref );
        i = close + 1;
      }
      else if ( ref[i] == PATH_DELIMITER ) {
        size_t j = i + 1;
        while ( j < ref.size() && ref[j] != PATH_DELIMITER && ref[j] != '[' ) {
          ++j;
        }
        const std::string name = ref.substr( i + 1, j - i - 1 );
        if ( name.empty() ) {
          throw SyntaxError( "Empty key segment in reference: " + ref );
        }
        if ( !cur->is_mapping() ) {
          throw ReferenceError( "Attempted to access key '" + name
            + "' on a non-object value: " + ref );
        }
        if ( !cur->contains(name) ) {
          throw ReferenceError( "Object key not found: '" + name + "' in "
            + ref );
        }
        cur = &cur->at( name );
        i = j;
      }
      else {
        throw SyntaxError( "Malformed reference: " + ref );
      }
    }
    return *cur;
  }

  // ------------------------------------------------------------------
  // Literals
  // ------------------------------------------------------------------

  // Recursive-descent check that a text is exactly one JSON object. The
  // deserializer reads any YAML flow mapping, so object literals are held
  // to the JSON grammar before they reach it.
  class StrictObjectChecker {
  public:
    StrictObjectChecker( const std::string& text, int depth_budget )
      : text_( text ), depth_budget_( depth_budget ) {}

    void check() {
      skip_space();
      if ( peek() != '{' ) fail( "expected '{'" );
      value( 0 );
      skip_space();
      if ( pos_ != text_.size() ) fail( "unexpected text after the object" );
    }

  private:
    const std::string& text_;
    int depth_budget_;
    size_t pos_ = 0;

    char peek() const { return pos_ < text_.size() ? text_[ pos_ ] : '\0'; }

    void skip_space() {
      while ( pos_ < text_.size()
        && std::isspace(static_cast< unsigned char >(text_[pos_])) ) ++pos_;
    }

    [[noreturn]] void fail( const std::string& what ) const {
      std::ostringstream oss;
      oss << "Invalid object literal: " << what << " at offset " << pos_
        << " in '" << text_ << "'";
      throw SyntaxError( oss.str() );
    }

    void expect( char c ) {
      if ( peek() != c ) fail( std::string("expected '") + c + '\'' );
      ++pos_;
    }

    bool keyword( const std::string& word ) {
      if ( text_.compare(pos_, word.size(), word) != 0 ) return false;
      pos_ += word.size();
      return true;
    }

    void value( int depth ) {
      if ( depth >= depth_budget_ ) fail( "nesting too deep" );
      skip_space();
      const char c = peek();
      if ( c == '{' ) object( depth + 1 );
      else if ( c == '[' ) array( depth + 1 );
      else if ( c == '"' ) string();
      else if ( c == '-' || std::isdigit(static_cast< unsigned char >(c)) ) {
        number();
      }
      else if ( !keyword("true") && !keyword("false") && !keyword("null") ) {
        fail( "expected a JSON value" );
      }
    }

    void object( int depth ) {
      expect( '{' );
      skip_space();
      if ( peek() == '}' ) {
        ++pos_;
        return;
      }
      while ( true ) {
        skip_space();
        if ( peek() != '"' ) fail( "keys must be double-quoted strings" );
        string();
        skip_space();
        expect( ':' );
        value( depth );
        skip_space();
        if ( peek() != ',' ) break;
        ++pos_;
      }
      expect( '}' );
    }

    void array( int depth ) {
      expect( '[' );
      skip_space();
      if ( peek() == ']' ) {
        ++pos_;
        return;
      }
      while ( true ) {
        value( depth );
        skip_space();
        if ( peek() != ',' ) break;
        ++pos_;
      }
      expect( ']' );
    }

    void string() {
      static const std::string simple_escapes = "\"\\/bfnrt";
      expect( '"' );
      while ( pos_ < text_.size() ) {
        const char c = text_[ pos_++ ];
        if ( c == '"' ) return;
        if ( static_cast< unsigned char >(c) < 0x20 ) {
          fail( "control character in string" );
        }
        if ( c != '\\' ) continue;

        const char e = peek();
        if ( e == 'u' ) {
          ++pos_;
          for ( int i = 0; i < 4; ++i, ++pos_ ) {
            if ( !std::isxdigit(static_cast< unsigned char >(peek())) ) {
              fail( "invalid unicode escape" );
            }
          }
        }
        else if ( e != '\0' && simple_escapes.find(e) != std::string::npos ) {
          ++pos_;
        }
        else {
          fail( "invalid escape" );
        }
      }
      fail( "unterminated string" );
    }

    void number() {
      static const std::regex json_number(
        R"(-?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?)" );
      size_t end = pos_;
      while ( end < text_.size()
        && std::string("+-.eE0123456789").find(text_[end]) != std::string::npos )
      {
        ++end;
      }
      if ( !std::regex_match(text_.substr(pos_, end - pos_), json_number) ) {
        fail( "invalid number" );
      }
      pos_ = end;
    }
  };

  // Strict embedded object literal: JSON grammar, then parsed by fkYAML (a
  // JSON object is a YAML flow mapping)
  inline ordered_node parse_object_literal( const std::string& text,
    EvalContext& ctx )
  {
    StrictObjectChecker( text, ctx.max_depth - ctx.depth ).check();

    // Continuation lines are already trimmed, so fold them onto one line
    std::string flow = text;
    std::replace( flow.begin(), flow.end(), '\n', ' ' );

    ordered_node parsed;
    try {
      parsed = ordered_node::deserialize( flow );
    }
    catch ( const fkyaml::exception& e ) {
      throw SyntaxError( std::string( "Invalid object literal: " ) + e.what()
        + " in '" + text + "'" );
    }
    if ( !parsed.is_mapping() ) {
      throw SyntaxError( "Invalid object literal: '" + text + "'" );
    }
    return normalize_numbers( parsed );
  }

  // Each top-level element goes back through the full value pipeline
  inline ordered_node parse_array_literal( const std::string& text,
    EvalContext& ctx )
  {
    DepthGuard guard( ctx, text );
    const std::string content = text.substr( 1, text.size() - 2 );
    std::vector< ordered_node > items;
    for ( const auto& element : split_top_level(content, ',') ) {
      items.push_back( parse_value(element, ctx) );
    }
    return make_sequence( items );
  }

  inline ordered_node parse_simple_value( const std::string& raw,
    EvalContext& ctx )
  {
    const std::string s = trim( raw );
    const std::string lower = to_lower( s );
    if ( lower == "null" ) return make_null();
    if ( lower == "true" ) return make_bool( true );
    if ( lower == "false" ) return make_bool( false );

    if ( s.size() >= 2 && is_quote_char(s.front()) && s.back() == s.front() ) {
      return make_string( unescape(s.substr(1, s.size() - 2)) );
    }
    if ( s.size() >= 2 && s.front() == '[' && s.back() == ']' ) {
      return parse_array_literal( s, ctx );
    }
    if ( s.size() >= 2 && s.front() == '{' && s.back() == '}' ) {
      return parse_object_literal( s, ctx );
    }
    if ( is_decimal_number(s) ) return make_number( parse_number_literal(s) );

    // Anything else is an opaque string
    return make_string( s );
  }

  // ------------------------------------------------------------------
  // Expression evaluator
  // ------------------------------------------------------------------

  // Operators and parentheses are single tokens. Quoted spans are single
  // tokens; bracketed and braced spans stay inside the surrounding operand
  // so accessors and $ENV{...} are not split.
  inline std::vector< std::string > tokenize_expression(
    const std::string& expr )
  {
    std::vector< std::string > tokens;
    std::string current;
    auto flush = [&]() {
      if ( !current.empty() ) tokens.push_back( current );
      current.clear();
    };

    QuoteState qs;
    int nesting = 0;
    for ( char c : expr ) {
      const bool was_quoted = qs.in_quotes();
      const bool plain = qs.step( c );

      if ( nesting == 0 && !was_quoted && qs.in_quotes() ) {
        flush();
        current += c;
        continue;
      }
      if ( nesting == 0 && was_quoted && !qs.in_quotes() ) {
        current += c;
        flush();
        continue;
      }
      if ( !plain ) {
        current += c;
        continue;
      }

      if ( c == '[' || c == '{' ) ++nesting;
      else if ( (c == ']' || c == '}') && nesting > 0 ) --nesting;
      else if ( nesting == 0 && (is_operator_char(c) || c == '(' || c == ')') ) {
        flush();
        tokens.push_back( std::string(1, c) );
        continue;
      }
      else if ( nesting == 0 && std::isspace(static_cast< unsigned char >(c)) ) {
        flush();
        continue;
      }
      current += c;
    }
    if ( qs.in_quotes() ) {
      throw SyntaxError( "Unterminated string in expression: " + expr );
    }
    flush();
    return tokens;
  }

  inline double to_number( const ordered_node& v, const std::string& expr ) {
    if ( is_number(v) ) return number_value( v );
    if ( v.is_null() ) return 0;
    if ( v.is_boolean() ) return bool_value( v ) ? 1 : 0;
    if ( v.is_string() ) {
      if ( auto d = parse_numeric_string(string_value(v)) ) return *d;
    }
    throw TypeError( "Cannot convert '" + canonical_text(v)
      + "' to number in expression: " + expr );
  }

  // Operand tokens: slot, env reference, simple literal, variable reference,
  // otherwise an opaque string. Never a nested expression or conversion.
  inline ordered_node resolve_operand( const std::string& token,
    const std::vector< ordered_node >& slots, EvalContext& ctx )
  {
    if ( token.front() == SLOT_MARK ) {
      return slots.at( std::stoul(token.substr(1)) );
    }
    if ( auto name = env_reference_name(token) ) {
      if ( auto value = ctx.env(*name) ) return make_string( *value );
      return make_null();
    }
    if ( is_simple_literal(token) ) return parse_simple_value( token, ctx );
    if ( is_reference(token) ) {
      return resolve_reference( ctx.doc, ctx.section, token );
    }
    return parse_simple_value( token, ctx );
  }

  inline ordered_node apply_multiplicative( const ordered_node& lhs, char op,
    const ordered_node& rhs, const std::string& expr )
  {
    const double l = to_number( lhs, expr );
    const double r = to_number( rhs, expr );
    switch ( op ) {
      case '*':
        return make_number( l * r );
      case '/':
        if ( r == 0 ) throw TypeError( "Division by zero in expression: " + expr );
        return make_number( l / r );
      default:
        if ( r == 0 ) throw TypeError( "Modulo by zero in expression: " + expr );
        return make_number( std::fmod(l, r) );
    }
  }

  inline ordered_node apply_additive( const ordered_node& lhs, char op,
    const ordered_node& rhs, const std::string& expr )
  {
    if ( op == '+' && (lhs.is_string() || rhs.is_string()) ) {
      return make_string( canonical_text(lhs) + canonical_text(rhs) );
    }
    const double l = to_number( lhs, expr );
    const double r = to_number( rhs, expr );
    return make_number( op == '+' ? l + r : l - r );
  }

  // Evaluate a parenthesis-free expression: operands, then * / %, then + -
  inline ordered_node evaluate_flat( const std::string& expr,
    const std::vector< ordered_node >& slots, EvalContext& ctx )
  {
    const std::vector< std::string > tokens = tokenize_expression( expr );
    if ( tokens.empty() ) {
      throw SyntaxError( "Empty expression: '" + expr + "'" );
    }

    std::vector< ordered_node > operands;
    std::vector< char > ops;
    bool expect_operand = true;
    bool has_sign = false;
    bool negate = false;

    for ( const auto& tok : tokens ) {
      if ( tok == "(" || tok == ")" ) {
        throw SyntaxError( "Mismatched parentheses in expression: " + expr );
      }
      if ( tok.size() == 1 && is_operator_char(tok[0]) ) {
        if ( !expect_operand ) {
          ops.push_back( tok[0] );
          expect_operand = true;
          continue;
        }
        // Operator in operand position: only a sign is allowed there
        if ( tok[0] != '+' && tok[0] != '-' ) {
          throw SyntaxError( "Unexpected operator '" + tok
            + "' in expression: " + expr );
        }
        has_sign = true;
        if ( tok[0] == '-' ) negate = !negate;
        continue;
      }
      if ( !expect_operand ) {
        throw SyntaxError( "Missing operator before '" + tok
          + "' in expression: " + expr );
      }
      ordered_node v = resolve_operand( tok, slots, ctx );
      if ( has_sign ) {
        const double d = to_number( v, expr );
        v = make_number( negate ? -d : d );
      }
      operands.push_back( v );
      expect_operand = false;
      has_sign = false;
      negate = false;
    }
    if ( expect_operand ) {
      throw SyntaxError( "Expression ends with an operator: " + expr );
    }

    // Multiplicative pass
    std::vector< ordered_node > terms{ operands.front() };
    std::vector< char > additive_ops;
    for ( size_t i = 0; i < ops.size(); ++i ) {
      const char op = ops[ i ];
      if ( op == '*' || op == '/' || op == '%' ) {
        terms.back() = apply_multiplicative( terms.back(), op,
          operands[i + 1], expr );
      } else {
        additive_ops.push_back( op );
        terms.push_back( operands[i + 1] );
      }
    }

    // Additive pass
    ordered_node result = terms.front();
    for ( size_t i = 0; i < additive_ops.size(); ++i ) {
      result = apply_additive( result, additive_ops[i], terms[i + 1], expr );
    }
    return result;
  }

  // Repeatedly evaluate the innermost-rightmost parenthesized span and
  // substitute a slot token for it until no parentheses remain
  inline ordered_node evaluate_expression( const std::string& text,
    EvalContext& ctx )
  {
    DepthGuard guard( ctx, text );

    // Parenthesis nesting counts against the depth budget
    int nesting = 0;
    int deepest = 0;
    QuoteState scan;
    for ( char c : text ) {
      if ( !scan.step(c) ) continue;
      if ( c == '(' ) deepest = std::max( deepest, ++nesting );
      else if ( c == ')' ) --nesting;
    }
    if ( ctx.depth + deepest > ctx.max_depth ) throw_depth_exceeded( ctx, text );

    std::string expr = text;
    std::vector< ordered_node > slots;

    while ( true ) {
      size_t open = std::string::npos;
      QuoteState qs;
      for ( size_t i = 0; i < expr.size(); ++i ) {
        if ( qs.step(expr[i]) && expr[i] == '(' ) open = i;
      }
      if ( open == std::string::npos ) break;

      const size_t close = find_unquoted( expr, ')', open + 1 );
      if ( close == std::string::npos ) {
        throw SyntaxError( "Mismatched parentheses in expression: " + text );
      }
      const std::string inner = expr.substr( open + 1, close - open - 1 );
      if ( trim(inner).empty() ) {
        throw SyntaxError( "Empty parentheses in expression: " + text );
      }

      slots.push_back( evaluate_flat(inner, slots, ctx) );
      const std::string slot = std::string( 1, SLOT_MARK )
        + std::to_string( slots.size() - 1 );
      expr = expr.substr( 0, open ) + ' ' + slot + ' '
        + expr.substr( close + 1 );
    }

    if ( find_unquoted(expr, ')') != std::string::npos ) {
      throw SyntaxError( "Mismatched parentheses in expression: " + text );
    }
    return evaluate_flat( expr, slots, ctx );
  }

  // ------------------------------------------------------------------
  // Value parser
  // ------------------------------------------------------------------

  // Strict priority: environment, conversion suffix, expression, reference,
  // simple literal
  inline ordered_node parse_value( const std::string& raw, EvalContext& ctx ) {
    const std::string text = trim( raw );
    if ( text.empty() ) return make_null();

    DepthGuard guard( ctx, text );

    // 1) $ENV{NAME}
    if ( auto name = env_reference_name(text) ) {
      if ( auto value = ctx.env(*name) ) return make_string( *value );
      return make_null();
    }

    const bool simple = is_simple_literal( text );

    // 2) value.int | value.float | value.string | value.bool
    if ( !simple && text.find(PATH_DELIMITER) != std::string::npos ) {
      if ( auto target = conversion_suffix(text) ) {
        const std::string base = text.substr( 0, text.rfind(PATH_DELIMITER) );
        return convert_type( parse_value(base, ctx), *target );
      }
    }

    // 3) arithmetic and concatenation
    if ( !simple && contains_operator(text) ) {
      return evaluate_expression( text, ctx );
    }

    // 4) references to earlier values
    if ( !simple && is_reference(text) ) {
      return resolve_reference( ctx.doc, ctx.section, text );
    }

    // 5) literals
    return parse_simple_value( text, ctx );
  }

} // namespace unicfg::internal
