#pragma once

// Standard library includes
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "spliced/errors.hh"
#include "spliced/value.hh"

namespace spliced {

  // Concrete values bound to reference keys for one evaluation
  using Bindings = std::unordered_map< std::string, ordered_node >;

  // Reference keys visible to a template during dependency extraction
  using KeySet = std::unordered_set< std::string >;

namespace internal {

  inline const std::string OPEN_MARKER = "${";
  inline const std::string ESCAPED_MARKER = "$${";
  inline constexpr char CLOSE_MARKER = '}';

  enum class TokenType { Integer, Float, String, Identifier, Symbol, End };

  struct Token {
    TokenType type;
    std::string text;
    std::size_t pos;
  };

  // Expression tree node. Only the members relevant to `kind` are used.
  struct Expr {
    enum class Kind {
      Literal, // literal
      Reference, // path = dotted identifier segments
      Index, // args = { target, index }
      Member, // path = { field }, args = { target }
      Unary, // op, args = { operand }
      Binary, // op, args = { lhs, rhs }
      Ternary // args = { condition, if_true, if_false }
    };

    Kind kind;
    ordered_node literal;
    std::vector< std::string > path;
    std::string op;
    std::vector< std::unique_ptr< Expr > > args;
  };

  using ExprPtr = std::unique_ptr< Expr >;

  inline std::vector< Token > tokenize( const std::string& src );

  // Recursive-descent parser for the restricted expression grammar:
  // ternary, ||, &&, equality, relational, additive, multiplicative, unary,
  // postfix indexing/member access, literals, references, parentheses
  class Parser {
  public:
    explicit Parser( const std::string& source )
      : source_( source ), tokens_( tokenize(source) ) {}

    ExprPtr parse();

  private:
    ExprPtr ternary();
    ExprPtr or_expr();
    ExprPtr and_expr();
    ExprPtr equality();
    ExprPtr relational();
    ExprPtr additive();
    ExprPtr multiplicative();
    ExprPtr unary();
    ExprPtr postfix();
    ExprPtr primary();

    const Token& peek( std::size_t ahead = 0 ) const;
    bool at_symbol( const char* sym, std::size_t ahead = 0 ) const;
    bool accept( const char* sym );
    void expect( const char* sym );

    [[noreturn]] void fail( const std::string& msg ) const;

    const std::string& source_;
    std::vector< Token > tokens_;
    std::size_t cur_ = 0;
  };

  // Evaluates a parsed expression against bindings. Errors carry the
  // expression source text.
  class Evaluator {
  public:
    Evaluator( const std::string& source, const Bindings& bindings )
      : source_( source ), bindings_( bindings ) {}

    ordered_node eval( const Expr& e ) const;

  private:
    ordered_node lookup( const std::vector< std::string >& path ) const;
    ordered_node member( const ordered_node& target,
      const std::string& name ) const;
    ordered_node index( const ordered_node& target,
      const ordered_node& idx ) const;
    ordered_node unary( const std::string& op, const ordered_node& v ) const;
    ordered_node binary( const std::string& op, const ordered_node& l,
      const ordered_node& r ) const;
    ordered_node arithmetic( const std::string& op, const ordered_node& l,
      const ordered_node& r ) const;
    bool less_than( const ordered_node& l, const ordered_node& r ) const;

    [[noreturn]] void fail( const std::string& msg ) const {
      throw TemplateEvalError( source_, msg );
    }

    const std::string& source_;
    const Bindings& bindings_;
  };

  // Key of the first n dotted segments
  inline std::string prefix_key( const std::vector< std::string >& path,
    std::size_t n )
  {
    return join_path( std::vector< std::string >( path.begin(),
      path.begin() + static_cast< std::ptrdiff_t >( n ) ) );
  }

  // Length of the longest dotted prefix of `path` accepted by `has_key`,
  // or zero when no prefix names a key
  template < typename HasKey >
  inline std::size_t match_reference_prefix(
    const std::vector< std::string >& path, HasKey has_key )
  {
    for ( std::size_t n = path.size(); n > 0; --n ) {
      if ( has_key(prefix_key(path, n)) ) return n;
    }
    return 0;
  }

  inline bool truthy( const ordered_node& n ) {
    if ( n.is_null() ) return false;
    if ( n.is_boolean() ) return n.get_value< bool >();
    if ( n.is_integer() ) return to_native_checked< std::int64_t >( n ) != 0;
    if ( n.is_float_number() ) return to_native_checked< double >( n ) != 0.0;
    if ( n.is_string() ) return !to_native_checked< std::string >( n ).empty();
    return n.size() > 0;
  }

  inline void collect_expr_references( const Expr& e, const KeySet& visible,
    std::set< std::string >& out )
  {
    if ( e.kind == Expr::Kind::Reference ) {
      const std::size_t n = match_reference_prefix( e.path,
        [&]( const std::string& k ) { return visible.count( k ) > 0; } );
      // Unknown references are still dependencies so that the resolver can
      // report the most specific missing key
      out.insert( n ? prefix_key( e.path, n ) : join_path( e.path ) );
    }
    for ( const auto& arg : e.args ) {
      collect_expr_references( *arg, visible, out );
    }
  }

} // namespace spliced::internal

  // A parsed template string: literal text runs interleaved with ${...}
  // markers. "$${" is an escaped, literal "${".
  class Template {
  public:
    static Template parse( const std::string& text );

    bool has_markers() const;

    // True when the whole string is exactly one marker, in which case the
    // evaluated value keeps its type
    bool is_single_marker() const;

    void collect_references( const KeySet& visible,
      std::set< std::string >& out ) const;

    ordered_node evaluate( const Bindings& bindings ) const;

  private:
    struct Segment {
      std::string text; // literal text, or the marker's expression source
      std::shared_ptr< const internal::Expr > expr; // null for literal text
    };

    std::vector< Segment > segments_;
  };

  // Reference keys used anywhere inside a structured value. Only string
  // leaves are scanned.
  inline std::set< std::string > template_references( const ordered_node& raw,
    const KeySet& visible );

  // Substitute every marker of every string leaf. Substituted text is never
  // expanded again.
  inline ordered_node render_template( const ordered_node& raw,
    const Bindings& bindings );

  inline bool contains_markers( const ordered_node& raw );

  // Evaluate a bare expression (no ${...} wrapper)
  inline ordered_node evaluate_expression( const std::string& expr,
    const Bindings& bindings );

} // namespace spliced

// Tokenizer

inline std::vector< spliced::internal::Token > spliced::internal::tokenize(
  const std::string& src )
{
  static const char* const TWO_CHAR[] = { "==", "!=", "<=", ">=", "&&", "||" };
  static const std::string ONE_CHAR = "+-*/%!<>?:()[].";

  std::vector< Token > out;
  std::size_t i = 0;
  while ( i < src.size() ) {
    const unsigned char c = static_cast< unsigned char >( src[i] );

    if ( std::isspace(c) ) { ++i; continue; }

    if ( std::isdigit(c) ) {
      const std::size_t start = i;
      bool is_float = false;
      while ( i < src.size() && std::isdigit(
        static_cast< unsigned char >(src[i])) ) ++i;
      if ( i + 1 < src.size() && src[i] == '.'
        && std::isdigit(static_cast< unsigned char >(src[i + 1])) )
      {
        is_float = true;
        ++i;
        while ( i < src.size() && std::isdigit(
          static_cast< unsigned char >(src[i])) ) ++i;
      }
      if ( i < src.size() && (src[i] == 'e' || src[i] == 'E') ) {
        std::size_t j = i + 1;
        if ( j < src.size() && (src[j] == '+' || src[j] == '-') ) ++j;
        if ( j < src.size() && std::isdigit(
          static_cast< unsigned char >(src[j])) )
        {
          is_float = true;
          i = j;
          while ( i < src.size() && std::isdigit(
            static_cast< unsigned char >(src[i])) ) ++i;
        }
      }
      out.push_back( { is_float ? TokenType::Float : TokenType::Integer,
        src.substr(start, i - start), start } );
      continue;
    }

    if ( std::isalpha(c) || c == '_' ) {
      const std::size_t start = i;
      while ( i < src.size() && (std::isalnum(
        static_cast< unsigned char >(src[i])) || src[i] == '_') ) ++i;
      out.push_back( { TokenType::Identifier, src.substr(start, i - start),
        start } );
      continue;
    }

    if ( c == '\'' || c == '"' ) {
      const std::size_t start = i;
      const char quote = src[ i++ ];
      std::string text;
      bool closed = false;
      while ( i < src.size() ) {
        char ch = src[ i++ ];
        if ( ch == quote ) { closed = true; break; }
        if ( ch == '\\' && i < src.size() ) {
          char esc = src[ i++ ];
          switch ( esc ) {
            case 'n': text += '\n'; break;
            case 't': text += '\t'; break;
            default: text += esc; break;
          }
          continue;
        }
        text += ch;
      }
      if ( !closed ) {
        throw TemplateEvalError( src, "Unterminated string literal" );
      }
      out.push_back( { TokenType::String, text, start } );
      continue;
    }

    bool matched = false;
    for ( const char* sym : TWO_CHAR ) {
      if ( src.compare(i, 2, sym) == 0 ) {
        out.push_back( { TokenType::Symbol, sym, i } );
        i += 2;
        matched = true;
        break;
      }
    }
    if ( matched ) continue;

    if ( ONE_CHAR.find(src[i]) != std::string::npos ) {
      out.push_back( { TokenType::Symbol, std::string(1, src[i]), i } );
      ++i;
      continue;
    }

    std::ostringstream oss;
    oss << "Unexpected character '" << src[ i ] << "' at offset " << i;
    throw TemplateEvalError( src, oss.str() );
  }

  out.push_back( { TokenType::End, std::string(), src.size() } );
  return out;
}

// Parser member function definitions

inline spliced::internal::ExprPtr spliced::internal::Parser::parse() {
  if ( peek().type == TokenType::End ) fail( "Empty expression" );
  ExprPtr e = ternary();
  if ( peek().type != TokenType::End ) {
    fail( "Unexpected trailing '" + peek().text + "'" );
  }
  return e;
}

inline const spliced::internal::Token& spliced::internal::Parser::peek(
  std::size_t ahead ) const
{
  const std::size_t idx = cur_ + ahead;
  return idx < tokens_.size() ? tokens_[ idx ] : tokens_.back();
}

inline bool spliced::internal::Parser::at_symbol( const char* sym,
  std::size_t ahead ) const
{
  const Token& t = peek( ahead );
  return t.type == TokenType::Symbol && t.text == sym;
}

inline bool spliced::internal::Parser::accept( const char* sym ) {
  if ( !at_symbol(sym) ) return false;
  ++cur_;
  return true;
}

inline void spliced::internal::Parser::expect( const char* sym ) {
  if ( !accept(sym) ) {
    const Token& t = peek();
    fail( std::string("Expected '") + sym + "' but found "
      + ( t.type == TokenType::End ? "end of expression"
        : "'" + t.text + "'" ) );
  }
}

[[noreturn]] inline void spliced::internal::Parser::fail(
  const std::string& msg ) const
{
  std::ostringstream oss;
  oss << msg << " at offset " << peek().pos;
  throw TemplateEvalError( source_, oss.str() );
}

namespace spliced::internal {

  inline ExprPtr make_binary( const std::string& op, ExprPtr lhs,
    ExprPtr rhs )
  {
    auto e = std::make_unique< Expr >();
    e->kind = Expr::Kind::Binary;
    e->op = op;
    e->args.push_back( std::move(lhs) );
    e->args.push_back( std::move(rhs) );
    return e;
  }

} // namespace spliced::internal

inline spliced::internal::ExprPtr spliced::internal::Parser::ternary() {
  ExprPtr cond = or_expr();
  if ( !accept("?") ) return cond;

  ExprPtr if_true = ternary();
  expect( ":" );
  ExprPtr if_false = ternary();

  auto e = std::make_unique< Expr >();
  e->kind = Expr::Kind::Ternary;
  e->args.push_back( std::move(cond) );
  e->args.push_back( std::move(if_true) );
  e->args.push_back( std::move(if_false) );
  return e;
}

inline spliced::internal::ExprPtr spliced::internal::Parser::or_expr() {
  ExprPtr lhs = and_expr();
  while ( accept("||") ) lhs = make_binary( "||", std::move(lhs), and_expr() );
  return lhs;
}

inline spliced::internal::ExprPtr spliced::internal::Parser::and_expr() {
  ExprPtr lhs = equality();
  while ( accept("&&") ) lhs = make_binary( "&&", std::move(lhs), equality() );
  return lhs;
}

inline spliced::internal::ExprPtr spliced::internal::Parser::equality() {
  ExprPtr lhs = relational();
  while ( at_symbol("==") || at_symbol("!=") ) {
    const std::string op = peek().text;
    ++cur_;
    lhs = make_binary( op, std::move(lhs), relational() );
  }
  return lhs;
}

inline spliced::internal::ExprPtr spliced::internal::Parser::relational() {
  ExprPtr lhs = additive();
  while ( at_symbol("<") || at_symbol("<=")
    || at_symbol(">") || at_symbol(">=") )
  {
    const std::string op = peek().text;
    ++cur_;
    lhs = make_binary( op, std::move(lhs), additive() );
  }
  return lhs;
}

inline spliced::internal::ExprPtr spliced::internal::Parser::additive() {
  ExprPtr lhs = multiplicative();
  while ( at_symbol("+") || at_symbol("-") ) {
    const std::string op = peek().text;
    ++cur_;
    lhs = make_binary( op, std::move(lhs), multiplicative() );
  }
  return lhs;
}

inline spliced::internal::ExprPtr
  spliced::internal::Parser::multiplicative()
{
  ExprPtr lhs = unary();
  while ( at_symbol("*") || at_symbol("/") || at_symbol("%") ) {
    const std::string op = peek().text;
    ++cur_;
    lhs = make_binary( op, std::move(lhs), unary() );
  }
  return lhs;
}

inline spliced::internal::ExprPtr spliced::internal::Parser::unary() {
  if ( at_symbol("!") || at_symbol("-") ) {
    auto e = std::make_unique< Expr >();
    e->kind = Expr::Kind::Unary;
    e->op = peek().text;
    ++cur_;
    e->args.push_back( unary() );
    return e;
  }
  return postfix();
}

inline spliced::internal::ExprPtr spliced::internal::Parser::postfix() {
  ExprPtr target = primary();
  while ( true ) {
    if ( accept("[") ) {
      auto e = std::make_unique< Expr >();
      e->kind = Expr::Kind::Index;
      e->args.push_back( std::move(target) );
      e->args.push_back( ternary() );
      expect( "]" );
      target = std::move( e );
      continue;
    }
    if ( at_symbol(".") ) {
      ++cur_;
      if ( peek().type != TokenType::Identifier ) {
        fail( "Expected a field name after '.'" );
      }
      auto e = std::make_unique< Expr >();
      e->kind = Expr::Kind::Member;
      e->path.push_back( peek().text );
      ++cur_;
      e->args.push_back( std::move(target) );
      target = std::move( e );
      continue;
    }
    return target;
  }
}

inline spliced::internal::ExprPtr spliced::internal::Parser::primary() {
  const Token t = peek();
  auto e = std::make_unique< Expr >();
  e->kind = Expr::Kind::Literal;

  switch ( t.type ) {
    case TokenType::Integer:
      ++cur_;
      try {
        e->literal = make_node_from< std::int64_t >( std::stoll(t.text) );
      }
      catch ( const std::out_of_range& ) {
        fail( "Integer literal '" + t.text + "' is out of range" );
      }
      return e;

    case TokenType::Float:
      ++cur_;
      try {
        e->literal = make_node_from< double >( std::stod(t.text) );
      }
      catch ( const std::out_of_range& ) {
        fail( "Float literal '" + t.text + "' is out of range" );
      }
      return e;

    case TokenType::String:
      ++cur_;
      e->literal = make_node_from( t.text );
      return e;

    case TokenType::Identifier:
      ++cur_;
      if ( t.text == "true" || t.text == "false" ) {
        e->literal = make_node_from< bool >( t.text == "true" );
        return e;
      }
      if ( t.text == "null" ) return e;

      // Dotted identifiers form one reference path; the resolver picks the
      // longest prefix naming a key
      e->kind = Expr::Kind::Reference;
      e->path.push_back( t.text );
      while ( at_symbol(".") && peek(1).type == TokenType::Identifier ) {
        e->path.push_back( peek(1).text );
        cur_ += 2;
      }
      return e;

    case TokenType::Symbol:
      if ( t.text == "(" ) {
        ++cur_;
        ExprPtr inner = ternary();
        expect( ")" );
        return inner;
      }
      fail( "Unexpected '" + t.text + "'" );

    case TokenType::End:
      fail( "Unexpected end of expression" );
  }
  fail( "Unexpected token" );
}

// Evaluator member function definitions

inline spliced::ordered_node spliced::internal::Evaluator::eval(
  const Expr& e ) const
{
  switch ( e.kind ) {
    case Expr::Kind::Literal:
      return e.literal;

    case Expr::Kind::Reference:
      return lookup( e.path );

    case Expr::Kind::Member:
      return member( eval(*e.args[0]), e.path.front() );

    case Expr::Kind::Index:
      return index( eval(*e.args[0]), eval(*e.args[1]) );

    case Expr::Kind::Unary:
      return unary( e.op, eval(*e.args[0]) );

    case Expr::Kind::Binary:
      // Logical operators short-circuit
      if ( e.op == "&&" ) {
        if ( !truthy(eval(*e.args[0])) ) return make_node_from< bool >( false );
        return make_node_from< bool >( truthy(eval(*e.args[1])) );
      }
      if ( e.op == "||" ) {
        if ( truthy(eval(*e.args[0])) ) return make_node_from< bool >( true );
        return make_node_from< bool >( truthy(eval(*e.args[1])) );
      }
      return binary( e.op, eval(*e.args[0]), eval(*e.args[1]) );

    case Expr::Kind::Ternary:
      return truthy( eval(*e.args[0]) ) ? eval( *e.args[1] )
        : eval( *e.args[2] );
  }
  fail( "Unsupported expression node" );
}

inline spliced::ordered_node spliced::internal::Evaluator::lookup(
  const std::vector< std::string >& path ) const
{
  const std::size_t n = match_reference_prefix( path,
    [&]( const std::string& k ) { return bindings_.count( k ) > 0; } );
  if ( n == 0 ) fail( "Unknown reference '" + join_path(path) + "'" );

  ordered_node v = bindings_.at( prefix_key(path, n) );
  for ( std::size_t i = n; i < path.size(); ++i ) {
    v = member( v, path[i] );
  }
  return v;
}

inline spliced::ordered_node spliced::internal::Evaluator::member(
  const ordered_node& target, const std::string& name ) const
{
  if ( !target.is_mapping() ) {
    fail( "Cannot access field '" + name + "' of " + type_tag(target) );
  }
  if ( !target.contains(name) ) fail( "No field '" + name + "'" );
  return target.at( name );
}

inline spliced::ordered_node spliced::internal::Evaluator::index(
  const ordered_node& target, const ordered_node& idx ) const
{
  if ( target.is_sequence() ) {
    if ( !idx.is_integer() ) {
      fail( "Array index must be an int (got: " + type_tag(idx) + ")" );
    }
    std::int64_t i = to_native_checked< std::int64_t >( idx );
    const std::int64_t size = static_cast< std::int64_t >( target.size() );
    if ( i < 0 ) i += size;
    if ( i < 0 || i >= size ) {
      std::ostringstream oss;
      oss << "Index " << to_string_any( idx ) << " out of range for array of "
        << size << " element(s)";
      fail( oss.str() );
    }
    return target.at( static_cast< std::size_t >(i) );
  }
  if ( target.is_mapping() ) {
    if ( !idx.is_string() ) {
      fail( "Object key must be a string (got: " + type_tag(idx) + ")" );
    }
    return member( target, to_native_checked< std::string >(idx) );
  }
  fail( "Cannot index into " + type_tag(target) );
}

inline spliced::ordered_node spliced::internal::Evaluator::unary(
  const std::string& op, const ordered_node& v ) const
{
  if ( op == "!" ) return make_node_from< bool >( !truthy(v) );

  // op == "-"
  if ( v.is_integer() ) {
    const std::int64_t i = to_native_checked< std::int64_t >( v );
    if ( i == std::numeric_limits< std::int64_t >::min() ) {
      fail( "Integer overflow in negation" );
    }
    return make_node_from< std::int64_t >( -i );
  }
  if ( v.is_float_number() ) {
    return make_node_from< double >( -to_native_checked< double >(v) );
  }
  fail( "Cannot negate " + type_tag(v) );
}

inline bool spliced::internal::Evaluator::less_than( const ordered_node& l,
  const ordered_node& r ) const
{
  if ( is_number(l) && is_number(r) ) {
    if ( l.is_integer() && r.is_integer() ) {
      return to_native_checked< std::int64_t >( l )
        < to_native_checked< std::int64_t >( r );
    }
    return as_double( l ) < as_double( r );
  }
  if ( l.is_string() && r.is_string() ) {
    return to_native_checked< std::string >( l )
      < to_native_checked< std::string >( r );
  }
  fail( "Cannot compare " + type_tag(l) + " and " + type_tag(r) );
}

inline spliced::ordered_node spliced::internal::Evaluator::binary(
  const std::string& op, const ordered_node& l, const ordered_node& r ) const
{
  if ( op == "==" ) return make_node_from< bool >( values_equal(l, r) );
  if ( op == "!=" ) return make_node_from< bool >( !values_equal(l, r) );
  if ( op == "<" ) return make_node_from< bool >( less_than(l, r) );
  if ( op == ">" ) return make_node_from< bool >( less_than(r, l) );
  if ( op == "<=" ) return make_node_from< bool >( !less_than(r, l) );
  if ( op == ">=" ) return make_node_from< bool >( !less_than(l, r) );

  if ( op == "+" ) {
    // String concatenation wins over arithmetic
    if ( l.is_string() || r.is_string() ) {
      return make_node_from( to_string_any(l) + to_string_any(r) );
    }
    if ( l.is_sequence() && r.is_sequence() ) {
      std::vector< ordered_node > out;
      out.reserve( l.size() + r.size() );
      for ( std::size_t i = 0; i < l.size(); ++i ) out.push_back( l.at(i) );
      for ( std::size_t i = 0; i < r.size(); ++i ) out.push_back( r.at(i) );
      return make_node_from( out );
    }
  }
  return arithmetic( op, l, r );
}

inline spliced::ordered_node spliced::internal::Evaluator::arithmetic(
  const std::string& op, const ordered_node& l, const ordered_node& r ) const
{
  if ( !is_number(l) || !is_number(r) ) {
    fail( "Operator '" + op + "' is not defined for " + type_tag(l)
      + " and " + type_tag(r) );
  }

  if ( l.is_integer() && r.is_integer() ) {
    const std::int64_t a = to_native_checked< std::int64_t >( l );
    const std::int64_t b = to_native_checked< std::int64_t >( r );
    std::int64_t out = 0;
    if ( op == "+" ) {
      if ( __builtin_add_overflow(a, b, &out) ) {
        fail( "Integer overflow in addition" );
      }
      return make_node_from< std::int64_t >( out );
    }
    if ( op == "-" ) {
      if ( __builtin_sub_overflow(a, b, &out) ) {
        fail( "Integer overflow in subtraction" );
      }
      return make_node_from< std::int64_t >( out );
    }
    if ( op == "*" ) {
      if ( __builtin_mul_overflow(a, b, &out) ) {
        fail( "Integer overflow in multiplication" );
      }
      return make_node_from< std::int64_t >( out );
    }
    if ( b == 0 ) fail( "Division by zero" );
    if ( a == std::numeric_limits< std::int64_t >::min() && b == -1 ) {
      fail( "Integer overflow in division" );
    }
    if ( op == "/" ) return make_node_from< std::int64_t >( a / b );
    return make_node_from< std::int64_t >( a % b );
  }

  const double a = as_double( l );
  const double b = as_double( r );
  if ( op == "+" ) return make_node_from< double >( a + b );
  if ( op == "-" ) return make_node_from< double >( a - b );
  if ( op == "*" ) return make_node_from< double >( a * b );
  if ( op == "%" ) fail( "Operator '%' requires int operands" );
  if ( b == 0.0 ) fail( "Division by zero" );
  return make_node_from< double >( a / b );
}

// Template member function definitions

inline spliced::Template spliced::Template::parse( const std::string& text ) {
  using internal::CLOSE_MARKER;
  using internal::ESCAPED_MARKER;
  using internal::OPEN_MARKER;

  Template t;
  std::string literal;
  std::size_t i = 0;
  while ( i < text.size() ) {
    if ( text.compare(i, ESCAPED_MARKER.size(), ESCAPED_MARKER) == 0 ) {
      literal += OPEN_MARKER;
      i += ESCAPED_MARKER.size();
      continue;
    }
    if ( text.compare(i, OPEN_MARKER.size(), OPEN_MARKER) != 0 ) {
      literal += text[ i++ ];
      continue;
    }

    // Find the closing brace, skipping braces inside string literals
    const std::size_t start = i + OPEN_MARKER.size();
    std::size_t j = start;
    char quote = 0;
    for ( ; j < text.size(); ++j ) {
      const char c = text[ j ];
      if ( quote ) {
        if ( c == '\\' ) ++j;
        else if ( c == quote ) quote = 0;
        continue;
      }
      if ( c == '\'' || c == '"' ) quote = c;
      else if ( c == CLOSE_MARKER ) break;
    }
    if ( j >= text.size() ) {
      throw TemplateEvalError( text.substr(i), "Unterminated marker" );
    }

    if ( !literal.empty() ) {
      t.segments_.push_back( { literal, nullptr } );
      literal.clear();
    }
    const std::string source = text.substr( start, j - start );
    internal::Parser parser( source );
    t.segments_.push_back(
      { source, std::shared_ptr< const internal::Expr >( parser.parse() ) } );
    i = j + 1;
  }
  if ( !literal.empty() ) t.segments_.push_back( { literal, nullptr } );
  return t;
}

inline bool spliced::Template::has_markers() const {
  for ( const auto& seg : segments_ ) {
    if ( seg.expr ) return true;
  }
  return false;
}

inline bool spliced::Template::is_single_marker() const {
  return segments_.size() == 1 && segments_.front().expr;
}

inline void spliced::Template::collect_references( const KeySet& visible,
  std::set< std::string >& out ) const
{
  for ( const auto& seg : segments_ ) {
    if ( seg.expr ) internal::collect_expr_references( *seg.expr, visible, out );
  }
}

inline spliced::ordered_node spliced::Template::evaluate(
  const Bindings& bindings ) const
{
  if ( is_single_marker() ) {
    const Segment& seg = segments_.front();
    return internal::Evaluator( seg.text, bindings ).eval( *seg.expr );
  }

  std::string out;
  for ( const auto& seg : segments_ ) {
    if ( !seg.expr ) {
      out += seg.text;
      continue;
    }
    out += internal::to_string_any(
      internal::Evaluator( seg.text, bindings ).eval(*seg.expr) );
  }
  return internal::make_node_from( out );
}

// Free function definitions

namespace spliced::internal {

  // Cheap pre-check before parsing a string leaf
  inline bool may_contain_marker( const std::string& s ) {
    return s.find( OPEN_MARKER ) != std::string::npos;
  }

  inline void collect_references_recursive( const ordered_node& n,
    const KeySet& visible, std::set< std::string >& out )
  {
    if ( n.is_string() ) {
      const std::string s = to_native_checked< std::string >( n );
      if ( may_contain_marker(s) ) {
        Template::parse( s ).collect_references( visible, out );
      }
      return;
    }
    if ( n.is_mapping() ) {
      for ( const auto& [mk, mv] : n.map_items() ) {
        collect_references_recursive( mv, visible, out );
      }
      return;
    }
    if ( n.is_sequence() ) {
      for ( std::size_t i = 0; i < n.size(); ++i ) {
        collect_references_recursive( n.at(i), visible, out );
      }
    }
    // scalars/null: nothing to do
  }

} // namespace spliced::internal

inline std::set< std::string > spliced::template_references(
  const ordered_node& raw, const KeySet& visible )
{
  std::set< std::string > out;
  internal::collect_references_recursive( raw, visible, out );
  return out;
}

inline spliced::ordered_node spliced::render_template( const ordered_node& raw,
  const Bindings& bindings )
{
  if ( raw.is_string() ) {
    const std::string s = internal::to_native_checked< std::string >( raw );
    if ( !internal::may_contain_marker(s) ) return raw;
    return Template::parse( s ).evaluate( bindings );
  }
  if ( raw.is_mapping() ) {
    // Keys are kept as authored (they may be non-string scalars); only the
    // values are rendered
    ordered_node out = raw;
    for ( auto& [mk, mv] : out.map_items() ) {
      mv = render_template( mv, bindings );
    }
    return out;
  }
  if ( raw.is_sequence() ) {
    std::vector< ordered_node > out;
    out.reserve( raw.size() );
    for ( std::size_t i = 0; i < raw.size(); ++i ) {
      out.push_back( render_template(raw.at(i), bindings) );
    }
    return internal::make_node_from( out );
  }
  // scalars/null pass through unchanged
  return raw;
}

inline bool spliced::contains_markers( const ordered_node& raw ) {
  if ( raw.is_string() ) {
    const std::string s = internal::to_native_checked< std::string >( raw );
    return internal::may_contain_marker( s )
      && Template::parse( s ).has_markers();
  }
  if ( raw.is_mapping() ) {
    for ( const auto& [mk, mv] : raw.map_items() ) {
      if ( contains_markers(mv) ) return true;
    }
    return false;
  }
  if ( raw.is_sequence() ) {
    for ( std::size_t i = 0; i < raw.size(); ++i ) {
      if ( contains_markers(raw.at(i)) ) return true;
    }
  }
  return false;
}

inline spliced::ordered_node spliced::evaluate_expression(
  const std::string& expr, const Bindings& bindings )
{
  internal::Parser parser( expr );
  internal::ExprPtr tree = parser.parse();
  return internal::Evaluator( expr, bindings ).eval( *tree );
}
