#pragma once

// Standard library includes
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

#include "spliced/errors.hh"

namespace spliced {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the lexical order of the input
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

  // Constants defining wire keys for variables. This block provides a single
  // location for easy editing to allow for future changes.
  inline constexpr char PATH_DELIMITER = '.';

  inline const std::string WIRE_TYPE = "type";
  inline const std::string WIRE_VALUE = "value";
  inline const std::string WIRE_CUSTOM_TYPE = "custom_type";
  inline const std::string WIRE_PLAIN = "plain";
  inline const std::string WIRE_SPLICE = "splice";
  inline const std::string WIRE_LAZY = "lazy";

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

  inline bool is_number( const ordered_node& n ) {
    return n.is_integer() || n.is_float_number();
  }

  inline double as_double( const ordered_node& n ) {
    if ( n.is_integer() ) {
      return static_cast< double >( to_native_checked< std::int64_t >(n) );
    }
    return to_native_checked< double >( n );
  }

  // Decimal text for a double with 15 significant digits, always showing a
  // fractional part
  inline std::string format_double( double d ) {
    std::ostringstream oss;
    oss << std::setprecision( 15 ) << d;
    std::string s = oss.str();
    if ( s.find_first_of(".eEn") == std::string::npos ) s += ".0";
    return s;
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return format_double(
      to_native_checked< double >( n )
    );
    if ( n.is_null() ) return "null";

    // We did not match any of the scalar types, so fall back to serialization
    std::string s = ordered_node::serialize( n );
    while ( !s.empty() && s.back() == '\n' ) s.pop_back();
    return s;
  }

  // Observed type tag, named after the schema type vocabulary
  inline std::string type_tag( const ordered_node& n ) {
    if ( n.is_null() ) return "null";
    if ( n.is_boolean() ) return "boolean";
    if ( n.is_integer() ) return "int";
    if ( n.is_float_number() ) return "float";
    if ( n.is_string() ) return "string";
    if ( n.is_sequence() ) return "array";
    if ( n.is_mapping() ) return "object";
    return "unknown";
  }

  // Structural equality with integer/float cross-comparison at the leaves
  inline bool values_equal( const ordered_node& a, const ordered_node& b ) {
    if ( is_number(a) && is_number(b) ) {
      if ( a.is_integer() && b.is_integer() ) {
        return to_native_checked< std::int64_t >( a )
          == to_native_checked< std::int64_t >( b );
      }
      return as_double( a ) == as_double( b );
    }
    if ( a.is_sequence() && b.is_sequence() ) {
      if ( a.size() != b.size() ) return false;
      for ( std::size_t i = 0; i < a.size(); ++i ) {
        if ( !values_equal(a.at(i), b.at(i)) ) return false;
      }
      return true;
    }
    if ( a.is_mapping() && b.is_mapping() ) {
      if ( a.size() != b.size() ) return false;
      // Keys may be any scalar, so match them node to node
      for ( const auto& [ak, av] : a.map_items() ) {
        bool matched = false;
        for ( const auto& [bk, bv] : b.map_items() ) {
          if ( ak == bk ) {
            matched = values_equal( av, bv );
            break;
          }
        }
        if ( !matched ) return false;
      }
      return true;
    }
    if ( type_tag(a) != type_tag(b) ) return false;
    return a == b;
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

  // Element step of a path, e.g., "jobs" and 2 give "jobs[2]"
  inline std::string seq_indexed( const std::string& base, size_t idx ) {
    return base + '[' + std::to_string( idx ) + ']';
  }

} // namespace spliced::internal

  enum class VariableKind { Literal, Template, Deferred };

  inline const char* variable_kind_name( VariableKind kind ) {
    switch ( kind ) {
      case VariableKind::Literal: return "literal";
      case VariableKind::Template: return "template";
      case VariableKind::Deferred: return "deferred";
    }
    return "unknown";
  }

  // A declared input. The kind and raw value are fixed at construction;
  // resolution only ever derives new values from them.
  class Variable {
  public:
    static Variable literal( ordered_node value );
    static Variable templated( ordered_node value );
    static Variable deferred( const std::string& type, ordered_node seed );

    // Wire format: { type: plain|splice|lazy, value: <any>,
    // custom_type: <string, lazy only> }
    static Variable from_wire( const ordered_node& wire );
    ordered_node to_wire() const;

    VariableKind kind() const { return kind_; }
    const ordered_node& raw_value() const { return raw_value_; }

    // Empty unless kind() == VariableKind::Deferred
    const std::string& deferred_type() const { return deferred_type_; }

  private:
    Variable( VariableKind kind, ordered_node raw, std::string type )
      : kind_( kind ), raw_value_( std::move(raw) ),
        deferred_type_( std::move(type) ) {}

    VariableKind kind_;
    ordered_node raw_value_;
    std::string deferred_type_;
  };

} // namespace spliced

// Variable member function definitions

inline spliced::Variable spliced::Variable::literal( ordered_node value ) {
  return Variable( VariableKind::Literal, std::move(value), std::string() );
}

inline spliced::Variable spliced::Variable::templated( ordered_node value ) {
  return Variable( VariableKind::Template, std::move(value), std::string() );
}

inline spliced::Variable spliced::Variable::deferred( const std::string& type,
  ordered_node seed )
{
  if ( type.empty() ) {
    throw WireFormatError( "Deferred variable requires a non-empty type" );
  }
  return Variable( VariableKind::Deferred, std::move(seed), type );
}

inline spliced::Variable spliced::Variable::from_wire(
  const ordered_node& wire )
{
  using internal::WIRE_CUSTOM_TYPE;
  using internal::WIRE_LAZY;
  using internal::WIRE_PLAIN;
  using internal::WIRE_SPLICE;
  using internal::WIRE_TYPE;
  using internal::WIRE_VALUE;

  if ( !wire.is_mapping() ) {
    throw WireFormatError( "Variable must be a mapping with '" + WIRE_TYPE
      + "' and '" + WIRE_VALUE + "' (got: " + internal::type_tag(wire) + ")" );
  }
  if ( !wire.contains(WIRE_TYPE) || !wire.at(WIRE_TYPE).is_string() ) {
    throw WireFormatError( "Variable is missing a string '" + WIRE_TYPE
      + "'" );
  }

  for ( const auto& [mk, mv] : wire.map_items() ) {
    const std::string k = mk.get_value< std::string >();
    if ( k != WIRE_TYPE && k != WIRE_VALUE && k != WIRE_CUSTOM_TYPE ) {
      throw WireFormatError( "Variable has unknown field '" + k + "'" );
    }
  }

  const std::string type
    = internal::to_native_checked< std::string >( wire.at(WIRE_TYPE) );
  ordered_node value = wire.contains( WIRE_VALUE )
    ? wire.at( WIRE_VALUE ) : ordered_node();

  if ( type == WIRE_LAZY ) {
    if ( !wire.contains(WIRE_CUSTOM_TYPE)
      || !wire.at(WIRE_CUSTOM_TYPE).is_string() )
    {
      throw WireFormatError( "Variable of type '" + WIRE_LAZY
        + "' requires a string '" + WIRE_CUSTOM_TYPE + "'" );
    }
    return deferred(
      internal::to_native_checked< std::string >( wire.at(WIRE_CUSTOM_TYPE) ),
      std::move(value) );
  }

  if ( wire.contains(WIRE_CUSTOM_TYPE) ) {
    throw WireFormatError( "'" + WIRE_CUSTOM_TYPE + "' is only allowed for '"
      + WIRE_LAZY + "' variables" );
  }
  if ( type == WIRE_PLAIN ) return literal( std::move(value) );
  if ( type == WIRE_SPLICE ) return templated( std::move(value) );

  std::ostringstream oss;
  oss << "Unknown variable type '" << type << "' (expected " << WIRE_PLAIN
    << ", " << WIRE_SPLICE << " or " << WIRE_LAZY << ")";
  throw WireFormatError( oss.str() );
}

inline spliced::ordered_node spliced::Variable::to_wire() const {
  ordered_node wire = ordered_node::mapping();
  switch ( kind_ ) {
    case VariableKind::Literal:
      wire[ internal::WIRE_TYPE ] = internal::make_node_from(
        internal::WIRE_PLAIN );
      break;
    case VariableKind::Template:
      wire[ internal::WIRE_TYPE ] = internal::make_node_from(
        internal::WIRE_SPLICE );
      break;
    case VariableKind::Deferred:
      wire[ internal::WIRE_TYPE ] = internal::make_node_from(
        internal::WIRE_LAZY );
      break;
  }
  wire[ internal::WIRE_VALUE ] = raw_value_;
  if ( kind_ == VariableKind::Deferred ) {
    wire[ internal::WIRE_CUSTOM_TYPE ]
      = internal::make_node_from( deferred_type_ );
  }
  return wire;
}
