#pragma once

// Standard library includes
#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include "spliced/errors.hh"
#include "spliced/value.hh"

namespace spliced {

  enum class SchemaType { String, Int, Float, Boolean, Array, Object };

  class Schema;

  // Schema nodes are immutable and shared; children are always built before
  // their parents, so a tree can never refer back to itself
  using SchemaPtr = std::shared_ptr< const Schema >;

  // Ordered property name -> schema
  using PropertyList = std::vector< std::pair< std::string, SchemaPtr > >;

  class Schema {
  public:
    struct Scalar {
      // Allowed values; empty means unconstrained
      std::vector< ordered_node > enumeration;
    };
    struct Array {
      SchemaPtr items;
    };
    struct Object {
      // Empty means any properties, unchecked
      PropertyList properties;
    };
    using Shape = std::variant< Scalar, Array, Object >;

    static SchemaPtr scalar( SchemaType type,
      std::vector< ordered_node > enumeration = {},
      std::string description = std::string() );
    static SchemaPtr array( SchemaPtr items,
      std::string description = std::string() );
    static SchemaPtr object( PropertyList properties = {},
      std::string description = std::string() );

    // Wire format: { type, description, enum, items, properties }
    static SchemaPtr from_wire( const ordered_node& wire );
    ordered_node to_wire() const;

    SchemaType type() const { return type_; }
    const std::string& description() const { return description_; }
    const Shape& shape() const { return shape_; }

    // Empty unless scalar
    const std::vector< ordered_node >& enumeration() const;
    // Null unless array
    SchemaPtr items() const;
    // Empty unless object
    const PropertyList& properties() const;
    // Null when the property is not declared
    SchemaPtr property( const std::string& name ) const;

    // Short human-readable type, e.g., "array<int>"
    std::string summary() const;

    // Structural equality
    bool operator==( const Schema& other ) const;
    bool operator!=( const Schema& other ) const { return !( *this == other ); }

  private:
    // Restricts construction to the factories while allowing make_shared
    struct Key { explicit Key() = default; };

  public:
    Schema( Key, SchemaType type, std::string description, Shape shape )
      : type_( type ), description_( std::move(description) ),
        shape_( std::move(shape) ) {}

  private:
    SchemaType type_;
    std::string description_;
    Shape shape_;
  };

  // One step into a value: a property name or an element index
  using PathSegment = std::variant< std::string, std::size_t >;

  // A single schema mismatch. Violations are data, never thrown.
  struct Violation {
    std::vector< PathSegment > path;
    std::string expected; // schema summary
    std::string actual; // observed type tag
    std::string message;
  };

  // Check a value against a schema. Never throws for mismatches and never
  // modifies the value.
  inline std::vector< Violation > validate( const Schema& schema,
    const ordered_node& value );

  // "a.b[2].c", or "(root)" for an empty path
  inline std::string format_path( const std::vector< PathSegment >& path );

  // Structured report: sequence of { path, at, expected, actual, message }
  inline ordered_node violations_to_node(
    const std::vector< Violation >& violations );

namespace internal {

  inline const std::string SCHEMA_TYPE = "type";
  inline const std::string SCHEMA_DESCRIPTION = "description";
  inline const std::string SCHEMA_ENUM = "enum";
  inline const std::string SCHEMA_ITEMS = "items";
  inline const std::string SCHEMA_PROPERTIES = "properties";

  inline const char* schema_type_name( SchemaType type ) {
    switch ( type ) {
      case SchemaType::String: return "string";
      case SchemaType::Int: return "int";
      case SchemaType::Float: return "float";
      case SchemaType::Boolean: return "boolean";
      case SchemaType::Array: return "array";
      case SchemaType::Object: return "object";
    }
    return "unknown";
  }

  // Canonical names plus the common aliases found in hand-written schemas
  inline std::optional< SchemaType > parse_schema_type(
    const std::string& name )
  {
    if ( name == "string" || name == "str" ) return SchemaType::String;
    if ( name == "int" || name == "integer" ) return SchemaType::Int;
    if ( name == "float" || name == "number" ) return SchemaType::Float;
    if ( name == "boolean" || name == "bool" ) return SchemaType::Boolean;
    if ( name == "array" ) return SchemaType::Array;
    if ( name == "object" ) return SchemaType::Object;
    return std::nullopt;
  }

  inline bool is_scalar_type( SchemaType type ) {
    return type != SchemaType::Array && type != SchemaType::Object;
  }

  // Runtime type check for scalar schema types. Floats accept integers.
  inline bool scalar_matches( SchemaType type, const ordered_node& v ) {
    switch ( type ) {
      case SchemaType::String: return v.is_string();
      case SchemaType::Int: return v.is_integer();
      case SchemaType::Float: return is_number( v );
      case SchemaType::Boolean: return v.is_boolean();
      default: return false;
    }
  }

  inline bool enum_contains( const std::vector< ordered_node >& allowed,
    const ordered_node& v )
  {
    for ( const auto& a : allowed ) {
      if ( values_equal(a, v) ) return true;
    }
    return false;
  }

  inline std::string format_enum( const std::vector< ordered_node >& allowed ) {
    std::ostringstream oss;
    oss << '[';
    for ( std::size_t i = 0; i < allowed.size(); ++i ) {
      if ( i ) oss << ", ";
      oss << to_string_any( allowed[i] );
    }
    oss << ']';
    return oss.str();
  }

  inline SchemaPtr schema_from_wire( const ordered_node& wire,
    std::vector< std::string >& path );

  inline void validate_into( const Schema& schema, const ordered_node& value,
    std::vector< PathSegment >& path, std::vector< Violation >& out );

} // namespace spliced::internal

} // namespace spliced

// Schema member function definitions

inline spliced::SchemaPtr spliced::Schema::scalar( SchemaType type,
  std::vector< ordered_node > enumeration, std::string description )
{
  if ( !internal::is_scalar_type(type) ) {
    throw SchemaError( std::string("Schema type '")
      + internal::schema_type_name( type ) + "' is not a scalar type" );
  }
  for ( const auto& v : enumeration ) {
    if ( !internal::scalar_matches(type, v) ) {
      std::ostringstream oss;
      oss << "Enum value " << internal::to_string_any( v ) << " ("
        << internal::type_tag( v ) << ") does not match schema type '"
        << internal::schema_type_name( type ) << "'";
      throw SchemaError( oss.str() );
    }
  }
  return std::make_shared< const Schema >( Key(), type,
    std::move(description), Scalar{ std::move(enumeration) } );
}

inline spliced::SchemaPtr spliced::Schema::array( SchemaPtr items,
  std::string description )
{
  if ( !items ) throw SchemaError( "Array schema requires an item schema" );
  return std::make_shared< const Schema >( Key(), SchemaType::Array,
    std::move(description), Array{ std::move(items) } );
}

inline spliced::SchemaPtr spliced::Schema::object( PropertyList properties,
  std::string description )
{
  std::unordered_set< std::string > seen;
  for ( const auto& [name, child] : properties ) {
    if ( !child ) {
      throw SchemaError( "Property '" + name + "' has no schema" );
    }
    if ( !seen.insert(name).second ) {
      throw SchemaError( "Duplicate property '" + name + "'" );
    }
  }
  return std::make_shared< const Schema >( Key(), SchemaType::Object,
    std::move(description), Object{ std::move(properties) } );
}

inline const std::vector< spliced::ordered_node >&
  spliced::Schema::enumeration() const
{
  static const std::vector< ordered_node > none;
  if ( const auto* s = std::get_if< Scalar >( &shape_ ) ) return s->enumeration;
  return none;
}

inline spliced::SchemaPtr spliced::Schema::items() const {
  if ( const auto* a = std::get_if< Array >( &shape_ ) ) return a->items;
  return nullptr;
}

inline const spliced::PropertyList& spliced::Schema::properties() const {
  static const PropertyList none;
  if ( const auto* o = std::get_if< Object >( &shape_ ) ) return o->properties;
  return none;
}

inline spliced::SchemaPtr spliced::Schema::property(
  const std::string& name ) const
{
  for ( const auto& [pname, child] : properties() ) {
    if ( pname == name ) return child;
  }
  return nullptr;
}

inline std::string spliced::Schema::summary() const {
  std::string s = internal::schema_type_name( type_ );
  switch ( type_ ) {
    case SchemaType::Array:
      return s + '<' + items()->summary() + '>';
    case SchemaType::Object:
      return s;
    default:
      if ( !enumeration().empty() ) {
        s += " enum " + internal::format_enum( enumeration() );
      }
      return s;
  }
}

inline bool spliced::Schema::operator==( const Schema& other ) const {
  if ( type_ != other.type_ || description_ != other.description_ ) {
    return false;
  }
  switch ( type_ ) {
    case SchemaType::Array:
      return *items() == *other.items();

    case SchemaType::Object: {
      const PropertyList& a = properties();
      const PropertyList& b = other.properties();
      if ( a.size() != b.size() ) return false;
      for ( std::size_t i = 0; i < a.size(); ++i ) {
        if ( a[i].first != b[i].first ) return false;
        if ( *a[i].second != *b[i].second ) return false;
      }
      return true;
    }

    default: {
      const auto& a = enumeration();
      const auto& b = other.enumeration();
      if ( a.size() != b.size() ) return false;
      for ( std::size_t i = 0; i < a.size(); ++i ) {
        if ( !internal::values_equal(a[i], b[i]) ) return false;
      }
      return true;
    }
  }
}

inline spliced::SchemaPtr spliced::Schema::from_wire(
  const ordered_node& wire )
{
  std::vector< std::string > path = { "schema" };
  return internal::schema_from_wire( wire, path );
}

inline spliced::ordered_node spliced::Schema::to_wire() const {
  ordered_node wire = ordered_node::mapping();
  wire[ internal::SCHEMA_TYPE ] = internal::make_node_from(
    std::string( internal::schema_type_name(type_) ) );
  if ( !description_.empty() ) {
    wire[ internal::SCHEMA_DESCRIPTION ]
      = internal::make_node_from( description_ );
  }

  switch ( type_ ) {
    case SchemaType::Array:
      wire[ internal::SCHEMA_ITEMS ] = items()->to_wire();
      break;

    case SchemaType::Object:
      if ( !properties().empty() ) {
        ordered_node props = ordered_node::mapping();
        for ( const auto& [name, child] : properties() ) {
          props[ name ] = child->to_wire();
        }
        wire[ internal::SCHEMA_PROPERTIES ] = props;
      }
      break;

    default:
      if ( !enumeration().empty() ) {
        wire[ internal::SCHEMA_ENUM ]
          = internal::make_node_from( enumeration() );
      }
      break;
  }
  return wire;
}

// Wire parsing. Errors name the offending location, e.g.,
// "schema.properties.timeout: unknown type 'integr'".
inline spliced::SchemaPtr spliced::internal::schema_from_wire(
  const ordered_node& wire, std::vector< std::string >& path )
{
  auto fail = [&]( const std::string& msg ) {
    throw SchemaError( join_path(path) + ": " + msg );
  };

  if ( !wire.is_mapping() ) {
    fail( "schema must be a mapping (got: " + type_tag(wire) + ")" );
  }
  for ( const auto& [mk, mv] : wire.map_items() ) {
    const std::string k = mk.get_value< std::string >();
    if ( k != SCHEMA_TYPE && k != SCHEMA_DESCRIPTION && k != SCHEMA_ENUM
      && k != SCHEMA_ITEMS && k != SCHEMA_PROPERTIES )
    {
      fail( "unknown field '" + k + "'" );
    }
  }

  if ( !wire.contains(SCHEMA_TYPE) || !wire.at(SCHEMA_TYPE).is_string() ) {
    fail( "missing string '" + SCHEMA_TYPE + "'" );
  }
  const std::string type_name
    = to_native_checked< std::string >( wire.at(SCHEMA_TYPE) );
  const std::optional< SchemaType > type = parse_schema_type( type_name );
  if ( !type ) fail( "unknown type '" + type_name + "'" );

  std::string description;
  if ( wire.contains(SCHEMA_DESCRIPTION) ) {
    const ordered_node& d = wire.at( SCHEMA_DESCRIPTION );
    if ( !d.is_string() ) fail( "'" + SCHEMA_DESCRIPTION
      + "' must be a string" );
    description = to_native_checked< std::string >( d );
  }

  const bool scalar = is_scalar_type( *type );
  if ( !scalar && wire.contains(SCHEMA_ENUM) ) {
    fail( "'" + SCHEMA_ENUM + "' is only allowed for scalar types" );
  }
  if ( *type != SchemaType::Array && wire.contains(SCHEMA_ITEMS) ) {
    fail( "'" + SCHEMA_ITEMS + "' is only allowed for arrays" );
  }
  if ( *type != SchemaType::Object && wire.contains(SCHEMA_PROPERTIES) ) {
    fail( "'" + SCHEMA_PROPERTIES + "' is only allowed for objects" );
  }

  if ( scalar ) {
    std::vector< ordered_node > enumeration;
    if ( wire.contains(SCHEMA_ENUM) ) {
      const ordered_node& e = wire.at( SCHEMA_ENUM );
      if ( !e.is_sequence() ) fail( "'" + SCHEMA_ENUM + "' must be a sequence" );
      for ( std::size_t i = 0; i < e.size(); ++i ) {
        enumeration.push_back( e.at(i) );
      }
    }
    try {
      return Schema::scalar( *type, std::move(enumeration),
        std::move(description) );
    }
    catch ( const SchemaError& ex ) {
      fail( ex.what() );
    }
  }

  if ( *type == SchemaType::Array ) {
    if ( !wire.contains(SCHEMA_ITEMS) ) {
      fail( "array schema requires '" + SCHEMA_ITEMS + "'" );
    }
    path.push_back( SCHEMA_ITEMS );
    SchemaPtr items = schema_from_wire( wire.at(SCHEMA_ITEMS), path );
    path.pop_back();
    return Schema::array( std::move(items), std::move(description) );
  }

  // Object
  PropertyList properties;
  if ( wire.contains(SCHEMA_PROPERTIES) ) {
    const ordered_node& props = wire.at( SCHEMA_PROPERTIES );
    if ( !props.is_mapping() ) {
      fail( "'" + SCHEMA_PROPERTIES + "' must be a mapping" );
    }
    path.push_back( SCHEMA_PROPERTIES );
    for ( const auto& [mk, mv] : props.map_items() ) {
      const std::string name = mk.get_value< std::string >();
      path.push_back( name );
      properties.emplace_back( name, schema_from_wire(mv, path) );
      path.pop_back();
    }
    path.pop_back();
  }
  return Schema::object( std::move(properties), std::move(description) );
}

// Validation: one recursive function dispatching on the schema type

inline void spliced::internal::validate_into( const Schema& schema,
  const ordered_node& value, std::vector< PathSegment >& path,
  std::vector< Violation >& out )
{
  auto report = [&]( const std::string& msg ) {
    out.push_back( { path, schema.summary(), type_tag(value), msg } );
  };

  switch ( schema.type() ) {
    case SchemaType::Array:
      if ( !value.is_sequence() ) {
        report( "expected array, got " + type_tag(value) );
        return;
      }
      for ( std::size_t i = 0; i < value.size(); ++i ) {
        path.emplace_back( i );
        validate_into( *schema.items(), value.at(i), path, out );
        path.pop_back();
      }
      return;

    case SchemaType::Object:
      if ( !value.is_mapping() ) {
        report( "expected object, got " + type_tag(value) );
        return;
      }
      // Absent and undeclared properties are accepted
      for ( const auto& [name, child] : schema.properties() ) {
        if ( !value.contains(name) ) continue;
        path.emplace_back( name );
        validate_into( *child, value.at(name), path, out );
        path.pop_back();
      }
      return;

    default:
      if ( !scalar_matches(schema.type(), value) ) {
        report( std::string("expected ") + schema_type_name( schema.type() )
          + ", got " + type_tag(value) );
        return;
      }
      if ( !schema.enumeration().empty()
        && !enum_contains(schema.enumeration(), value) )
      {
        report( "value " + to_string_any(value) + " is not one of "
          + format_enum(schema.enumeration()) );
      }
      return;
  }
}

inline std::vector< spliced::Violation > spliced::validate(
  const Schema& schema, const ordered_node& value )
{
  std::vector< Violation > out;
  std::vector< PathSegment > path;
  internal::validate_into( schema, value, path, out );
  return out;
}

inline std::string spliced::format_path(
  const std::vector< PathSegment >& path )
{
  if ( path.empty() ) return "(root)";
  std::string s;
  for ( const auto& seg : path ) {
    if ( const auto* name = std::get_if< std::string >( &seg ) ) {
      if ( !s.empty() ) s += internal::PATH_DELIMITER;
      s += *name;
    }
    else {
      s = internal::seq_indexed( s, std::get< std::size_t >(seg) );
    }
  }
  return s;
}

inline spliced::ordered_node spliced::violations_to_node(
  const std::vector< Violation >& violations )
{
  std::vector< ordered_node > out;
  out.reserve( violations.size() );
  for ( const auto& v : violations ) {
    std::vector< ordered_node > segs;
    for ( const auto& seg : v.path ) {
      if ( const auto* name = std::get_if< std::string >( &seg ) ) {
        segs.push_back( internal::make_node_from(*name) );
      }
      else {
        segs.push_back( internal::make_node_from< std::int64_t >(
          static_cast< std::int64_t >( std::get< std::size_t >(seg) ) ) );
      }
    }
    ordered_node entry = ordered_node::mapping();
    entry[ "path" ] = internal::make_node_from( segs );
    entry[ "at" ] = internal::make_node_from( format_path(v.path) );
    entry[ "expected" ] = internal::make_node_from( v.expected );
    entry[ "actual" ] = internal::make_node_from( v.actual );
    entry[ "message" ] = internal::make_node_from( v.message );
    out.push_back( entry );
  }
  return internal::make_node_from( out );
}
