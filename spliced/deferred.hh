#pragma once

// Standard library includes
#include <cstdlib>
#include <ctime>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "spliced/errors.hh"
#include "spliced/value.hh"

namespace spliced {

  // A deferred resolver maps its (already template-resolved) seed to the
  // final value. It must not keep shared mutable state between calls.
  using DeferredResolverFn = std::function< ordered_node( const ordered_node& ) >;

  // Source of "now" for resolvers that derive time-stamped values
  using Clock = std::function< std::time_t() >;

  // Table of custom resolvers keyed by type code. Populate it at process
  // start; lookups are read-only afterwards and safe to share between
  // threads.
  class DeferredRegistry {
  public:
    void register_type( const std::string& code, DeferredResolverFn fn );

    bool contains( const std::string& code ) const;

    // Sorted registered codes
    std::vector< std::string > codes() const;

    ordered_node resolve( const std::string& code,
      const ordered_node& seed ) const;

  private:
    std::map< std::string, DeferredResolverFn > resolvers_;
  };

namespace internal {

  inline const std::string DEFERRED_TIMESTAMP = "timestamp";
  inline const std::string DEFERRED_ENV = "env";
  inline const std::string DEFERRED_YAML = "yaml";

  inline const std::string DEFAULT_TIMESTAMP_FORMAT = "%Y%m%d%H%M%S";

  inline std::time_t system_now() {
    return std::time( nullptr );
  }

  // Optional string field of a mapping seed
  inline std::string seed_field( const std::string& type,
    const ordered_node& seed, const std::string& field,
    const std::string& fallback )
  {
    if ( !seed.contains(field) ) return fallback;
    const ordered_node& v = seed.at( field );
    if ( !v.is_string() ) {
      throw DeferredResolverError( type, "field '" + field
        + "' must be a string (got: " + type_tag(v) + ")" );
    }
    return to_native_checked< std::string >( v );
  }

  // seed: strftime format, or { format, prefix, suffix }
  inline ordered_node resolve_timestamp( const ordered_node& seed,
    const Clock& clock )
  {
    std::string format = DEFAULT_TIMESTAMP_FORMAT;
    std::string prefix, suffix;
    if ( seed.is_string() ) {
      format = to_native_checked< std::string >( seed );
    }
    else if ( seed.is_mapping() ) {
      format = seed_field( DEFERRED_TIMESTAMP, seed, "format", format );
      prefix = seed_field( DEFERRED_TIMESTAMP, seed, "prefix", prefix );
      suffix = seed_field( DEFERRED_TIMESTAMP, seed, "suffix", suffix );
    }
    else if ( !seed.is_null() ) {
      throw DeferredResolverError( DEFERRED_TIMESTAMP,
        "seed must be a format string or a mapping (got: "
        + type_tag(seed) + ")" );
    }

    const std::time_t now = clock();
    std::tm utc{};
    if ( gmtime_r(&now, &utc) == nullptr ) {
      throw DeferredResolverError( DEFERRED_TIMESTAMP,
        "clock value cannot be represented as UTC time" );
    }

    char buffer[ 256 ];
    const std::size_t len = std::strftime( buffer, sizeof(buffer),
      format.c_str(), &utc );
    if ( len == 0 && !format.empty() ) {
      throw DeferredResolverError( DEFERRED_TIMESTAMP,
        "format '" + format + "' produced no output" );
    }
    return make_node_from( prefix + std::string(buffer, len) + suffix );
  }

  // seed: variable name, or { name, default }
  inline ordered_node resolve_env( const ordered_node& seed ) {
    std::string name;
    bool has_default = false;
    ordered_node fallback;
    if ( seed.is_string() ) {
      name = to_native_checked< std::string >( seed );
    }
    else if ( seed.is_mapping() ) {
      name = seed_field( DEFERRED_ENV, seed, "name", std::string() );
      if ( seed.contains(std::string("default")) ) {
        has_default = true;
        fallback = seed.at( std::string("default") );
      }
    }
    if ( name.empty() ) {
      throw DeferredResolverError( DEFERRED_ENV,
        "seed must name an environment variable" );
    }

    if ( const char* v = std::getenv(name.c_str()) ) {
      return make_node_from( std::string(v) );
    }
    if ( has_default ) return fallback;
    throw DeferredResolverError( DEFERRED_ENV,
      "environment variable '" + name + "' is not set" );
  }

  // seed: YAML text parsed into a structured value
  inline ordered_node resolve_yaml( const ordered_node& seed ) {
    if ( !seed.is_string() ) {
      throw DeferredResolverError( DEFERRED_YAML,
        "seed must be a string (got: " + type_tag(seed) + ")" );
    }
    try {
      return ordered_node::deserialize(
        to_native_checked< std::string >(seed) );
    }
    catch ( const fkyaml::exception& ex ) {
      throw DeferredResolverError( DEFERRED_YAML, ex.what() );
    }
  }

} // namespace spliced::internal

  // Register the stock resolvers: "timestamp", "env" and "yaml"
  inline void register_builtin_resolvers( DeferredRegistry& registry,
    Clock clock = internal::system_now );

} // namespace spliced

// DeferredRegistry member function definitions

inline void spliced::DeferredRegistry::register_type( const std::string& code,
  DeferredResolverFn fn )
{
  if ( code.empty() ) {
    throw std::invalid_argument( "Deferred type code must not be empty" );
  }
  if ( !fn ) {
    throw std::invalid_argument( "Deferred type '" + code
      + "' has no resolver function" );
  }
  if ( resolvers_.count(code) ) throw DuplicateDeferredType( code );
  resolvers_.emplace( code, std::move(fn) );
}

inline bool spliced::DeferredRegistry::contains(
  const std::string& code ) const
{
  return resolvers_.count( code ) > 0;
}

inline std::vector< std::string > spliced::DeferredRegistry::codes() const {
  std::vector< std::string > out;
  out.reserve( resolvers_.size() );
  for ( const auto& kv : resolvers_ ) out.push_back( kv.first );
  return out;
}

inline spliced::ordered_node spliced::DeferredRegistry::resolve(
  const std::string& code, const ordered_node& seed ) const
{
  auto it = resolvers_.find( code );
  if ( it == resolvers_.end() ) throw UnknownDeferredType( code );

  try {
    return it->second( seed );
  }
  catch ( const RecoverableError& ) {
    throw;
  }
  catch ( const UnknownDeferredType& ) {
    throw;
  }
  catch ( const std::exception& ex ) {
    // Foreign failures from user resolvers stay isolated to their entry
    throw DeferredResolverError( code, ex.what() );
  }
}

inline void spliced::register_builtin_resolvers( DeferredRegistry& registry,
  Clock clock )
{
  registry.register_type( internal::DEFERRED_TIMESTAMP,
    [clock]( const ordered_node& seed ) {
      return internal::resolve_timestamp( seed, clock );
    } );
  registry.register_type( internal::DEFERRED_ENV, internal::resolve_env );
  registry.register_type( internal::DEFERRED_YAML, internal::resolve_yaml );
}
