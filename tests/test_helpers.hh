#pragma once

#include <cstdint>
#include <string>

#include "spliced.hh"

namespace spliced::test_support {

  // Parse a YAML snippet (flow or block style)
  inline ordered_node yaml( const std::string& text ) {
    return ordered_node::deserialize( text );
  }

  inline ordered_node str( const std::string& s ) {
    return internal::make_node_from( s );
  }

  inline ordered_node integer( std::int64_t i ) {
    return internal::make_node_from< std::int64_t >( i );
  }

  inline std::string as_str( const ordered_node& n ) {
    return internal::to_native_checked< std::string >( n );
  }

  inline std::int64_t as_int( const ordered_node& n ) {
    return internal::to_native_checked< std::int64_t >( n );
  }

  inline bool same( const ordered_node& a, const ordered_node& b ) {
    return internal::values_equal( a, b );
  }

} // namespace spliced::test_support
