#include <gtest/gtest.h>

#include "test_helpers.hh"

using namespace spliced;
using namespace spliced::test_support;

TEST( Variable, LiteralKeepsRawValue ) {
  const ordered_node raw = yaml( "{a: 1, b: [x, y]}" );
  const Variable v = Variable::literal( raw );
  EXPECT_EQ( v.kind(), VariableKind::Literal );
  EXPECT_TRUE( same(v.raw_value(), raw) );
  EXPECT_TRUE( v.deferred_type().empty() );
}

TEST( Variable, DeferredRequiresType ) {
  EXPECT_THROW( Variable::deferred( "", str("seed") ), WireFormatError );

  const Variable v = Variable::deferred( "timestamp", str("%Y") );
  EXPECT_EQ( v.kind(), VariableKind::Deferred );
  EXPECT_EQ( v.deferred_type(), "timestamp" );
}

TEST( Variable, FromWireKinds ) {
  const Variable plain = Variable::from_wire(
    yaml("{type: plain, value: 42}") );
  EXPECT_EQ( plain.kind(), VariableKind::Literal );
  EXPECT_EQ( as_int(plain.raw_value()), 42 );

  const Variable splice = Variable::from_wire(
    yaml("{type: splice, value: \"run-${id}\"}") );
  EXPECT_EQ( splice.kind(), VariableKind::Template );
  EXPECT_EQ( as_str(splice.raw_value()), "run-${id}" );

  const Variable lazy = Variable::from_wire(
    yaml("{type: lazy, value: \"%Y\", custom_type: timestamp}") );
  EXPECT_EQ( lazy.kind(), VariableKind::Deferred );
  EXPECT_EQ( lazy.deferred_type(), "timestamp" );
  EXPECT_EQ( as_str(lazy.raw_value()), "%Y" );
}

TEST( Variable, FromWireMissingValueIsNull ) {
  const Variable v = Variable::from_wire( yaml("{type: plain}") );
  EXPECT_TRUE( v.raw_value().is_null() );
}

TEST( Variable, FromWireRejectsMalformedInput ) {
  EXPECT_THROW( Variable::from_wire( yaml("[1, 2]") ), WireFormatError );
  EXPECT_THROW( Variable::from_wire( yaml("{value: 1}") ), WireFormatError );
  EXPECT_THROW( Variable::from_wire( yaml("{type: eager, value: 1}") ),
    WireFormatError );
  EXPECT_THROW( Variable::from_wire( yaml("{type: lazy, value: 1}") ),
    WireFormatError );
  EXPECT_THROW( Variable::from_wire(
    yaml("{type: plain, value: 1, custom_type: env}") ), WireFormatError );
  EXPECT_THROW( Variable::from_wire(
    yaml("{type: plain, value: 1, extra: true}") ), WireFormatError );
}

TEST( Variable, WireRoundTrip ) {
  const Variable lazy = Variable::deferred( "env",
    yaml("{name: HOME, default: /root}") );
  const Variable back = Variable::from_wire( lazy.to_wire() );
  EXPECT_EQ( back.kind(), VariableKind::Deferred );
  EXPECT_EQ( back.deferred_type(), "env" );
  EXPECT_TRUE( same(back.raw_value(), lazy.raw_value()) );

  const ordered_node wire = Variable::templated( str("${a}") ).to_wire();
  EXPECT_EQ( as_str(wire.at(std::string("type"))), "splice" );
  EXPECT_FALSE( wire.contains(std::string("custom_type")) );
}

TEST( ValueHelpers, ToStringAny ) {
  EXPECT_EQ( internal::to_string_any( integer(7) ), "7" );
  EXPECT_EQ( internal::to_string_any( str("x") ), "x" );
  EXPECT_EQ( internal::to_string_any(
    internal::make_node_from< bool >( true ) ), "true" );
  EXPECT_EQ( internal::to_string_any( ordered_node() ), "null" );
  EXPECT_EQ( internal::to_string_any(
    internal::make_node_from< double >( 2.0 ) ), "2.0" );
  EXPECT_EQ( internal::to_string_any(
    internal::make_node_from< double >( 0.5 ) ), "0.5" );
  EXPECT_EQ( internal::to_string_any(
    internal::make_node_from< double >( 0.1 + 0.2 ) ), "0.3" );
}

TEST( ValueHelpers, ValuesEqualCrossNumeric ) {
  EXPECT_TRUE( internal::values_equal( integer(3),
    internal::make_node_from< double >( 3.0 ) ) );
  EXPECT_FALSE( internal::values_equal( integer(3), str("3") ) );
  EXPECT_TRUE( same( yaml("{a: [1, 2]}"), yaml("{a: [1, 2]}") ) );
  EXPECT_FALSE( same( yaml("{a: [1, 2]}"), yaml("{a: [1, 3]}") ) );

  // Mapping keys need not be strings
  EXPECT_TRUE( same( yaml("{1: a, true: b}"), yaml("{true: b, 1: a}") ) );
  EXPECT_FALSE( same( yaml("{1: a}"), yaml("{2: a}") ) );
}

TEST( ValueHelpers, TypeTags ) {
  EXPECT_EQ( internal::type_tag( yaml("{a: 1}") ), "object" );
  EXPECT_EQ( internal::type_tag( yaml("[1]") ), "array" );
  EXPECT_EQ( internal::type_tag( integer(1) ), "int" );
  EXPECT_EQ( internal::type_tag( str("s") ), "string" );
}
