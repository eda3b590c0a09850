#include <gtest/gtest.h>

#include "test_helpers.hh"

using namespace spliced;
using namespace spliced::test_support;

namespace {

  SchemaPtr build_schema() {
    return Schema::object( {
      { "branch", Schema::scalar( SchemaType::String ) },
      { "timeout", Schema::scalar( SchemaType::Int ) },
    } );
  }

} // anonymous namespace

TEST( Schema, MatchingValueHasNoViolations ) {
  const auto violations = validate( *build_schema(),
    yaml("{branch: master, timeout: 3600}") );
  EXPECT_TRUE( violations.empty() );
}

TEST( Schema, WrongScalarTypeIsOneViolation ) {
  const auto violations = validate( *build_schema(),
    yaml("{timeout: \"3600\"}") );
  ASSERT_EQ( violations.size(), 1u );
  const Violation& v = violations.front();
  ASSERT_EQ( v.path.size(), 1u );
  EXPECT_EQ( std::get< std::string >(v.path[0]), "timeout" );
  EXPECT_EQ( v.expected, "int" );
  EXPECT_EQ( v.actual, "string" );
  EXPECT_EQ( v.message, "expected int, got string" );
}

TEST( Schema, EmptyPropertiesAcceptAnyObject ) {
  const SchemaPtr any = Schema::object();
  EXPECT_TRUE( validate( *any, yaml("{x: 1, y: [a, {b: c}]}") ).empty() );
  EXPECT_TRUE( validate( *any, ordered_node::mapping() ).empty() );
  EXPECT_EQ( validate( *any, integer(1) ).size(), 1u );
}

TEST( Schema, AbsentAndUndeclaredPropertiesAreAccepted ) {
  EXPECT_TRUE( validate( *build_schema(), yaml("{other: true}") ).empty() );
}

TEST( Schema, EnumConstrainsScalars ) {
  const SchemaPtr mode = Schema::scalar( SchemaType::String,
    { str("fast"), str("safe") } );
  EXPECT_TRUE( validate( *mode, str("safe") ).empty() );

  const auto violations = validate( *mode, str("yolo") );
  ASSERT_EQ( violations.size(), 1u );
  EXPECT_EQ( violations[0].message, "value yolo is not one of [fast, safe]" );
  EXPECT_TRUE( violations[0].path.empty() );
}

TEST( Schema, EnumMustMatchDeclaredType ) {
  EXPECT_THROW( Schema::scalar( SchemaType::Int, { str("one") } ),
    SchemaError );
  EXPECT_THROW( Schema::scalar( SchemaType::Array ), SchemaError );
  EXPECT_THROW( Schema::array( nullptr ), SchemaError );
  EXPECT_THROW( Schema::object( { { "a", Schema::object() },
    { "a", Schema::object() } } ), SchemaError );
}

TEST( Schema, NumericTypes ) {
  const SchemaPtr f = Schema::scalar( SchemaType::Float );
  const SchemaPtr i = Schema::scalar( SchemaType::Int );
  EXPECT_TRUE( validate( *f, integer(2) ).empty() );
  EXPECT_TRUE( validate( *f, internal::make_node_from< double >( 2.5 ) ).empty() );
  EXPECT_EQ( validate( *i, internal::make_node_from< double >( 2.5 ) ).size(),
    1u );
  EXPECT_EQ( validate( *i, internal::make_node_from< bool >( true ) ).size(),
    1u );
}

TEST( Schema, NestedViolationsCarryFullPath ) {
  const SchemaPtr s = Schema::object( {
    { "jobs", Schema::array( Schema::object( {
      { "name", Schema::scalar( SchemaType::String ) },
      { "retries", Schema::scalar( SchemaType::Int ) },
    } ) ) },
  } );

  const auto violations = validate( *s, yaml(
    "{jobs: [{name: a, retries: 1}, {name: 7, retries: x}, 3]}" ) );
  ASSERT_EQ( violations.size(), 3u );
  EXPECT_EQ( format_path(violations[0].path), "jobs[1].name" );
  EXPECT_EQ( format_path(violations[1].path), "jobs[1].retries" );
  EXPECT_EQ( format_path(violations[2].path), "jobs[2]" );
  EXPECT_EQ( violations[2].expected, "object" );
  EXPECT_EQ( violations[2].actual, "int" );
}

TEST( Schema, ValidationDoesNotStopAtFirstMismatch ) {
  const SchemaPtr tags = Schema::array( Schema::scalar( SchemaType::String ) );
  EXPECT_EQ( validate( *tags, yaml("[1, ok, 2.5, false]") ).size(), 3u );
}

TEST( Schema, FormatPath ) {
  EXPECT_EQ( format_path( {} ), "(root)" );
  EXPECT_EQ( format_path( { std::string("a"), std::string("b"),
    std::size_t(2), std::string("c") } ), "a.b[2].c" );
  EXPECT_EQ( format_path( { std::size_t(0), std::size_t(1) } ), "[0][1]" );
}

TEST( Schema, Summary ) {
  EXPECT_EQ( Schema::array( Schema::scalar( SchemaType::Int ) )->summary(),
    "array<int>" );
  EXPECT_EQ( Schema::scalar( SchemaType::String,
    { str("a"), str("b") } )->summary(), "string enum [a, b]" );
  EXPECT_EQ( build_schema()->summary(), "object" );
}

TEST( Schema, FromWireAcceptsAliases ) {
  const SchemaPtr s = Schema::from_wire( yaml(
    "{type: object, properties: {a: {type: str}, b: {type: integer},"
    " c: {type: number}, d: {type: bool}}}" ) );
  ASSERT_EQ( s->properties().size(), 4u );
  EXPECT_EQ( s->property("a")->type(), SchemaType::String );
  EXPECT_EQ( s->property("b")->type(), SchemaType::Int );
  EXPECT_EQ( s->property("c")->type(), SchemaType::Float );
  EXPECT_EQ( s->property("d")->type(), SchemaType::Boolean );
  EXPECT_FALSE( s->property("e") );
}

TEST( Schema, WireRoundTripPreservesStructure ) {
  const SchemaPtr original = Schema::object( {
    { "branch", Schema::scalar( SchemaType::String, {}, "git branch" ) },
    { "mode", Schema::scalar( SchemaType::String,
      { str("fast"), str("safe") } ) },
    { "limits", Schema::object( {
      { "cpu", Schema::scalar( SchemaType::Float ) },
      { "ports", Schema::array( Schema::scalar( SchemaType::Int,
        { integer(80), integer(443) } ) ) },
    } ) },
    { "extra", Schema::object() },
    { "matrix", Schema::array( Schema::array(
      Schema::scalar( SchemaType::Boolean ) ) ) },
  }, "node inputs" );

  const SchemaPtr back = Schema::from_wire( original->to_wire() );
  EXPECT_TRUE( *back == *original );

  // Serialized text survives a second trip unchanged
  const std::string text = ordered_node::serialize( original->to_wire() );
  const SchemaPtr reparsed = Schema::from_wire( yaml(text) );
  EXPECT_TRUE( *reparsed == *original );
  EXPECT_EQ( ordered_node::serialize( reparsed->to_wire() ), text );
}

TEST( Schema, StructuralEquality ) {
  EXPECT_TRUE( *build_schema() == *build_schema() );
  EXPECT_TRUE( *Schema::scalar( SchemaType::Int )
    != *Schema::scalar( SchemaType::Float ) );
  EXPECT_TRUE( *Schema::scalar( SchemaType::Int, {}, "a" )
    != *Schema::scalar( SchemaType::Int, {}, "b" ) );
}

TEST( Schema, FromWireRejectsMalformedSchemas ) {
  EXPECT_THROW( Schema::from_wire( yaml("[1]") ), SchemaError );
  EXPECT_THROW( Schema::from_wire( yaml("{description: x}") ), SchemaError );
  EXPECT_THROW( Schema::from_wire( yaml("{type: integr}") ), SchemaError );
  EXPECT_THROW( Schema::from_wire( yaml("{type: array}") ), SchemaError );
  EXPECT_THROW( Schema::from_wire(
    yaml("{type: array, items: {type: int}, enum: [1]}") ), SchemaError );
  EXPECT_THROW( Schema::from_wire(
    yaml("{type: int, enum: [a]}") ), SchemaError );
  EXPECT_THROW( Schema::from_wire(
    yaml("{type: int, items: {type: int}}") ), SchemaError );
  EXPECT_THROW( Schema::from_wire(
    yaml("{type: object, required: [a]}") ), SchemaError );
}

TEST( Schema, FromWireErrorsNameTheLocation ) {
  try {
    Schema::from_wire( yaml(
      "{type: object, properties: {timeout: {type: integr}}}" ) );
    FAIL() << "expected SchemaError";
  }
  catch ( const SchemaError& ex ) {
    EXPECT_EQ( std::string(ex.what()),
      "schema.properties.timeout: unknown type 'integr'" );
  }
}

TEST( Schema, ViolationsToNode ) {
  const auto violations = validate( *build_schema(),
    yaml("{timeout: \"3600\"}") );
  const ordered_node report = violations_to_node( violations );
  ASSERT_TRUE( report.is_sequence() );
  ASSERT_EQ( report.size(), 1u );
  const ordered_node& entry = report.at( 0 );
  EXPECT_EQ( as_str(entry.at(std::string("at"))), "timeout" );
  EXPECT_EQ( as_str(entry.at(std::string("path")).at(0)), "timeout" );
  EXPECT_EQ( as_str(entry.at(std::string("expected"))), "int" );
  EXPECT_EQ( as_str(entry.at(std::string("actual"))), "string" );
}
