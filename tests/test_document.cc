#include <ctime>
#include <sstream>

#include <gtest/gtest.h>

#include "test_helpers.hh"

using namespace spliced;
using namespace spliced::test_support;

namespace {

  const std::string BUILD_NODE = R"(globals:
  project:
    type: plain
    value: demo
  started:
    type: lazy
    custom_type: timestamp
    value: "%Y%m%d"
params:
  branch: master
outputs:
  compile:
    artifact: app.tar
    size: 12
inputs:
  branch:
    type: splice
    value: "${branch}"
  timeout:
    type: plain
    value: 3600
  archive:
    type: splice
    value: "${project}-${started}-${compile.artifact}"
schema:
  type: object
  properties:
    branch:
      type: string
    timeout:
      type: int
)";

  DeferredRegistry test_registry() {
    DeferredRegistry registry;
    register_builtin_resolvers( registry, []() -> std::time_t {
      return 1614834367; // 2021-03-04 UTC
    } );
    return registry;
  }

} // anonymous namespace

TEST( NodeDocument, ParsesSections ) {
  const NodeDocument doc = NodeDocument::parse( BUILD_NODE );
  ASSERT_EQ( doc.globals.size(), 2u );
  EXPECT_EQ( doc.globals[1].first, "started" );
  EXPECT_EQ( doc.globals[1].second.kind(), VariableKind::Deferred );
  ASSERT_EQ( doc.params.size(), 1u );
  ASSERT_EQ( doc.outputs.size(), 1u );
  ASSERT_EQ( doc.inputs.size(), 3u );
  EXPECT_EQ( doc.inputs[0].first, "branch" );
  ASSERT_TRUE( doc.schema );
  EXPECT_EQ( doc.schema->properties().size(), 2u );
}

TEST( NodeDocument, LoadReadsStream ) {
  std::istringstream in( BUILD_NODE );
  EXPECT_EQ( NodeDocument::load( in ).inputs.size(), 3u );
}

TEST( NodeDocument, EmptyDocumentIsValid ) {
  const NodeDocument doc = NodeDocument::parse( "" );
  EXPECT_TRUE( doc.inputs.empty() );
  EXPECT_FALSE( doc.schema );
}

TEST( NodeDocument, RejectsUnknownSections ) {
  EXPECT_THROW( NodeDocument::parse( "variables: {}\n" ), WireFormatError );
  EXPECT_THROW( NodeDocument::parse( "- a\n- b\n" ), WireFormatError );
  EXPECT_THROW( NodeDocument::parse( "inputs: [1, 2]\n" ), WireFormatError );
  EXPECT_THROW( NodeDocument::parse( "1: {}\n" ), WireFormatError );
  EXPECT_THROW( NodeDocument::parse( "params: {7: x}\n" ), WireFormatError );
}

TEST( NodeDocument, RejectsKeysDeclaredTwice ) {
  try {
    NodeDocument::parse(
      "params: {x: 1}\ninputs: {x: {type: plain, value: 2}}\n" );
    FAIL() << "expected WireFormatError";
  }
  catch ( const WireFormatError& ex ) {
    EXPECT_EQ( std::string(ex.what()),
      "inputs.x: key is already declared in another section" );
  }
}

TEST( NodeDocument, VariableErrorsNameTheirKey ) {
  try {
    NodeDocument::parse( "inputs: {x: {type: eager}}\n" );
    FAIL() << "expected WireFormatError";
  }
  catch ( const WireFormatError& ex ) {
    EXPECT_EQ( std::string(ex.what()).rfind("inputs.x: ", 0), 0u );
  }
}

TEST( RunDocument, ResolvesAndValidatesInputs ) {
  const DeferredRegistry registry = test_registry();
  const NodeReport report = run_document( NodeDocument::parse(BUILD_NODE),
    registry );

  EXPECT_TRUE( report.clean() );
  EXPECT_EQ( as_str(report.inputs.at(std::string("branch"))), "master" );
  EXPECT_EQ( as_int(report.inputs.at(std::string("timeout"))), 3600 );
  EXPECT_EQ( as_str(report.inputs.at(std::string("archive"))),
    "demo-20210304-app.tar" );

  // Only declared inputs are reported
  EXPECT_EQ( report.inputs.size(), 3u );
}

TEST( RunDocument, ReportsViolations ) {
  const std::string text = R"(params:
  t: "3600"
inputs:
  timeout:
    type: splice
    value: "${t}"
schema:
  type: object
  properties:
    timeout:
      type: int
)";
  const NodeReport report = run_document( NodeDocument::parse(text),
    test_registry() );

  EXPECT_TRUE( report.resolution.ok() );
  EXPECT_FALSE( report.clean() );
  ASSERT_EQ( report.violations.size(), 1u );
  EXPECT_EQ( format_path(report.violations[0].path), "timeout" );
}

TEST( RunDocument, ReportsResolutionErrors ) {
  const std::string text = R"(inputs:
  ok:
    type: plain
    value: 1
  broken:
    type: splice
    value: "${nowhere}"
)";
  const NodeReport report = run_document( NodeDocument::parse(text),
    test_registry() );

  EXPECT_FALSE( report.clean() );
  EXPECT_EQ( report.inputs.size(), 1u );

  const ordered_node out = report.to_node();
  const ordered_node& errors = out.at( std::string("errors") );
  ASSERT_TRUE( errors.contains(std::string("broken")) );
  const ordered_node& err = errors.at( std::string("broken") );
  EXPECT_EQ( as_str(err.at(std::string("kind"))), "UnresolvedReferenceError" );
  EXPECT_EQ( as_str(err.at(std::string("detail")).at(0)), "nowhere" );
  EXPECT_TRUE( out.at(std::string("violations")).is_sequence() );
  EXPECT_EQ( as_int(out.at(std::string("inputs")).at(std::string("ok"))), 1 );
}

TEST( RunDocument, UnknownDeferredTypeIsFatal ) {
  const std::string text = R"(inputs:
  x:
    type: lazy
    custom_type: vault
    value: secret/path
)";
  EXPECT_THROW( run_document( NodeDocument::parse(text), test_registry() ),
    UnknownDeferredType );
}
