#pragma once

// Standard library includes
#include <istream>
#include <map>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "spliced/context.hh"
#include "spliced/deferred.hh"
#include "spliced/errors.hh"
#include "spliced/schema.hh"
#include "spliced/value.hh"

namespace spliced {

namespace internal {

  // Constants defining the sections of a node document
  inline const std::string DOC_GLOBALS = "globals";
  inline const std::string DOC_PARAMS = "params";
  inline const std::string DOC_OUTPUTS = "outputs";
  inline const std::string DOC_INPUTS = "inputs";
  inline const std::string DOC_SCHEMA = "schema";

  inline const std::string REPORT_INPUTS = "inputs";
  inline const std::string REPORT_ERRORS = "errors";
  inline const std::string REPORT_VIOLATIONS = "violations";

} // namespace spliced::internal

  // One node execution as seen by the engine:
  //
  //   globals: { <key>: <variable wire> }   workflow-level
  //   params:  { <key>: <value> }           parent-scope values
  //   outputs: { <node>: <mapping> }        prior node outputs
  //   inputs:  { <key>: <variable wire> }   declared node inputs
  //   schema:  <schema wire>                optional input schema
  struct NodeDocument {
    std::vector< std::pair< std::string, Variable > > globals;
    std::vector< std::pair< std::string, ordered_node > > params;
    std::vector< std::pair< std::string, ordered_node > > outputs;
    std::vector< std::pair< std::string, Variable > > inputs;
    SchemaPtr schema;

    static NodeDocument parse( const std::string& yaml_text );
    static NodeDocument load( std::istream& in );
  };

  struct NodeReport {
    ResolveResult resolution;

    // Resolved inputs, in declaration order
    ordered_node inputs = ordered_node::mapping();

    std::vector< Violation > violations;

    bool clean() const { return resolution.ok() && violations.empty(); }

    // { inputs, errors, violations }
    ordered_node to_node() const;
  };

  // Resolve the document's globals in a shared store, then its inputs in a
  // fresh per-pass context, and validate the resolved inputs
  inline NodeReport run_document( const NodeDocument& doc,
    const DeferredRegistry& registry,
    ResolveOptions options = ResolveOptions() );

  inline ordered_node errors_to_node(
    const std::map< std::string, ResolutionError >& errors );

} // namespace spliced

// NodeDocument member function definitions

inline spliced::NodeDocument spliced::NodeDocument::load( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse( ss.str() );
}

inline spliced::NodeDocument spliced::NodeDocument::parse(
  const std::string& yaml_text )
{
  using internal::DOC_GLOBALS;
  using internal::DOC_INPUTS;
  using internal::DOC_OUTPUTS;
  using internal::DOC_PARAMS;
  using internal::DOC_SCHEMA;

  ordered_node dom;
  try {
    dom = ordered_node::deserialize( yaml_text );
  }
  catch ( const fkyaml::exception& ex ) {
    throw WireFormatError( std::string("Invalid YAML document: ")
      + ex.what() );
  }

  NodeDocument doc;
  if ( dom.is_null() ) return doc;
  if ( !dom.is_mapping() ) {
    throw WireFormatError( "Node document must be a mapping (got: "
      + internal::type_tag(dom) + ")" );
  }

  // Reference keys are unique across all sections
  std::unordered_set< std::string > seen;
  auto claim = [&]( const std::string& section, const std::string& key ) {
    if ( !seen.insert(key).second ) {
      throw WireFormatError( section + "." + key
        + ": key is already declared in another section" );
    }
  };

  auto section_items = [&]( const std::string& section )
    -> std::vector< std::pair< std::string, ordered_node > >
  {
    std::vector< std::pair< std::string, ordered_node > > out;
    if ( !dom.contains(section) || dom.at(section).is_null() ) return out;
    const ordered_node& sec = dom.at( section );
    if ( !sec.is_mapping() ) {
      throw WireFormatError( "'" + section + "' must be a mapping (got: "
        + internal::type_tag(sec) + ")" );
    }
    for ( const auto& [mk, mv] : sec.map_items() ) {
      if ( !mk.is_string() ) {
        throw WireFormatError( "'" + section + "' keys must be strings (got: "
          + internal::type_tag(mk) + ")" );
      }
      const std::string key = mk.get_value< std::string >();
      claim( section, key );
      out.emplace_back( key, mv );
    }
    return out;
  };

  auto variables = [&]( const std::string& section ) {
    std::vector< std::pair< std::string, Variable > > out;
    for ( const auto& [key, wire] : section_items(section) ) {
      try {
        out.emplace_back( key, Variable::from_wire(wire) );
      }
      catch ( const WireFormatError& ex ) {
        throw WireFormatError( section + "." + key + ": " + ex.what() );
      }
    }
    return out;
  };

  for ( const auto& [mk, mv] : dom.map_items() ) {
    if ( !mk.is_string() ) {
      throw WireFormatError( "Document section names must be strings (got: "
        + internal::type_tag(mk) + ")" );
    }
    const std::string k = mk.get_value< std::string >();
    if ( k != DOC_GLOBALS && k != DOC_PARAMS && k != DOC_OUTPUTS
      && k != DOC_INPUTS && k != DOC_SCHEMA )
    {
      throw WireFormatError( "Unknown document section '" + k + "'" );
    }
  }

  doc.globals = variables( DOC_GLOBALS );
  doc.params = section_items( DOC_PARAMS );
  doc.outputs = section_items( DOC_OUTPUTS );
  doc.inputs = variables( DOC_INPUTS );

  if ( dom.contains(DOC_SCHEMA) && !dom.at(DOC_SCHEMA).is_null() ) {
    doc.schema = Schema::from_wire( dom.at(DOC_SCHEMA) );
  }
  return doc;
}

// Report rendering

inline spliced::ordered_node spliced::errors_to_node(
  const std::map< std::string, ResolutionError >& errors )
{
  ordered_node out = ordered_node::mapping();
  for ( const auto& [key, err] : errors ) {
    ordered_node entry = ordered_node::mapping();
    entry[ "kind" ] = internal::make_node_from(
      std::string( error_kind_name(err.kind) ) );
    entry[ "message" ] = internal::make_node_from( err.message );
    if ( !err.detail.empty() ) {
      std::vector< ordered_node > detail;
      for ( const auto& d : err.detail ) {
        detail.push_back( internal::make_node_from(d) );
      }
      entry[ "detail" ] = internal::make_node_from( detail );
    }
    out[ key ] = entry;
  }
  return out;
}

inline spliced::ordered_node spliced::NodeReport::to_node() const {
  ordered_node out = ordered_node::mapping();
  out[ internal::REPORT_INPUTS ] = inputs;
  out[ internal::REPORT_ERRORS ] = errors_to_node( resolution.errors );
  out[ internal::REPORT_VIOLATIONS ] = violations_to_node( violations );
  return out;
}

inline spliced::NodeReport spliced::run_document( const NodeDocument& doc,
  const DeferredRegistry& registry, ResolveOptions options )
{
  GlobalStore globals( registry, options );
  for ( const auto& [key, var] : doc.globals ) globals.declare( key, var );

  ResolutionContext ctx;
  ctx.import_globals( globals );
  for ( const auto& [key, value] : doc.params ) ctx.set_value( key, value );
  for ( const auto& [key, value] : doc.outputs ) ctx.set_value( key, value );
  for ( const auto& [key, var] : doc.inputs ) ctx.declare( key, var );

  NodeReport report;
  Resolver resolver( registry, options );
  report.resolution = resolver.resolve_all( ctx );

  for ( const auto& [key, var] : doc.inputs ) {
    auto it = report.resolution.values.find( key );
    if ( it != report.resolution.values.end() ) {
      report.inputs[ key ] = it->second;
    }
  }

  // Entries that failed to resolve are reported as errors, not violations
  if ( doc.schema ) report.violations = validate( *doc.schema, report.inputs );
  return report;
}
