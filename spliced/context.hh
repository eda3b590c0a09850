#pragma once

// Standard library includes
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "spliced/deferred.hh"
#include "spliced/errors.hh"
#include "spliced/expression.hh"
#include "spliced/value.hh"

namespace spliced {

  class GlobalStore;

  enum class EntryState { Unresolved, Resolving, Resolved, Failed };

  // Every named value visible during one resolution pass: globals,
  // parent-scope values, prior node outputs and the declared variables of
  // the node being resolved. Build one per pass; never share it.
  class ResolutionContext {
  public:
    // Already-resolved value
    void set_value( const std::string& key, ordered_node value );

    // Unresolved variable
    void declare( const std::string& key, Variable variable );

    // Copy the (resolved or failed) entries of a shared global store
    void import_globals( const GlobalStore& store );

    bool contains( const std::string& key ) const;
    EntryState state( const std::string& key ) const;

    // Sorted keys
    std::vector< std::string > keys() const;
    KeySet visible_keys() const;

    // Null unless the key is declared as a variable
    const Variable* variable( const std::string& key ) const;

  private:
    friend class Resolver;

    struct Entry {
      std::optional< Variable > variable;
      ordered_node value;
      EntryState state = EntryState::Unresolved;
      std::optional< ResolutionError > error;
    };

    Entry& insert_unique( const std::string& key );

    std::map< std::string, Entry > entries_;
  };

  struct ResolveOptions {
    // Throw the first per-entry error instead of collecting it
    bool strict = false;

    // Receives one "[spliced] ..." line per resolution event when set
    std::ostream* trace = nullptr;
  };

  // Outcome of a pass: partial success is normal
  struct ResolveResult {
    std::map< std::string, ordered_node > values;
    std::map< std::string, ResolutionError > errors;

    bool ok() const { return errors.empty(); }
  };

  // Dependency-ordered, cycle-safe, memoized resolution of a context
  class Resolver {
  public:
    explicit Resolver( const DeferredRegistry& registry,
      ResolveOptions options = ResolveOptions() )
      : registry_( registry ), options_( options ) {}

    // Resolve every entry. Per-entry failures are collected (unless strict);
    // UnknownDeferredType aborts the pass.
    ResolveResult resolve_all( ResolutionContext& ctx );

    // Resolve one key (and what it needs). Throws the entry's error.
    ordered_node resolve( ResolutionContext& ctx, const std::string& key );

    // key -> reference keys its template or seed depends on
    std::map< std::string, std::set< std::string > > dependency_graph(
      const ResolutionContext& ctx ) const;

    // Reject deferred variables naming unregistered resolvers
    void preflight( const ResolutionContext& ctx ) const;

  private:
    const ordered_node& resolve_entry( ResolutionContext& ctx,
      const std::string& key );

    void record_failure( ResolutionContext::Entry& entry,
      const std::string& key, const RecoverableError& ex );

    void trace( const std::string& msg ) const;

    const DeferredRegistry& registry_;
    ResolveOptions options_;

    // Keys currently marked Resolving, outermost first
    std::vector< std::string > stack_;
  };

  // Workflow-level globals shared by concurrently resolving contexts. Values
  // are computed once (single-flight) on first access; the store is
  // read-only from then on.
  class GlobalStore {
  public:
    explicit GlobalStore( const DeferredRegistry& registry,
      ResolveOptions options = ResolveOptions() )
      : registry_( registry ), options_( options ) {}

    GlobalStore( const GlobalStore& ) = delete;
    GlobalStore& operator=( const GlobalStore& ) = delete;

    void set_value( const std::string& key, ordered_node value );
    void declare( const std::string& key, Variable variable );

    // Blocks until the single resolution pass has completed
    const ResolveResult& results() const;

  private:
    void ensure_mutable() const;

    const DeferredRegistry& registry_;
    ResolveOptions options_;

    mutable std::mutex mutex_;
    mutable std::once_flag once_;
    mutable bool frozen_ = false;
    mutable ResolutionContext context_;
    mutable ResolveResult results_;
  };

} // namespace spliced

// ResolutionContext member function definitions

inline spliced::ResolutionContext::Entry&
  spliced::ResolutionContext::insert_unique( const std::string& key )
{
  if ( key.empty() ) {
    throw std::invalid_argument( "Reference key must not be empty" );
  }
  auto [it, inserted] = entries_.try_emplace( key );
  if ( !inserted ) {
    throw std::invalid_argument( "Duplicate reference key '" + key + "'" );
  }
  return it->second;
}

inline void spliced::ResolutionContext::set_value( const std::string& key,
  ordered_node value )
{
  Entry& e = insert_unique( key );
  e.value = std::move( value );
  e.state = EntryState::Resolved;
}

inline void spliced::ResolutionContext::declare( const std::string& key,
  Variable variable )
{
  Entry& e = insert_unique( key );
  e.variable = std::move( variable );
}

inline void spliced::ResolutionContext::import_globals(
  const GlobalStore& store )
{
  const ResolveResult& r = store.results();
  for ( const auto& [key, value] : r.values ) set_value( key, value );
  for ( const auto& [key, error] : r.errors ) {
    Entry& e = insert_unique( key );
    e.state = EntryState::Failed;
    e.error = error;
  }
}

inline bool spliced::ResolutionContext::contains(
  const std::string& key ) const
{
  return entries_.count( key ) > 0;
}

inline spliced::EntryState spliced::ResolutionContext::state(
  const std::string& key ) const
{
  auto it = entries_.find( key );
  if ( it == entries_.end() ) {
    throw std::out_of_range( "No entry for reference key '" + key + "'" );
  }
  return it->second.state;
}

inline std::vector< std::string > spliced::ResolutionContext::keys() const {
  std::vector< std::string > out;
  out.reserve( entries_.size() );
  for ( const auto& kv : entries_ ) out.push_back( kv.first );
  return out;
}

inline spliced::KeySet spliced::ResolutionContext::visible_keys() const {
  KeySet out;
  for ( const auto& kv : entries_ ) out.insert( kv.first );
  return out;
}

inline const spliced::Variable* spliced::ResolutionContext::variable(
  const std::string& key ) const
{
  auto it = entries_.find( key );
  if ( it == entries_.end() || !it->second.variable ) return nullptr;
  return &*it->second.variable;
}

// Resolver member function definitions

inline void spliced::Resolver::trace( const std::string& msg ) const {
  if ( options_.trace ) *options_.trace << "[spliced] " << msg << '\n';
}

inline void spliced::Resolver::preflight(
  const ResolutionContext& ctx ) const
{
  for ( const auto& [key, entry] : ctx.entries_ ) {
    if ( !entry.variable ) continue;
    if ( entry.variable->kind() != VariableKind::Deferred ) continue;
    const std::string& type = entry.variable->deferred_type();
    if ( !registry_.contains(type) ) throw UnknownDeferredType( type, key );
  }
}

inline std::map< std::string, std::set< std::string > >
  spliced::Resolver::dependency_graph( const ResolutionContext& ctx ) const
{
  const KeySet visible = ctx.visible_keys();
  std::map< std::string, std::set< std::string > > graph;
  for ( const auto& [key, entry] : ctx.entries_ ) {
    auto& deps = graph[ key ];
    if ( !entry.variable ) continue;
    if ( entry.variable->kind() == VariableKind::Literal ) continue;
    deps = template_references( entry.variable->raw_value(), visible );
  }
  return graph;
}

inline void spliced::Resolver::record_failure(
  ResolutionContext::Entry& entry, const std::string& key,
  const RecoverableError& ex )
{
  entry.state = EntryState::Failed;
  entry.error = ResolutionError{ ex.kind(), key, ex.what(), ex.detail(),
    std::current_exception() };
  if ( !stack_.empty() && stack_.back() == key ) stack_.pop_back();

  std::ostringstream oss;
  oss << "failed '" << key << "': " << ex.what();
  trace( oss.str() );
}

inline const spliced::ordered_node& spliced::Resolver::resolve_entry(
  ResolutionContext& ctx, const std::string& key )
{
  ResolutionContext::Entry& entry = ctx.entries_.at( key );

  switch ( entry.state ) {
    case EntryState::Resolved:
      return entry.value;

    case EntryState::Failed:
      // Dependents fail with the dependency's own error
      std::rethrow_exception( entry.error->cause );

    case EntryState::Resolving: {
      // Reached a key that is still on the stack: report the cycle from its
      // first occurrence, closing it with the key itself
      std::vector< std::string > cycle;
      bool in_cycle = false;
      for ( const auto& k : stack_ ) {
        if ( k == key ) in_cycle = true;
        if ( in_cycle ) cycle.push_back( k );
      }
      cycle.push_back( key );
      throw CyclicReferenceError( cycle );
    }

    case EntryState::Unresolved:
      break;
  }

  const Variable& var = *entry.variable;

  // Literals resolve by identity
  if ( var.kind() == VariableKind::Literal ) {
    entry.value = var.raw_value();
    entry.state = EntryState::Resolved;
    trace( "resolved '" + key + "' (literal)" );
    return entry.value;
  }

  entry.state = EntryState::Resolving;
  stack_.push_back( key );

  try {
    const std::set< std::string > deps
      = template_references( var.raw_value(), ctx.visible_keys() );

    Bindings bindings;
    for ( const auto& dep : deps ) {
      if ( !ctx.contains(dep) ) throw UnresolvedReferenceError( dep, key );
      bindings.emplace( dep, resolve_entry(ctx, dep) );
    }

    ordered_node value = render_template( var.raw_value(), bindings );
    if ( var.kind() == VariableKind::Deferred ) {
      trace( "invoking deferred type '" + var.deferred_type() + "' for '"
        + key + "'" );
      value = registry_.resolve( var.deferred_type(), value );
    }

    entry.value = std::move( value );
    entry.state = EntryState::Resolved;
    stack_.pop_back();
    trace( "resolved '" + key + "' ("
      + variable_kind_name( var.kind() ) + ")" );
    return entry.value;
  }
  catch ( const RecoverableError& ex ) {
    record_failure( entry, key, ex );
    throw;
  }
  catch ( ... ) {
    // Not a per-entry failure: leave the entry resolvable again
    entry.state = EntryState::Unresolved;
    if ( !stack_.empty() && stack_.back() == key ) stack_.pop_back();
    throw;
  }
}

inline spliced::ordered_node spliced::Resolver::resolve(
  ResolutionContext& ctx, const std::string& key )
{
  if ( !ctx.contains(key) ) {
    throw std::out_of_range( "No entry for reference key '" + key + "'" );
  }
  preflight( ctx );
  stack_.clear();
  return resolve_entry( ctx, key );
}

inline spliced::ResolveResult spliced::Resolver::resolve_all(
  ResolutionContext& ctx )
{
  preflight( ctx );
  stack_.clear();

  ResolveResult result;
  for ( const auto& key : ctx.keys() ) {
    try {
      result.values.emplace( key, resolve_entry(ctx, key) );
    }
    catch ( const RecoverableError& ) {
      if ( options_.strict ) throw;
    }

    const ResolutionContext::Entry& entry = ctx.entries_.at( key );
    if ( entry.state == EntryState::Failed ) {
      result.errors.emplace( key, *entry.error );
    }
  }
  return result;
}

// GlobalStore member function definitions

inline void spliced::GlobalStore::ensure_mutable() const {
  if ( frozen_ ) {
    throw std::logic_error(
      "Global store is read-only once its values have been resolved" );
  }
}

inline void spliced::GlobalStore::set_value( const std::string& key,
  ordered_node value )
{
  std::lock_guard< std::mutex > lock( mutex_ );
  ensure_mutable();
  context_.set_value( key, std::move(value) );
}

inline void spliced::GlobalStore::declare( const std::string& key,
  Variable variable )
{
  std::lock_guard< std::mutex > lock( mutex_ );
  ensure_mutable();
  context_.declare( key, std::move(variable) );
}

inline const spliced::ResolveResult& spliced::GlobalStore::results() const {
  std::call_once( once_, [this]() {
    std::lock_guard< std::mutex > lock( mutex_ );
    frozen_ = true;
    Resolver resolver( registry_, options_ );
    results_ = resolver.resolve_all( context_ );
  } );
  return results_;
}
