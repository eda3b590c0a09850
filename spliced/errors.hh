#pragma once

// Standard library includes
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace spliced {

  // Tags for per-entry (recoverable) resolution failures
  enum class ErrorKind {
    TemplateEval,
    UnresolvedReference,
    CyclicReference,
    DeferredResolver
  };

  inline const char* error_kind_name( ErrorKind kind ) {
    switch ( kind ) {
      case ErrorKind::TemplateEval: return "TemplateEvalError";
      case ErrorKind::UnresolvedReference: return "UnresolvedReferenceError";
      case ErrorKind::CyclicReference: return "CyclicReferenceError";
      case ErrorKind::DeferredResolver: return "DeferredResolverError";
    }
    return "UnknownError";
  }

  // Base class of the failures that are isolated to a single context entry.
  // Anything else escaping a resolution pass aborts the whole pass.
  class RecoverableError : public std::runtime_error {
  public:
    explicit RecoverableError( const std::string& msg )
      : std::runtime_error( msg ) {}

    virtual ErrorKind kind() const = 0;

    // Structured diagnostic payload (expression text, missing key, cycle)
    virtual std::vector< std::string > detail() const = 0;
  };

  // Malformed expression or runtime type error during substitution
  class TemplateEvalError : public RecoverableError {
  public:
    TemplateEvalError( const std::string& expression, const std::string& msg )
      : RecoverableError( msg + " in expression '" + expression + "'" ),
        expression_( expression ) {}

    const std::string& expression() const { return expression_; }

    ErrorKind kind() const override { return ErrorKind::TemplateEval; }
    std::vector< std::string > detail() const override {
      return { expression_ };
    }

  private:
    std::string expression_;
  };

  // A referenced key is absent from the resolution context
  class UnresolvedReferenceError : public RecoverableError {
  public:
    UnresolvedReferenceError( const std::string& missing_key,
      const std::string& requested_by )
      : RecoverableError( "Unresolved reference '" + missing_key
          + "' requested by '" + requested_by + "'" ),
        missing_key_( missing_key ), requested_by_( requested_by ) {}

    const std::string& missing_key() const { return missing_key_; }
    const std::string& requested_by() const { return requested_by_; }

    ErrorKind kind() const override { return ErrorKind::UnresolvedReference; }
    std::vector< std::string > detail() const override {
      return { missing_key_, requested_by_ };
    }

  private:
    std::string missing_key_;
    std::string requested_by_;
  };

  // The reference graph contains a cycle. The path repeats its first key at
  // the end, e.g., [a, b, a].
  class CyclicReferenceError : public RecoverableError {
  public:
    explicit CyclicReferenceError( const std::vector< std::string >& cycle )
      : RecoverableError( "Cyclic reference: " + format_cycle(cycle) ),
        cycle_( cycle ) {}

    const std::vector< std::string >& cycle() const { return cycle_; }

    ErrorKind kind() const override { return ErrorKind::CyclicReference; }
    std::vector< std::string > detail() const override { return cycle_; }

    static std::string format_cycle( const std::vector< std::string >& c ) {
      std::ostringstream oss;
      for ( std::size_t i = 0; i < c.size(); ++i ) {
        if ( i ) oss << " -> ";
        oss << c[ i ];
      }
      return oss.str();
    }

  private:
    std::vector< std::string > cycle_;
  };

  // A registered deferred resolver rejected its seed
  class DeferredResolverError : public RecoverableError {
  public:
    DeferredResolverError( const std::string& type, const std::string& msg )
      : RecoverableError( "Deferred resolver '" + type + "': " + msg ),
        type_( type ) {}

    const std::string& type() const { return type_; }

    ErrorKind kind() const override { return ErrorKind::DeferredResolver; }
    std::vector< std::string > detail() const override { return { type_ }; }

  private:
    std::string type_;
  };

  // Fatal: a Deferred variable names a resolver nobody registered
  class UnknownDeferredType : public std::runtime_error {
  public:
    explicit UnknownDeferredType( const std::string& type,
      const std::string& key = std::string() )
      : std::runtime_error( "Unknown deferred type '" + type + "'"
          + ( key.empty() ? std::string() : " declared by '" + key + "'" ) ),
        type_( type ) {}

    const std::string& type() const { return type_; }

  private:
    std::string type_;
  };

  // Fatal: a resolver code was registered twice
  class DuplicateDeferredType : public std::runtime_error {
  public:
    explicit DuplicateDeferredType( const std::string& type )
      : std::runtime_error( "Deferred type '" + type
          + "' is already registered" ) {}
  };

  // Fatal: malformed schema description
  class SchemaError : public std::runtime_error {
  public:
    explicit SchemaError( const std::string& msg )
      : std::runtime_error( msg ) {}
  };

  // Fatal: malformed variable or document wire data
  class WireFormatError : public std::runtime_error {
  public:
    explicit WireFormatError( const std::string& msg )
      : std::runtime_error( msg ) {}
  };

  // Record of a per-entry failure returned from a resolution pass
  struct ResolutionError {
    ErrorKind kind;
    std::string key;
    std::string message;
    std::vector< std::string > detail;

    // Original exception, rethrown by strict mode and by dependents
    std::exception_ptr cause;
  };

} // namespace spliced
