# include "../scopes.hpp"
# include <mtc/recursive_shared_mutex.hpp>
# include <mtc/wcsstr.h>

namespace rescope {

  // ResolvedScope implementation

  auto  ResolvedScope::Find( const std::string_view& wire ) const -> const Binding*
  {
    for ( auto& next: bindings )
      if ( next.wire == wire )
        return &next;
    return nullptr;
  }

  auto  ResolvedScope::FindField( const std::string_view& fieldName ) const -> const Binding*
  {
    for ( auto& next: bindings )
      if ( next.field->GetName() == fieldName )
        return &next;
    return nullptr;
  }

  bool  ResolvedScope::operator == ( const ResolvedScope& r ) const
  {
    if ( bindings.size() != r.bindings.size() )
      return false;

    for ( size_t i = 0; i != bindings.size(); ++i )
    {
      if ( bindings[i].field->GetName() != r.bindings[i].field->GetName()
        || bindings[i].wire != r.bindings[i].wire
        || bindings[i].permission != r.bindings[i].permission )
        return false;
    }
    return true;
  }

  // Scope implementation

  Scope::Scope( const std::string& n, const std::string& m, const std::vector<Pattern>& p ):
    name( n ),
    model( m ),
    patterns( p )
  {
    if ( name.empty() )
      throw ConfigurationError( "scope name has to be non-empty string" );
    if ( model.empty() )
      throw ConfigurationError( mtc::strprintf( "scope '%s' has to reference a model", name.c_str() ) );
  }

  Scope::Scope( const Scope& scope ):
    name( scope.name ),
    model( scope.model ),
    patterns( scope.patterns )  {}

  auto  Scope::Add( const Pattern& pattern ) -> Scope&
  {
    auto  exlock = mtc::make_unique_lock( guard );

    patterns.push_back( pattern );
    resolved = nullptr;
    return *this;
  }

  auto  Scope::Resolve( const Model& target ) const -> const ResolvedScope&
  {
    auto  exlock = mtc::make_unique_lock( guard );

    if ( resolved == nullptr )
      resolved = std::make_shared<const ResolvedScope>( Compute( target ) );

    return *resolved;
  }

  auto  Scope::Compute( const Model& target ) const -> ResolvedScope
  {
    std::vector<Binding>  bindings;

    if ( target.GetName() != model )
    {
      throw ConfigurationError( mtc::strprintf( "scope '%s' targets model '%s', not '%s'",
        name.c_str(), model.c_str(), target.GetName().c_str() ) );
    }

  // check if all the patterns reference existing fields
    for ( auto& pattern: patterns )
      for ( auto& next: pattern.Names() )
        if ( target.GetField( next ) == nullptr )
        {
          throw ConfigurationError( mtc::strprintf( "scope '%s' references unknown field '%s' of model '%s'",
            name.c_str(), next.c_str(), model.c_str() ) );
        }

  // start with all the fields, default wire names and scope permissions
    for ( auto& next: target.GetFields() )
      bindings.push_back( { &next, next.GetWire(), next.GetPermission( name ) } );

    for ( auto& pattern: patterns )
      bindings = pattern.Apply( bindings );

  // wire names have to stay unique
    for ( auto next = bindings.begin(); next != bindings.end(); ++next )
      for ( auto prev = bindings.begin(); prev != next; ++prev )
        if ( prev->wire == next->wire )
        {
          throw ConfigurationError( mtc::strprintf( "scope '%s' of model '%s' exposes fields '%s' and '%s' as '%s'",
            name.c_str(), model.c_str(), prev->field->GetName().c_str(), next->field->GetName().c_str(),
              next->wire.c_str() ) );
        }

    return ResolvedScope( std::move( bindings ) );
  }

}
