# include "../views.hpp"
# include <mtc/wcsstr.h>
# include <strings.h>

namespace rescope {

  auto  Verb::ToString( unsigned verb ) -> const char*
  {
    switch ( verb )
    {
      case list:            return "list";
      case retrieve:        return "retrieve";
      case create:          return "create";
      case update:          return "update";
      case partial_update:  return "partial_update";
      case destroy:         return "destroy";
      default:              throw std::invalid_argument( "unexpected verb value" );
    }
  }

  auto  GetVerb( const std::string& method, bool hasLookup ) -> unsigned
  {
    if ( strcasecmp( method.c_str(), "get" ) == 0 )
      return hasLookup ? Verb::retrieve : Verb::list;
    if ( strcasecmp( method.c_str(), "post" ) == 0 )
      return Verb::create;
    if ( strcasecmp( method.c_str(), "put" ) == 0 )
      return Verb::update;
    if ( strcasecmp( method.c_str(), "patch" ) == 0 )
      return Verb::partial_update;
    if ( strcasecmp( method.c_str(), "delete" ) == 0 )
      return Verb::destroy;
    throw std::invalid_argument( mtc::strprintf( "unsupported request method '%s'", method.c_str() ) );
  }

  // View implementation

  View::View( const std::string& m, const std::string& s ):
    model( m ),
    scope( s )
  {
    if ( scope.empty() )
      throw ConfigurationError( "view scope name has to be non-empty string" );
  }

  auto  View::SetScope( const std::string& s ) -> View&
  {
    if ( s.empty() )
      throw ConfigurationError( "view scope name has to be non-empty string" );
    return scope = s, *this;
  }

  auto  View::SetScope( unsigned verb, const std::string& s ) -> View&
  {
    if ( s.empty() )
      throw ConfigurationError( mtc::strprintf( "scope name for '%s' has to be non-empty string", Verb::ToString( verb ) ) );
    return scopeForVerb[verb] = s, *this;
  }

  auto  View::GetScopeName( unsigned verb ) const -> const std::string&
  {
    auto  pfound = scopeForVerb.find( verb );

    return pfound != scopeForVerb.end() ? pfound->second : scope;
  }

  auto  View::GetSerializer( const Register& reg, unsigned verb ) const -> SerializerPtr
  {
    if ( model.empty() )
      throw ConfigurationError( "view has to be bound to a model" );

    return reg.Get( model, GetScopeName( verb ) );
  }

  auto  View::Render( const Register& reg, unsigned verb, const Object& object ) const -> mtc::zmap
  {
    return GetSerializer( reg, verb )->Encode( object );
  }

  auto  View::Render( const Register& reg, unsigned verb, const std::vector<ObjectPtr>& objects ) const -> mtc::array_zmap
  {
    auto  serial = GetSerializer( reg, verb );
    auto  output = mtc::array_zmap();

    for ( auto& next: objects )
    {
      if ( next == nullptr )
      {
        throw std::logic_error( mtc::strprintf( "list of model '%s' contains null object",
          model.c_str() ) );
      }
      output.push_back( serial->Encode( *next ) );
    }

    return output;
  }

  auto  View::Accept( const Register& reg, unsigned verb, const mtc::zmap& input ) const -> ObjectPtr
  {
    return GetSerializer( reg, verb )->Decode( input, verb == Verb::partial_update );
  }

}
