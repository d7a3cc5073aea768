# include "../models.hpp"
# include <mtc/wcsstr.h>

namespace rescope {

  // Model implementation

  Model::Model( const std::string& n, const std::string& i ):
    name( n ),
    identity( i )
  {
    if ( name.empty() )
      throw ConfigurationError( "model name has to be non-empty string" );
  }

  auto  Model::Add( const Field& field ) -> Model&
  {
    if ( GetField( field.GetName() ) != nullptr )
    {
      throw ConfigurationError( mtc::strprintf( "field '%s' already exists in model '%s'",
        field.GetName().c_str(), name.c_str() ) );
    }
    return fields.push_back( field ), *this;
  }

  auto  Model::GetField( const std::string_view& fieldName ) const -> const Field*
  {
    for ( auto& next: fields )
      if ( next.GetName() == fieldName )
        return &next;
    return nullptr;
  }

}
