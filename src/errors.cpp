# include "../errors.hpp"
# include <mtc/wcsstr.h>

namespace rescope {

  auto  FieldError::KindName( unsigned kind ) -> const char*
  {
    switch ( kind )
    {
      case ScopeViolation:        return "ScopeViolation";
      case ValidationError:       return "ValidationError";
      case MandatoryFieldMissing: return "MandatoryFieldMissing";
      case DecodeTypeError:       return "DecodeTypeError";
      default:                    return "UnknownError";
    }
  }

  static  auto  MakeMessage( const std::vector<FieldError>& errors ) -> std::string
  {
    if ( errors.empty() )
      return "decode failed";

    return mtc::strprintf( "decode failed with %u error(s), first at '%s': %s (%s)",
      unsigned(errors.size()),
      errors.front().path.c_str(),
      errors.front().message.c_str(), FieldError::KindName( errors.front().kind ) );
  }

  // AggregatedDecodeError implementation

  AggregatedDecodeError::AggregatedDecodeError( std::vector<FieldError>&& list ):
    std::invalid_argument( MakeMessage( list ) ),
    errors( std::move( list ) ) {}

  auto  AggregatedDecodeError::Find( const std::string& path ) const -> const FieldError*
  {
    for ( auto& next: errors )
      if ( next.path == path )
        return &next;
    return nullptr;
  }

}
