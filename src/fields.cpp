# include "../fields.hpp"
# include <moonycode/codes.h>
# include <mtc/wcsstr.h>
# include <cstdlib>
# include <cerrno>
# include <limits>
# include <cmath>

namespace rescope {

  template <class E>
  class Coerce
  {
    const std::string&  name;
    const bool          strict;

    template <class ... Args>
    [[noreturn]] void  Fail( const char* format, Args ... args ) const
      {  throw E( mtc::strprintf( format, args... ) );  }

  public:
    Coerce( const std::string& n, bool s ):
      name( n ),
      strict( s ) {}

    auto  Integer( const mtc::zval& ) const -> int64_t;
    auto  Real( const mtc::zval& ) const -> double;
    auto  Boolean( const mtc::zval& ) const -> bool;
    auto  String( const mtc::zval& ) const -> std::string;

  protected:
    auto  Parse( const std::string&, int64_t& ) const -> bool;
    auto  Parse( const std::string&, double& ) const -> bool;

  };

  template <class E>
  auto  Coerce<E>::Parse( const std::string& str, int64_t& out ) const -> bool
  {
    char* endptr;

    if ( str.empty() )
      return false;

    errno = 0;
    out = strtoll( str.c_str(), &endptr, 10 );
    return errno == 0 && *endptr == '\0';
  }

  template <class E>
  auto  Coerce<E>::Parse( const std::string& str, double& out ) const -> bool
  {
    char* endptr;

    if ( str.empty() )
      return false;

    errno = 0;
    out = strtod( str.c_str(), &endptr );
    return errno == 0 && *endptr == '\0';
  }

  template <class E>
  auto  Coerce<E>::Integer( const mtc::zval& z ) const -> int64_t
  {
    int64_t ivalue;
    double  dvalue;

    switch ( z.get_type() )
    {
      case mtc::zval::z_int16:    return *z.get_int16();
      case mtc::zval::z_int32:    return *z.get_int32();
      case mtc::zval::z_int64:    return *z.get_int64();
      case mtc::zval::z_word16:   return *z.get_word16();
      case mtc::zval::z_word32:   return *z.get_word32();
      case mtc::zval::z_word64:
        if ( *z.get_word64() > uint64_t(std::numeric_limits<int64_t>::max()) )
          Fail( "field '%s' value out of range", name.c_str() );
        return int64_t(*z.get_word64());
      case mtc::zval::z_double:
        if ( strict )
          break;
        if ( std::trunc( dvalue = *z.get_double() ) != dvalue
          || dvalue > double(std::numeric_limits<int64_t>::max())
          || dvalue < double(std::numeric_limits<int64_t>::min()) )
          Fail( "field '%s' has to be integer, non-integral number found", name.c_str() );
        return int64_t(dvalue);
      case mtc::zval::z_charstr:
        if ( strict )
          break;
        if ( !Parse( *z.get_charstr(), ivalue ) )
          Fail( "field '%s' has to be integer, '%s' found", name.c_str(), z.get_charstr()->c_str() );
        return ivalue;
      default:
        break;
    }
    Fail( "field '%s' has to be integer", name.c_str() );
  }

  template <class E>
  auto  Coerce<E>::Real( const mtc::zval& z ) const -> double
  {
    double  dvalue;

    switch ( z.get_type() )
    {
      case mtc::zval::z_float:    return *z.get_float();
      case mtc::zval::z_double:   return *z.get_double();
      case mtc::zval::z_int16:
      case mtc::zval::z_int32:
      case mtc::zval::z_int64:
      case mtc::zval::z_word16:
      case mtc::zval::z_word32:
      case mtc::zval::z_word64:   return double(Integer( z ));
      case mtc::zval::z_charstr:
        if ( strict )
          break;
        if ( !Parse( *z.get_charstr(), dvalue ) )
          Fail( "field '%s' has to be number, '%s' found", name.c_str(), z.get_charstr()->c_str() );
        return dvalue;
      default:
        break;
    }
    Fail( "field '%s' has to be number", name.c_str() );
  }

  template <class E>
  auto  Coerce<E>::Boolean( const mtc::zval& z ) const -> bool
  {
    switch ( z.get_type() )
    {
      case mtc::zval::z_int16:
      case mtc::zval::z_int32:
      case mtc::zval::z_int64:
      case mtc::zval::z_word16:
      case mtc::zval::z_word32:
      case mtc::zval::z_word64:
        switch ( Integer( z ) )
        {
          case 0:   return false;
          case 1:   return true;
          default:  Fail( "field '%s' has to be boolean, only 0 and 1 are allowed", name.c_str() );
        }
      case mtc::zval::z_charstr:
        if ( strict )
          break;
        if ( *z.get_charstr() == "true" || *z.get_charstr() == "1" )
          return true;
        if ( *z.get_charstr() == "false" || *z.get_charstr() == "0" )
          return false;
        Fail( "field '%s' has to be boolean, '%s' found", name.c_str(), z.get_charstr()->c_str() );
      default:
        break;
    }
    Fail( "field '%s' has to be boolean", name.c_str() );
  }

  template <class E>
  auto  Coerce<E>::String( const mtc::zval& z ) const -> std::string
  {
    switch ( z.get_type() )
    {
      case mtc::zval::z_charstr:
        return *z.get_charstr();
      case mtc::zval::z_widestr:
        return codepages::widetombcs( codepages::codepage_utf8,
          z.get_widestr()->c_str(), z.get_widestr()->size() );
      default:
        Fail( "field '%s' has to be string", name.c_str() );
    }
  }

  template <class E>
  auto  Normalize( const Field& field, const mtc::zval& z, bool strict ) -> mtc::zval
  {
    auto  coerce = Coerce<E>( field.GetName(), strict );

    switch ( field.GetKind() )
    {
      case Field::k_boolean:  return int32_t(coerce.Boolean( z ) ? 1 : 0);
      case Field::k_integer:  return int64_t(coerce.Integer( z ));
      case Field::k_real:     return double(coerce.Real( z ));
      case Field::k_string:   return coerce.String( z );
      default:
        throw std::logic_error( mtc::strprintf( "field '%s' is nested, scalar value is not applicable",
          field.GetName().c_str() ) );
    }
  }

  // Field implementation

  Field::Field( const std::string& n, Kind k ):
    name( n ),
    kind( k ),
    wire( n )
  {
    if ( name.empty() )
      throw ConfigurationError( "field name has to be non-empty string" );
    if ( kind == k_nested )
      throw ConfigurationError( mtc::strprintf( "nested field '%s' has to reference a model", name.c_str() ) );
    if ( kind > k_nested )
      throw ConfigurationError( mtc::strprintf( "field '%s' has invalid kind", name.c_str() ) );
  }

  Field::Field( const std::string& n, const std::string& m, Relation r ):
    name( n ),
    kind( k_nested ),
    wire( n ),
    model( m ),
    relation( r )
  {
    if ( name.empty() )
      throw ConfigurationError( "field name has to be non-empty string" );
    if ( model.empty() )
      throw ConfigurationError( mtc::strprintf( "nested field '%s' has to reference a model", name.c_str() ) );
  }

  auto  Field::SetWire( const std::string& s ) -> Field&
  {
    if ( s.empty() )
      throw ConfigurationError( mtc::strprintf( "field '%s' wire name has to be non-empty string", name.c_str() ) );
    return wire = s, *this;
  }

  auto  Field::SetAccess( const Permission& p ) -> Field&
  {
    return access = p, *this;
  }

  auto  Field::SetScope( const std::string& scope, const Permission& p ) -> Field&
  {
    return scopes[scope] = p, *this;
  }

  auto  Field::SetDefault( const mtc::zval& z ) -> Field&
  {
    if ( kind == k_nested )
      throw ConfigurationError( mtc::strprintf( "nested field '%s' can not have default value", name.c_str() ) );

    defValue = Normalize<ConfigurationError>( *this, z, false );
    hasDefault = true;
    return *this;
  }

  auto  Field::SetRequired( bool r ) -> Field&
  {
    return required = r, *this;
  }

  auto  Field::AddValidator( const Validator& v ) -> Field&
  {
    if ( v.check == nullptr )
      throw ConfigurationError( mtc::strprintf( "field '%s' validator has no predicate", name.c_str() ) );
    return validators.push_back( v ), *this;
  }

  auto  Field::GetPermission( const std::string& scope ) const -> Permission
  {
    auto  pfound = scopes.find( scope );

    return pfound != scopes.end() ? pfound->second : access;
  }

  auto  Field::Validate( const mtc::zval& value, unsigned direction ) const -> std::vector<FieldError>
  {
    std::vector<FieldError> errors;

    for ( auto& next: validators )
      if ( (next.directions & direction) != 0 && !next.check( value ) )
        errors.push_back( { name, FieldError::ValidationError, next.message } );

    return errors;
  }

  auto  Field::ToWire( const mtc::zval& value ) const -> mtc::zval
  {
    return Normalize<std::logic_error>( *this, value, true );
  }

  auto  Field::FromWire( const mtc::zval& value ) const -> mtc::zval
  {
    if ( kind == k_nested )
      throw DecodeTypeError( mtc::strprintf( "field '%s' expects nested structure", name.c_str() ) );
    return Normalize<DecodeTypeError>( *this, value, false );
  }

  auto  Field::KindName( Kind kind ) -> const char*
  {
    switch ( kind )
    {
      case k_boolean: return "boolean";
      case k_integer: return "integer";
      case k_real:    return "real";
      case k_string:  return "string";
      case k_nested:  return "nested";
      default:        return "unknown";
    }
  }

}
