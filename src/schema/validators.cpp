# include "../../schema/validators.hpp"
# include <mtc/wcsstr.h>

namespace rescope {
namespace schema {

  bool  GetNumber( const mtc::zval& z, double& out )
  {
    switch ( z.get_type() )
    {
      case mtc::zval::z_int16:    return out = *z.get_int16(), true;
      case mtc::zval::z_int32:    return out = *z.get_int32(), true;
      case mtc::zval::z_int64:    return out = double(*z.get_int64()), true;
      case mtc::zval::z_word16:   return out = *z.get_word16(), true;
      case mtc::zval::z_word32:   return out = *z.get_word32(), true;
      case mtc::zval::z_word64:   return out = double(*z.get_word64()), true;
      case mtc::zval::z_float:    return out = *z.get_float(), true;
      case mtc::zval::z_double:   return out = *z.get_double(), true;
      default:                    return false;
    }
  }

  bool  GetLength( const mtc::zval& z, size_t& out )
  {
    if ( z.get_type() != mtc::zval::z_charstr )
      return false;

  // count utf-8 sequence heads only
    out = 0;

    for ( auto ch: *z.get_charstr() )
      if ( ((unsigned char)ch & 0xc0) != 0x80 )
        ++out;

    return true;
  }

  auto  MinValue( double limit ) -> Validator
  {
    return { [limit]( const mtc::zval& z )
      {
        double  value;
        return GetNumber( z, value ) && value >= limit;
      }, mtc::strprintf( "value has to be at least %g", limit ) };
  }

  auto  MaxValue( double limit ) -> Validator
  {
    return { [limit]( const mtc::zval& z )
      {
        double  value;
        return GetNumber( z, value ) && value <= limit;
      }, mtc::strprintf( "value has to be at most %g", limit ) };
  }

  auto  MinLength( size_t limit ) -> Validator
  {
    return { [limit]( const mtc::zval& z )
      {
        size_t  length;
        return GetLength( z, length ) && length >= limit;
      }, mtc::strprintf( "length has to be at least %u", unsigned(limit) ) };
  }

  auto  MaxLength( size_t limit ) -> Validator
  {
    return { [limit]( const mtc::zval& z )
      {
        size_t  length;
        return GetLength( z, length ) && length <= limit;
      }, mtc::strprintf( "length has to be at most %u", unsigned(limit) ) };
  }

  auto  NotEmpty() -> Validator
  {
    return { []( const mtc::zval& z )
      {
        size_t  length;
        return !GetLength( z, length ) || length != 0;
      }, "value has to be non-empty" };
  }

  auto  OneOf( const mtc::array_zval& values ) -> Validator
  {
    return { [values]( const mtc::zval& z )
      {
        double  lvalue;
        double  rvalue;

        for ( auto& next: values )
        {
          if ( GetNumber( z, lvalue ) && GetNumber( next, rvalue ) )
          {
            if ( lvalue == rvalue )
              return true;
          }
            else
          if ( z.get_type() == mtc::zval::z_charstr && next.get_type() == mtc::zval::z_charstr )
          {
            if ( *z.get_charstr() == *next.get_charstr() )
              return true;
          }
        }
        return false;
      }, "value is not one of the allowed values" };
  }

}}
