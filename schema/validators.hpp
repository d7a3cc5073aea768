# if !defined( __rescope_schema_validators_hpp__ )
# define __rescope_schema_validators_hpp__
# include "../fields.hpp"

namespace rescope {
namespace schema {

  auto  MinValue( double ) -> Validator;
  auto  MaxValue( double ) -> Validator;
  auto  MinLength( size_t ) -> Validator;     // in utf-8 characters
  auto  MaxLength( size_t ) -> Validator;
  auto  NotEmpty() -> Validator;
  auto  OneOf( const mtc::array_zval& ) -> Validator;

}}

# endif   // !__rescope_schema_validators_hpp__
