# include "../../schema/validators.hpp"
# include <mtc/test-it-easy.hpp>

using namespace rescope;

TestItEasy::RegisterFunc  test_schema_validators( []()
{
  TEST_CASE( "rescope/schema/validators" )
  {
    SECTION( "MinValue() and MaxValue() compare any numbers" )
    {
      auto  min = schema::MinValue( 0 );
      auto  max = schema::MaxValue( 2.5 );

      REQUIRE( min.check( int64_t(0) ) );
      REQUIRE( min.check( 0.5 ) );
      REQUIRE( !min.check( int32_t(-1) ) );
      REQUIRE( max.check( int64_t(2) ) );
      REQUIRE( !max.check( 3.0 ) );

      SECTION( "* non-numbers never pass" )
      {
        REQUIRE( !min.check( "1" ) );
      }
      SECTION( "* messages name the limit" )
      {
        REQUIRE( max.message == "value has to be at most 2.5" );
        REQUIRE( min.directions == Direction::decode );
      }
    }
    SECTION( "MinLength() and MaxLength() count utf-8 characters" )
    {
      auto  min = schema::MinLength( 2 );
      auto  max = schema::MaxLength( 3 );

      REQUIRE( !min.check( "a" ) );
      REQUIRE( min.check( "ab" ) );
      REQUIRE( max.check( "\xd0\x9c\xd0\xb8\xd1\x80" ) );
      REQUIRE( !max.check( "abcd" ) );
      REQUIRE( !max.check( int64_t(1) ) );
    }
    SECTION( "NotEmpty() rejects empty strings only" )
    {
      auto  validator = schema::NotEmpty();

      REQUIRE( !validator.check( "" ) );
      REQUIRE( validator.check( "x" ) );
      REQUIRE( validator.check( int64_t(0) ) );
    }
    SECTION( "OneOf() matches numbers by value and strings exactly" )
    {
      auto  validator = schema::OneOf( mtc::array_zval{ 1, 2, "three" } );

      REQUIRE( validator.check( int64_t(2) ) );
      REQUIRE( validator.check( 1.0 ) );
      REQUIRE( validator.check( "three" ) );
      REQUIRE( !validator.check( "Three" ) );
      REQUIRE( !validator.check( int64_t(3) ) );
    }
  }
} );
