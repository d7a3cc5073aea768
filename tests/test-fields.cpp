# include "../schema/validators.hpp"
# include "../models.hpp"
# include <mtc/test-it-easy.hpp>
# include <moonycode/codes.h>

using namespace rescope;

TestItEasy::RegisterFunc  test_fields( []()
{
  TEST_CASE( "rescope/Field" )
  {
    SECTION( "Field may be declared" )
    {
      SECTION( "* with non-empty name only" )
      {
        REQUIRE_EXCEPTION( Field( "", Field::k_string ), ConfigurationError );
        REQUIRE_EXCEPTION( Field( "", "Model" ), ConfigurationError );
      }
      SECTION( "* nested fields reference a model" )
      {
        REQUIRE_EXCEPTION( Field( "owner", Field::k_nested ), ConfigurationError );
        REQUIRE_EXCEPTION( Field( "owner", "" ), ConfigurationError );

        auto  field = Field( "owner", "User", Field::collection );

        REQUIRE( field.IsNested() );
        REQUIRE( field.GetModel() == "User" );
        REQUIRE( field.GetRelation() == Field::collection );
      }
      SECTION( "* wire name defaults to the field name" )
      {
        auto  field = Field( "fullName", Field::k_string );

        REQUIRE( field.GetWire() == "fullName" );
        REQUIRE( field.SetWire( "full_name" ).GetWire() == "full_name" );
        REQUIRE_EXCEPTION( field.SetWire( "" ), ConfigurationError );
      }
    }
    SECTION( "Field permissions may be overridden per scope" )
    {
      auto  field = Field( "email", Field::k_string );

      REQUIRE( (field.GetPermission() == Permission{ true, true }) );

      field.ReadOnly().SetScope( "admin", { true, true } );

      REQUIRE( (field.GetPermission() == Permission{ true, false }) );
      REQUIRE( (field.GetPermission( "public" ) == Permission{ true, false }) );
      REQUIRE( (field.GetPermission( "admin" ) == Permission{ true, true }) );

      field.WriteOnly();

      REQUIRE( (field.GetPermission( "public" ) == Permission{ false, true }) );
      REQUIRE( (field.GetPermission( "admin" ) == Permission{ true, true }) );
    }
    SECTION( "Field default values are normalized at declaration" )
    {
      SECTION( "* integer from string" )
      {
        auto  field = Field( "count", Field::k_integer );

        if ( REQUIRE_NOTHROW( field.SetDefault( "42" ) ) && REQUIRE( field.GetDefault() != nullptr ) )
        {
          REQUIRE( field.GetDefault()->get_type() == mtc::zval::z_int64 );
          REQUIRE( *field.GetDefault()->get_int64() == 42 );
        }
      }
      SECTION( "* boolean from string" )
      {
        auto  field = Field( "active", Field::k_boolean );

        if ( REQUIRE_NOTHROW( field.SetDefault( "true" ) ) && REQUIRE( field.GetDefault() != nullptr ) )
        {
          REQUIRE( field.GetDefault()->get_type() == mtc::zval::z_int32 );
          REQUIRE( *field.GetDefault()->get_int32() == 1 );
        }
      }
      SECTION( "* non-coercible defaults are configuration errors" )
      {
        REQUIRE_EXCEPTION( Field( "count", Field::k_integer ).SetDefault( "many" ), ConfigurationError );
        REQUIRE_EXCEPTION( Field( "active", Field::k_boolean ).SetDefault( 2 ), ConfigurationError );
        REQUIRE_EXCEPTION( Field( "owner", "User" ).SetDefault( 1 ), ConfigurationError );
      }
      SECTION( "* fields have no default unless set" )
      {
        REQUIRE( Field( "count", Field::k_integer ).GetDefault() == nullptr );
      }
    }
    SECTION( "Field::FromWire() coerces wire values to the canonical type" )
    {
      SECTION( "* integers accept numbers and decimal strings" )
      {
        auto    field = Field( "count", Field::k_integer );
        mtc::zval  value;

        if ( REQUIRE_NOTHROW( value = field.FromWire( int32_t(7) ) ) )
          REQUIRE( *value.get_int64() == 7 );
        if ( REQUIRE_NOTHROW( value = field.FromWire( "-12" ) ) )
          REQUIRE( *value.get_int64() == -12 );
        if ( REQUIRE_NOTHROW( value = field.FromWire( 3.0 ) ) )
          REQUIRE( *value.get_int64() == 3 );

        REQUIRE_EXCEPTION( field.FromWire( 3.5 ), DecodeTypeError );
        REQUIRE_EXCEPTION( field.FromWire( "12a" ), DecodeTypeError );
        REQUIRE_EXCEPTION( field.FromWire( "" ), DecodeTypeError );
        REQUIRE_EXCEPTION( field.FromWire( mtc::zmap() ), DecodeTypeError );
      }
      SECTION( "* reals accept integers and numeric strings" )
      {
        auto    field = Field( "ratio", Field::k_real );
        mtc::zval  value;

        if ( REQUIRE_NOTHROW( value = field.FromWire( int32_t(2) ) ) )
          REQUIRE( *value.get_double() == 2.0 );
        if ( REQUIRE_NOTHROW( value = field.FromWire( "0.5" ) ) )
          REQUIRE( *value.get_double() == 0.5 );

        REQUIRE_EXCEPTION( field.FromWire( "half" ), DecodeTypeError );
      }
      SECTION( "* booleans accept 0, 1 and their string forms" )
      {
        auto    field = Field( "active", Field::k_boolean );
        mtc::zval  value;

        if ( REQUIRE_NOTHROW( value = field.FromWire( int32_t(0) ) ) )
          REQUIRE( *value.get_int32() == 0 );
        if ( REQUIRE_NOTHROW( value = field.FromWire( "true" ) ) )
          REQUIRE( *value.get_int32() == 1 );

        REQUIRE_EXCEPTION( field.FromWire( int32_t(5) ), DecodeTypeError );
        REQUIRE_EXCEPTION( field.FromWire( "yes" ), DecodeTypeError );
      }
      SECTION( "* strings accept utf-8 and wide strings" )
      {
        auto    field = Field( "name", Field::k_string );
        mtc::zval  value;

        if ( REQUIRE_NOTHROW( value = field.FromWire( "Anna" ) ) )
          REQUIRE( *value.get_charstr() == "Anna" );
        if ( REQUIRE_NOTHROW( value = field.FromWire( codepages::mbcstowide( codepages::codepage_utf8, "Anna" ) ) ) )
          REQUIRE( *value.get_charstr() == "Anna" );

        REQUIRE_EXCEPTION( field.FromWire( int32_t(1) ), DecodeTypeError );
      }
      SECTION( "* nested fields do not accept scalars" )
      {
        REQUIRE_EXCEPTION( Field( "owner", "User" ).FromWire( int32_t(1) ), DecodeTypeError );
      }
    }
    SECTION( "Field::ToWire() passes canonical values and rejects mistyped ones" )
    {
      mtc::zval value;

      if ( REQUIRE_NOTHROW( value = Field( "count", Field::k_integer ).ToWire( int64_t(9) ) ) )
        REQUIRE( *value.get_int64() == 9 );
      if ( REQUIRE_NOTHROW( value = Field( "active", Field::k_boolean ).ToWire( int32_t(1) ) ) )
        REQUIRE( *value.get_int32() == 1 );

      REQUIRE_EXCEPTION( Field( "count", Field::k_integer ).ToWire( "9" ), std::logic_error );
      REQUIRE_EXCEPTION( Field( "name", Field::k_string ).ToWire( 9 ), std::logic_error );
    }
    SECTION( "Field::Validate() runs the validators of the direction" )
    {
      auto  field = Field( "age", Field::k_integer );

      field.AddValidator( schema::MinValue( 0 ) );
      field.AddValidator( { []( const mtc::zval& z ){  return *z.get_int64() != 13;  }, "unlucky", Direction::both } );

      REQUIRE( field.Validate( int64_t(5), Direction::decode ).empty() );
      REQUIRE( field.Validate( int64_t(-1), Direction::decode ).size() == 1 );
      REQUIRE( field.Validate( int64_t(-1), Direction::encode ).empty() );
      REQUIRE( field.Validate( int64_t(13), Direction::encode ).size() == 1 );

      if ( REQUIRE( field.Validate( int64_t(-1), Direction::decode ).size() == 1 ) )
      {
        auto  error = field.Validate( int64_t(-1), Direction::decode ).front();

        REQUIRE( error.kind == FieldError::ValidationError );
        REQUIRE( error.path == "age" );
      }
      REQUIRE_EXCEPTION( field.AddValidator( {} ), ConfigurationError );
    }
  }
  TEST_CASE( "rescope/Model" )
  {
    SECTION( "Model keeps fields in declaration order" )
    {
      auto  model = Model( "User" );

      model.Add( Field( "id", Field::k_integer ) )
           .Add( Field( "name", Field::k_string ) );

      if ( REQUIRE( model.GetFields().size() == 2 ) )
      {
        REQUIRE( model.GetFields()[0].GetName() == "id" );
        REQUIRE( model.GetFields()[1].GetName() == "name" );
      }
      REQUIRE( model.GetField( "name" ) != nullptr );
      REQUIRE( model.GetField( "email" ) == nullptr );
      REQUIRE( model.GetIdentity() == "id" );
    }
    SECTION( "Model rejects duplicate fields" )
    {
      auto  model = Model( "User" );

      model.Add( Field( "id", Field::k_integer ) );

      REQUIRE_EXCEPTION( model.Add( Field( "id", Field::k_string ) ), ConfigurationError );
    }
    SECTION( "Model name has to be non-empty" )
    {
      REQUIRE_EXCEPTION( Model( "" ), ConfigurationError );
    }
  }
} );
