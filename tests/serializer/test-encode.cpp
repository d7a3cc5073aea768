# include "../toolbox/samples.hpp"
# include "../../register.hpp"
# include <mtc/test-it-easy.hpp>

using namespace rescope;

 /*
  * Records writer events as strings: keys for values, key + "{" or "[" for
  * open objects and arrays, "}" and "]" for their ends.
  */
class EventList: public IWireWriter, public std::vector<std::string>
{
  void  OpenObject( const std::string& key ) override {  push_back( key + "{" );  }
  void  CloseObject() override                        {  push_back( "}" );  }
  void  OpenArray( const std::string& key ) override  {  push_back( key + "[" );  }
  void  CloseArray() override                         {  push_back( "]" );  }
  void  SetValue( const std::string& key, const mtc::zval& ) override {  push_back( key );  }
};

TestItEasy::RegisterFunc  test_serializer_encode( []()
{
  TEST_CASE( "rescope/Serializer/Encode" )
  {
    auto  reg = Register( MakeSchema() );

    SECTION( "public scope exposes only the included fields" )
    {
      auto  user = MakeUser( 1, "A", "a@example.com" );
      auto  tree = mtc::zmap();

      if ( REQUIRE_NOTHROW( tree = reg.Get( "User", "public" )->Encode( *user ) ) )
      {
        REQUIRE( tree.get_int64( "id" ) != nullptr );
        REQUIRE( *tree.get_int64( "id" ) == 1 );
        REQUIRE( tree.get_charstr( "name" ) != nullptr );
        REQUIRE( *tree.get_charstr( "name" ) == "A" );
        REQUIRE( tree.get( "email" ) == nullptr );
      }
      REQUIRE( (reg.Get( "User", "public" )->WireNames() == std::vector<std::string>{ "id", "name" }) );
    }
    SECTION( "default scope writes readable fields present in the object" )
    {
      auto  user = MakeUser( 2, "B", "b@example.com" );
      auto  tree = mtc::zmap();

      user->Set( "password", "secret" );
      user->Set( "active", int32_t(0) );

      if ( REQUIRE_NOTHROW( tree = reg.Get( "User", "default" )->Encode( *user ) ) )
      {
        REQUIRE( *tree.get_charstr( "email" ) == "b@example.com" );
        REQUIRE( *tree.get_int32( "active" ) == 0 );

        SECTION( "* write-only fields are never encoded" )
        {
          REQUIRE( tree.get( "password" ) == nullptr );
        }
        SECTION( "* absent values are omitted" )
        {
          REQUIRE( tree.get( "age" ) == nullptr );
          REQUIRE( tree.get( "address" ) == nullptr );
        }
      }
    }
    SECTION( "renamed fields are written with the wire name" )
    {
      auto  schema = MakeSchema();
      auto  local = Register();
      auto  tree = mtc::zmap();

      schema.Add( Scope( "renamed", "User", { Pattern::Chain( {
        Pattern::IncludeOnly( { "id", "name" } ),
        Pattern::Rename( "name", "full_name" ) } ) } ) );

      local.Init( schema );

      if ( REQUIRE_NOTHROW( tree = local.Get( "User", "renamed" )->Encode( *MakeUser( 3, "C", "c@example.com" ) ) ) )
      {
        REQUIRE( tree.get( "name" ) == nullptr );
        REQUIRE( *tree.get_charstr( "full_name" ) == "C" );
      }
    }
    SECTION( "nested objects are encoded by the nested model serializer" )
    {
      auto  user = MakeUser( 4, "D", "d@example.com" );
      auto  addr = MakeObject( "Address" );
      auto  tree = mtc::zmap();

      addr->Set( "id", int64_t(40) );
      addr->Set( "city", "Riga" );
      user->Set( "address", addr );
      user->Set( "friends", std::vector<ObjectPtr>{
        MakeUser( 5, "E", "e@example.com" ),
        MakeUser( 6, "F", "f@example.com" ) } );

      if ( REQUIRE_NOTHROW( tree = reg.Get( "User", "default" )->Encode( *user ) ) )
      {
        if ( REQUIRE( tree.get_zmap( "address" ) != nullptr ) )
        {
          REQUIRE( *tree.get_zmap( "address" )->get_charstr( "city" ) == "Riga" );
          REQUIRE( tree.get_zmap( "address" )->get( "zip" ) == nullptr );
        }
        if ( REQUIRE( tree.get_array_zmap( "friends" ) != nullptr ) && REQUIRE( tree.get_array_zmap( "friends" )->size() == 2 ) )
        {
          REQUIRE( *(*tree.get_array_zmap( "friends" ))[0].get_charstr( "name" ) == "E" );
          REQUIRE( *(*tree.get_array_zmap( "friends" ))[1].get_charstr( "name" ) == "F" );
        }
      }
      SECTION( "* nested objects use the scope of the same name if declared" )
      {
        if ( REQUIRE_NOTHROW( tree = reg.Get( "User", "graph" )->Encode( *user ) ) )
        {
          REQUIRE( tree.get_array_zmap( "friends" ) != nullptr );
          REQUIRE( *tree.get_zmap( "address" )->get_charstr( "city" ) == "Riga" );
        }
      }
    }
    SECTION( "fields are written in resolved scope order at every level" )
    {
      auto  user = MakeObject( "User" );
      auto  addr = MakeObject( "Address" );
      auto  events = EventList();

      addr->Set( "city", "Riga" );
      addr->Set( "id", int64_t(40) );
      user->Set( "best", user );
      user->Set( "friends", std::vector<ObjectPtr>{ MakeUser( 8, "H", "h@example.com" ) } );
      user->Set( "address", addr );
      user->Set( "active", int32_t(1) );
      user->Set( "email", "g@example.com" );
      user->Set( "name", "G" );
      user->Set( "id", int64_t(7) );

      if ( REQUIRE_NOTHROW( reg.Get( "User", "default" )->Encode( *user, events ) ) )
      {
        REQUIRE( (events == std::vector<std::string>{
          "{", "id", "name", "email", "active",
            "address{", "id", "city", "}",
            "friends[",
              "{", "id", "name", "email", "}",
            "]",
            "best{", "__ref__", "id", "}",
          "}" }) );
      }
      SECTION( "* the order follows the scope and not the model" )
      {
        auto  schema = MakeSchema();
        auto  local = Register();

        events.clear();

        schema.Add( Scope( "renamed", "User", { Pattern::Chain( {
          Pattern::IncludeOnly( { "id", "name", "email" } ),
          Pattern::Rename( "id", "user_id" ) } ) } ) );
        local.Init( schema );

        if ( REQUIRE_NOTHROW( local.Get( "User", "renamed" )->Encode( *user, events ) ) )
        {
          REQUIRE( (events == std::vector<std::string>{ "{", "user_id", "name", "email", "}" }) );
          REQUIRE( (local.Get( "User", "renamed" )->WireNames() == std::vector<std::string>{ "user_id", "name", "email" }) );
        }
      }
      SECTION( "* the tree overload holds the same values" )
      {
        auto  tree = reg.Get( "User", "default" )->Encode( *user );

        REQUIRE( *tree.get_int64( "id" ) == 7 );
        REQUIRE( *tree.get_zmap( "address" )->get_charstr( "city" ) == "Riga" );
        REQUIRE( Serializer::IsReference( *tree.get_zmap( "best" ) ) );
      }
      user->Del( "best" );
    }
    SECTION( "encoding defects are logic errors" )
    {
      auto  serial = reg.Get( "User", "default" );

      SECTION( "* object of another model" )
      {
        REQUIRE_EXCEPTION( serial->Encode( *MakeObject( "Address" ) ), std::logic_error );
      }
      SECTION( "* value of the wrong type" )
      {
        auto  user = MakeUser( 8, "H", "h@example.com" );

        user->Set( "age", "eight" );

        REQUIRE_EXCEPTION( serial->Encode( *user ), std::logic_error );
      }
      SECTION( "* scalar where object is expected" )
      {
        auto  user = MakeUser( 9, "I", "i@example.com" );

        user->Set( "address", int64_t(1) );

        REQUIRE_EXCEPTION( serial->Encode( *user ), std::logic_error );
      }
    }
  }
} );
