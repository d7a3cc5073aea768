# include "toolbox/samples.hpp"
# include "../views.hpp"
# include <mtc/test-it-easy.hpp>

using namespace rescope;

TestItEasy::RegisterFunc  test_views( []()
{
  TEST_CASE( "rescope/views" )
  {
    SECTION( "request methods are mapped to verbs" )
    {
      REQUIRE( GetVerb( "GET" ) == Verb::list );
      REQUIRE( GetVerb( "GET", true ) == Verb::retrieve );
      REQUIRE( GetVerb( "post" ) == Verb::create );
      REQUIRE( GetVerb( "PUT", true ) == Verb::update );
      REQUIRE( GetVerb( "Patch", true ) == Verb::partial_update );
      REQUIRE( GetVerb( "DELETE", true ) == Verb::destroy );
      REQUIRE_EXCEPTION( GetVerb( "OPTIONS" ), std::invalid_argument );
      REQUIRE( std::string( Verb::ToString( Verb::partial_update ) ) == "partial_update" );
    }
    SECTION( "View selects the scope by verb" )
    {
      auto  view = View( "User" );

      REQUIRE( view.GetScopeName( Verb::list ) == "default" );

      view.SetScope( "profile" ).SetScope( Verb::list, "public" );

      REQUIRE( view.GetScopeName( Verb::list ) == "public" );
      REQUIRE( view.GetScopeName( Verb::retrieve ) == "profile" );
      REQUIRE_EXCEPTION( view.SetScope( "" ), ConfigurationError );
      REQUIRE_EXCEPTION( view.SetScope( Verb::create, "" ), ConfigurationError );
    }
    SECTION( "View renders and accepts objects" )
    {
      auto  reg = Register( MakeSchema() );
      auto  view = View( "User" );

      view.SetScope( Verb::list, "public" );

      SECTION( "* lists are rendered with the list scope" )
      {
        auto  list = mtc::array_zmap();

        if ( REQUIRE_NOTHROW( list = view.Render( reg, Verb::list, std::vector<ObjectPtr>{
          MakeUser( 1, "A", "a@example.com" ),
          MakeUser( 2, "B", "b@example.com" ) } ) ) && REQUIRE( list.size() == 2 ) )
        {
          REQUIRE( list[0].get( "email" ) == nullptr );
          REQUIRE( *list[1].get_charstr( "name" ) == "B" );
        }
      }
      SECTION( "* null list items are logic errors" )
      {
        REQUIRE_EXCEPTION( view.Render( reg, Verb::list, std::vector<ObjectPtr>{
          MakeUser( 1, "A", "a@example.com" ),
          nullptr } ), std::logic_error );
      }
      SECTION( "* details are rendered with the view scope" )
      {
        auto  tree = mtc::zmap();

        if ( REQUIRE_NOTHROW( tree = view.Render( reg, Verb::retrieve, *MakeUser( 1, "A", "a@example.com" ) ) ) )
          REQUIRE( *tree.get_charstr( "email" ) == "a@example.com" );
      }
      SECTION( "* partial updates are decoded in partial mode" )
      {
        auto  input = mtc::zmap{ { "email", "new@example.com" } };
        auto  user = ObjectPtr();

        REQUIRE_EXCEPTION( view.Accept( reg, Verb::update, input ), AggregatedDecodeError );

        if ( REQUIRE_NOTHROW( user = view.Accept( reg, Verb::partial_update, input ) ) )
        {
          REQUIRE( user->size() == 1 );
          REQUIRE( *user->GetScalar( "email" )->get_charstr() == "new@example.com" );
        }
      }
      SECTION( "* unknown scopes are reported at use" )
      {
        view.SetScope( Verb::destroy, "missing" );

        REQUIRE_EXCEPTION( view.GetSerializer( reg, Verb::destroy ), UnknownScope );
      }
    }
    SECTION( "View without a model can not select serializers" )
    {
      auto  reg = Register( MakeSchema() );

      REQUIRE_EXCEPTION( View().GetSerializer( reg, Verb::list ), ConfigurationError );
    }
  }
} );
