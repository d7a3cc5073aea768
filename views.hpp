# if !defined( __rescope_views_hpp__ )
# define __rescope_views_hpp__
# include "register.hpp"
# include <map>

namespace rescope {

  struct Verb
  {
    enum: unsigned
    {
      list            = 0,
      retrieve        = 1,
      create          = 2,
      update          = 3,
      partial_update  = 4,
      destroy         = 5
    };

    static  auto  ToString( unsigned ) -> const char*;
  };

 /*
  * GetVerb()
  *
  * Maps request method to the verb: GET is 'retrieve' if the request carries
  * a lookup key and 'list' otherwise; POST, PUT, PATCH and DELETE are
  * 'create', 'update', 'partial_update' and 'destroy'. Method names are case
  * insensitive; unknown ones throw invalid_argument.
  */
  auto  GetVerb( const std::string& method, bool hasLookup = false ) -> unsigned;

 /*
  * View
  *
  * Serializer selection of one request handler. The scope used for a verb is
  * the one set for that verb, else the view scope ("default" unless set).
  * 'partial_update' requests are decoded in partial mode.
  */
  class View
  {
  public:
    View( const std::string& model = {}, const std::string& scope = "default" );

    auto  SetScope( const std::string& ) -> View&;
    auto  SetScope( unsigned verb, const std::string& ) -> View&;

    auto  GetModel() const -> const std::string& {  return model;  }
    auto  GetScopeName( unsigned verb ) const -> const std::string&;
    auto  GetSerializer( const Register&, unsigned verb ) const -> SerializerPtr;

    auto  Render( const Register&, unsigned verb, const Object& ) const -> mtc::zmap;
    auto  Render( const Register&, unsigned verb, const std::vector<ObjectPtr>& ) const -> mtc::array_zmap;
    auto  Accept( const Register&, unsigned verb, const mtc::zmap& ) const -> ObjectPtr;

  protected:
    std::string                       model;
    std::string                       scope;
    std::map<unsigned, std::string>   scopeForVerb;

  };

}

# endif   // !__rescope_views_hpp__
