# if !defined( __rescope_models_hpp__ )
# define __rescope_models_hpp__
# include "fields.hpp"
# include <string_view>
# include <memory>
# include <string>
# include <vector>

namespace rescope {

 /*
  * Model
  *
  * Named ordered set of fields. Field order is the default wire order.
  * Nested fields reference other models by name, so models may refer to
  * each other or to themselves.
  */
  class Model
  {
  public:
    Model( const std::string& name, const std::string& identity = "id" );

    auto  Add( const Field& ) -> Model&;      // throws ConfigurationError on duplicates

    auto  GetName() const -> const std::string& {  return name;  }
    auto  GetIdentity() const -> const std::string& {  return identity;  }
    auto  GetField( const std::string_view& ) const -> const Field*;
    auto  GetFields() const -> const std::vector<Field>& {  return fields;  }

  protected:
    std::string         name;
    std::string         identity;
    std::vector<Field>  fields;

  };

  using ModelPtr = std::shared_ptr<const Model>;

}

# endif   // !__rescope_models_hpp__
