# if !defined( __rescope_schema_hpp__ )
# define __rescope_schema_hpp__
# include "scopes.hpp"
# include <string_view>
# include <memory>
# include <vector>
# include <map>

namespace rescope {

 /*
  * Schema
  *
  * Configuration-time container of models and scopes. Scopes are resolved
  * as they are added, so patterns referencing unknown fields are reported
  * here and never at request time. Cross-model references are checked with
  * Check() once the whole schema is declared.
  */
  class Schema
  {
  public:
    Schema( const std::string& defaultScope = "default" );

    auto  Add( const Model& ) -> Schema&;     // throws ConfigurationError
    auto  Add( const Scope& ) -> Schema&;     // throws ConfigurationError
    auto  SetDefaultScope( const std::string& ) -> Schema&;

    auto  GetDefaultScope() const -> const std::string& {  return defaultScope;  }
    auto  GetModel( const std::string_view& ) const -> ModelPtr;
    auto  GetModels() const -> const std::vector<ModelPtr>& {  return models;  }
    auto  GetScope( const std::string_view& model, const std::string_view& scope ) const -> ScopePtr;
    auto  GetScopes( const std::string_view& model ) const -> std::vector<ScopePtr>;

   /*
    * GetNestedScope()
    *
    * Scope used for a nested object of the model: the one named as the logical
    * scope of the call if declared, else the default one; nullptr if neither.
    */
    auto  GetNestedScope( const std::string_view& model, const std::string_view& logical ) const -> ScopePtr;

    void  Check() const;                      // throws ConfigurationError

  protected:
    using scope_key = std::pair<std::string, std::string>;

    std::string                   defaultScope;
    std::vector<ModelPtr>         models;
    std::map<scope_key, ScopePtr> scopes;

  };

  using SchemaPtr = std::shared_ptr<const Schema>;

}

# endif   // !__rescope_schema_hpp__
