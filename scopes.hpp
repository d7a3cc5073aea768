# if !defined( __rescope_scopes_hpp__ )
# define __rescope_scopes_hpp__
# include "patterns.hpp"
# include "models.hpp"
# include <string_view>
# include <memory>
# include <mutex>

namespace rescope {

 /*
  * ResolvedScope
  *
  * Ordered list of the fields surviving pattern application to a model.
  * Field pointers refer to the resolved model, so a resolved scope is valid
  * while the model is.
  */
  class ResolvedScope
  {
    using binding_list = std::vector<Binding>;

  public:
    ResolvedScope( binding_list&& list ):
      bindings( std::move( list ) ) {}

    auto  Find( const std::string_view& wire ) const -> const Binding*;
    auto  FindField( const std::string_view& name ) const -> const Binding*;

    auto  size() const -> size_t  {  return bindings.size();  }
    auto  begin() const -> binding_list::const_iterator {  return bindings.begin();  }
    auto  end() const -> binding_list::const_iterator {  return bindings.end();  }
    auto  operator []( size_t i ) const -> const Binding& {  return bindings[i];  }

    bool  operator == ( const ResolvedScope& ) const;
    bool  operator != ( const ResolvedScope& r ) const  {  return !(*this == r);  }

  protected:
    binding_list  bindings;

  };

 /*
  * Scope
  *
  * Named visibility context of one model. The model is referenced by name,
  * the patterns are owned. Resolve() builds the ResolvedScope once and keeps
  * it for the lifetime of the scope; concurrent first calls build it once.
  */
  class Scope
  {
  public:
    Scope( const std::string& name, const std::string& model, const std::vector<Pattern>& = {} );
    Scope( const Scope& );

    auto  Add( const Pattern& ) -> Scope&;

    auto  GetName() const -> const std::string& {  return name;  }
    auto  GetModel() const -> const std::string& {  return model;  }
    auto  GetPatterns() const -> const std::vector<Pattern>& {  return patterns;  }

    auto  Resolve( const Model& ) const -> const ResolvedScope&;   // throws ConfigurationError
    auto  Compute( const Model& ) const -> ResolvedScope;           // throws ConfigurationError

  protected:
    std::string                                   name;
    std::string                                   model;
    std::vector<Pattern>                          patterns;
    mutable std::mutex                            guard;
    mutable std::shared_ptr<const ResolvedScope>  resolved;

  };

  using ScopePtr = std::shared_ptr<const Scope>;

}

# endif   // !__rescope_scopes_hpp__
