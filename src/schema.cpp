# include "../schema.hpp"
# include <mtc/wcsstr.h>
# include <set>

namespace rescope {

  // Schema implementation

  Schema::Schema( const std::string& defScope ):
    defaultScope( defScope )
  {
    if ( defaultScope.empty() )
      throw ConfigurationError( "default scope name has to be non-empty string" );
  }

  auto  Schema::Add( const Model& model ) -> Schema&
  {
    if ( GetModel( model.GetName() ) != nullptr )
      throw ConfigurationError( mtc::strprintf( "model '%s' is already defined", model.GetName().c_str() ) );

    return models.push_back( std::make_shared<const Model>( model ) ), *this;
  }

  auto  Schema::Add( const Scope& scope ) -> Schema&
  {
    auto  pmodel = GetModel( scope.GetModel() );
    auto  pscope = std::shared_ptr<Scope>();

    if ( pmodel == nullptr )
    {
      throw ConfigurationError( mtc::strprintf( "scope '%s' references unknown model '%s'",
        scope.GetName().c_str(), scope.GetModel().c_str() ) );
    }

    if ( scopes.find( { scope.GetModel(), scope.GetName() } ) != scopes.end() )
    {
      throw ConfigurationError( mtc::strprintf( "scope '%s' is already defined for model '%s'",
        scope.GetName().c_str(), scope.GetModel().c_str() ) );
    }

  // resolve the scope right now to report pattern errors at declaration
    (pscope = std::make_shared<Scope>( scope ))->Resolve( *pmodel );

    scopes.emplace( scope_key( scope.GetModel(), scope.GetName() ), pscope );
    return *this;
  }

  auto  Schema::SetDefaultScope( const std::string& name ) -> Schema&
  {
    if ( name.empty() )
      throw ConfigurationError( "default scope name has to be non-empty string" );
    return defaultScope = name, *this;
  }

  auto  Schema::GetModel( const std::string_view& name ) const -> ModelPtr
  {
    for ( auto& next: models )
      if ( next->GetName() == name )
        return next;
    return nullptr;
  }

  auto  Schema::GetScope( const std::string_view& model, const std::string_view& scope ) const -> ScopePtr
  {
    auto  pfound = scopes.find( { std::string( model ), std::string( scope ) } );

    return pfound != scopes.end() ? pfound->second : nullptr;
  }

  auto  Schema::GetScopes( const std::string_view& model ) const -> std::vector<ScopePtr>
  {
    std::vector<ScopePtr> output;

    for ( auto& next: scopes )
      if ( next.first.first == model )
        output.push_back( next.second );

    return output;
  }

  auto  Schema::GetNestedScope( const std::string_view& model, const std::string_view& logical ) const -> ScopePtr
  {
    auto  pscope = GetScope( model, logical );

    return pscope != nullptr ? pscope : GetScope( model, defaultScope );
  }

  void  Schema::Check() const
  {
  // nested fields have to reference known models having scalar identity
    for ( auto& model: models )
      for ( auto& field: model->GetFields() )
      {
        ModelPtr      target;
        const Field*  ident;

        if ( !field.IsNested() )
          continue;

        if ( (target = GetModel( field.GetModel() )) == nullptr )
        {
          throw ConfigurationError( mtc::strprintf( "field '%s.%s' references unknown model '%s'",
            model->GetName().c_str(), field.GetName().c_str(), field.GetModel().c_str() ) );
        }

        if ( (ident = target->GetField( target->GetIdentity() )) == nullptr || ident->IsNested() )
        {
          throw ConfigurationError( mtc::strprintf( "model '%s' is nested in '%s.%s' and has to have scalar identity field '%s'",
            target->GetName().c_str(), model->GetName().c_str(), field.GetName().c_str(),
              target->GetIdentity().c_str() ) );
        }
      }

  // every nested object reachable from a scope has to get a scope of its own
    for ( auto& entry: scopes )
    {
      auto  logical = entry.first.second;
      auto  visited = std::set<std::string>();
      auto  pending = std::vector<std::pair<ModelPtr, ScopePtr>>{
        { GetModel( entry.first.first ), entry.second } };

      while ( !pending.empty() )
      {
        auto  model = pending.back().first;
        auto  scope = pending.back().second;

        pending.pop_back();

        if ( !visited.insert( model->GetName() + '\0' + scope->GetName() ).second )
          continue;

        for ( auto& next: scope->Resolve( *model ) )
        {
          ModelPtr  target;
          ScopePtr  nested;

          if ( !next.field->IsNested() )
            continue;

          target = GetModel( next.field->GetModel() );

          if ( (nested = GetNestedScope( target->GetName(), logical )) == nullptr )
          {
            throw ConfigurationError( mtc::strprintf( "model '%s' nested in '%s.%s' has neither scope '%s' nor default scope '%s'",
              target->GetName().c_str(), model->GetName().c_str(), next.field->GetName().c_str(),
                logical.c_str(), defaultScope.c_str() ) );
          }
          pending.emplace_back( target, nested );
        }
      }
    }
  }

}
