# include "../register.hpp"
# include <mtc/recursive_shared_mutex.hpp>
# include <mtc/wcsstr.h>

namespace rescope {

  // Register implementation

  Register::Register( const Schema& s )
  {
    Init( s );
  }

  auto  Register::Init( const Schema& s ) -> Register&
  {
    auto  pnew = std::make_shared<const Schema>( s );
    auto  exlock = mtc::make_unique_lock( guard, std::defer_lock );

    pnew->Check();

    exlock.lock();
      schema = pnew;
      cache.clear();
    return *this;
  }

  auto  Register::Get( const std::string& model, const std::string& scope ) const -> SerializerPtr
  {
    auto  pfound = mtc::interlocked( mtc::make_shared_lock( guard ), [&]()
      {
        auto  pcache = cache.find( { model, scope } );

        return pcache != cache.end() ? pcache->second : nullptr;
      } );

    if ( pfound != nullptr )
      return pfound;

    return mtc::interlocked( mtc::make_unique_lock( guard ), [&]()
      {  return getSerializer( model, scope );  } );
  }

  void  Register::Invalidate( const std::string& model )
  {
    auto  exlock = mtc::make_unique_lock( guard );

    for ( auto it = cache.begin(); it != cache.end(); )
    {
      if ( it->first.first == model ) it = cache.erase( it );
        else ++it;
    }
  }

  auto  Register::GetSchema() const -> SchemaPtr
  {
    return mtc::interlocked( mtc::make_shared_lock( guard ), [&]()
      {  return schema;  } );
  }

  auto  Register::GetNested( const std::string& model, const std::string& logical ) const -> SerializerPtr
  {
    auto  scopeName = std::string();
    auto  pfound = mtc::interlocked( mtc::make_shared_lock( guard ), [&]() -> SerializerPtr
      {
        auto  pscope = schema != nullptr ? schema->GetNestedScope( model, logical ) : nullptr;

        if ( pscope == nullptr )
          return nullptr;

        auto  pcache = cache.find( { model, scopeName = pscope->GetName() } );

        return pcache != cache.end() ? pcache->second : nullptr;
      } );

    if ( pfound != nullptr )
      return pfound;

  // Schema::Check() guarantees the nested scope exists for checked schemas
    if ( scopeName.empty() )
    {
      throw std::logic_error( mtc::strprintf( "no scope '%s' for nested model '%s'",
        logical.c_str(), model.c_str() ) );
    }

    return mtc::interlocked( mtc::make_unique_lock( guard ), [&]()
      {  return getSerializer( model, scopeName );  } );
  }

 /*
  * getSerializer()
  *
  * Finds or builds the serializer; has to be called with exclusive lock held.
  */
  auto  Register::getSerializer( const std::string& model, const std::string& scope ) const -> SerializerPtr
  {
    auto  pfound = cache.find( { model, scope } );
    auto  pmodel = ModelPtr();
    auto  pscope = ScopePtr();

    if ( pfound != cache.end() )
      return pfound->second;

    if ( schema == nullptr || (pmodel = schema->GetModel( model )) == nullptr )
      throw UnknownModel( mtc::strprintf( "model '%s' is not registered", model.c_str() ) );

    if ( (pscope = schema->GetScope( model, scope )) == nullptr )
    {
      throw UnknownScope( mtc::strprintf( "scope '%s' is not registered for model '%s'",
        scope.c_str(), model.c_str() ) );
    }

    return cache.emplace( cache_key( model, scope ),
      SerializerPtr( new Serializer( *this, schema, pmodel, pscope ) ) ).first->second;
  }

}
