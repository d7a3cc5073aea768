# if !defined( __rescope_register_hpp__ )
# define __rescope_register_hpp__
# include "serializer.hpp"
# include <shared_mutex>
# include <map>

namespace rescope {

 /*
  * Register
  *
  * Maps (model name, scope name) to serializers, building each one on first
  * access. Builds run under an exclusive lock, so concurrent first calls for
  * the same key produce exactly one serializer; lookups of built serializers
  * share the lock.
  *
  * Serializers refer to the register to find nested serializers, so the
  * register has to outlive every serializer it returned.
  */
  class Register
  {
    friend class Serializer;

  public:
    Register() = default;
    Register( const Schema& );
    Register( const Register& ) = delete;
    Register& operator = ( const Register& ) = delete;

   /*
    * Init()
    *
    * Checks the schema and makes it current, dropping all the serializers
    * built for the previous one.
    */
    auto  Init( const Schema& ) -> Register&;     // throws ConfigurationError

   /*
    * Get()
    *
    * Returns serializer for the model and scope, throws UnknownModel or
    * UnknownScope if not declared.
    */
    auto  Get( const std::string& model, const std::string& scope ) const -> SerializerPtr;

   /*
    * Invalidate()
    *
    * Drops cached serializers of the model; next Get() rebuilds them.
    */
    void  Invalidate( const std::string& model );

    auto  GetSchema() const -> SchemaPtr;

  protected:
    auto  GetNested( const std::string& model, const std::string& logical ) const -> SerializerPtr;
    auto  getSerializer( const std::string& model, const std::string& scope ) const -> SerializerPtr;

  protected:
    using cache_key = std::pair<std::string, std::string>;

    mutable std::shared_mutex                         guard;
    SchemaPtr                                         schema;
    mutable std::map<cache_key, SerializerPtr>        cache;

  };

}

# endif   // !__rescope_register_hpp__
