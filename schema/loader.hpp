# if !defined( __rescope_schema_loader_hpp__ )
# define __rescope_schema_loader_hpp__
# include "../schema.hpp"
# include <mtc/zmap.h>

namespace rescope {
namespace schema {

 /*
  * LoadSchema()
  *
  * Creates checked schema from parsed configuration:
  *
  *   {
  *     "default-scope": "default",
  *     "models": [ {
  *       "name": "User", "identity": "id",
  *       "fields": [
  *         { "name": "id", "type": "integer", "access": "r" },
  *         { "name": "name", "type": "string", "wire": "full_name",
  *           "scopes": { "list": "r" }, "validators": [ { "max-length": 64 } ] },
  *         { "name": "friends", "type": "nested", "model": "User", "many": true } ] } ],
  *     "scopes": [ {
  *       "model": "User", "name": "public",
  *       "patterns": [ { "include": [ "id", "name" ] }, { "rename": { "name": "title" } } ] } ]
  *   }
  *
  * field keys:     name, type, model, many, wire, access, required, default,
  *                 scopes, validators;
  * access values:  "r", "w", "rw", "";
  * validators:     min, max, min-length, max-length, not-empty, one-of;
  * patterns:       include, exclude, rename, writable, readonly, chain.
  *
  * Any malformed entry throws ConfigurationError.
  */
  auto  LoadSchema( const mtc::zmap& ) -> Schema;
  auto  LoadSchema( const mtc::zmap&, const mtc::zmap::key& ) -> Schema;

  auto  LoadModel( const mtc::zmap& ) -> Model;
  auto  LoadField( const mtc::zmap& ) -> Field;
  auto  LoadScope( const mtc::zmap& ) -> Scope;
  auto  LoadPattern( const mtc::zmap& ) -> Pattern;

}}

# endif   // !__rescope_schema_loader_hpp__
