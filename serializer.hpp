# if !defined( __rescope_serializer_hpp__ )
# define __rescope_serializer_hpp__
# include "objects.hpp"
# include "schema.hpp"
# include <mtc/zmap.h>

namespace rescope {

  class Register;

 /*
  * IWireWriter
  *
  * Receives the encoded wire tree as a stream of events in ResolvedScope
  * order at every level. Keys are empty for the root object and for the
  * items of collections.
  */
  struct IWireWriter
  {
    virtual ~IWireWriter() = default;

    virtual void  OpenObject( const std::string& key ) = 0;
    virtual void  CloseObject() = 0;
    virtual void  OpenArray( const std::string& key ) = 0;
    virtual void  CloseArray() = 0;
    virtual void  SetValue( const std::string& key, const mtc::zval& ) = 0;
  };

 /*
  * Serializer
  *
  * Encodes objects of one model to wire trees and decodes them back, as seen
  * through one scope. Serializers are built and owned by a Register and keep
  * no per-call state: all the call-scoped data (objects being encoded, errors
  * being collected) lives in the call context.
  *
  * Nested objects are processed by the serializer of the nested model for the
  * same logical scope name, falling back to the default scope of the schema.
  * An object met again while it is still being encoded is written as a
  * reference stub:
  *
  *   { "__ref__": "<model name>", "id": <identity value> }
  *
  * Stubs are decoded to identity-only reference objects and never to the
  * objects decoded in the same call, so a decoded graph holds no ownership
  * cycles.
  */
  class Serializer
  {
    friend class Register;

    struct EncodeContext;
    struct DecodeContext;

  public:
    static  const char  refKey[];   // "__ref__"
    static  const char  idKey[];    // "id"

  public:
   /*
    * Encode()
    *
    * Builds the wire tree of an object from the readable fields of the scope.
    * Fields absent in the object are omitted. Objects of another model or
    * values of unexpected types are programming errors and throw logic_error.
    *
    * The writer overload emits fields in ResolvedScope order; the zmap one
    * keeps the values but orders keys the way mtc::zmap does.
    */
    auto  Encode( const Object& ) const -> mtc::zmap;
    void  Encode( const Object&, IWireWriter& ) const;

   /*
    * Decode()
    *
    * Builds an object from the writable fields of the scope. All the fields
    * are visited, and if any field failed, AggregatedDecodeError listing every
    * failure is thrown. In partial mode absent fields are left unset instead
    * of being defaulted or reported as missing.
    */
    auto  Decode( const mtc::zmap&, bool partial = false ) const -> ObjectPtr;
    auto  Check( const mtc::zmap&, bool partial = false ) const -> std::vector<FieldError>;

    auto  GetModel() const -> const Model& {  return *model;  }
    auto  GetScope() const -> const Scope& {  return *scope;  }
    auto  GetResolved() const -> const ResolvedScope& {  return resolved;  }
    auto  WireNames() const -> std::vector<std::string>;

    static  bool  IsReference( const mtc::zmap& );

  protected:
    Serializer( const Register&, const SchemaPtr&, const ModelPtr&, const ScopePtr& );

    auto  GetNested( const Field&, const std::string& logical ) const -> std::shared_ptr<const Serializer>;
    auto  GetIdentity( const Object& ) const -> const mtc::zval*;
    auto  MakeKey( const Object& ) const -> std::string;
    auto  MakeKey( const mtc::zval& ) const -> std::string;
    void  MakeStub( const Object&, const std::string&, IWireWriter& ) const;

    void  encode( const Object&, const std::string&, EncodeContext& ) const;
    void  encodeNested( const Object&, const std::string&, EncodeContext& ) const;
    auto  decode( const mtc::zmap&, const std::string&, DecodeContext& ) const -> ObjectPtr;
    auto  decodeStub( const mtc::zmap&, const std::string&, DecodeContext& ) const -> ObjectPtr;
    void  decodeValue( Object&, const Binding&, const mtc::zval&, const std::string&, DecodeContext& ) const;

  protected:
    const Register&       owner;
    SchemaPtr             schema;
    ModelPtr              model;
    ScopePtr              scope;
    const ResolvedScope&  resolved;

  };

  using SerializerPtr = std::shared_ptr<const Serializer>;

}

# endif   // !__rescope_serializer_hpp__
