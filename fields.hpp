# if !defined( __rescope_fields_hpp__ )
# define __rescope_fields_hpp__
# include "errors.hpp"
# include <mtc/zmap.h>
# include <functional>
# include <string>
# include <vector>
# include <map>

namespace rescope {

  struct Permission
  {
    bool  readable = true;
    bool  writable = true;

    bool  operator == ( const Permission& p ) const {  return readable == p.readable && writable == p.writable;  }
    bool  operator != ( const Permission& p ) const {  return !(*this == p);  }
  };

  struct Direction
  {
    enum: unsigned
    {
      encode = 0x01,
      decode = 0x02,
      both   = 0x03
    };
  };

  struct Validator
  {
    std::function<bool( const mtc::zval& )> check;
    std::string                             message;
    unsigned                                directions = Direction::decode;
  };

 /*
  * Field
  *
  * Typed descriptor of one model attribute. Scalar kinds are stored in domain
  * objects as canonical mtc::zval values:
  *   k_boolean - int32 0/1;
  *   k_integer - int64;
  *   k_real    - double;
  *   k_string  - utf-8 charstr.
  * Nested fields reference another model by name, either as a single object
  * or as an ordered collection.
  */
  class Field
  {
  public:
    enum Kind: unsigned
    {
      k_boolean = 0,
      k_integer = 1,
      k_real    = 2,
      k_string  = 3,
      k_nested  = 4
    };

    enum Relation: unsigned
    {
      singular    = 0,
      collection  = 1
    };

  public:
    Field( const std::string& name, Kind );
    Field( const std::string& name, const std::string& model, Relation = singular );

  // declaration
    auto  SetWire( const std::string& ) -> Field&;
    auto  SetAccess( const Permission& ) -> Field&;
    auto  ReadOnly() -> Field&    {  return SetAccess( { true, false } );  }
    auto  WriteOnly() -> Field&   {  return SetAccess( { false, true } );  }
    auto  SetScope( const std::string&, const Permission& ) -> Field&;
    auto  SetDefault( const mtc::zval& ) -> Field&;     // throws ConfigurationError
    auto  SetRequired( bool ) -> Field&;
    auto  AddValidator( const Validator& ) -> Field&;

  // access
    auto  GetName() const -> const std::string& {  return name;  }
    auto  GetKind() const -> Kind {  return kind;  }
    auto  GetWire() const -> const std::string& {  return wire;  }
    bool  IsNested() const  {  return kind == k_nested;  }
    auto  GetModel() const -> const std::string& {  return model;  }
    auto  GetRelation() const -> Relation {  return relation;  }
    auto  GetPermission( const std::string& scope = {} ) const -> Permission;
    auto  GetDefault() const -> const mtc::zval*  {  return hasDefault ? &defValue : nullptr;  }
    bool  IsRequired() const  {  return required;  }

  // operations
    auto  Validate( const mtc::zval&, unsigned direction ) const -> std::vector<FieldError>;
    auto  ToWire( const mtc::zval& ) const -> mtc::zval;        // throws logic_error
    auto  FromWire( const mtc::zval& ) const -> mtc::zval;      // throws DecodeTypeError

    static  auto  KindName( Kind ) -> const char*;

  protected:
    std::string                       name;
    Kind                              kind;
    std::string                       wire;
    std::string                       model;
    Relation                          relation = singular;
    Permission                        access;
    std::map<std::string, Permission> scopes;
    mtc::zval                         defValue;
    bool                              hasDefault = false;
    bool                              required = true;
    std::vector<Validator>            validators;

  };

}

# endif   // !__rescope_fields_hpp__
