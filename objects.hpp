# if !defined( __rescope_objects_hpp__ )
# define __rescope_objects_hpp__
# include <mtc/zmap.h>
# include <string_view>
# include <memory>
# include <string>
# include <vector>
# include <map>

namespace rescope {

  class Object;

  using ObjectPtr = std::shared_ptr<Object>;

 /*
  * Value
  *
  * Domain-side value of one field: a scalar stored as mtc::zval, a single
  * nested object or an ordered collection of nested objects.
  */
  class Value
  {
  public:
    enum: unsigned
    {
      v_none    = 0,
      v_scalar  = 1,
      v_object  = 2,
      v_objects = 3
    };

  public:
    Value() = default;
    Value( const mtc::zval& );
    Value( mtc::zval&& );
    Value( const ObjectPtr& );
    Value( const std::vector<ObjectPtr>& );
    Value( std::vector<ObjectPtr>&& );

    auto  GetType() const -> unsigned {  return vatype;  }

    auto  GetScalar() const -> const mtc::zval*
      {  return vatype == v_scalar ? &scalar : nullptr;  }
    auto  GetObject() const -> const ObjectPtr*
      {  return vatype == v_object ? &object : nullptr;  }
    auto  GetObjects() const -> const std::vector<ObjectPtr>*
      {  return vatype == v_objects ? &objects : nullptr;  }

  protected:
    unsigned                vatype = v_none;
    mtc::zval               scalar;
    ObjectPtr               object;
    std::vector<ObjectPtr>  objects;

  };

 /*
  * Object
  *
  * Generic record of a model instance. Domain entities are adapted to Object
  * to be encoded and are rebuilt from the Object returned by decode.
  *
  * A reference object is an identity-only placeholder produced when a decoded
  * reference stub does not match any object of the same decode call.
  */
  class Object
  {
    using value_map = std::map<std::string, Value, std::less<>>;

  public:
    Object( const std::string& model, bool isRef = false ):
      modelName( model ),
      reference( isRef ) {}

    auto  GetModel() const -> const std::string& {  return modelName;  }
    bool  IsReference() const {  return reference;  }

    bool  Has( const std::string_view& ) const;
    auto  Get( const std::string_view& ) const -> const Value*;
    auto  Set( const std::string_view&, const Value& ) -> Object&;
    auto  Set( const std::string_view&, const mtc::zval& ) -> Object&;
    bool  Del( const std::string_view& );

    auto  GetScalar( const std::string_view& ) const -> const mtc::zval*;
    auto  GetObject( const std::string_view& ) const -> ObjectPtr;
    auto  GetObjects( const std::string_view& ) const -> const std::vector<ObjectPtr>*;

    auto  size() const -> size_t  {  return values.size();  }
    auto  begin() const -> value_map::const_iterator  {  return values.begin();  }
    auto  end() const -> value_map::const_iterator  {  return values.end();  }

  protected:
    std::string modelName;
    bool        reference;
    value_map   values;

  };

  inline
  auto  MakeObject( const std::string& model ) -> ObjectPtr
    {  return std::make_shared<Object>( model );  }

}

# endif   // !__rescope_objects_hpp__
