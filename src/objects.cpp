# include "../objects.hpp"

namespace rescope {

  // Value implementation

  Value::Value( const mtc::zval& z ):
    vatype( v_scalar ),
    scalar( z ) {}

  Value::Value( mtc::zval&& z ):
    vatype( v_scalar ),
    scalar( std::move( z ) ) {}

  Value::Value( const ObjectPtr& p ):
    vatype( v_object ),
    object( p ) {}

  Value::Value( const std::vector<ObjectPtr>& v ):
    vatype( v_objects ),
    objects( v ) {}

  Value::Value( std::vector<ObjectPtr>&& v ):
    vatype( v_objects ),
    objects( std::move( v ) ) {}

  // Object implementation

  bool  Object::Has( const std::string_view& name ) const
  {
    return values.find( name ) != values.end();
  }

  auto  Object::Get( const std::string_view& name ) const -> const Value*
  {
    auto  pfound = values.find( name );

    return pfound != values.end() ? &pfound->second : nullptr;
  }

  auto  Object::Set( const std::string_view& name, const Value& value ) -> Object&
  {
    auto  pfound = values.find( name );

    if ( pfound == values.end() )
      values.emplace( std::string( name ), value );
    else pfound->second = value;

    return *this;
  }

  auto  Object::Set( const std::string_view& name, const mtc::zval& value ) -> Object&
  {
    return Set( name, Value( value ) );
  }

  bool  Object::Del( const std::string_view& name )
  {
    auto  pfound = values.find( name );

    if ( pfound == values.end() )
      return false;
    return values.erase( pfound ), true;
  }

  auto  Object::GetScalar( const std::string_view& name ) const -> const mtc::zval*
  {
    auto  pvalue = Get( name );

    return pvalue != nullptr ? pvalue->GetScalar() : nullptr;
  }

  auto  Object::GetObject( const std::string_view& name ) const -> ObjectPtr
  {
    auto  pvalue = Get( name );
    auto  object = pvalue != nullptr ? pvalue->GetObject() : nullptr;

    return object != nullptr ? *object : nullptr;
  }

  auto  Object::GetObjects( const std::string_view& name ) const -> const std::vector<ObjectPtr>*
  {
    auto  pvalue = Get( name );

    return pvalue != nullptr ? pvalue->GetObjects() : nullptr;
  }

}
