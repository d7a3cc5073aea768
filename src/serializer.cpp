# include "../serializer.hpp"
# include "../register.hpp"
# include <mtc/wcsstr.h>
# include <set>

namespace rescope {

  const char  Serializer::refKey[] = "__ref__";
  const char  Serializer::idKey[] = "id";

  struct Serializer::EncodeContext
  {
    const std::string&      logical;
    std::set<std::string>   active;       // objects being encoded now
    IWireWriter&            output;
  };

  struct Serializer::DecodeContext
  {
    const std::string&                logical;
    const bool                        partial;
    std::map<std::string, ObjectPtr>  references;   // reference objects by identity
    std::vector<FieldError>           errors;
  };

 /*
  * TreeWriter
  *
  * Builds mtc::zmap from the writer events. Each open object or array is a
  * frame of its own, moved into the parent frame when closed.
  */
  class TreeWriter: public IWireWriter
  {
    struct Frame
    {
      std::string       key;
      bool              isArray;
      mtc::zmap         object;
      mtc::array_zmap   array;
    };

  public:
    auto  Result() -> mtc::zmap {  return std::move( output );  }

  public:
    void  OpenObject( const std::string& key ) override
    {
      frames.push_back( { key, false, {}, {} } );
    }
    void  CloseObject() override
    {
      auto  last = std::move( frames.back() );

      frames.pop_back();

      if ( frames.empty() )
        output = std::move( last.object );
      else
      if ( frames.back().isArray )
        frames.back().array.push_back( std::move( last.object ) );
      else
        frames.back().object[last.key.c_str()] = std::move( last.object );
    }
    void  OpenArray( const std::string& key ) override
    {
      frames.push_back( { key, true, {}, {} } );
    }
    void  CloseArray() override
    {
      auto  last = std::move( frames.back() );

      frames.pop_back();
      frames.back().object[last.key.c_str()] = std::move( last.array );
    }
    void  SetValue( const std::string& key, const mtc::zval& value ) override
    {
      frames.back().object[key.c_str()] = value;
    }

  protected:
    std::vector<Frame>  frames;
    mtc::zmap           output;

  };

  static  auto  JoinPath( const std::string& path, const std::string& name ) -> std::string
  {
    return path.empty() ? name : path + '.' + name;
  }

  // Serializer implementation

  Serializer::Serializer( const Register& reg, const SchemaPtr& sch, const ModelPtr& mod, const ScopePtr& sco ):
    owner( reg ),
    schema( sch ),
    model( mod ),
    scope( sco ),
    resolved( sco->Resolve( *mod ) ) {}

  auto  Serializer::Encode( const Object& object ) const -> mtc::zmap
  {
    auto  writer = TreeWriter();

    return Encode( object, writer ), writer.Result();
  }

  void  Serializer::Encode( const Object& object, IWireWriter& output ) const
  {
    auto  ctx = EncodeContext{ scope->GetName(), {}, output };

    encode( object, {}, ctx );
  }

  auto  Serializer::Decode( const mtc::zmap& input, bool partial ) const -> ObjectPtr
  {
    auto  ctx = DecodeContext{ scope->GetName(), partial, {}, {} };
    auto  out = decode( input, {}, ctx );

    if ( !ctx.errors.empty() )
      throw AggregatedDecodeError( std::move( ctx.errors ) );

    return out;
  }

  auto  Serializer::Check( const mtc::zmap& input, bool partial ) const -> std::vector<FieldError>
  {
    auto  ctx = DecodeContext{ scope->GetName(), partial, {}, {} };

    return decode( input, {}, ctx ), std::move( ctx.errors );
  }

  auto  Serializer::WireNames() const -> std::vector<std::string>
  {
    std::vector<std::string>  names;

    for ( auto& next: resolved )
      names.push_back( next.wire );

    return names;
  }

  bool  Serializer::IsReference( const mtc::zmap& tree )
  {
    return tree.get_charstr( refKey ) != nullptr;
  }

  auto  Serializer::GetNested( const Field& field, const std::string& logical ) const -> std::shared_ptr<const Serializer>
  {
    return owner.GetNested( field.GetModel(), logical );
  }

  auto  Serializer::GetIdentity( const Object& object ) const -> const mtc::zval*
  {
    return object.GetScalar( model->GetIdentity() );
  }

  auto  Serializer::MakeKey( const mtc::zval& ident ) const -> std::string
  {
    return model->GetName() + '\0' + ident.to_string();
  }

  auto  Serializer::MakeKey( const Object& object ) const -> std::string
  {
    auto  pident = GetIdentity( object );

    if ( pident != nullptr )
      return MakeKey( *pident );

  // objects having no identity are told apart by address
    return model->GetName() + '\0' + mtc::strprintf( "@%p", (const void*)&object );
  }

  void  Serializer::MakeStub( const Object& object, const std::string& key, IWireWriter& output ) const
  {
    auto  pident = GetIdentity( object );
    auto  ifield = model->GetField( model->GetIdentity() );

    output.OpenObject( key );
    output.SetValue( refKey, model->GetName() );

    if ( pident != nullptr && ifield != nullptr )
      output.SetValue( idKey, ifield->ToWire( *pident ) );

    output.CloseObject();
  }

  void  Serializer::encode( const Object& object, const std::string& key, EncodeContext& ctx ) const
  {
    auto  objkey = std::string();

    if ( object.GetModel() != model->GetName() )
    {
      throw std::logic_error( mtc::strprintf( "object of model '%s' passed to serializer of model '%s'",
        object.GetModel().c_str(), model->GetName().c_str() ) );
    }

    if ( object.IsReference() )
      return MakeStub( object, key, ctx.output );

    ctx.active.insert( objkey = MakeKey( object ) );
    ctx.output.OpenObject( key );

    for ( auto& next: resolved )
    {
      auto  pvalue = (const Value*)nullptr;

      if ( !next.permission.readable || (pvalue = object.Get( next.field->GetName() )) == nullptr )
        continue;

    // scalar values are written as is
      if ( !next.field->IsNested() )
      {
        if ( pvalue->GetScalar() == nullptr )
        {
          throw std::logic_error( mtc::strprintf( "field '%s.%s' has to hold scalar value",
            model->GetName().c_str(), next.field->GetName().c_str() ) );
        }
        for ( auto& error: next.field->Validate( *pvalue->GetScalar(), Direction::encode ) )
        {
          throw std::logic_error( mtc::strprintf( "field '%s.%s' value is invalid: %s",
            model->GetName().c_str(), next.field->GetName().c_str(), error.message.c_str() ) );
        }
        ctx.output.SetValue( next.wire, next.field->ToWire( *pvalue->GetScalar() ) );
        continue;
      }

    // nested values are written by the nested serializer
      auto  nested = GetNested( *next.field, ctx.logical );

      if ( next.field->GetRelation() == Field::singular )
      {
        auto  pobject = pvalue->GetObject();

        if ( pobject == nullptr )
        {
          throw std::logic_error( mtc::strprintf( "field '%s.%s' has to hold nested object",
            model->GetName().c_str(), next.field->GetName().c_str() ) );
        }
        if ( *pobject != nullptr )
          nested->encodeNested( **pobject, next.wire, ctx );
      }
        else
      {
        auto  objects = pvalue->GetObjects();

        if ( objects == nullptr )
        {
          throw std::logic_error( mtc::strprintf( "field '%s.%s' has to hold collection of objects",
            model->GetName().c_str(), next.field->GetName().c_str() ) );
        }

        ctx.output.OpenArray( next.wire );

        for ( auto& item: *objects )
        {
          if ( item == nullptr )
          {
            throw std::logic_error( mtc::strprintf( "field '%s.%s' collection contains null object",
              model->GetName().c_str(), next.field->GetName().c_str() ) );
          }
          nested->encodeNested( *item, {}, ctx );
        }

        ctx.output.CloseArray();
      }
    }

    ctx.output.CloseObject();
    ctx.active.erase( objkey );
  }

  void  Serializer::encodeNested( const Object& object, const std::string& key, EncodeContext& ctx ) const
  {
    if ( object.GetModel() == model->GetName() && ctx.active.count( MakeKey( object ) ) != 0 )
      return MakeStub( object, key, ctx.output );
    encode( object, key, ctx );
  }

  auto  Serializer::decode( const mtc::zmap& input, const std::string& path, DecodeContext& ctx ) const -> ObjectPtr
  {
    if ( IsReference( input ) )
      return decodeStub( input, path, ctx );

    auto  object = std::make_shared<Object>( model->GetName() );

    for ( auto& next: resolved )
    {
      auto  fpath = JoinPath( path, next.wire );
      auto  pvalue = input.get( next.wire.c_str() );

    // absent values are defaulted or reported as missing unless partial
      if ( pvalue == nullptr )
      {
        auto  pdefault = next.field->GetDefault();

        if ( ctx.partial || !next.permission.writable )
          continue;

        if ( pdefault != nullptr )
          object->Set( next.field->GetName(), *pdefault );
        else
        if ( next.field->IsRequired() )
          ctx.errors.push_back( { fpath, FieldError::MandatoryFieldMissing, "field is required" } );

        continue;
      }

      if ( !next.permission.writable )
      {
        ctx.errors.push_back( { fpath, FieldError::ScopeViolation, mtc::strprintf( "field is read-only in scope '%s'",
          scope->GetName().c_str() ) } );
        continue;
      }

      decodeValue( *object, next, *pvalue, fpath, ctx );
    }

    return object;
  }

  void  Serializer::decodeValue( Object& object, const Binding& bind, const mtc::zval& value,
    const std::string& path, DecodeContext& ctx ) const
  {
    auto  field = bind.field;

  // scalar value: coerce, then validate
    if ( !field->IsNested() )
    {
      try
      {
        auto  scalar = field->FromWire( value );
        auto  errors = field->Validate( scalar, Direction::decode );

        if ( errors.empty() )
          return (void)object.Set( field->GetName(), scalar );

        for ( auto& next: errors )
          ctx.errors.push_back( { path, next.kind, next.message } );
      }
      catch ( const DecodeTypeError& xp )
      {
        ctx.errors.push_back( { path, FieldError::DecodeTypeError, xp.what() } );
      }
      return;
    }

  // nested value: recurse to the nested serializer
    auto  nested = GetNested( *field, ctx.logical );

    if ( field->GetRelation() == Field::singular )
    {
      if ( value.get_type() != mtc::zval::z_zmap )
        return ctx.errors.push_back( { path, FieldError::DecodeTypeError, "field has to be structure" } );

      object.Set( field->GetName(), nested->decode( *value.get_zmap(), path, ctx ) );
    }
      else
    {
      auto  objects = std::vector<ObjectPtr>();

      switch ( value.get_type() )
      {
        case mtc::zval::z_array_zmap:
        {
          auto& items = *value.get_array_zmap();

          for ( size_t i = 0; i != items.size(); ++i )
            objects.push_back( nested->decode( items[i], JoinPath( path, std::to_string( i ) ), ctx ) );

          break;
        }
        case mtc::zval::z_array_zval:
        {
          auto& items = *value.get_array_zval();

          for ( size_t i = 0; i != items.size(); ++i )
          {
            auto  ipath = JoinPath( path, std::to_string( i ) );

            if ( items[i].get_type() == mtc::zval::z_zmap )
              objects.push_back( nested->decode( *items[i].get_zmap(), ipath, ctx ) );
            else ctx.errors.push_back( { ipath, FieldError::DecodeTypeError, "collection item has to be structure" } );
          }
          break;
        }
        default:
          return ctx.errors.push_back( { path, FieldError::DecodeTypeError, "field has to be array of structures" } );
      }
      object.Set( field->GetName(), std::move( objects ) );
    }
  }

 /*
  * Stubs with the same identity met in one call share the reference object.
  */
  auto  Serializer::decodeStub( const mtc::zmap& input, const std::string& path, DecodeContext& ctx ) const -> ObjectPtr
  {
    auto  refmod = input.get_charstr( refKey );
    auto  pident = input.get( idKey );
    auto  ifield = model->GetField( model->GetIdentity() );

    if ( *refmod != model->GetName() )
    {
      ctx.errors.push_back( { path, FieldError::DecodeTypeError, mtc::strprintf( "reference to model '%s' where '%s' is expected",
        refmod->c_str(), model->GetName().c_str() ) } );
      return nullptr;
    }

    if ( pident == nullptr || ifield == nullptr || ifield->IsNested() )
    {
      ctx.errors.push_back( { path, FieldError::DecodeTypeError, "reference has no identity" } );
      return nullptr;
    }

    try
    {
      auto  ident = ifield->FromWire( *pident );
      auto  objkey = MakeKey( ident );
      auto  pfound = ctx.references.find( objkey );
      auto  refobj = ObjectPtr();

      if ( pfound != ctx.references.end() )
        return pfound->second;

      (refobj = std::make_shared<Object>( model->GetName(), true ))->Set( ifield->GetName(), ident );

      return ctx.references.emplace( objkey, refobj ), refobj;
    }
    catch ( const DecodeTypeError& xp )
    {
      ctx.errors.push_back( { JoinPath( path, idKey ), FieldError::DecodeTypeError, xp.what() } );
    }
    return nullptr;
  }

}
