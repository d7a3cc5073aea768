# include "../../schema/loader.hpp"
# include "../../schema/validators.hpp"
# include <mtc/wcsstr.h>
# include <cstring>

namespace rescope {
namespace schema {

  bool  operator == ( const mtc::zmap::key& k, const char* s )
  {
    if ( !k.is_charstr() )
      throw ConfigurationError( "schema keys must be strings" );
    return strcmp( k.to_charstr(), s ) == 0;
  }

  bool  operator != ( const mtc::zmap::key& k, const char* s )
  {
    return !(k == s);
  }

  auto  GetString( const mtc::zval& z, const char* what ) -> const std::string&
  {
    if ( z.get_type() != mtc::zval::z_charstr )
      throw ConfigurationError( mtc::strprintf( "%s has to be string", what ) );
    return *z.get_charstr();
  }

  auto  GetStructs( const mtc::zval& z, const char* what ) -> mtc::array_zmap
  {
    switch ( z.get_type() )
    {
      case mtc::zval::z_array_zmap:
        return *z.get_array_zmap();

    // empty json arrays come as array of values
      case mtc::zval::z_array_zval:
        if ( !z.get_array_zval()->empty() )
          throw ConfigurationError( mtc::strprintf( "%s is expected to be array of structures", what ) );
        return {};

      default:
        throw ConfigurationError( mtc::strprintf( "%s is expected to be array of structures", what ) );
    }
  }

  auto  GetStrings( const mtc::zval& z, const char* what ) -> std::vector<std::string>
  {
    std::vector<std::string>  strings;

    switch ( z.get_type() )
    {
      case mtc::zval::z_array_charstr:
        for ( auto& next: *z.get_array_charstr() )
          strings.push_back( next );
        return strings;

      case mtc::zval::z_array_zval:
        for ( auto& next: *z.get_array_zval() )
          strings.push_back( GetString( next, what ) );
        return strings;

      default:
        throw ConfigurationError( mtc::strprintf( "%s has to be array of strings", what ) );
    }
  }

  bool  GetFlag( const mtc::zval& z, const char* what )
  {
    switch ( z.get_type() )
    {
      case mtc::zval::z_int16:    return *z.get_int16() != 0;
      case mtc::zval::z_int32:    return *z.get_int32() != 0;
      case mtc::zval::z_int64:    return *z.get_int64() != 0;
      case mtc::zval::z_word16:   return *z.get_word16() != 0;
      case mtc::zval::z_word32:   return *z.get_word32() != 0;
      case mtc::zval::z_word64:   return *z.get_word64() != 0;
      case mtc::zval::z_charstr:
        if ( *z.get_charstr() == "true" || *z.get_charstr() == "yes" || *z.get_charstr() == "on" )
          return true;
        if ( *z.get_charstr() == "false" || *z.get_charstr() == "no" || *z.get_charstr() == "off" )
          return false;
        throw ConfigurationError( mtc::strprintf( "invalid %s value '%s'", what, z.get_charstr()->c_str() ) );
      default:
        throw ConfigurationError( mtc::strprintf( "%s has to be boolean", what ) );
    }
  }

  auto  GetNumber( const mtc::zval& z, const char* what ) -> double
  {
    switch ( z.get_type() )
    {
      case mtc::zval::z_int16:    return *z.get_int16();
      case mtc::zval::z_int32:    return *z.get_int32();
      case mtc::zval::z_int64:    return double(*z.get_int64());
      case mtc::zval::z_word16:   return *z.get_word16();
      case mtc::zval::z_word32:   return *z.get_word32();
      case mtc::zval::z_word64:   return double(*z.get_word64());
      case mtc::zval::z_float:    return *z.get_float();
      case mtc::zval::z_double:   return *z.get_double();
      default:
        throw ConfigurationError( mtc::strprintf( "%s has to be number", what ) );
    }
  }

  auto  GetLength( const mtc::zval& z, const char* what ) -> size_t
  {
    auto  length = GetNumber( z, what );

    if ( length < 0 || length != double(size_t(length)) )
      throw ConfigurationError( mtc::strprintf( "%s has to be non-negative integer", what ) );
    return size_t(length);
  }

 /*
  * access format:
  *   "r"   - readable only;
  *   "w"   - writable only;
  *   "rw"  - readable and writable;
  *   ""    - hidden in both directions.
  */
  auto  GetAccess( const mtc::zval& z, const char* what ) -> Permission
  {
    auto& access = GetString( z, what );

    if ( access == "rw" || access == "wr" ) return { true, true };
    if ( access == "r" )                    return { true, false };
    if ( access == "w" )                    return { false, true };
    if ( access == "" )                     return { false, false };

    throw ConfigurationError( mtc::strprintf( "invalid %s '%s', one of 'r', 'w', 'rw' or '' expected",
      what, access.c_str() ) );
  }

  bool  HasSingleKey( const mtc::zmap& cfg )
  {
    int   count = 0;

    for ( auto& next: cfg )
      (void)next, ++count;

    return count == 1;
  }

  auto  GetKind( const std::string& type ) -> Field::Kind
  {
    for ( auto kind: { Field::k_boolean, Field::k_integer, Field::k_real, Field::k_string, Field::k_nested } )
      if ( type == Field::KindName( kind ) )
        return kind;

    throw ConfigurationError( mtc::strprintf( "unknown field type '%s'", type.c_str() ) );
  }

  auto  GetValidator( const mtc::zmap& cfg ) -> Validator
  {
    if ( !HasSingleKey( cfg ) )
      throw ConfigurationError( "validator has to be structure of exactly one key" );

    for ( auto& next: cfg )
    {
      if ( next.first == "min" )
        return MinValue( GetNumber( next.second, "'min' limit" ) );
      if ( next.first == "max" )
        return MaxValue( GetNumber( next.second, "'max' limit" ) );
      if ( next.first == "min-length" )
        return MinLength( GetLength( next.second, "'min-length' limit" ) );
      if ( next.first == "max-length" )
        return MaxLength( GetLength( next.second, "'max-length' limit" ) );
      if ( next.first == "not-empty" )
        return NotEmpty();
      if ( next.first == "one-of" )
      {
        switch ( next.second.get_type() )
        {
          case mtc::zval::z_array_zval:
            return OneOf( *next.second.get_array_zval() );
          case mtc::zval::z_array_charstr:
          {
            mtc::array_zval values;

            for ( auto& s: *next.second.get_array_charstr() )
              values.push_back( s );

            return OneOf( values );
          }
          default:
            throw ConfigurationError( "'one-of' has to be array of values" );
        }
      }
      throw ConfigurationError( mtc::strprintf( "unknown validator '%s'", next.first.to_charstr() ) );
    }
    throw ConfigurationError( "validator has to be structure of exactly one key" );
  }

  void  ParseField( Field& field, const mtc::zmap& cfg )
  {
    for ( auto& next: cfg )
    {
      if ( next.first == "wire" )
      {
        field.SetWire( GetString( next.second, "field 'wire'" ) );
      }
        else
      if ( next.first == "access" )
      {
        field.SetAccess( GetAccess( next.second, "field 'access'" ) );
      }
        else
      if ( next.first == "required" )
      {
        field.SetRequired( GetFlag( next.second, "field 'required'" ) );
      }
        else
      if ( next.first == "default" )
      {
        field.SetDefault( next.second );
      }
        else
      if ( next.first == "scopes" )
      {
        if ( next.second.get_type() != mtc::zval::z_zmap )
          throw ConfigurationError( "field 'scopes' has to be structure" );

        for ( auto& scope: *next.second.get_zmap() )
        {
          if ( !scope.first.is_charstr() )
            throw ConfigurationError( "field 'scopes' may contain only string keys" );
          field.SetScope( scope.first.to_charstr(), GetAccess( scope.second, "field scope access" ) );
        }
      }
        else
      if ( next.first == "validators" )
      {
        for ( auto& validator: GetStructs( next.second, "field 'validators'" ) )
          field.AddValidator( GetValidator( validator ) );
      }
        else
      if ( next.first != "name" && next.first != "type" && next.first != "model" && next.first != "many" )
      {
        throw ConfigurationError( mtc::strprintf( "unexpected field key '%s'",
          next.first.to_charstr() ) );
      }
    }
  }

  auto  LoadField( const mtc::zmap& cfg ) -> Field
  {
    auto  name = cfg.get_charstr( "name" );
    auto  type = cfg.get_charstr( "type" );

    if ( name == nullptr )
    {
      throw cfg.get( "name" ) == nullptr ?
        ConfigurationError( "field description has to have 'name' string key" )
      : ConfigurationError( "field 'name' has to be string" );
    }

    if ( type == nullptr )
    {
      throw ConfigurationError( mtc::strprintf( cfg.get( "type" ) == nullptr ?
        "field '%s' description has to have 'type' string key" : "field '%s' 'type' has to be string", name->c_str() ) );
    }

    if ( GetKind( *type ) != Field::k_nested )
    {
      auto  field = Field( *name, GetKind( *type ) );

      if ( cfg.get( "model" ) != nullptr || cfg.get( "many" ) != nullptr )
        throw ConfigurationError( mtc::strprintf( "scalar field '%s' can not have 'model' or 'many' keys", name->c_str() ) );

      return ParseField( field, cfg ), field;
    }
      else
    {
      auto  model = cfg.get_charstr( "model" );
      auto  pmany = cfg.get( "many" );

      if ( model == nullptr )
        throw ConfigurationError( mtc::strprintf( "nested field '%s' has to have 'model' string key", name->c_str() ) );

      auto  field = Field( *name, *model, pmany != nullptr && GetFlag( *pmany, "field 'many'" ) ?
        Field::collection : Field::singular );

      return ParseField( field, cfg ), field;
    }
  }

  auto  LoadModel( const mtc::zmap& cfg ) -> Model
  {
    auto  name = cfg.get_charstr( "name" );
    auto  ident = std::string( "id" );

    if ( name == nullptr )
    {
      throw cfg.get( "name" ) == nullptr ?
        ConfigurationError( "model description has to have 'name' string key" )
      : ConfigurationError( "model 'name' has to be string" );
    }

    for ( auto& next: cfg )
    {
      if ( next.first == "identity" )
      {
        ident = GetString( next.second, "model 'identity'" );
      }
        else
      if ( next.first != "name" && next.first != "fields" )
      {
        throw ConfigurationError( mtc::strprintf( "unexpected model key '%s'",
          next.first.to_charstr() ) );
      }
    }

    auto  model = Model( *name, ident );

    if ( cfg.get( "fields" ) != nullptr )
    {
      for ( auto& next: GetStructs( *cfg.get( "fields" ), "model 'fields'" ) )
        model.Add( LoadField( next ) );
    }

    return model;
  }

  auto  LoadPattern( const mtc::zmap& cfg ) -> Pattern
  {
    if ( !HasSingleKey( cfg ) )
      throw ConfigurationError( "pattern has to be structure of exactly one key" );

    for ( auto& next: cfg )
    {
      if ( next.first == "include" )
        return Pattern::IncludeOnly( GetStrings( next.second, "pattern 'include'" ) );
      if ( next.first == "exclude" )
        return Pattern::Exclude( GetStrings( next.second, "pattern 'exclude'" ) );
      if ( next.first == "writable" )
        return Pattern::RequireWritable( GetStrings( next.second, "pattern 'writable'" ) );
      if ( next.first == "readonly" )
        return Pattern::MarkReadonly( GetStrings( next.second, "pattern 'readonly'" ) );
      if ( next.first == "rename" )
      {
        Pattern::rename_list  renames;

        if ( next.second.get_type() != mtc::zval::z_zmap )
          throw ConfigurationError( "pattern 'rename' has to be structure" );

        for ( auto& item: *next.second.get_zmap() )
        {
          if ( !item.first.is_charstr() )
            throw ConfigurationError( "pattern 'rename' may contain only string keys" );
          renames.emplace_back( item.first.to_charstr(), GetString( item.second, "pattern 'rename' wire name" ) );
        }
        return Pattern::Rename( renames );
      }
      if ( next.first == "chain" )
      {
        std::vector<Pattern>  chained;

        for ( auto& item: GetStructs( next.second, "pattern 'chain'" ) )
          chained.push_back( LoadPattern( item ) );

        return Pattern::Chain( chained );
      }
      throw ConfigurationError( mtc::strprintf( "unknown pattern '%s'", next.first.to_charstr() ) );
    }
    throw ConfigurationError( "pattern has to be structure of exactly one key" );
  }

  auto  LoadScope( const mtc::zmap& cfg ) -> Scope
  {
    auto  model = cfg.get_charstr( "model" );
    auto  name = cfg.get_charstr( "name" );

    if ( model == nullptr || name == nullptr )
      throw ConfigurationError( "scope description has to have 'model' and 'name' string keys" );

    auto  scope = Scope( *name, *model );

    for ( auto& next: cfg )
    {
      if ( next.first == "patterns" )
      {
        for ( auto& pattern: GetStructs( next.second, "scope 'patterns'" ) )
          scope.Add( LoadPattern( pattern ) );
      }
        else
      if ( next.first != "model" && next.first != "name" )
      {
        throw ConfigurationError( mtc::strprintf( "unexpected scope key '%s'",
          next.first.to_charstr() ) );
      }
    }
    return scope;
  }

  auto  LoadSchema( const mtc::zmap& cfg ) -> Schema
  {
    auto  schema = Schema();

    for ( auto& next: cfg )
    {
      if ( next.first == "default-scope" )
      {
        schema.SetDefaultScope( GetString( next.second, "'default-scope'" ) );
      }
        else
      if ( next.first != "models" && next.first != "scopes" )
      {
        throw ConfigurationError( mtc::strprintf( "unexpected schema key '%s'",
          next.first.to_charstr() ) );
      }
    }

  // models go first to let scopes resolve
    if ( cfg.get( "models" ) != nullptr )
    {
      for ( auto& next: GetStructs( *cfg.get( "models" ), "'models'" ) )
        schema.Add( LoadModel( next ) );
    }

    if ( cfg.get( "scopes" ) != nullptr )
    {
      for ( auto& next: GetStructs( *cfg.get( "scopes" ), "'scopes'" ) )
        schema.Add( LoadScope( next ) );
    }

    schema.Check();

    return schema;
  }

  auto  LoadSchema( const mtc::zmap& cfg, const mtc::zmap::key& key ) -> Schema
  {
    auto  pval = cfg.get( key );

    if ( pval == nullptr )
      throw ConfigurationError( "schema description not found" );

    if ( pval->get_type() != mtc::zval::z_zmap )
      throw ConfigurationError( "schema description has to be structure" );

    return LoadSchema( *pval->get_zmap() );
  }

}}
