# include "../patterns.hpp"
# include <algorithm>

namespace rescope {

  // Pattern implementation

  auto  Pattern::IncludeOnly( const std::vector<std::string>& list ) -> Pattern
  {
    Pattern pattern( include_only );

    return pattern.names = list, pattern;
  }

  auto  Pattern::Exclude( const std::vector<std::string>& list ) -> Pattern
  {
    Pattern pattern( exclude );

    return pattern.names = list, pattern;
  }

  auto  Pattern::Rename( const rename_list& list ) -> Pattern
  {
    Pattern pattern( rename );

    return pattern.renames = list, pattern;
  }

  auto  Pattern::Rename( const std::string& name, const std::string& wire ) -> Pattern
  {
    return Rename( rename_list{ { name, wire } } );
  }

  auto  Pattern::RequireWritable( const std::vector<std::string>& list ) -> Pattern
  {
    Pattern pattern( require_writable );

    return pattern.names = list, pattern;
  }

  auto  Pattern::MarkReadonly( const std::vector<std::string>& list ) -> Pattern
  {
    Pattern pattern( mark_readonly );

    return pattern.names = list, pattern;
  }

  auto  Pattern::Chain( const std::vector<Pattern>& list ) -> Pattern
  {
    Pattern pattern( chain );

    return pattern.chained = list, pattern;
  }

  bool  Pattern::Lists( const std::string& name ) const
  {
    return std::find( names.begin(), names.end(), name ) != names.end();
  }

  auto  Pattern::Apply( const std::vector<Binding>& source ) const -> std::vector<Binding>
  {
    std::vector<Binding>  output;

    switch ( kind )
    {
      case include_only:
        for ( auto& next: source )
          if ( Lists( next.field->GetName() ) )
            output.push_back( next );
        return output;

      case exclude:
        for ( auto& next: source )
          if ( !Lists( next.field->GetName() ) )
            output.push_back( next );
        return output;

      case rename:
        output = source;

        for ( auto& next: output )
          for ( auto& item: renames )
            if ( item.first == next.field->GetName() )
              next.wire = item.second;
        return output;

      case require_writable:
      case mark_readonly:
        output = source;

        for ( auto& next: output )
          if ( Lists( next.field->GetName() ) )
            next.permission.writable = kind == require_writable;
        return output;

      case chain:
        output = source;

        for ( auto& next: chained )
          output = next.Apply( output );
        return output;
    }
    throw std::logic_error( "unexpected pattern kind" );
  }

  auto  Pattern::Names() const -> std::vector<std::string>
  {
    std::vector<std::string>  output;

    switch ( kind )
    {
      case chain:
        for ( auto& next: chained )
        {
          auto  sublist = next.Names();

          output.insert( output.end(), sublist.begin(), sublist.end() );
        }
        return output;

      case rename:
        for ( auto& next: renames )
          output.push_back( next.first );
        return output;

      default:
        return names;
    }
  }

}
