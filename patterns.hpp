# if !defined( __rescope_patterns_hpp__ )
# define __rescope_patterns_hpp__
# include "fields.hpp"
# include <string>
# include <vector>

namespace rescope {

 /*
  * Binding
  *
  * One visible field of a scope: the field, the key it is exposed with on
  * the wire and the directions it is allowed in.
  */
  struct Binding
  {
    const Field*  field;
    std::string   wire;
    Permission    permission;
  };

 /*
  * Pattern
  *
  * Closed set of visibility rules operating on field names only:
  *   include_only     - keeps only the named fields;
  *   exclude          - drops the named fields;
  *   rename           - rewrites wire names;
  *   require_writable - grants write permission to the named fields;
  *   mark_readonly    - revokes write permission from the named fields;
  *   chain            - applies nested patterns left to right.
  *
  * Patterns never add fields, so a field dropped by an earlier rule of a
  * chain can not be brought back by a later one.
  */
  class Pattern
  {
  public:
    enum Kind: unsigned
    {
      include_only      = 0,
      exclude           = 1,
      rename            = 2,
      require_writable  = 3,
      mark_readonly     = 4,
      chain             = 5
    };

    using rename_list = std::vector<std::pair<std::string, std::string>>;

  public:
    static  auto  IncludeOnly( const std::vector<std::string>& ) -> Pattern;
    static  auto  Exclude( const std::vector<std::string>& ) -> Pattern;
    static  auto  Rename( const rename_list& ) -> Pattern;
    static  auto  Rename( const std::string& name, const std::string& wire ) -> Pattern;
    static  auto  RequireWritable( const std::vector<std::string>& ) -> Pattern;
    static  auto  MarkReadonly( const std::vector<std::string>& ) -> Pattern;
    static  auto  Chain( const std::vector<Pattern>& ) -> Pattern;

    auto  GetKind() const -> Kind {  return kind;  }
    auto  Apply( const std::vector<Binding>& ) const -> std::vector<Binding>;
    auto  Names() const -> std::vector<std::string>;

  protected:
    Pattern( Kind k ): kind( k ) {}

    bool  Lists( const std::string& ) const;

  protected:
    Kind                      kind;
    std::vector<std::string>  names;
    rename_list               renames;
    std::vector<Pattern>      chained;

  };

}

# endif   // !__rescope_patterns_hpp__
