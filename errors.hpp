# if !defined( __rescope_errors_hpp__ )
# define __rescope_errors_hpp__
# include <stdexcept>
# include <string>
# include <vector>

namespace rescope {

 /*
  * ConfigurationError
  *
  * Schema is inconsistent: duplicate names, patterns referencing unknown
  * fields, unknown nested models and so on. Thrown at schema-build time only.
  */
  class ConfigurationError: public std::invalid_argument {  using std::invalid_argument::invalid_argument;  };

  class UnknownModel: public std::invalid_argument {  using std::invalid_argument::invalid_argument;  };
  class UnknownScope: public std::invalid_argument {  using std::invalid_argument::invalid_argument;  };

 /*
  * DecodeTypeError
  *
  * Wire value can not be coerced to the field type. Thrown by Field::FromWire()
  * and always caught by the Serializer to be aggregated.
  */
  class DecodeTypeError: public std::invalid_argument {  using std::invalid_argument::invalid_argument;  };

  struct FieldError
  {
    enum: unsigned
    {
      ScopeViolation = 1,
      ValidationError = 2,
      MandatoryFieldMissing = 3,
      DecodeTypeError = 4
    };

    std::string path;
    unsigned    kind;
    std::string message;

    static  auto  KindName( unsigned ) -> const char*;
  };

 /*
  * AggregatedDecodeError
  *
  * All the field-level errors collected during one decode call, in the order
  * the fields were visited.
  */
  class AggregatedDecodeError: public std::invalid_argument
  {
  public:
    AggregatedDecodeError( std::vector<FieldError>&& );

    auto  GetErrors() const -> const std::vector<FieldError>&  {  return errors;  }
    auto  Find( const std::string& path ) const -> const FieldError*;

  protected:
    std::vector<FieldError> errors;

  };

}

# endif   // !__rescope_errors_hpp__
