#include <mintgate/encode/error.hpp>

#include <string>
#include <utility>

namespace mintgate::encode {

struct _hex_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "hex";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< encode_errc >( condition ) )
    {
      case encode_errc::ok:
        return "ok"s;
      case encode_errc::invalid_character:
        return "invalid hex digit"s;
      case encode_errc::odd_length:
        return "odd number of hex digits"s;
      case encode_errc::length_mismatch:
        return "hex string does not match the expected byte length"s;
    }
    std::unreachable();
  }
};

const std::error_category& encode_category() noexcept
{
  static _hex_category category;
  return category;
}

std::error_code make_error_code( encode_errc e )
{
  return std::error_code( static_cast< int >( e ), encode_category() );
}

} // namespace mintgate::encode
