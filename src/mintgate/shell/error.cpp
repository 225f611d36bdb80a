#include <mintgate/shell/error.hpp>

#include <string>
#include <utility>

namespace mintgate::shell {

struct _shell_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "shell";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< shell_errc >( condition ) )
    {
      case shell_errc::ok:
        return "ok"s;
      case shell_errc::empty_command:
        return "empty command"s;
      case shell_errc::unknown_command:
        return "unknown command"s;
      case shell_errc::wrong_argument_count:
        return "wrong number of arguments"s;
    }
    std::unreachable();
  }
};

const std::error_category& shell_category() noexcept
{
  static _shell_category category;
  return category;
}

std::error_code make_error_code( shell_errc e )
{
  return std::error_code( static_cast< int >( e ), shell_category() );
}

} // namespace mintgate::shell
