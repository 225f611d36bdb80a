#include <mintgate/token/error.hpp>

#include <string>
#include <utility>

namespace mintgate::token {

struct _token_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "token";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< token_errc >( condition ) )
    {
      case token_errc::ok:
        return "ok"s;
      case token_errc::unauthorized:
        return "unauthorized"s;
      case token_errc::paused:
        return "ledger is paused"s;
      case token_errc::already_paused:
        return "ledger is already paused"s;
      case token_errc::not_paused:
        return "ledger is not paused"s;
      case token_errc::insufficient_balance:
        return "insufficient balance"s;
      case token_errc::insufficient_allowance:
        return "insufficient allowance"s;
      case token_errc::invalid_sender:
        return "invalid sender"s;
      case token_errc::invalid_recipient:
        return "invalid recipient"s;
      case token_errc::invalid_spender:
        return "invalid spender"s;
      case token_errc::invalid_owner:
        return "invalid owner"s;
      case token_errc::overflow:
        return "supply overflow"s;
      case token_errc::last_administrator:
        return "cannot remove the last administrator"s;
    }
    std::unreachable();
  }
};

const std::error_category& token_category() noexcept
{
  static _token_category category;
  return category;
}

std::error_code make_error_code( token_errc e )
{
  return std::error_code( static_cast< int >( e ), token_category() );
}

} // namespace mintgate::token
