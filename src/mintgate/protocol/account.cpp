#include <mintgate/protocol/account.hpp>

#include <algorithm>

#include <mintgate/encode.hpp>
#include <mintgate/memory.hpp>

namespace mintgate::protocol {

bool account::zero() const noexcept
{
  return std::ranges::all_of( *this, []( std::byte b ) { return b == std::byte{ 0x00 }; } );
}

result< account > account_from_string( std::string_view str ) noexcept
{
  if( !str.starts_with( "0x" ) && !str.starts_with( "0X" ) )
    return std::unexpected( protocol_errc::invalid_account );

  account a{};
  if( encode::from_hex( str, memory::as_writable_bytes( a ) ) )
    return std::unexpected( protocol_errc::invalid_account );

  return a;
}

std::string to_string( const account& a )
{
  return encode::to_hex( memory::as_bytes( a ) );
}

} // namespace mintgate::protocol
