#include <mintgate/encode/hex.hpp>

#include <bit>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace mintgate::encode {

constexpr char hex_offset = 10;

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::stringstream stream;
  stream << "0x" << std::hex << std::setfill( '0' );
  for( const auto& b: s )
    stream << std::setw( 2 ) << static_cast< unsigned int >( std::bit_cast< unsigned char >( b ) );

  return stream.str();
}

static result< std::uint8_t > hex_to_nibble( char in ) noexcept
{
  if( in >= '0' && in <= '9' )
    return in - '0';
  if( in >= 'a' && in <= 'f' )
    return in - 'a' + hex_offset;
  if( in >= 'A' && in <= 'F' )
    return in - 'A' + hex_offset;

  return std::unexpected( encode_errc::invalid_character );
}

static std::string_view strip_prefix( std::string_view sv ) noexcept
{
  if( sv.size() >= 2 && sv[ 0 ] == '0' && ( sv[ 1 ] == 'x' || sv[ 1 ] == 'X' ) )
    sv.remove_prefix( 2 );

  return sv;
}

static result< std::byte > hex_to_byte( char high, char low ) noexcept
{
  auto first = hex_to_nibble( high );
  if( !first )
    return std::unexpected( first.error() );

  auto second = hex_to_nibble( low );
  if( !second )
    return std::unexpected( second.error() );

  return static_cast< std::byte >( *first << 4 | *second );
}

result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept
{
  sv = strip_prefix( sv );

  if( sv.size() % 2 != 0 )
    return std::unexpected( encode_errc::odd_length );

  std::vector< std::byte > bytes;
  bytes.reserve( sv.size() / 2 );

  for( std::size_t i = 0; i < sv.size(); i += 2 )
  {
    auto b = hex_to_byte( sv[ i ], sv[ i + 1 ] );
    if( !b )
      return std::unexpected( b.error() );

    bytes.push_back( *b );
  }

  return bytes;
}

std::error_code from_hex( std::string_view sv, std::span< std::byte > out ) noexcept
{
  sv = strip_prefix( sv );

  if( sv.size() % 2 != 0 )
    return encode_errc::odd_length;

  if( sv.size() != out.size() * 2 )
    return encode_errc::length_mismatch;

  for( std::size_t i = 0; i < out.size(); ++i )
  {
    auto b = hex_to_byte( sv[ 2 * i ], sv[ 2 * i + 1 ] );
    if( !b )
      return b.error();

    out[ i ] = *b;
  }

  return encode_errc::ok;
}

} // namespace mintgate::encode
