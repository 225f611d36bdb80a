#include <mintgate/protocol/amount.hpp>

#include <algorithm>
#include <cctype>

namespace mintgate::protocol {

result< amount > amount_from_string( std::string_view str )
{
  if( str.empty() || !std::ranges::all_of( str, []( char c ) { return std::isdigit( static_cast< unsigned char >( c ) ); } ) )
    return std::unexpected( protocol_errc::invalid_amount );

  // A leading zero selects octal in cpp_int's string constructor
  auto first_significant = str.find_first_not_of( '0' );
  if( first_significant == std::string_view::npos )
    return amount( 0 );

  str.remove_prefix( first_significant );

  boost::multiprecision::cpp_int value( std::string{ str } );
  if( value > boost::multiprecision::cpp_int( max_amount ) )
    return std::unexpected( protocol_errc::invalid_amount );

  return value.convert_to< amount >();
}

std::string to_string( const amount& a )
{
  return a.str();
}

} // namespace mintgate::protocol
