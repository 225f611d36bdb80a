#include <mintgate/token/balance_ledger.hpp>

namespace mintgate::token {

const protocol::amount& balance_ledger::total_supply() const noexcept
{
  return _total_supply;
}

protocol::amount balance_ledger::balance_of( const protocol::account& account ) const
{
  auto it = _balances.find( account );
  if( it == _balances.end() )
    return 0;

  return it->second;
}

protocol::amount balance_ledger::allowance( const protocol::account& owner, const protocol::account& spender ) const
{
  auto owner_it = _allowances.find( owner );
  if( owner_it == _allowances.end() )
    return 0;

  auto it = owner_it->second.find( spender );
  if( it == owner_it->second.end() )
    return 0;

  return it->second;
}

std::error_code balance_ledger::check_transfer( const protocol::account& from,
                                                const protocol::account& to,
                                                const protocol::amount& value ) const
{
  if( from.zero() )
    return token_errc::invalid_sender;

  if( to.zero() )
    return token_errc::invalid_recipient;

  if( balance_of( from ) < value )
    return token_errc::insufficient_balance;

  return token_errc::ok;
}

void balance_ledger::move( const protocol::account& from, const protocol::account& to, const protocol::amount& value )
{
  if( value == 0 || from == to )
    return;

  auto from_it = _balances.find( from );
  from_it->second -= value;
  if( from_it->second == 0 )
    _balances.erase( from_it );

  // Cannot overflow, a balance never exceeds the total supply
  _balances[ to ] += value;
}

std::error_code
balance_ledger::transfer( const protocol::account& from, const protocol::account& to, const protocol::amount& value )
{
  if( auto ec = check_transfer( from, to, value ); ec )
    return ec;

  move( from, to, value );
  return token_errc::ok;
}

std::error_code balance_ledger::transfer_from( const protocol::account& spender,
                                               const protocol::account& from,
                                               const protocol::account& to,
                                               const protocol::amount& value )
{
  auto current_allowance = allowance( from, spender );

  if( current_allowance < value )
    return token_errc::insufficient_allowance;

  if( auto ec = check_transfer( from, to, value ); ec )
    return ec;

  if( current_allowance != protocol::max_amount && value != 0 )
    _allowances[ from ][ spender ] -= value;

  move( from, to, value );
  return token_errc::ok;
}

std::error_code
balance_ledger::approve( const protocol::account& owner, const protocol::account& spender, const protocol::amount& value )
{
  if( owner.zero() )
    return token_errc::invalid_sender;

  if( spender.zero() )
    return token_errc::invalid_spender;

  _allowances[ owner ][ spender ] = value;
  return token_errc::ok;
}

std::error_code balance_ledger::mint( const protocol::account& to, const protocol::amount& value )
{
  if( to.zero() )
    return token_errc::invalid_recipient;

  if( protocol::max_amount - value < _total_supply )
    return token_errc::overflow;

  if( value == 0 )
    return token_errc::ok;

  _total_supply   += value;
  _balances[ to ] += value;
  return token_errc::ok;
}

protocol::amount balance_ledger::sum_of_balances() const
{
  // Saturates at max_amount
  boost::multiprecision::cpp_int sum = 0;
  for( const auto& [ account, balance ]: _balances )
    sum += boost::multiprecision::cpp_int( balance );

  if( sum > boost::multiprecision::cpp_int( protocol::max_amount ) )
    return protocol::max_amount;

  return sum.convert_to< protocol::amount >();
}

} // namespace mintgate::token
