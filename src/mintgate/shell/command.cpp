#include <mintgate/shell/command.hpp>

#include <istream>
#include <ostream>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <boost/algorithm/string.hpp>

#include <mintgate/protocol/overloaded.hpp>

namespace mintgate::shell {

namespace {

// Reads positional arguments, remembering the first failure
class argument_reader
{
public:
  explicit argument_reader( std::span< const std::string > args ):
      _args( args )
  {}

  void expect( std::size_t count )
  {
    if( _args.size() != count )
      fail( shell_errc::wrong_argument_count );
  }

  protocol::account account( std::size_t i )
  {
    return read< protocol::account >( i, protocol::account_from_string );
  }

  protocol::amount amount( std::size_t i )
  {
    return read< protocol::amount >( i, protocol::amount_from_string );
  }

  protocol::role role( std::size_t i )
  {
    return read< protocol::role >( i, protocol::role_from_string );
  }

  template< typename T >
  result< T > yield( T value ) const
  {
    if( _error )
      return std::unexpected( _error );

    return value;
  }

private:
  template< typename T, typename Parser >
  T read( std::size_t i, Parser&& parser )
  {
    if( i >= _args.size() )
    {
      fail( shell_errc::wrong_argument_count );
      return T{};
    }

    auto value = parser( _args[ i ] );
    if( !value )
    {
      fail( value.error() );
      return T{};
    }

    return *value;
  }

  void fail( std::error_code ec )
  {
    if( !_error )
      _error = ec;
  }

  std::span< const std::string > _args;
  std::error_code _error;
};

result< protocol::operation > parse_operation( std::string_view op, std::span< const std::string > words )
{
  argument_reader args( words );

  if( op == "transfer" )
  {
    args.expect( 2 );
    return args.yield< protocol::operation >( protocol::transfer_operation{ args.account( 0 ), args.amount( 1 ) } );
  }
  if( op == "approve" )
  {
    args.expect( 2 );
    return args.yield< protocol::operation >( protocol::approve_operation{ args.account( 0 ), args.amount( 1 ) } );
  }
  if( op == "transfer_from" )
  {
    args.expect( 3 );
    return args.yield< protocol::operation >(
      protocol::transfer_from_operation{ args.account( 0 ), args.account( 1 ), args.amount( 2 ) } );
  }
  if( op == "mint" )
  {
    args.expect( 2 );
    return args.yield< protocol::operation >( protocol::mint_operation{ args.account( 0 ), args.amount( 1 ) } );
  }
  if( op == "pause" )
  {
    args.expect( 0 );
    return args.yield< protocol::operation >( protocol::pause_operation{} );
  }
  if( op == "unpause" )
  {
    args.expect( 0 );
    return args.yield< protocol::operation >( protocol::unpause_operation{} );
  }
  if( op == "grant_role" )
  {
    args.expect( 2 );
    return args.yield< protocol::operation >( protocol::grant_role_operation{ args.role( 0 ), args.account( 1 ) } );
  }
  if( op == "revoke_role" )
  {
    args.expect( 2 );
    return args.yield< protocol::operation >( protocol::revoke_role_operation{ args.role( 0 ), args.account( 1 ) } );
  }
  if( op == "renounce_role" )
  {
    args.expect( 2 );
    return args.yield< protocol::operation >( protocol::renounce_role_operation{ args.role( 0 ), args.account( 1 ) } );
  }
  if( op == "grant_minter_role" )
  {
    args.expect( 1 );
    return args.yield< protocol::operation >( protocol::grant_minter_role_operation{ args.account( 0 ) } );
  }
  if( op == "revoke_minter_role" )
  {
    args.expect( 1 );
    return args.yield< protocol::operation >( protocol::revoke_minter_role_operation{ args.account( 0 ) } );
  }
  if( op == "transfer_ownership" )
  {
    args.expect( 1 );
    return args.yield< protocol::operation >( protocol::transfer_ownership_operation{ args.account( 0 ) } );
  }
  if( op == "renounce_ownership" )
  {
    args.expect( 0 );
    return args.yield< protocol::operation >( protocol::renounce_ownership_operation{} );
  }

  return std::unexpected( shell_errc::unknown_command );
}

result< query > parse_query( std::string_view name, std::span< const std::string > words )
{
  static const std::vector< std::pair< std::string_view, query_kind > > no_argument_queries{
    { "name",         query_kind::name         },
    { "symbol",       query_kind::symbol       },
    { "decimals",     query_kind::decimals     },
    { "total_supply", query_kind::total_supply },
    { "paused",       query_kind::paused       },
    { "owner",        query_kind::owner        },
    { "events",       query_kind::events       }
  };

  argument_reader args( words );
  query q;

  for( const auto& [ query_name, kind ]: no_argument_queries )
  {
    if( name == query_name )
    {
      args.expect( 0 );
      q.kind = kind;
      return args.yield( q );
    }
  }

  if( name == "balance_of" || name == "is_admin" || name == "is_minter" )
  {
    args.expect( 1 );
    q.kind    = name == "balance_of" ? query_kind::balance_of
                : name == "is_admin" ? query_kind::is_admin
                                     : query_kind::is_minter;
    q.account = args.account( 0 );
    return args.yield( q );
  }

  if( name == "allowance" )
  {
    args.expect( 2 );
    q.kind    = query_kind::allowance;
    q.account = args.account( 0 );
    q.other   = args.account( 1 );
    return args.yield( q );
  }

  if( name == "has_role" )
  {
    args.expect( 2 );
    q.kind    = query_kind::has_role;
    q.role    = args.role( 0 );
    q.account = args.account( 1 );
    return args.yield( q );
  }

  if( name == "role_admin" )
  {
    args.expect( 1 );
    q.kind = query_kind::role_admin;
    q.role = args.role( 0 );
    return args.yield( q );
  }

  return std::unexpected( shell_errc::unknown_command );
}

std::string boolean( bool b )
{
  return b ? "true" : "false";
}

std::string run_query( const controller::controller& ledger, const query& q )
{
  switch( q.kind )
  {
    case query_kind::name:
      return ledger.name();
    case query_kind::symbol:
      return ledger.symbol();
    case query_kind::decimals:
      return std::to_string( ledger.decimals() );
    case query_kind::total_supply:
      return protocol::to_string( ledger.total_supply() );
    case query_kind::balance_of:
      return protocol::to_string( ledger.balance_of( q.account ) );
    case query_kind::allowance:
      return protocol::to_string( ledger.allowance( q.account, q.other ) );
    case query_kind::paused:
      return boolean( ledger.paused() );
    case query_kind::is_admin:
      return boolean( ledger.is_admin( q.account ) );
    case query_kind::is_minter:
      return boolean( ledger.is_minter( q.account ) );
    case query_kind::has_role:
      return boolean( ledger.has_role( q.role, q.account ) );
    case query_kind::role_admin:
      return std::string( protocol::to_string( ledger.role_admin( q.role ) ) );
    case query_kind::owner:
      return protocol::to_string( ledger.owner() );
    case query_kind::events:
      {
        std::vector< std::string > lines;
        for( const auto& ev: ledger.events() )
          lines.push_back( protocol::to_string( ev ) );

        return boost::algorithm::join( lines, "\n" );
      }
  }
  std::unreachable();
}

} // namespace

result< command > parse( std::string_view line )
{
  auto trimmed = boost::algorithm::trim_copy( std::string( line ) );
  if( trimmed.empty() )
    return std::unexpected( shell_errc::empty_command );

  std::vector< std::string > words;
  boost::algorithm::split( words, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on );

  if( boost::algorithm::istarts_with( words.front(), "0x" ) )
  {
    if( words.size() < 2 )
      return std::unexpected( shell_errc::wrong_argument_count );

    auto caller = protocol::account_from_string( words[ 0 ] );
    if( !caller )
      return std::unexpected( caller.error() );

    auto operation = parse_operation( words[ 1 ], std::span< const std::string >( words ).subspan( 2 ) );
    if( !operation )
      return std::unexpected( operation.error() );

    return protocol::transaction{ *caller, std::move( *operation ) };
  }

  auto q = parse_query( words.front(), std::span< const std::string >( words ).subspan( 1 ) );
  if( !q )
    return std::unexpected( q.error() );

  return *q;
}

std::string execute( controller::controller& ledger, const command& cmd )
{
  return std::visit( protocol::overloaded{ [ & ]( const protocol::transaction& transaction ) -> std::string
                                 {
                                   auto receipt = ledger.process( transaction );
                                   if( !receipt )
                                     return "error: " + receipt.error().message();

                                   std::string response = "ok";
                                   for( const auto& ev: receipt->events )
                                     response += "\n  " + protocol::to_string( ev );

                                   return response;
                                 },
                                 [ & ]( const query& q ) -> std::string { return run_query( ledger, q ); } },
                     cmd );
}

void serve( std::istream& input, std::ostream& output, controller::controller& ledger )
{
  std::string line;
  while( std::getline( input, line ) )
  {
    auto first = line.find_first_not_of( " \t\r" );
    if( first == std::string::npos || line[ first ] == '#' )
      continue;

    auto cmd = parse( line );
    if( !cmd )
    {
      output << "error: " << cmd.error().message() << std::endl;
      continue;
    }

    output << execute( ledger, *cmd ) << std::endl;
  }
}

} // namespace mintgate::shell
