#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <mintgate/controller.hpp>
#include <mintgate/log.hpp>
#include <mintgate/shell.hpp>

namespace constants {

using namespace std::string_literals;

const auto help_option        = "help,h"s;
const auto version_option     = "version,v"s;
const auto basedir_option     = "basedir,d"s;
const auto basedir_default    = "."s;
const auto log_level_option   = "log-level,l"s;
const auto log_level_default  = "info"s;
const auto genesis_option     = "genesis,g"s;
const auto genesis_default    = "genesis.yml"s;
const auto service_section    = "ledger"s;
const auto global_section     = "global"s;
const auto version_string     = "v0.0.1"s;

} // namespace constants

// Command line first, then the service section, then the global section
template< typename T >
static T get_option( std::string key,
                     T default_value,
                     const boost::program_options::variables_map& cli_args,
                     const YAML::Node& service_config,
                     const YAML::Node& global_config )
{
  if( auto pos = key.find( ',' ); pos != std::string::npos )
    key.resize( pos );

  if( cli_args.count( key ) )
    return cli_args[ key ].as< T >();

  if( service_config && service_config[ key ] )
    return service_config[ key ].as< T >();

  if( global_config && global_config[ key ] )
    return global_config[ key ].as< T >();

  return default_value;
}

auto main( int argc, char** argv ) -> int
{
  std::string log_level;
  std::filesystem::path genesis_file;
  mintgate::controller::genesis_data genesis;

  try
  {
    boost::program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()     , "Print this help message and exit" )
      ( constants::version_option.data()  , "Print version string and exit" )
      ( constants::basedir_option.data()  , boost::program_options::value< std::string >()->default_value( constants::basedir_default ), "The ledger base directory" )
      ( constants::log_level_option.data(), boost::program_options::value< std::string >(), "The log filtering level" )
      ( constants::genesis_option.data()  , boost::program_options::value< std::string >(), "The genesis file (absolute path or relative to basedir)" );
    // clang-format on

    boost::program_options::variables_map args;
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );

    if( args.count( "help" ) )
    {
      options.print( std::cout );
      return EXIT_SUCCESS;
    }

    if( args.count( "version" ) )
    {
      std::cout << constants::version_string << '\n';
      return EXIT_SUCCESS;
    }

    auto basedir = std::filesystem::path( args[ "basedir" ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node config;
    YAML::Node global_config;
    YAML::Node ledger_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
      yaml_config = basedir / "config.yaml";

    if( std::filesystem::exists( yaml_config ) )
    {
      config        = YAML::LoadFile( yaml_config.string() );
      global_config = config[ constants::global_section ];
      ledger_config = config[ constants::service_section ];
    }

    // clang-format off
    log_level    = get_option< std::string >( constants::log_level_option, constants::log_level_default, args, ledger_config, global_config );
    genesis_file = get_option< std::string >( constants::genesis_option, constants::genesis_default, args, ledger_config, global_config );
    // clang-format on

    mintgate::log::initialize( log_level );
    LOG_INFO( mintgate::log::instance(), "mintgate ledger {}", constants::version_string );

    if( config.IsNull() )
      LOG_WARNING( mintgate::log::instance(),
                   "Could not find config (config.yml or config.yaml expected). Using default values" );

    if( genesis_file.is_relative() )
      genesis_file = basedir / genesis_file;

    if( !std::filesystem::exists( genesis_file ) )
      throw std::runtime_error( "unable to locate genesis file at " + genesis_file.string() );

    auto loaded = mintgate::controller::load_genesis( YAML::LoadFile( genesis_file.string() ) );
    if( !loaded )
      throw std::runtime_error( "invalid genesis file " + genesis_file.string() + ": " + loaded.error().message() );

    genesis = std::move( *loaded );
    LOG_INFO( mintgate::log::instance(), "Using genesis file: {}", genesis_file.string() );
  }
  catch( const std::exception& e )
  {
    mintgate::log::initialize();
    LOG_ERROR( mintgate::log::instance(), "Invalid argument: {}", e.what() );
    return EXIT_FAILURE;
  }

  try
  {
    mintgate::controller::controller ledger( genesis );

    mintgate::shell::serve( std::cin, std::cout, ledger );
  }
  catch( const std::exception& e )
  {
    LOG_CRITICAL( mintgate::log::instance(), "An unexpected error has occurred: {}", e.what() );
    return EXIT_FAILURE;
  }

  LOG_INFO( mintgate::log::instance(), "Ledger shutdown" );
  return EXIT_SUCCESS;
}
