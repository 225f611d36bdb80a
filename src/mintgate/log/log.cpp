#include <mintgate/log/log.hpp>

#include <chrono>
#include <string>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/core/LogLevel.h>
#include <quill/core/QuillError.h>
#include <quill/sinks/ConsoleSink.h>

namespace mintgate::log {

static quill::LogLevel parse_level( std::string_view level ) noexcept
{
  if( level == "trace" )
    return quill::LogLevel::TraceL1;

  try
  {
    return quill::loglevel_from_string( std::string( level ) );
  }
  catch( const quill::QuillError& )
  {
    return quill::LogLevel::Info;
  }
}

void initialize( std::string_view level ) noexcept
{
  constexpr auto sleep_duration = std::chrono::milliseconds{ 100 };

  if( !quill::Backend::is_running() )
  {
    quill::BackendOptions options;
    options.sleep_duration = sleep_duration;
    options.error_notifier = []( const std::string& err ) noexcept
    {
      LOG_ERROR( mintgate::log::instance(), "Encountered backend logging error: {}", err );
    };

    quill::Backend::start( options );
  }

  instance()->set_log_level( parse_level( level ) );
}

// Standard output carries the ledger responses, so log lines go to standard error
static quill::ConsoleSinkConfig console_config()
{
  quill::ConsoleSinkConfig config;
  config.set_stream( "stderr" );
  return config;
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    "root",
    frontend::create_or_get_sink< quill::ConsoleSink >( "console_sink_id_1", console_config() ),
    quill::PatternFormatterOptions{ "%(time) [%(thread_id)] %(short_source_location:<28) %(log_level_short_code:<2) "
                                    "%(message)",
                                    "%Y-%m-%d %H:%M:%S.%Qms",
                                    quill::Timezone::GmtTime } );
  return logger;
}

} // namespace mintgate::log
