#include <nftledger/log/log.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <string>
#include <utility>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/core/LogLevel.h>
#include <quill/sinks/ConsoleSink.h>

namespace nftledger::log {

namespace {

constexpr std::array< std::pair< std::string_view, quill::LogLevel >, 6 > levels{
  { { "trace", quill::LogLevel::TraceL1 },
   { "debug", quill::LogLevel::Debug },
   { "info", quill::LogLevel::Info },
   { "warning", quill::LogLevel::Warning },
   { "error", quill::LogLevel::Error },
   { "critical", quill::LogLevel::Critical } }
};

} // namespace

void initialize() noexcept
{
  constexpr auto sleep_duration = std::chrono::milliseconds{ 100 };

  quill::BackendOptions options;
  options.sleep_duration = sleep_duration;
  options.error_notifier = []( const std::string& err ) noexcept
  {
    LOG_ERROR( nftledger::log::instance(), "Encountered backend logging error: {}", err );
  };

  quill::Backend::start( options );
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    "root",
    frontend::create_or_get_sink< quill::ConsoleSink >( "console_sink_id_1" ),
    quill::PatternFormatterOptions{ "%(time) [%(thread_id)] %(short_source_location:<28) %(log_level_short_code:<2) "
                                    "%(message)",
                                    "%Y-%m-%d %H:%M:%S.%Qms",
                                    quill::Timezone::GmtTime } );
  return logger;
}

bool valid_level( std::string_view level ) noexcept
{
  return std::ranges::any_of( levels,
                              [ level ]( const auto& entry )
                              {
                                return entry.first == level;
                              } );
}

bool set_level( std::string_view level ) noexcept
{
  auto itr = std::ranges::find_if( levels,
                                   [ level ]( const auto& entry )
                                   {
                                     return entry.first == level;
                                   } );
  if( itr == levels.end() )
    return false;

  instance()->set_log_level( itr->second );
  return true;
}

} // namespace nftledger::log
