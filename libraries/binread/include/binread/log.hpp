#pragma once

#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cstdint>
#include <iosfwd>

namespace binread
{
   namespace loggers
   {
      enum class level : std::uint32_t
      {
         debug,
         info,
         notice,
         warning,
         error,
         critical,
      };
      std::ostream& operator<<(std::ostream&, const level&);
      std::istream& operator>>(std::istream& is, level& l);
      using common_logger = boost::log::sources::severity_logger_mt<level>;
      BOOST_LOG_GLOBAL_LOGGER(generic, common_logger)

      // Installs a console sink writing to std::clog. Calling it again has no
      // effect.
      void configure_default();

      // Records below this level are dropped. Defaults to warning.
      void  set_level(level l);
      level get_level();

      // log-level and log-file
      void add_options(boost::program_options::options_description& desc);
      void configure(const boost::program_options::variables_map&);
   }  // namespace loggers

#define BINREAD_LOG(logger, log_level) BOOST_LOG_SEV(logger, ::binread::loggers::level::log_level)
}  // namespace binread
