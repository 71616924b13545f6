#pragma once

#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cstdint>
#include <iosfwd>

namespace p11uri
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

      // Replaces the console sink. Records below `threshold` are dropped.
      void configure(level threshold);
      // Reads the log-level option
      void configure(const boost::program_options::variables_map&);
      void configure_default();
   }  // namespace loggers

#define P11URI_LOG(logger, log_level) BOOST_LOG_SEV(logger, p11uri::loggers::level::log_level)
}  // namespace p11uri
