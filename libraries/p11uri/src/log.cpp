#include <p11uri/log.hpp>

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/function.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>

namespace p11uri::loggers
{
   BOOST_LOG_GLOBAL_LOGGER_DEFAULT(generic, common_logger)

   namespace
   {
      using console_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

      BOOST_LOG_ATTRIBUTE_KEYWORD(severity_kw, "Severity", level)
      BOOST_LOG_ATTRIBUTE_KEYWORD(timestamp_kw, "TimeStamp", std::chrono::system_clock::time_point)

      template <typename S, typename T>
      void format_timestamp(S& os, const T& timestamp)
      {
         auto date = std::chrono::floor<std::chrono::days>(timestamp);
         auto ymd  = std::chrono::year_month_day(date);
         auto time = std::chrono::hh_mm_ss(
             std::chrono::duration_cast<std::chrono::milliseconds>(timestamp - date));
         os << std::setfill('0');
         os << std::setw(4) << (int)ymd.year() << '-' << std::setw(2) << (unsigned)ymd.month()
            << '-' << std::setw(2) << (unsigned)ymd.day();
         os << 'T' << std::setw(2) << time.hours().count() << ':' << std::setw(2)
            << time.minutes().count() << ':' << std::setw(2) << time.seconds().count() << '.'
            << std::setw(3) << time.subseconds().count() << 'Z';
         os << std::setfill(' ');
      }

      void format_record(const boost::log::record_view& rec, boost::log::formatting_ostream& os)
      {
         os << '[';
         if (auto ts = rec[timestamp_kw])
         {
            format_timestamp(os, *ts);
         }
         os << "] [";
         if (auto sev = rec[severity_kw])
         {
            os << *sev;
         }
         os << "]: " << rec[boost::log::expressions::smessage];
      }

      struct log_config
      {
         std::mutex                     mutex;
         boost::shared_ptr<console_sink> sink;

         static log_config& instance()
         {
            static log_config result;
            return result;
         }

         log_config()
         {
            boost::log::core::get()->add_global_attribute(
                "TimeStamp",
                boost::log::attributes::function<std::chrono::system_clock::time_point>(
                    []() { return std::chrono::system_clock::now(); }));
         }

         void set(level threshold)
         {
            std::lock_guard lock{mutex};
            auto            core = boost::log::core::get();
            if (sink)
            {
               core->remove_sink(sink);
               sink.reset();
            }
            auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
            backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
            backend->auto_flush(true);
            sink = boost::make_shared<console_sink>(backend);
            sink->set_filter(severity_kw >= threshold);
            sink->set_formatter(&format_record);
            core->add_sink(sink);
         }
      };
   }  // namespace

   void configure(level threshold)
   {
      log_config::instance().set(threshold);
   }

   void configure(const boost::program_options::variables_map& map)
   {
      if (auto pos = map.find("log-level"); pos != map.end())
      {
         configure(pos->second.as<level>());
      }
      else
      {
         configure_default();
      }
   }

   void configure_default()
   {
      configure(level::info);
   }

   namespace
   {
      constexpr const char* level_names[] = {"debug",   "info",  "notice",
                                             "warning", "error", "critical"};
   }

   std::ostream& operator<<(std::ostream& os, const level& l)
   {
      auto i = static_cast<std::size_t>(l);
      if (i < std::size(level_names))
         os << level_names[i];
      else
         os << static_cast<std::uint32_t>(l);
      return os;
   }

   std::istream& operator>>(std::istream& is, level& l)
   {
      std::string s;
      if (is >> s)
      {
         auto pos = std::find(std::begin(level_names), std::end(level_names), s);
         if (pos == std::end(level_names))
            is.setstate(std::ios_base::failbit);
         else
            l = static_cast<level>(pos - std::begin(level_names));
      }
      return is;
   }
}  // namespace p11uri::loggers
