#include <binread/log.hpp>

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/function.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/make_shared.hpp>
#include <boost/program_options/value_semantic.hpp>

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace binread::loggers
{
   namespace
   {
      using sink_type = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

      std::atomic<level> min_level{level::warning};
      std::once_flag     init_flag;
      std::mutex         sinks_mutex;

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

      auto text_formatter =
          [](const boost::log::record_view& rec, boost::log::formatting_ostream& os)
      {
         if (auto timestamp =
                 boost::log::extract<std::chrono::system_clock::time_point>("TimeStamp", rec))
         {
            format_timestamp(os, *timestamp);
            os << ' ';
         }
         if (auto l = boost::log::extract<level>("Severity", rec))
         {
            os << '[' << *l << "] ";
         }
         os << rec[boost::log::expressions::smessage];
      };

      bool severity_filter(const boost::log::attribute_value_set& attrs)
      {
         auto l = boost::log::extract<level>("Severity", attrs);
         return l && *l >= min_level.load();
      }

      void do_init()
      {
         auto core = boost::log::core::get();
         core->add_global_attribute(
             "TimeStamp", boost::log::attributes::function<std::chrono::system_clock::time_point>(
                              []() { return std::chrono::system_clock::now(); }));
         core->set_filter(&severity_filter);
      }

      void init()
      {
         std::call_once(init_flag, do_init);
      }

      boost::shared_ptr<sink_type> make_sink(boost::shared_ptr<std::ostream> os)
      {
         auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
         backend->add_stream(std::move(os));
         backend->auto_flush(true);
         auto sink = boost::make_shared<sink_type>(backend);
         sink->set_formatter(text_formatter);
         return sink;
      }

      boost::shared_ptr<sink_type> console_sink;
      boost::shared_ptr<sink_type> file_sink;
   }  // namespace

   // The threshold must be in place before the first record
   BOOST_LOG_GLOBAL_LOGGER_INIT(generic, common_logger)
   {
      init();
      return common_logger();
   }

   std::ostream& operator<<(std::ostream& os, const level& l)
   {
      switch (l)
      {
         case level::debug:
            os << "debug";
            break;
         case level::info:
            os << "info";
            break;
         case level::notice:
            os << "notice";
            break;
         case level::warning:
            os << "warning";
            break;
         case level::error:
            os << "error";
            break;
         case level::critical:
            os << "critical";
            break;
      }
      return os;
   }

   std::istream& operator>>(std::istream& is, level& l)
   {
      std::string s;
      if (is >> s)
      {
         if (s == "debug")
         {
            l = level::debug;
         }
         else if (s == "info")
         {
            l = level::info;
         }
         else if (s == "notice")
         {
            l = level::notice;
         }
         else if (s == "warning")
         {
            l = level::warning;
         }
         else if (s == "error")
         {
            l = level::error;
         }
         else if (s == "critical")
         {
            l = level::critical;
         }
         else
         {
            is.setstate(std::ios_base::failbit);
         }
      }
      return is;
   }

   void configure_default()
   {
      init();
      std::lock_guard lock{sinks_mutex};
      if (console_sink)
         return;
      console_sink = make_sink(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      boost::log::core::get()->add_sink(console_sink);
   }

   void set_level(level l)
   {
      init();
      min_level = l;
   }

   level get_level()
   {
      return min_level.load();
   }

   void add_options(boost::program_options::options_description& desc)
   {
      namespace po = boost::program_options;
      auto opt     = desc.add_options();
      opt("log-level", po::value<level>()->default_value(level::warning)->value_name("level"),
          "Minimum severity to log: debug, info, notice, warning, error, or critical");
      opt("log-file", po::value<std::string>()->value_name("path"),
          "Also write log records to this file");
   }

   void configure(const boost::program_options::variables_map& map)
   {
      init();
      if (map.count("log-level"))
      {
         set_level(map["log-level"].as<level>());
      }
      if (map.count("log-file"))
      {
         const auto& path = map["log-file"].as<std::string>();
         auto        file = boost::make_shared<std::ofstream>(path, std::ios_base::app);
         if (!*file)
            throw std::runtime_error("Cannot open log file: " + path);
         std::lock_guard lock{sinks_mutex};
         if (file_sink)
            boost::log::core::get()->remove_sink(file_sink);
         file_sink = make_sink(std::move(file));
         boost::log::core::get()->add_sink(file_sink);
      }
   }
}  // namespace binread::loggers
