#include "log.hpp"

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <cstddef>
#include <initializer_list>
#include <iomanip>

namespace {

struct SeverityStyle {
  const char * color;
  const char * label;
};

// indexed by Log::severity
const std::array<SeverityStyle, 6> severity_styles = {{
    {"\033[36m", "DEBUG"}, // cyan
    {"\033[32m", "INFO "}, // green
    {"\033[32m", "INFO "},
    {"\033[33m", "WARN "}, // yellow
    {"\033[31m", "ERROR"}, // red
    {"\033[31m", "FATAL"},
}};

const char * const COLOR_RESET = "\033[0m";

} // namespace

void
Log::console_formatter(boost::log::record_view const & rec,
                       boost::log::formatting_ostream & strm) noexcept
{
  namespace logging = boost::log;

  auto sev = logging::extract<Log::severity>("Severity", rec);
  const SeverityStyle * style = nullptr;
  if (sev) {
    style = &severity_styles[static_cast<size_t>(sev.get())];
    strm << style->color;
  }

  auto timestamp = logging::extract<boost::posix_time::ptime>("TimeStamp", rec);
  strm << "[";
  if (timestamp) {
    const auto time = timestamp.get().time_of_day();
    strm << std::setfill('0') << std::setw(2) << time.hours() << ":"
         << std::setw(2) << time.minutes() << ":" << std::setw(2)
         << time.seconds() << std::setfill(' ');
  }
  strm << "]";

  strm << "[" << (style != nullptr ? style->label : "     ") << "]";

  auto component = logging::extract<std::string>("component", rec);
  strm << "[" << std::setw(9) << (component ? component.get().substr(0, 9) : "")
       << "] ";

  // continuation lines are indented below the message
  auto message = logging::extract<std::string>("Message", rec);
  if (message) {
    for (char c : message.get()) {
      strm << c;
      if (c == '\n') {
        strm << "                              ";
      }
    }
  }

  if (style != nullptr) {
    strm << COLOR_RESET;
  }
}

void
Log::setup(severity min_severity) noexcept
{
  boost::log::core::get()->add_global_attribute(
      "TimeStamp", boost::log::attributes::local_clock());

  auto console_sink = boost::log::add_console_log();
  console_sink->set_formatter(&Log::console_formatter);

  Log::set_min_severity(min_severity);
}

void
Log::set_min_severity(severity min_severity) noexcept
{
  boost::log::core::get()->set_filter(
      !boost::log::expressions::has_attr<bool>("discard") &&
      boost::log::expressions::attr<Log::severity>("Severity") >=
          min_severity);
}

bool
Log::parse_severity(const std::string & name, severity & sev) noexcept
{
  if (name == "debug") {
    sev = severity::debug;
  } else if (name == "info") {
    sev = severity::info;
  } else if (name == "warning") {
    sev = severity::warning;
  } else if (name == "error") {
    sev = severity::error;
  } else {
    return false;
  }
  return true;
}

Log::Log(std::string component) noexcept
    : i_logger(boost::log::keywords::severity = severity::info),
      n_logger(boost::log::keywords::severity = severity::normal),
      w_logger(boost::log::keywords::severity = severity::warning),
      e_logger(boost::log::keywords::severity = severity::error),
      f_logger(boost::log::keywords::severity = severity::fatal)
{
  const boost::log::attributes::constant<std::string> name(component);

  for (auto & debug_logger : this->d_logger) {
    debug_logger = logger(boost::log::keywords::severity = severity::debug);
    debug_logger.add_attribute("component", name);
  }

  for (logger * lg : {&this->i_logger, &this->n_logger, &this->w_logger,
                      &this->e_logger, &this->f_logger}) {
    lg->add_attribute("component", name);
  }

  this->discard_logger.add_attribute(
      "discard", boost::log::attributes::constant<bool>(true));
}

Log::logger &
Log::d(unsigned int level) const noexcept
{
  if (level < MAX_DBG_LEVEL) {
    return this->d_logger[level];
  }
  return this->discard_logger;
}

Log::logger &
Log::i() const noexcept
{
  return this->i_logger;
}

Log::logger &
Log::n() const noexcept
{
  return this->n_logger;
}

Log::logger &
Log::w() const noexcept
{
  return this->w_logger;
}

Log::logger &
Log::e() const noexcept
{
  return this->e_logger;
}

Log::logger &
Log::f() const noexcept
{
  return this->f_logger;
}
