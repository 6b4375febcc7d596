#ifndef LOG_H
#define LOG_H

#define BOOST_LOG_DYN_LINK 1

#include "generated_config.hpp"

#include <array>
#include <string>

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

/**
 * @brief Per-component logging frontend on top of Boost.Log
 *
 * Every component holds its own Log object, named after the component. The
 * component name is attached to every record and printed by the console
 * formatter as
 *
 *   [12:01:33][WARN ][SCHEDULER] message
 *
 * Use it like this:
 *
 *   BOOST_LOG(l.i()) << "Scheduled " << count << " tasks";
 *
 * Debug output has MAX_DBG_LEVEL sub-levels. d(0) is the coarsest, records
 * logged with a level of MAX_DBG_LEVEL or above are dropped.
 */
class Log {
public:
  enum class severity
  {
    debug,
    info,
    normal,
    warning,
    error,
    fatal
  };

  using logger = boost::log::sources::severity_logger<severity>;

  /**
   * Installs the console sink. Records below min_severity are dropped.
   *
   * @param min_severity  The lowest severity that is still printed
   */
  static void setup(severity min_severity = severity::debug) noexcept;

  /**
   * Changes the severity filter of an already set up logging core.
   */
  static void set_min_severity(severity min_severity) noexcept;

  /**
   * Maps "debug", "info", "warning" and "error" to a severity. Returns false
   * for anything else and leaves sev untouched.
   */
  static bool parse_severity(const std::string & name, severity & sev) noexcept;

  Log(std::string component) noexcept;

  logger & d(unsigned int level = 0) const noexcept;
  logger & i() const noexcept;
  logger & n() const noexcept;
  logger & w() const noexcept;
  logger & e() const noexcept;
  logger & f() const noexcept;

private:
  static void
  console_formatter(boost::log::record_view const & rec,
                    boost::log::formatting_ostream & strm) noexcept;

  // records sent here never pass the filter
  mutable logger discard_logger;

  mutable std::array<logger, MAX_DBG_LEVEL> d_logger;
  mutable logger i_logger;
  mutable logger n_logger;
  mutable logger w_logger;
  mutable logger e_logger;
  mutable logger f_logger;
};

#endif
