// IRON: iron_headers
/*
 * Distribution A
 *
 * Approved for Public Release, Distribution Unlimited
 *
 * EdgeCT (IRON) Software Contract No.: HR0011-15-C-0097
 * DCOMP (GNAT)  Software Contract No.: HR0011-17-C-0050
 * Copyright (c) 2015-20 Raytheon BBN Technologies Corp.
 *
 * This material is based upon work supported by the Defense Advanced
 * Research Projects Agency under Contracts No. HR0011-15-C-0097 and
 * HR0011-17-C-0050. Any opinions, findings and conclusions or
 * recommendations expressed in this material are those of the author(s)
 * and do not necessarily reflect the views of the Defense Advanced
 * Research Project Agency.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
/* IRON: end */

/// \brief The GbnStream logging header file.
///
/// Provides the GbnStream software with an efficient, flexible logging
/// capability.  May be directed to stdout, stderr, or a file.  The logging
/// levels to be output are dynamically selectable.

#ifndef GBN_COMMON_LOG_H
#define GBN_COMMON_LOG_H

#include <map>
#include <string>
#include <cstdio>

#include <sys/time.h>
#include <stdint.h>
#include <pthread.h>

// Macros for the actual logging functions.  Use these, not the InternalLog()
// method.  The end letter of the function name represents the level of the
// logging for the message (Fatal, Error, Warning, Information, Analysis, and
// Debug).
//
// The parameters are:
//
// \param  const char* cn      The class name string.
// \param  const char* mn      The method name string.
// \param  const char* format  The printf-style format string that specifies
//                             how subsequent arguments are converted for
//                             output.  See printf(3) for details.
//
// There are no return values from these functions.

#define LogC(cn, mn, format, ...)                                       \
  gbn::Log::InternalLog(gbn::Log::LOG_CONFIG, "C", cn, mn, format,      \
                        ##__VA_ARGS__)

#define LogF(cn, mn, format, ...)                                       \
  gbn::Log::InternalLog(gbn::Log::LOG_FATAL, "F", cn, mn, format,       \
                        ##__VA_ARGS__)

#define LogE(cn, mn, format, ...)                                       \
  gbn::Log::InternalLog(gbn::Log::LOG_ERROR, "E", cn, mn, format,       \
                        ##__VA_ARGS__)

#define LogW(cn, mn, format, ...)                                       \
  gbn::Log::InternalLog(gbn::Log::LOG_WARNING, "W", cn, mn, format,     \
                        ##__VA_ARGS__)

#define LogI(cn, mn, format, ...)                                       \
  gbn::Log::InternalLog(gbn::Log::LOG_INFO, "I", cn, mn, format,        \
                        ##__VA_ARGS__)

#define LogA(cn, mn, format, ...)                                       \
  gbn::Log::InternalLog(gbn::Log::LOG_ANALYSIS, "A", cn, mn, format,    \
                        ##__VA_ARGS__)

#ifdef DEBUG

#define LogD(cn, mn, format, ...)                                       \
  gbn::Log::InternalLog(gbn::Log::LOG_DEBUG, "D", cn, mn, format,       \
                        ##__VA_ARGS__)

#else

#define LogD(cn, mn, format, ...)      /* */

#endif // DEBUG

#define WouldLogE(cn) gbn::Log::WouldLog(gbn::Log::LOG_ERROR, cn)

#define WouldLogW(cn) gbn::Log::WouldLog(gbn::Log::LOG_WARNING, cn)

#define WouldLogI(cn) gbn::Log::WouldLog(gbn::Log::LOG_INFO, cn)

#define WouldLogA(cn) gbn::Log::WouldLog(gbn::Log::LOG_ANALYSIS, cn)

#ifdef DEBUG
#define WouldLogD(cn) gbn::Log::WouldLog(gbn::Log::LOG_DEBUG, cn)
#else
#define WouldLogD(cn) false
#endif // DEBUG


namespace gbn
{

  /// \brief A class for logging messages to stdout, stderr, or a file.
  ///
  /// Each log statement may be at one of six levels:
  ///
  /// "C" = CONFIG:  Startup configuration settings, can't be disabled.
  /// "F" = Fatal:   Catastophic errors, execution will stop immediately.
  /// "E" = Error:   Serious errors, possible missing data or data corruption.
  /// "W" = Warning: System can continue operation without data loss.
  /// "I" = Info:    High level events concerning major functions.
  /// "A" = Analyis: Medium level events, i.e. session startup and shutdown.
  /// "D" = Debug:   Low level events to help track algorithm execution.
  ///
  /// To generate a log message, use one of the logging preprocessor macros:
  ///
  ///   LogA("GbnSender", "Send", "Sending seq %" PRIu16 ".\n", seq);
  ///
  /// The general format of the generated log message is:
  ///
  ///   \<time\> \<level\> [\<class\>::\<method\>] \<message\>
  ///
  /// The levels that are actually logged at run-time are controlled by a
  /// mask, which may be set using SetDefaultLevel() and SetClassLevel().  The
  /// Debug level is only available when compiled with the "-D DEBUG"
  /// preprocessor flag.
  class Log
  {

  public:

    /// The logging levels.  Used in the InternalLog() method.
    enum Level
    {
      LOG_FATAL    = 0x01,  ///< Catastophic errors, execution will stop
                            ///< immediately.
      LOG_ERROR    = 0x02,  ///< Serious errors, possible missing data or
                            ///< data corruption.
      LOG_WARNING  = 0x04,  ///< System can continue operation without data
                            ///< loss.
      LOG_INFO     = 0x08,  ///< High level events concerning major
                            ///< functions.
      LOG_ANALYSIS = 0x10,  ///< Medium level events, i.e. session startup
                            ///< and shutdown.
      LOG_DEBUG    = 0x20,  ///< Low level events to help track algorithm
                            ///< execution.
      LOG_ALL      = 0x3f,  ///< All levels.
      LOG_CONFIG   = 0xff   ///< Startup configuration settings, can't be
                            /// disabled.
    };

    /// \brief Set the default logging levels.
    ///
    /// By default, only the "FEWI" levels are logged until this method is
    /// called.
    ///
    /// \param  levels  The levels to be logged in a string format.  Valid
    ///                 levels are any of the letters "FEWIAD" (case
    ///                 independent) in any combination, or else the strings
    ///                 "ALL" or "NONE" (case independent).
    static void SetDefaultLevel(const std::string& levels);

    /// \brief Get the current default logging levels in a string format.
    ///
    /// \return  Returns a string of the form "FEWIAD", with the presence of
    ///          a letter signifying that the level is currently being logged.
    static std::string GetDefaultLevel();

    /// \brief Set the logging level for a particular class.
    ///
    /// If a level is not specified for a class, then the default logging
    /// level (which may be set using SetDefaultLevel()) is used.
    ///
    /// \param  class_name  The class name.
    /// \param  levels      The levels to be logged in a string format.
    static void SetClassLevel(const std::string& class_name,
                              const std::string& levels);

    /// \brief Apply class logging levels from a "Class=LEVELS;..." string.
    ///
    /// \param  class_levels  The semicolon separated list of class name and
    ///                       level assignments.
    static void SetClassLevels(const std::string& class_levels);

    /// \brief Send the logging to stdout.
    static void SetOutputToStdOut();

    /// \brief Send the logging to stderr.
    static void SetOutputToStdErr();

    /// \brief Send the logging to an output file.
    ///
    /// \param  file_name  The output file name.
    /// \param  append     If set to true, the output file will be appended
    ///                    to.
    ///
    /// \return  Returns true on success, false otherwise.
    static bool SetOutputFile(const std::string& file_name, bool append);

    /// \brief Check if a log message would be written for a specific
    /// level and class name.
    ///
    /// \param  level  The logging level for the message.
    /// \param  cn     The class name.
    ///
    /// \return  Returns true if the log message would be written.
    static bool WouldLog(Level level, const char* cn);

    /// \brief Log a message.
    ///
    /// Although this method can be called directly, it should really only be
    /// used by the LogF() through LogD() preprocessor macros.
    ///
    /// \param  level   The logging level for the message.
    /// \param  ln      The level name.
    /// \param  cn      The class name.
    /// \param  mn      The method name.
    /// \param  format  The printf-style format string.
    static void InternalLog(Level level, const char* ln, const char* cn,
                            const char* mn, const char* format, ...)
      __attribute__ ((format (printf, 5, 6)));

    /// \brief Change the config logging active setting.
    ///
    /// By default, any call to LogC() will write despite the default or class
    /// log level. Use this method to disable or re-enable this behavior.
    ///
    /// \param  config_active  If true, then any call to LogC() will write the
    ///                        message.
    ///
    /// \return  Returns the previous setting.
    static bool SetConfigLoggingActive(bool config_active);

    /// \brief Flush any logging output buffers.
    static void Flush();

    /// \brief Make sure that logging will still work after a signal occurs.
    ///
    /// This should be called <B>ONCE</B> at the start of a signal handler,
    /// before any logging takes place.
    static void OnSignal();

    /// \brief Prepare the logging for application shutdown.
    ///
    /// This method flushes any buffering of the logging strings and closes
    /// any logging output file.
    static void Destroy();

  private:

    /// \brief The default constructor.
    Log() { }

    /// \brief The destructor.
    virtual ~Log() { }

    /// \brief Copy constructor.
    Log(const Log& other);

    /// \brief Copy operator.
    Log& operator=(const Log& other);

    /// \brief Convert a logging level string into a mask.
    static int StringToMask(const std::string& levels);

    /// \brief Convert a logging level mask to a string.
    static void MaskToString(int mask, char* levels);

    /// \brief Set a new output file descriptor.
    static void SetNewFileDescriptor(FILE* new_fd);

    /// The default logging level mask.
    static int                         mask_;

    /// The current number of class-level logging masks.
    static int                         cmask_cnt_;

    /// A map of class names to logging masks.
    static std::map<std::string, int>  cmask_map_;

    /// The output file descriptor.
    static FILE*                       output_fd_;

    /// A flag recording if the start time is set or not.
    static bool                        start_time_set_;

    /// A lock to prevent logging contention.
    static pthread_mutex_t             mutex_;

    /// A flag recording if a LogC() call should output or not.
    static bool                        logc_active_;

  }; // class Log

} // namespace gbn

#endif // GBN_COMMON_LOG_H
