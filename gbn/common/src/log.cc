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

/// \brief The GbnStream logging source file.
///
/// Provides the GbnStream software with a flexible logging capability.  May
/// be directed to stdout, stderr, or a file.  The logging levels to be output
/// are dynamically selectable.

#include "log.h"

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <strings.h>
#include <unistd.h>
#include <sys/time.h>


using ::gbn::Log;
using ::std::map;
using ::std::string;


//
// Static class members.
//

int                         Log::mask_           = (LOG_FATAL |
                                                    LOG_ERROR |
                                                    LOG_WARNING |
                                                    LOG_INFO);
int                         Log::cmask_cnt_      = 0;
std::map<std::string, int>  Log::cmask_map_;
FILE*                       Log::output_fd_      = stdout;
bool                        Log::start_time_set_ = false;
pthread_mutex_t             Log::mutex_          = PTHREAD_MUTEX_INITIALIZER;
bool                        Log::logc_active_    = true;

//============================================================================
void Log::SetDefaultLevel(const string& levels)
{
  Log::mask_ = Log::StringToMask(levels);
}

//============================================================================
string Log::GetDefaultLevel()
{
  char  mask_str[8];

  Log::MaskToString(Log::mask_, mask_str);

  return string(mask_str);
}

//============================================================================
void Log::SetClassLevel(const string& class_name, const string& levels)
{
  Log::cmask_map_[class_name] = Log::StringToMask(levels);
  Log::cmask_cnt_             = Log::cmask_map_.size();
}

//============================================================================
void Log::SetClassLevels(const string& class_levels)
{
  size_t  start = 0;

  while (start < class_levels.size())
  {
    size_t  end = class_levels.find(';', start);

    if (end == string::npos)
    {
      end = class_levels.size();
    }

    string  token = class_levels.substr(start, (end - start));
    size_t  eq    = token.find('=');

    if ((eq != string::npos) && (eq > 0) && ((eq + 1) < token.size()))
    {
      Log::SetClassLevel(token.substr(0, eq), token.substr(eq + 1));
    }

    start = (end + 1);
  }
}

//============================================================================
void Log::SetOutputToStdOut()
{
  Log::SetNewFileDescriptor(stdout);
}

//============================================================================
void Log::SetOutputToStdErr()
{
  Log::SetNewFileDescriptor(stderr);
}

//============================================================================
bool Log::SetOutputFile(const string& file_name, bool append)
{

  //
  // Attempt to open the output file.  If successful, then make the change.
  //

  FILE*  new_fd = fopen(file_name.c_str(), (append ? "a" : "w"));

  if (new_fd == NULL)
  {
    return false;
  }

  Log::SetNewFileDescriptor(new_fd);

  return true;
}

//============================================================================
void Log::Flush()
{
  fflush(Log::output_fd_);
}

//============================================================================
bool Log::SetConfigLoggingActive(bool config_active)
{
  bool old_setting = logc_active_;
  logc_active_ = config_active;
  return old_setting;
}

//============================================================================
bool Log::WouldLog(Level level, const char* cn)
{
#ifndef DEBUG
  if (level == LOG_DEBUG)
  {
    // debug is compiled out for optimized
    return false;
  }
#endif

  if (level == LOG_CONFIG)
  {
    return logc_active_;
  }

  // Only check for a class name logging level if there is a class name and
  // there is at least one class name in the map.
  int mask = mask_;
  if (cmask_cnt_ > 0 && cn != NULL)
  {
    map<string, int>::iterator it = cmask_map_.find(string(cn));
    if (it != cmask_map_.end())
    {
      mask = (*it).second;
    }
  }
  return mask & level;
}

//============================================================================
void Log::InternalLog(Log::Level level, const char* ln, const char* cn,
                      const char* mn, const char* format, ...)
{
  va_list  args;
  va_start(args, format);

  if (WouldLog(level, cn))
  {

    //
    // Get the time to be logged.  Output the absolute time with microsecond
    // accuracy, which is better for correlating the server and client log
    // files.
    //

    struct timeval  curr_time;
    gettimeofday(&curr_time, 0);

    time_t       diff_sec  = curr_time.tv_sec;
    suseconds_t  diff_usec = curr_time.tv_usec;

    int  err;
    if ((err = pthread_mutex_lock(&Log::mutex_)) != 0)
    {
      fprintf(stderr, "Log::InternalLog(): Error %d locking mutex.\n", err);
      va_end(args);
      return;
    }

    //
    // If this is also the start time, then print out the current time in the
    // format "Fri Sep 13 00:00:00:000000 1986".
    //

    if (!Log::start_time_set_)
    {
      //
      // Note that ctime_r() requires at least 26 characters, and we need to
      // allow space for microsecconds.
      //

      unsigned int  year = 0;
      char          buf[40];
      char         *cptr;

      ctime_r(&(curr_time.tv_sec), buf);
      cptr = &buf[strlen(buf) - 6];  // Get location right after seconds.
      if (sscanf(cptr, "%u", &year) == 1)
      {
        snprintf(cptr, (sizeof(buf) - (cptr - buf)), ":%06ld %u",
                 static_cast<long>(diff_usec), year);
      }

      fprintf(Log::output_fd_, "%ld.%06ld Logging Started at: %s\n",
              static_cast<long>(diff_sec), static_cast<long>(diff_usec), buf);

      Log::start_time_set_ = true;
      fflush(Log::output_fd_);
    }

    //
    // Log the message.
    //

    fprintf(Log::output_fd_, "%ld.%06ld %s [%s::%s] ",
            static_cast<long>(diff_sec), static_cast<long>(diff_usec), ln, cn,
            mn);
    vfprintf(Log::output_fd_, format, args);

    if ((err = pthread_mutex_unlock(&Log::mutex_)) != 0)
    {
      fprintf(stderr, "Log::InternalLog(): Error %d unlocking mutex.\n", err);
    }
  }

  //
  // If necessary, dump core and exit.  Do not depend on whether LOG_FATAL is
  // in the mask.
  //

  if (level == LOG_FATAL)
  {
    // Flush the logging output.
    fflush(Log::output_fd_);

    // Dump core and exit immediately.
    abort();
  }

  va_end(args);
}

//============================================================================
void Log::OnSignal()
{
  // Attempt to lock the mutex.  If it is not already locked, it will lock it
  // and return immediately.  If it is already locked, this will not block
  // and will return EBUSY.
  int  err = pthread_mutex_trylock(&Log::mutex_);

  // Now that we know that the mutex is locked, unlock it.
  if ((err = pthread_mutex_unlock(&Log::mutex_)) != 0)
  {
    fprintf(stderr, "Log::OnSignal(): Error %d unlocking mutex.\n", err);
  }
}

//============================================================================
void Log::Destroy()
{
  //
  // This method logs a message indicating application shutdown, but it cannot
  // call into the InternalLog() method.  This is because a signal might have
  // interrupted the InternalLog() method while the mutex lock was locked, and
  // calling back into the InternalLog() method would cause a deadlock.  Thus,
  // this method must log the message manually.
  //

  if (Log::mask_ & LOG_INFO)
  {
    struct timeval  curr_time;
    gettimeofday(&curr_time, 0);

    fprintf(Log::output_fd_, "%ld.%06ld I [Log::Destroy] Application "
            "shutdown.\n", static_cast<long>(curr_time.tv_sec),
            static_cast<long>(curr_time.tv_usec));
  }

  //
  // If the current output file descriptor is not equal to stdout or stderr,
  // then we must close it without disrupting users of Log::output_fd_.
  //

  if ((Log::output_fd_ != stdout) && (Log::output_fd_ != stderr))
  {
    FILE*  old_fd    = Log::output_fd_;
    Log::output_fd_ = stdout;

    fflush(old_fd);
    fclose(old_fd);
  }

  fflush(Log::output_fd_);
}

//============================================================================
int Log::StringToMask(const string& levels)
{
  int          mask     = 0;
  const char*  mask_str = levels.c_str();

  //
  // Convert the string into a mask and store it as the default mask.
  //

  if (strcasecmp(mask_str, "all") == 0)
  {
    mask = LOG_ALL;
  }
  else if (strcasecmp(mask_str, "none") == 0)
  {
    mask = 0;
  }
  else
  {
    if (strchr(mask_str, 'F') || strchr(mask_str, 'f'))
    {
      mask |= LOG_FATAL;
    }
    if (strchr(mask_str, 'E') || strchr(mask_str, 'e'))
    {
      mask |= LOG_ERROR;
    }
    if (strchr(mask_str, 'W') || strchr(mask_str, 'w'))
    {
      mask |= LOG_WARNING;
    }
    if (strchr(mask_str, 'I') || strchr(mask_str, 'i'))
    {
      mask |= LOG_INFO;
    }
    if (strchr(mask_str, 'A') || strchr(mask_str, 'a'))
    {
      mask |= LOG_ANALYSIS;
    }
    if (strchr(mask_str, 'D') || strchr(mask_str, 'd'))
    {
      mask |= LOG_DEBUG;
    }
  }

  return mask;
}

//============================================================================
void Log::MaskToString(int mask, char* levels)
{
  int  i = 0;

  if (mask & LOG_FATAL)
  {
    levels[i++] = 'F';
  }

  if (mask & LOG_ERROR)
  {
    levels[i++] = 'E';
  }

  if (mask & LOG_WARNING)
  {
    levels[i++] = 'W';
  }

  if (mask & LOG_INFO)
  {
    levels[i++] = 'I';
  }

  if (mask & LOG_ANALYSIS)
  {
    levels[i++] = 'A';
  }

  if (mask & LOG_DEBUG)
  {
    levels[i++] = 'D';
  }

  levels[i] = '\0';
}

//============================================================================
void Log::SetNewFileDescriptor(FILE* new_fd)
{
  int  err;

  if ((err = pthread_mutex_lock(&Log::mutex_)) != 0)
  {
    fprintf(stderr, "Log::SetNewFileDescriptor(): Error %d locking mutex.\n",
            err);
    return;
  }

  //
  // If the current output file descriptor is not equal to stdout or stderr,
  // then close it before switching.
  //

  if ((Log::output_fd_ != stdout) && (Log::output_fd_ != stderr) &&
      (Log::output_fd_ != new_fd))
  {
    fflush(Log::output_fd_);
    fclose(Log::output_fd_);
  }

  Log::output_fd_ = new_fd;

  if ((err = pthread_mutex_unlock(&Log::mutex_)) != 0)
  {
    fprintf(stderr, "Log::SetNewFileDescriptor(): Error %d unlocking "
            "mutex.\n", err);
  }
}
