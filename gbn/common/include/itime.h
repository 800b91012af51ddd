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

/// \brief The GbnStream time header file.
///
/// Provides the GbnStream software with a time class.

#ifndef GBN_COMMON_ITIME_H
#define GBN_COMMON_ITIME_H

#include "log.h"

#include <limits>

#include <stdint.h>
#include <string>
#include <stdio.h>
#include <sys/time.h>
#include <time.h>

namespace gbn
{

  /// Time class: Provides a wrapper to a timeval time and a good number of
  /// accessors and operators for a monotonic clock.  The timeval is rounded
  /// from a timespec, which is returned in seconds and nanoseconds.  Math and
  /// logical operators are provided as part of this class, which also
  /// provides 'now'.
  ///
  /// This class does support negative times.  When the result of a
  /// subtraction is a negative time, the seconds are negative and the
  /// microseconds are positive.  For example, "-10.70000s" is stored
  /// internally as tv_sec = -11 and tv_usec = 300000.
  class Time
  {
    public:

    /// \brief Default constructor.
    ///
    /// This sets the value of the Time to 0.
    inline Time() : t_val_() {}

    /// \brief Copy constructor.
    ///
    /// \param  other_time  The Time object to copy.
    inline Time(const Time& other_time) : t_val_(other_time.t_val_) {}

    /// \brief Constructor from a timeval.
    ///
    /// \param  t_val  The timeval value.
    inline explicit Time(const timeval& t_val)  : t_val_(t_val) {}

    /// \brief Constructor from a timespec, rounded to microseconds.
    ///
    /// \param  t_spec  The timespec value.
    explicit Time(const timespec& t_spec);

    /// \brief Constructor from seconds and microseconds.
    ///
    /// \param  seconds       The seconds component.
    /// \param  microseconds  The microseconds component.
    inline explicit Time(time_t seconds, suseconds_t microseconds)
    {
      t_val_.tv_sec  = seconds;
      t_val_.tv_usec = microseconds;
    }

    /// \brief Constructor from a fractional number of seconds.
    ///
    /// \param  fractional_time_in_seconds  The time in seconds.
    explicit Time(double fractional_time_in_seconds);

    /// \brief Destructor.
    virtual ~Time() {};

    /// \brief Create a Time from a number of seconds.
    ///
    /// \param  seconds  The time in seconds.
    ///
    /// \return  The Time object.
    static Time FromSec(time_t seconds);

    /// \brief Create a Time from a number of milliseconds.
    ///
    /// \param  milliseconds  The time in milliseconds.
    ///
    /// \return  The Time object.
    static Time FromMsec(int64_t milliseconds);

    /// \brief Create a Time from a number of microseconds.
    ///
    /// \param  microseconds  The time in microseconds.
    ///
    /// \return  The Time object.
    static Time FromUsec(int64_t microseconds);

    /// \brief Get the current monotonic time.
    ///
    /// \return  The current time.
    static Time Now();

    /// \brief Get a Time that is larger than any other Time.
    static Time Infinite();

    /// \brief Get the larger of two times.
    static Time Max(const Time& t1, const Time& t2);

    /// \brief Get the smaller of two times.
    static Time Min(const Time& t1, const Time& t2);

    /// \brief Get a string representation of the time, "sec.usecs".
    ///
    /// \return  The string representation.
    std::string ToString() const;

    /// \brief Get the time as a timeval.
    inline timeval ToTval() const
    {
      return t_val_;
    }

    /// \brief Get the time as a timespec.
    inline timespec ToTspec() const
    {
      timespec  t_spec;
      t_spec.tv_sec  = t_val_.tv_sec;
      t_spec.tv_nsec = static_cast<long>(t_val_.tv_usec) * 1000;
      return t_spec;
    }

    /// \brief Get the time as a fractional number of seconds.
    inline double ToDouble() const
    {
      return (static_cast<double>(t_val_.tv_sec) +
              (static_cast<double>(t_val_.tv_usec) / 1000000.0));
    }

    /// \brief Get the current monotonic time in microseconds.
    static int64_t GetNowInUsec();

    /// \brief Set the time value to zero.
    void Zero();

    /// \brief Set the time value to the current monotonic time.
    ///
    /// \return  True on success, false otherwise.
    bool GetNow();

    inline gbn::Time operator+(const gbn::Time& time_to_add) const
    {
      timeval  ret_tval;
      timeradd(&t_val_, &time_to_add.t_val_, &ret_tval);
      return Time(ret_tval);
    }

    Time& operator+=(const Time& time_to_add);

    inline Time operator-(const Time& time_to_remove) const
    {
      timeval  ret_tval;
      timersub(&t_val_, &time_to_remove.t_val_, &ret_tval);
      return Time(ret_tval);
    }

    inline bool operator<(const Time& time_to_compare) const
    {
      return (timercmp(&t_val_, &time_to_compare.t_val_, <) != 0);
    }

    inline bool operator>(const Time& time_to_compare) const
    {
      return (timercmp(&t_val_, &time_to_compare.t_val_, >) != 0);
    }

    inline bool operator!=(const Time& time_to_compare) const
    {
      return (timercmp(&t_val_, &time_to_compare.t_val_, !=) != 0);
    }

    inline bool operator<=(const Time& time_to_compare) const
    {
      return (timercmp(&t_val_, &time_to_compare.t_val_, >) == 0);
    }

    inline bool operator>=(const Time& time_to_compare) const
    {
      return (timercmp(&t_val_, &time_to_compare.t_val_, <) == 0);
    }

    inline bool operator==(const Time& time_to_compare) const
    {
      return (timercmp(&t_val_, &time_to_compare.t_val_, !=) == 0);
    }

    inline Time& operator=(const Time& time_to_assign)
    {
      t_val_ = time_to_assign.t_val_;
      return *this;
    }

    /// \brief Multiply the Time by the provided floating point multiplier.
    ///
    /// \param  multiplier  The multiplier value.
    ///
    /// \return  Time object that results from multiplying this Time by the
    ///          multiplier.
    gbn::Time Multiply(double multiplier) const;

    /// \brief Check if the time value is zero or not.
    inline bool IsZero() const
    {
      return ((t_val_.tv_sec == 0) && (t_val_.tv_usec == 0));
    }

    /// \brief Check if the time value is infinite or not.
    inline bool IsInfinite() const
    {
      return (t_val_.tv_sec == std::numeric_limits<time_t>::max());
    }

    /// \brief Get the time in milliseconds.
    int64_t GetTimeInMsec() const;

    /// \brief Get the time in microseconds.
    int64_t GetTimeInUsec() const;

    private:

    /// The struct timeval that keeps the internal time representation.
    timeval  t_val_;

  }; // end class Time

} // namespace gbn

#endif // GBN_COMMON_ITIME_H
