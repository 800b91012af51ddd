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

/// \brief The GbnStream Timer header file.
///
/// Provides the GbnStream software with a single-threaded timer capability.

#ifndef GBN_COMMON_TIMER_H
#define GBN_COMMON_TIMER_H

#include "callback.h"
#include "itime.h"

#include <stdint.h>

namespace gbn
{

  class Timer;

  /// \brief A timer event.
  ///
  /// Allocated and managed by the Timer class only.
  struct TimerElem
  {
    TimerElem(uint32_t id, const Time& t)
        : handle_id(id), event_time(t), cb(NULL), prev(NULL), next(NULL)
    { }

    /// The handle identifier, or 0 if the element is not in use.
    uint32_t            handle_id;

    /// The absolute expiration time.
    Time                event_time;

    /// The cloned callback object.
    CallbackInterface*  cb;

    /// The previous element in the list.
    TimerElem*          prev;

    /// The next element in the list.
    TimerElem*          next;

  }; // end struct TimerElem

  /// \brief A timer capability for polled, single-threaded use.
  ///
  /// A timer is started by passing a relative duration and a callback object
  /// to StartTimer().  The callback object is cloned, so the caller may pass
  /// a stack object.  The owner of the Timer periodically calls
  /// GetNextExpirationTime() to learn how long it may block, and then calls
  /// DoCallbacks() to perform the callbacks for all expired timers.
  ///
  /// Each started timer is identified by a Handle.  Canceling a timer, or the
  /// timer firing, invalidates the handle, so a stale handle can never cancel
  /// or modify a newer timer, and a canceled timer never fires.
  ///
  /// This class is not thread-safe.  All methods must be called with the
  /// same lock held.
  class Timer
  {

   public:

    /// \brief A handle to a started timer event.
    class Handle
    {

     public:

      /// \brief The default constructor.
      Handle() : id_(0), elem_(NULL)
      { }

      /// \brief The copy constructor.
      Handle(const Handle& h) : id_(h.id_), elem_(h.elem_)
      { }

      /// \brief The destructor.
      virtual ~Handle()
      { }

      /// \brief Copy operator.
      Handle& operator=(const Handle& h)
      {
        id_   = h.id_;
        elem_ = h.elem_;
        return *this;
      }

      /// \brief Clear the handle.
      inline void Clear()
      {
        id_   = 0;
        elem_ = NULL;
      }

     private:

      friend class Timer;

      /// The handle identifier.
      uint32_t    id_;

      /// The timer element.
      TimerElem*  elem_;

    }; // end class Handle

    /// \brief The default constructor.
    Timer();

    /// \brief The destructor.
    ///
    /// Cancels all outstanding timers.
    virtual ~Timer();

    /// \brief Start a timer.
    ///
    /// \param  delta_time  The duration from now until the callback.
    /// \param  cb          The callback object, which is cloned.
    /// \param  handle      The handle that is set for the timer event.
    ///
    /// \return  True on success, false otherwise.
    bool StartTimer(const Time& delta_time, CallbackInterface* cb,
                    Handle& handle);

    /// \brief Change the expiration time of a timer.
    ///
    /// \param  delta_time  The new duration from now until the callback.
    /// \param  handle      The handle of the timer event.
    ///
    /// \return  True if the timer was still pending and has been modified.
    bool ModifyTimer(const Time& delta_time, Handle& handle);

    /// \brief Check if a timer is still pending.
    ///
    /// \param  handle  The handle of the timer event.
    ///
    /// \return  True if the timer has neither fired nor been canceled.
    bool IsTimerSet(const Handle& handle) const;

    /// \brief Cancel a timer.
    ///
    /// The handle is always cleared.
    ///
    /// \param  handle  The handle of the timer event.
    ///
    /// \return  True if a pending timer was canceled.
    bool CancelTimer(Handle& handle);

    /// \brief Cancel all pending timers.
    void CancelAllTimers();

    /// \brief Get the time until the next timer expires.
    ///
    /// \param  max_wait  The maximum amount of time that can be returned.
    ///
    /// \return  The time until the next expiration, limited to max_wait.
    ///          Zero if a timer has already expired.
    Time GetNextExpirationTime(const Time& max_wait);

    /// \brief Perform the callbacks for all expired timers.
    void DoCallbacks();

   private:

    /// \brief Copy constructor.
    Timer(const Timer& other);

    /// \brief Copy operator.
    Timer& operator=(const Timer& other);

    /// \brief Unlink an element from the event list and return it to the
    /// pool.
    ///
    /// \param  te  The element to be recycled.
    void Recycle(TimerElem* te);

    /// \brief Find the event that will expire next.
    ///
    /// \return  True if there is a next event.
    bool FindNextEvent();

    /// The next handle identifier to assign.  Never zero.
    uint32_t    next_handle_;

    /// The head of the event list.
    TimerElem*  events_head_;

    /// The tail of the event list.
    TimerElem*  events_tail_;

    /// The cached next event, or NULL if it must be searched for.
    TimerElem*  next_event_;

    /// The pool of unused elements.
    TimerElem*  pool_;

  }; // end class Timer

} // namespace gbn

#endif // GBN_COMMON_TIMER_H
