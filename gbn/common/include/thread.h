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

///
/// Provides the GbnStream software with a simple class to streamline the
/// threading of an object.
///

#ifndef GBN_COMMON_THREAD_H
#define GBN_COMMON_THREAD_H

#include "runnable_if.h"

#include <pthread.h>

//
// Definition of function type for execution within a thread.
//
typedef void* runner_t(void*);

namespace gbn
{

  ///
  /// A simple class to streamline the threading of an object.
  ///
  /// Threads are started either with a static function conforming to the
  /// runner_t signature or with an object implementing RunnableIf.  Threads
  /// are joinable.  The owner asks the threaded object to return from its
  /// run method (for example by setting a stop flag) and then calls
  /// JoinThread() to wait for it.
  ///
  /// \code
  ///   class GbnReceiver : public RunnableIf
  ///   {
  ///     public:
  ///
  ///     void Start()
  ///     {
  ///       thread_.StartThread(this);
  ///     }
  ///
  ///     void Run()
  ///     {
  ///       while (!closed_)
  ///       {
  ///         ...
  ///       }
  ///     }
  ///
  ///     void Close()
  ///     {
  ///       closed_ = true;
  ///       thread_.JoinThread();
  ///     }
  ///
  ///     private:
  ///     Thread  thread_;
  ///   };
  /// \endcode
  ///
  class Thread
  {
    public:

    ///
    /// Default no-arg constructor.
    ///
    Thread();

    ///
    /// Destructor.  The thread must have been joined already.
    ///
    virtual ~Thread();

    ///
    /// Start a thread. This will launch the thread executing against the
    /// provided static runner_t method with the provided argument.
    ///
    /// \param  fn   The static runner_t method that will be called inside the
    ///              new thread.
    /// \param  arg  The argument passed to the static runner_t method.
    ///
    /// \return true if successful, false if an error occurs.
    ///
    bool StartThread(runner_t* fn, void* arg);

    ///
    /// Start a thread. This will launch a thread executing against the
    /// gbn::RunnableIf object's run method.
    ///
    /// \param  object  The runnable object to execute.
    ///
    /// \return true if successful, false if an error occurs.
    ///
    bool StartThread(gbn::RunnableIf* object);

    ///
    /// Wait for the thread to return.  Must not be called from the thread
    /// itself.
    ///
    /// \return true if the thread was joined, false if it was not running or
    ///         an error occurs.
    ///
    bool JoinThread();

    ///
    /// Check if the thread has been started and not yet joined.
    ///
    /// \return true if the thread is running.
    ///
    inline bool IsRunning() const
    {
      return is_running_;
    }

    private:

    /// Copy Constructor.
    Thread(const Thread& other);

    /// Copy operator.
    Thread& operator=(const Thread& other);

    ///
    /// The static routine that binds the thread to the abstract run method on
    /// a gbn::RunnableIf object.
    ///
    static void* Run(void* arg);

    ///
    /// The thread. Not valid when is_running_ is false.
    ///
    pthread_t  thread_;

    ///
    /// A flag for recording if the thread is currently running.
    ///
    bool       is_running_;

  }; // end class Thread

} // namespace gbn

#endif // GBN_COMMON_THREAD_H
