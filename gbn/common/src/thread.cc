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

#include "thread.h"
#include "log.h"

#include <cerrno>
#include <csignal>
#include <cstring>

using ::gbn::Thread;
using ::gbn::RunnableIf;

//
// Class name used for logging.
//
static const char  kCn[] = "Thread";

//============================================================================
Thread::Thread() : thread_(), is_running_(false)
{
}

//============================================================================
Thread::~Thread()
{
  if (is_running_)
  {
    LogW(kCn, __func__, "Thread destroyed while still running, joining.\n");
    JoinThread();
  }
}

//============================================================================
bool Thread::StartThread(runner_t* fn, void* arg)
{
  if (fn == NULL)
  {
    LogE(kCn, __func__, "Null function pointer provided.\n");
    return false;
  }

  if (is_running_)
  {
    LogW(kCn, __func__, "Thread is already running.\n");
    return true;
  }

  int  err = pthread_create(&thread_, NULL, fn, arg);

  if (err != 0)
  {
    LogE(kCn, __func__, "pthread_create error: %s\n", strerror(err));
    return false;
  }

  LogD(kCn, __func__, "Thread created.\n");

  is_running_ = true;

  return true;
}

//============================================================================
bool Thread::StartThread(gbn::RunnableIf* object)
{
  if (object == NULL)
  {
    LogE(kCn, __func__, "Null runnable provided.\n");
    return false;
  }

  return StartThread(Thread::Run, object);
}

//============================================================================
bool Thread::JoinThread()
{
  if (!is_running_)
  {
    return false;
  }

  if (pthread_equal(thread_, pthread_self()) != 0)
  {
    LogE(kCn, __func__, "Thread cannot join itself.\n");
    return false;
  }

  int  err = pthread_join(thread_, NULL);

  is_running_ = false;

  if (err != 0)
  {
    LogE(kCn, __func__, "pthread_join error: %s\n", strerror(err));
    return false;
  }

  LogD(kCn, __func__, "Thread joined.\n");

  return true;
}

//============================================================================
void* Thread::Run(void* arg)
{
  RunnableIf*  runnable = static_cast<RunnableIf*>(arg);

  //
  // Block the SIGINT and SIGTERM signals in this thread, so they are handled
  // by the main thread.
  //

  sigset_t  blocked_signals;
  sigemptyset(&blocked_signals);
  sigaddset(&blocked_signals, SIGINT);
  sigaddset(&blocked_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &blocked_signals, NULL);

  runnable->Run();

  return NULL;
}
