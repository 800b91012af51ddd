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

#include <cppunit/extensions/HelperMacros.h>

#include "log.h"
#include "runnable_if.h"
#include "scoped_lock.h"
#include "thread.h"

#include <pthread.h>

using ::gbn::Log;
using ::gbn::RunnableIf;
using ::gbn::ScopedLock;
using ::gbn::Thread;


/// A runnable that increments a shared counter under a lock.
class Incrementer : public RunnableIf
{

 public:

  Incrementer(pthread_mutex_t* m, int* c, int n)
      : mutex(m), counter(c), iterations(n)
  { }

  virtual ~Incrementer()
  { }

  void Run()
  {
    for (int i = 0; i < iterations; ++i)
    {
      ScopedLock  lock(mutex);
      ++(*counter);
    }
  }

  pthread_mutex_t*  mutex;
  int*              counter;
  int               iterations;
};

/// A static runner_t function.
static void* SetFlag(void* arg)
{
  *static_cast<bool*>(arg) = true;
  return NULL;
}

//============================================================================
class ThreadTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(ThreadTest);

  CPPUNIT_TEST(TestRunnable);
  CPPUNIT_TEST(TestStaticRunner);
  CPPUNIT_TEST(TestJoinErrors);

  CPPUNIT_TEST_SUITE_END();

public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");
  }

  //==========================================================================
  void tearDown()
  {
    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void TestRunnable()
  {
    pthread_mutex_t  mutex;
    int              counter = 0;

    pthread_mutex_init(&mutex, NULL);

    Incrementer  inc1(&mutex, &counter, 10000);
    Incrementer  inc2(&mutex, &counter, 10000);
    Thread       t1;
    Thread       t2;

    CPPUNIT_ASSERT(t1.StartThread(&inc1));
    CPPUNIT_ASSERT(t2.StartThread(&inc2));
    CPPUNIT_ASSERT(t1.IsRunning());

    CPPUNIT_ASSERT(t1.JoinThread());
    CPPUNIT_ASSERT(t2.JoinThread());
    CPPUNIT_ASSERT(!t1.IsRunning());

    CPPUNIT_ASSERT(counter == 20000);

    pthread_mutex_destroy(&mutex);
  }

  //==========================================================================
  void TestStaticRunner()
  {
    bool    flag = false;
    Thread  t;

    CPPUNIT_ASSERT(t.StartThread(SetFlag, &flag));
    CPPUNIT_ASSERT(t.JoinThread());
    CPPUNIT_ASSERT(flag);
  }

  //==========================================================================
  void TestJoinErrors()
  {
    Thread  t;

    CPPUNIT_ASSERT(!t.JoinThread());
    CPPUNIT_ASSERT(!t.StartThread(static_cast<RunnableIf*>(NULL)));
    CPPUNIT_ASSERT(!t.StartThread(NULL, NULL));
  }

}; // end class ThreadTest

CPPUNIT_TEST_SUITE_REGISTRATION(ThreadTest);
