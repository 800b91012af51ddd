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

#include "itime.h"

#include <unistd.h>

using ::gbn::Time;


//============================================================================
class TimeTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(TimeTest);

  CPPUNIT_TEST(TestConversions);
  CPPUNIT_TEST(TestNegativeTimes);
  CPPUNIT_TEST(TestArithmetic);
  CPPUNIT_TEST(TestNow);
  CPPUNIT_TEST(TestToString);

  CPPUNIT_TEST_SUITE_END();

public:

  //==========================================================================
  void setUp()
  {
  }

  //==========================================================================
  void tearDown()
  {
  }

  //==========================================================================
  void TestConversions()
  {
    CPPUNIT_ASSERT(Time::FromSec(3).GetTimeInMsec() == 3000);
    CPPUNIT_ASSERT(Time::FromMsec(1500).GetTimeInUsec() == 1500000);
    CPPUNIT_ASSERT(Time::FromUsec(2500001).GetTimeInUsec() == 2500001);
    CPPUNIT_ASSERT(Time(0.5) == Time::FromMsec(500));
    CPPUNIT_ASSERT(Time(1.9999999) == Time::FromSec(2));
    CPPUNIT_ASSERT(Time::FromMsec(250).ToDouble() == 0.25);

    timespec  ts;
    ts.tv_sec  = 1;
    ts.tv_nsec = 999999600;
    CPPUNIT_ASSERT(Time(ts) == Time::FromSec(2));

    Time  t = Time::FromMsec(1250);
    CPPUNIT_ASSERT(t.ToTspec().tv_sec == 1);
    CPPUNIT_ASSERT(t.ToTspec().tv_nsec == 250000000);

    CPPUNIT_ASSERT(Time().IsZero());
    CPPUNIT_ASSERT(Time::Infinite().IsInfinite());
    CPPUNIT_ASSERT(Time::Infinite() > Time::FromSec(1000000));
  }

  //==========================================================================
  void TestNegativeTimes()
  {
    Time  t = Time::FromMsec(-1000);

    CPPUNIT_ASSERT(t.ToTval().tv_sec == -1);
    CPPUNIT_ASSERT(t.ToTval().tv_usec == 0);
    CPPUNIT_ASSERT(t.GetTimeInMsec() == -1000);

    t = Time::FromUsec(-10700000);
    CPPUNIT_ASSERT(t.ToTval().tv_sec == -11);
    CPPUNIT_ASSERT(t.ToTval().tv_usec == 300000);
    CPPUNIT_ASSERT(t.GetTimeInUsec() == -10700000);

    CPPUNIT_ASSERT((Time::FromMsec(100) - Time::FromMsec(300)) ==
                   Time::FromMsec(-200));
  }

  //==========================================================================
  void TestArithmetic()
  {
    Time  a = Time::FromMsec(700);
    Time  b = Time::FromMsec(600);

    CPPUNIT_ASSERT((a + b) == Time::FromMsec(1300));
    CPPUNIT_ASSERT((a - b) == Time::FromMsec(100));
    CPPUNIT_ASSERT(a > b);
    CPPUNIT_ASSERT(b < a);
    CPPUNIT_ASSERT(a >= a);
    CPPUNIT_ASSERT(a <= a);
    CPPUNIT_ASSERT(a != b);

    a += b;
    CPPUNIT_ASSERT(a == Time::FromMsec(1300));

    CPPUNIT_ASSERT(Time::FromSec(1).Multiply(0.5) == Time::FromMsec(500));
    CPPUNIT_ASSERT(Time::Max(a, b) == a);
    CPPUNIT_ASSERT(Time::Min(a, b) == b);

    Time  z = a;
    z.Zero();
    CPPUNIT_ASSERT(z.IsZero());
  }

  //==========================================================================
  void TestNow()
  {
    Time  t1 = Time::Now();

    usleep(10000);

    Time  t2;
    CPPUNIT_ASSERT(t2.GetNow());
    CPPUNIT_ASSERT(t2 > t1);
    CPPUNIT_ASSERT((t2 - t1) >= Time::FromMsec(10));
    CPPUNIT_ASSERT(Time::GetNowInUsec() >= t2.GetTimeInUsec());
  }

  //==========================================================================
  void TestToString()
  {
    CPPUNIT_ASSERT(Time::FromMsec(1500).ToString() == "1.500000s");
    CPPUNIT_ASSERT(Time::FromMsec(-1500).ToString() == "-1.500000s");
    CPPUNIT_ASSERT(Time::FromMsec(-500).ToString() == "-0.500000s");
    CPPUNIT_ASSERT(Time::FromSec(-2).ToString() == "-2.000000s");
  }

}; // end class TimeTest

CPPUNIT_TEST_SUITE_REGISTRATION(TimeTest);
