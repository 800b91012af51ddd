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

#include "config_info.h"
#include "frame_reassembly_buffer.h"
#include "itime.h"
#include "log.h"
#include "playback_buffer.h"
#include "playback_scheduler.h"
#include "qoe_metrics.h"
#include "recording_display.h"

#include <string>
#include <vector>

#include <unistd.h>

using ::gbn::ConfigInfo;
using ::gbn::FrameReassemblyBuffer;
using ::gbn::Log;
using ::gbn::PlaybackBuffer;
using ::gbn::PlaybackScheduler;
using ::gbn::QoeMetrics;
using ::gbn::QoeStats;
using ::gbn::RecordingDisplay;
using ::gbn::Time;
using ::std::vector;

namespace
{
  /// The playback rate used by most tests.
  const double  kFps = 100.0;
}

//============================================================================
class PlaybackSchedulerTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(PlaybackSchedulerTest);

  CPPUNIT_TEST(TestDisplayInOrder);
  CPPUNIT_TEST(TestEndOfStreamWithBufferedFrames);
  CPPUNIT_TEST(TestStallAndRecover);
  CPPUNIT_TEST(TestEndOfStreamDuringStall);
  CPPUNIT_TEST(TestMissingFrameAfterEndOfStream);
  CPPUNIT_TEST(TestStopDuringStall);
  CPPUNIT_TEST(TestPassOverRefusedFrame);
  CPPUNIT_TEST(TestEvictsPartialFrames);
  CPPUNIT_TEST(TestConfiguration);

  CPPUNIT_TEST_SUITE_END();

  PlaybackBuffer*         playback;
  FrameReassemblyBuffer*  reassembly;
  QoeMetrics*             metrics;
  RecordingDisplay*       display;
  PlaybackScheduler*      scheduler;

  //==========================================================================
  void InsertFrame(uint32_t fid)
  {
    vector<uint8_t>  frame(3, static_cast<uint8_t>(fid));

    playback->Insert(fid, frame);
  }

  //==========================================================================
  void MakeScheduler(size_t capacity, double fps, uint32_t start_id)
  {
    playback  = new PlaybackBuffer(capacity);
    scheduler = new PlaybackScheduler(*playback, *reassembly, *metrics,
                                      display);

    CPPUNIT_ASSERT(scheduler->Configure(fps, start_id, 2));
  }

 public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");

    reassembly = new FrameReassemblyBuffer();
    metrics    = new QoeMetrics();
    display    = new RecordingDisplay();
    playback   = NULL;
    scheduler  = NULL;
  }

  //==========================================================================
  void tearDown()
  {
    delete scheduler;
    delete playback;
    delete display;
    delete metrics;
    delete reassembly;

    scheduler  = NULL;
    playback   = NULL;
    display    = NULL;
    metrics    = NULL;
    reassembly = NULL;

    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void TestDisplayInOrder()
  {
    MakeScheduler(16, kFps, 0);

    for (uint32_t fid = 0; fid < 5; ++fid)
    {
      InsertFrame(fid);
    }

    scheduler->NotifyEndOfStream();

    Time  start = Time::Now();

    CPPUNIT_ASSERT(scheduler->Start());
    CPPUNIT_ASSERT(scheduler->WaitUntilStopped(Time::FromMsec(5000)));
    CPPUNIT_ASSERT(scheduler->GetState() == gbn::PLAYBACK_STOPPED);

    vector<uint32_t>  ids = display->GetFrameIds();

    CPPUNIT_ASSERT(ids.size() == 5);

    for (uint32_t i = 0; i < 5; ++i)
    {
      CPPUNIT_ASSERT(ids[i] == i);
    }

    // Five frames at 100 fps take at least four intervals.
    vector<RecordingDisplay::Record>  records = display->GetRecords();

    CPPUNIT_ASSERT((records[4].display_time - start) >=
                   Time::FromMsec(35));

    QoeStats  stats = metrics->GetStats();

    CPPUNIT_ASSERT(stats.frames_displayed == 5);
    CPPUNIT_ASSERT(stats.dropped_frames == 0);
    CPPUNIT_ASSERT(stats.stall_count == 0);
  }

  //==========================================================================
  void TestEndOfStreamWithBufferedFrames()
  {
    MakeScheduler(16, kFps, 7);

    InsertFrame(7);
    InsertFrame(8);
    scheduler->NotifyEndOfStream();

    Time  start = Time::Now();

    CPPUNIT_ASSERT(scheduler->Start());
    CPPUNIT_ASSERT(scheduler->WaitUntilStopped(Time::FromMsec(5000)));

    // No waiting for frame 9.
    CPPUNIT_ASSERT((Time::Now() - start) < Time::FromMsec(1000));

    vector<uint32_t>  ids = display->GetFrameIds();

    CPPUNIT_ASSERT(ids.size() == 2);
    CPPUNIT_ASSERT(ids[0] == 7);
    CPPUNIT_ASSERT(ids[1] == 8);
    CPPUNIT_ASSERT(scheduler->expected_frame_id() == 9);
    CPPUNIT_ASSERT(metrics->GetStats().dropped_frames == 0);
  }

  //==========================================================================
  void TestStallAndRecover()
  {
    MakeScheduler(16, 50.0, 0);

    CPPUNIT_ASSERT(scheduler->Start());

    usleep(150000);

    CPPUNIT_ASSERT(scheduler->GetState() == gbn::PLAYBACK_STALLING);
    CPPUNIT_ASSERT(display->NumFrames() == 0);

    InsertFrame(0);

    CPPUNIT_ASSERT(display->WaitForFrames(1, Time::FromMsec(2000)));

    // Frame 1 never arrives, so the scheduler stalls again.
    usleep(150000);

    CPPUNIT_ASSERT(scheduler->GetState() == gbn::PLAYBACK_STALLING);

    scheduler->NotifyEndOfStream();

    CPPUNIT_ASSERT(scheduler->WaitUntilStopped(Time::FromMsec(5000)));

    QoeStats  stats = metrics->GetStats();

    CPPUNIT_ASSERT(stats.frames_displayed == 1);
    CPPUNIT_ASSERT(stats.stall_count >= 2);
    CPPUNIT_ASSERT(stats.stall_time_seconds >= 0.15);
    CPPUNIT_ASSERT(stats.dropped_frames == 1);
  }

  //==========================================================================
  void TestEndOfStreamDuringStall()
  {
    MakeScheduler(16, 50.0, 0);

    CPPUNIT_ASSERT(scheduler->Start());

    usleep(200000);

    CPPUNIT_ASSERT(scheduler->GetState() == gbn::PLAYBACK_STALLING);

    scheduler->NotifyEndOfStream();

    CPPUNIT_ASSERT(scheduler->WaitUntilStopped(Time::FromMsec(5000)));
    CPPUNIT_ASSERT(scheduler->GetState() == gbn::PLAYBACK_STOPPED);

    // The frame waited on when the stream ended is dropped.
    QoeStats  stats = metrics->GetStats();

    CPPUNIT_ASSERT(stats.frames_displayed == 0);
    CPPUNIT_ASSERT(stats.dropped_frames == 1);
    CPPUNIT_ASSERT(stats.stall_count == 1);
    CPPUNIT_ASSERT(stats.stall_time_seconds > 0.0);
    CPPUNIT_ASSERT(display->NumFrames() == 0);
  }

  //==========================================================================
  void TestMissingFrameAfterEndOfStream()
  {
    MakeScheduler(16, kFps, 0);

    InsertFrame(0);
    InsertFrame(2);
    scheduler->NotifyEndOfStream();

    CPPUNIT_ASSERT(scheduler->Start());
    CPPUNIT_ASSERT(scheduler->WaitUntilStopped(Time::FromMsec(5000)));

    vector<uint32_t>  ids = display->GetFrameIds();

    CPPUNIT_ASSERT(ids.size() == 2);
    CPPUNIT_ASSERT(ids[0] == 0);
    CPPUNIT_ASSERT(ids[1] == 2);

    QoeStats  stats = metrics->GetStats();

    CPPUNIT_ASSERT(stats.dropped_frames == 1);
    CPPUNIT_ASSERT(stats.stall_count == 0);
  }

  //==========================================================================
  void TestStopDuringStall()
  {
    MakeScheduler(16, kFps, 0);

    CPPUNIT_ASSERT(scheduler->Start());

    usleep(100000);

    CPPUNIT_ASSERT(scheduler->GetState() == gbn::PLAYBACK_STALLING);

    Time  start = Time::Now();

    scheduler->Stop();

    CPPUNIT_ASSERT((Time::Now() - start) < Time::FromMsec(500));
    CPPUNIT_ASSERT(scheduler->GetState() == gbn::PLAYBACK_STOPPED);

    QoeStats  stats = metrics->GetStats();

    CPPUNIT_ASSERT(stats.dropped_frames == 0);
    CPPUNIT_ASSERT(stats.stall_count == 1);
    CPPUNIT_ASSERT(stats.stall_time_seconds > 0.0);
  }

  //==========================================================================
  void TestPassOverRefusedFrame()
  {
    MakeScheduler(1, kFps, 0);

    InsertFrame(0);
    InsertFrame(1);
    scheduler->NotifyEndOfStream();

    CPPUNIT_ASSERT(scheduler->Start());
    CPPUNIT_ASSERT(scheduler->WaitUntilStopped(Time::FromMsec(5000)));

    vector<uint32_t>  ids = display->GetFrameIds();

    CPPUNIT_ASSERT(ids.size() == 1);
    CPPUNIT_ASSERT(ids[0] == 0);

    // The refused frame is counted where it is refused, not here.
    QoeStats  stats = metrics->GetStats();

    CPPUNIT_ASSERT(stats.dropped_frames == 0);
    CPPUNIT_ASSERT(stats.stall_count == 0);
  }

  //==========================================================================
  void TestEvictsPartialFrames()
  {
    MakeScheduler(16, kFps, 0);

    uint8_t  data = 0;

    CPPUNIT_ASSERT(reassembly->AddChunk(0, 0, 3, &data, 1));
    CPPUNIT_ASSERT(reassembly->AddChunk(10, 0, 3, &data, 1));

    for (uint32_t fid = 0; fid < 5; ++fid)
    {
      InsertFrame(fid);
    }

    scheduler->NotifyEndOfStream();

    CPPUNIT_ASSERT(scheduler->Start());
    CPPUNIT_ASSERT(scheduler->WaitUntilStopped(Time::FromMsec(5000)));

    // Frames below 5 - 2 are evicted.
    CPPUNIT_ASSERT(reassembly->NumFrames() == 1);
    CPPUNIT_ASSERT(!reassembly->IsComplete(0));
  }

  //==========================================================================
  void TestConfiguration()
  {
    MakeScheduler(16, kFps, 0);

    CPPUNIT_ASSERT(!scheduler->Configure(0.0, 0, 10));
    CPPUNIT_ASSERT(!scheduler->Configure(-5.0, 0, 10));

    ConfigInfo  ci;

    ci.Add("Stream.Fps", "25");
    ci.Add("Stream.StartFrameId", "42");
    ci.Add("Stream.EvictLagFrames", "3");

    CPPUNIT_ASSERT(scheduler->Initialize(ci));
    CPPUNIT_ASSERT(scheduler->expected_frame_id() == 42);
    CPPUNIT_ASSERT(scheduler->GetState() == gbn::PLAYBACK_RUNNING);

    CPPUNIT_ASSERT(scheduler->Start());
    CPPUNIT_ASSERT(!scheduler->Start());
    CPPUNIT_ASSERT(!scheduler->Configure(30.0, 0, 10));

    scheduler->Stop();

    CPPUNIT_ASSERT(scheduler->GetState() == gbn::PLAYBACK_STOPPED);
    CPPUNIT_ASSERT(gbn::PlaybackStateToString(gbn::PLAYBACK_STALLING) ==
                   std::string("STALLING"));
  }
};

CPPUNIT_TEST_SUITE_REGISTRATION(PlaybackSchedulerTest);
