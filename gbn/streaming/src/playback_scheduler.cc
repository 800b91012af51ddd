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

/// \brief The GbnStream playback scheduler source file.

#include "playback_scheduler.h"

#include "log.h"
#include "scoped_lock.h"
#include "unused.h"

#include <cerrno>
#include <cstring>

#include <inttypes.h>

using ::gbn::ConfigInfo;
using ::gbn::FrameDisplayIf;
using ::gbn::FrameReassemblyBuffer;
using ::gbn::PlaybackBuffer;
using ::gbn::PlaybackScheduler;
using ::gbn::PlaybackState;
using ::gbn::QoeMetrics;
using ::gbn::ScopedLock;
using ::gbn::Time;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*     UNUSED(kClassName)       = "PlaybackScheduler";

  /// The default playback frame rate.
  const double    kDefaultFps              = 30.0;

  /// The default first frame id.
  const uint32_t  kDefaultStartFrameId     = 0;

  /// The default eviction lag, in frames.
  const uint32_t  kDefaultEvictLag         = 10;

  /// The longest grace period for a late frame.
  const int64_t   kMaxGraceMs              = 50;

  /// The polling interval of all playback waits.  Bounds the time Stop()
  /// takes.
  const int64_t   kPollIntervalMs          = 10;
}

//============================================================================
const char* gbn::PlaybackStateToString(PlaybackState state)
{
  switch (state)
  {
    case PLAYBACK_RUNNING:
      return "RUNNING";

    case PLAYBACK_STALLING:
      return "STALLING";

    case PLAYBACK_STOPPED:
      return "STOPPED";
  }

  return "UNKNOWN";
}

//============================================================================
PlaybackScheduler::PlaybackScheduler(PlaybackBuffer& playback,
                                     FrameReassemblyBuffer& reassembly,
                                     QoeMetrics& metrics,
                                     FrameDisplayIf* display)
    : playback_(playback),
      reassembly_(reassembly),
      metrics_(metrics),
      display_(display),
      frame_interval_(),
      grace_(),
      start_frame_id_(kDefaultStartFrameId),
      evict_lag_(kDefaultEvictLag),
      expected_frame_id_(kDefaultStartFrameId),
      state_(PLAYBACK_RUNNING),
      eos_(false),
      started_(false),
      stop_requested_(false),
      thread_(),
      mutex_(),
      cond_()
{
  pthread_mutex_init(&mutex_, NULL);

  pthread_condattr_t  attr;
  pthread_condattr_init(&attr);

  if (pthread_condattr_setclock(&attr, CLOCK_MONOTONIC) != 0)
  {
    LogF(kClassName, __func__, "Unable to use the monotonic clock for "
         "condition variables.\n");
  }

  pthread_cond_init(&cond_, &attr);
  pthread_condattr_destroy(&attr);

  Configure(kDefaultFps, kDefaultStartFrameId, kDefaultEvictLag);
}

//============================================================================
PlaybackScheduler::~PlaybackScheduler()
{
  Stop();

  pthread_cond_destroy(&cond_);
  pthread_mutex_destroy(&mutex_);
}

//============================================================================
bool PlaybackScheduler::Initialize(const ConfigInfo& ci)
{
  double    fps       = ci.GetDouble("Stream.Fps", kDefaultFps);
  uint32_t  start_id  = ci.GetUint("Stream.StartFrameId",
                                   kDefaultStartFrameId);
  uint32_t  evict_lag = ci.GetUint("Stream.EvictLagFrames", kDefaultEvictLag);

  return Configure(fps, start_id, evict_lag);
}

//============================================================================
bool PlaybackScheduler::Configure(double fps, uint32_t start_frame_id,
                                  uint32_t evict_lag)
{
  if (!(fps > 0.0))
  {
    LogE(kClassName, __func__, "Invalid frame rate %f.\n", fps);
    return false;
  }

  ScopedLock  lock(&mutex_);

  if (started_)
  {
    LogE(kClassName, __func__, "Cannot configure a started scheduler.\n");
    return false;
  }

  frame_interval_    = Time(1.0 / fps);
  grace_             = Time::Min(Time::FromMsec(kMaxGraceMs),
                                 frame_interval_.Multiply(0.5));
  start_frame_id_    = start_frame_id;
  evict_lag_         = evict_lag;
  expected_frame_id_ = start_frame_id;

  LogD(kClassName, __func__, "Frame interval %s, grace %s, start frame %"
       PRIu32 ", eviction lag %" PRIu32 ".\n",
       frame_interval_.ToString().c_str(), grace_.ToString().c_str(),
       start_frame_id_, evict_lag_);

  return true;
}

//============================================================================
bool PlaybackScheduler::Start()
{
  {
    ScopedLock  lock(&mutex_);

    if (started_)
    {
      LogE(kClassName, __func__, "Scheduler already started.\n");
      return false;
    }

    started_ = true;
  }

  if (!thread_.StartThread(this))
  {
    LogE(kClassName, __func__, "Unable to start the playback thread.\n");

    ScopedLock  lock(&mutex_);
    started_ = false;
    return false;
  }

  LogI(kClassName, __func__, "Playback started at frame %" PRIu32
       ", interval %s.\n", start_frame_id_,
       frame_interval_.ToString().c_str());

  return true;
}

//============================================================================
void PlaybackScheduler::Stop()
{
  {
    ScopedLock  lock(&mutex_);

    stop_requested_ = true;
    pthread_cond_broadcast(&cond_);
  }

  playback_.Wakeup();

  if (thread_.IsRunning())
  {
    thread_.JoinThread();
  }

  SetState(PLAYBACK_STOPPED);
}

//============================================================================
bool PlaybackScheduler::WaitUntilStopped(const Time& max_wait)
{
  ScopedLock  lock(&mutex_);

  timespec  deadline = (Time::Now() + max_wait).ToTspec();

  while (state_ != PLAYBACK_STOPPED)
  {
    int  rv = pthread_cond_timedwait(&cond_, &mutex_, &deadline);

    if (rv == ETIMEDOUT)
    {
      break;
    }

    if (rv != 0)
    {
      LogW(kClassName, __func__, "pthread_cond_timedwait() error: %s\n",
           strerror(rv));
      break;
    }
  }

  return (state_ == PLAYBACK_STOPPED);
}

//============================================================================
void PlaybackScheduler::NotifyEndOfStream()
{
  {
    ScopedLock  lock(&mutex_);

    if (eos_)
    {
      return;
    }

    eos_ = true;
    pthread_cond_broadcast(&cond_);
  }

  LogI(kClassName, __func__, "End of stream observed.\n");

  playback_.Wakeup();
}

//============================================================================
PlaybackState PlaybackScheduler::GetState() const
{
  ScopedLock  lock(&mutex_);

  return state_;
}

//============================================================================
uint32_t PlaybackScheduler::expected_frame_id() const
{
  ScopedLock  lock(&mutex_);

  return expected_frame_id_;
}

//============================================================================
void PlaybackScheduler::Run()
{
  uint32_t  frame_id;
  Time      next_display_time = Time::Now();

  {
    ScopedLock  lock(&mutex_);
    frame_id = expected_frame_id_;
  }

  LogD(kClassName, __func__, "Playback thread running.\n");

  while (WaitUntil(next_display_time))
  {
    CycleResult  result = PlayFrame(frame_id);

    if (result == CYCLE_CANCELLED)
    {
      break;
    }

    ++frame_id;
    next_display_time += frame_interval_;

    {
      ScopedLock  lock(&mutex_);
      expected_frame_id_ = frame_id;
    }

    if (frame_id >= evict_lag_)
    {
      reassembly_.EvictBefore(frame_id - evict_lag_);
    }

    playback_.DiscardBefore(frame_id);

    if (IsEndOfStream() && playback_.IsEmpty())
    {
      LogI(kClassName, __func__, "End of stream reached after frame %"
           PRIu32 ".\n", (frame_id - 1));
      break;
    }
  }

  SetState(PLAYBACK_STOPPED);

  LogI(kClassName, __func__, "Playback stopped: %s\n",
       metrics_.ToString().c_str());
}

//============================================================================
bool PlaybackScheduler::WaitUntil(const Time& display_time)
{
  ScopedLock  lock(&mutex_);

  while (!stop_requested_)
  {
    Time  now = Time::Now();

    if (now >= display_time)
    {
      return true;
    }

    Time      wait     = Time::Min(display_time - now,
                                   Time::FromMsec(kPollIntervalMs));
    timespec  deadline = (now + wait).ToTspec();
    int       rv       = pthread_cond_timedwait(&cond_, &mutex_, &deadline);

    if ((rv != 0) && (rv != ETIMEDOUT))
    {
      LogW(kClassName, __func__, "pthread_cond_timedwait() error: %s\n",
           strerror(rv));
    }
  }

  return false;
}

//============================================================================
PlaybackScheduler::CycleResult PlaybackScheduler::PlayFrame(uint32_t frame_id)
{
  vector<uint8_t>            frame;
  PlaybackBuffer::PopResult  rv = playback_.Pop(frame_id, frame);

  if (rv == PlaybackBuffer::POP_ABSENT)
  {
    rv = playback_.WaitAndPop(frame_id, frame, grace_);
  }

  if (rv == PlaybackBuffer::POP_OK)
  {
    Display(frame_id, frame);
    return CYCLE_DISPLAYED;
  }

  if (rv == PlaybackBuffer::POP_SKIPPED)
  {
    LogD(kClassName, __func__, "Passing over frame %" PRIu32 ", refused by "
         "the full playback buffer.\n", frame_id);
    return CYCLE_SKIPPED;
  }

  if (IsStopRequested())
  {
    return CYCLE_CANCELLED;
  }

  if (IsEndOfStream())
  {
    LogD(kClassName, __func__, "Frame %" PRIu32 " missing after end of "
         "stream, dropped.\n", frame_id);
    metrics_.IncrementDroppedFrames();
    return CYCLE_DROPPED;
  }

  return Stall(frame_id);
}

//============================================================================
PlaybackScheduler::CycleResult PlaybackScheduler::Stall(uint32_t frame_id)
{
  Time         stall_start = Time::Now();
  CycleResult  result      = CYCLE_CANCELLED;

  SetState(PLAYBACK_STALLING);
  metrics_.IncrementStallCount();

  LogD(kClassName, __func__, "Stalled waiting for frame %" PRIu32 ".\n",
       frame_id);

  vector<uint8_t>  frame;

  while (!IsStopRequested())
  {
    PlaybackBuffer::PopResult  rv = playback_.WaitAndPop(
      frame_id, frame, Time::FromMsec(kPollIntervalMs));

    if (rv == PlaybackBuffer::POP_OK)
    {
      result = CYCLE_DISPLAYED;
      break;
    }

    if (rv == PlaybackBuffer::POP_SKIPPED)
    {
      result = CYCLE_SKIPPED;
      break;
    }

    // No frame can arrive after the end of the stream.
    if (IsEndOfStream())
    {
      metrics_.IncrementDroppedFrames();
      result = CYCLE_DROPPED;
      break;
    }
  }

  Time  stall_duration = Time::Now() - stall_start;

  metrics_.AddStallTime(stall_duration);

  LogD(kClassName, __func__, "Stall on frame %" PRIu32 " ended after %s.\n",
       frame_id, stall_duration.ToString().c_str());

  if (result != CYCLE_CANCELLED)
  {
    SetState(PLAYBACK_RUNNING);
  }

  if (result == CYCLE_DISPLAYED)
  {
    Display(frame_id, frame);
  }

  return result;
}

//============================================================================
void PlaybackScheduler::Display(uint32_t frame_id,
                                const vector<uint8_t>& frame)
{
  if (display_ != NULL)
  {
    display_->DisplayFrame(frame_id, frame);
  }

  metrics_.IncrementFramesDisplayed();
}

//============================================================================
void PlaybackScheduler::SetState(PlaybackState state)
{
  ScopedLock  lock(&mutex_);

  if (state_ == PLAYBACK_STOPPED)
  {
    return;
  }

  state_ = state;
  pthread_cond_broadcast(&cond_);
}

//============================================================================
bool PlaybackScheduler::IsStopRequested() const
{
  ScopedLock  lock(&mutex_);

  return stop_requested_;
}

//============================================================================
bool PlaybackScheduler::IsEndOfStream() const
{
  ScopedLock  lock(&mutex_);

  return eos_;
}
