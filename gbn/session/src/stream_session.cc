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

/// \brief The GbnStream stream session source file.

#include "stream_session.h"

#include "gbn_types.h"
#include "log.h"
#include "scoped_lock.h"
#include "unused.h"

#include <cerrno>
#include <cstring>
#include <vector>

#include <inttypes.h>

using ::gbn::ConfigInfo;
using ::gbn::DatagramChannel;
using ::gbn::FrameSource;
using ::gbn::Ipv4Endpoint;
using ::gbn::ScopedLock;
using ::gbn::SendStatus;
using ::gbn::SessionConfig;
using ::gbn::StreamSession;
using ::gbn::Time;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*     UNUSED(kClassName)     = "StreamSession";

  /// The default largest GBN payload.
  const uint32_t  kDefaultMaxPacketSize  = 1400;

  /// The default frame rate.
  const double    kDefaultFps            = 30.0;
}

//============================================================================
SessionConfig::SessionConfig()
    : window_size(kDefaultWindowSize),
      rto_sec(kDefaultRtoSec),
      loss_random_rate(0.0),
      loss_burst_rate(0.0),
      loss_burst_duration_ms(0),
      loss_burst_interval_ms(0),
      loss_seed(0),
      max_packet_size(kDefaultMaxPacketSize),
      fps(kDefaultFps)
{
}

//============================================================================
bool SessionConfig::Initialize(const ConfigInfo& ci)
{
  uint32_t  window = ci.GetUint("Gbn.WindowSize", kDefaultWindowSize);

  if ((window == 0) || (window > kMaxWindowSize))
  {
    LogE(kClassName, __func__, "Invalid Gbn.WindowSize %" PRIu32 ".\n",
         window);
    return false;
  }

  window_size            = static_cast<uint16_t>(window);
  rto_sec                = ci.GetDouble("Gbn.RtoSec", kDefaultRtoSec);
  loss_random_rate       = ci.GetDouble("Gbn.Loss.RandomRate", 0.0);
  loss_burst_rate        = ci.GetDouble("Gbn.Loss.BurstRate", 0.0);
  loss_burst_duration_ms = ci.GetUint("Gbn.Loss.BurstDurationMs", 0);
  loss_burst_interval_ms = ci.GetUint("Gbn.Loss.BurstIntervalMs", 0);
  loss_seed              = ci.GetUint("Gbn.Loss.Seed", 0);
  max_packet_size        = ci.GetUint("Stream.MaxPacketSize",
                                      kDefaultMaxPacketSize);
  fps                    = ci.GetDouble("Stream.Fps", kDefaultFps);

  if (!(rto_sec > 0.0) || !(fps > 0.0))
  {
    LogE(kClassName, __func__, "Gbn.RtoSec and Stream.Fps must be "
         "positive.\n");
    return false;
  }

  return true;
}

//============================================================================
StreamSession::StreamSession(DatagramChannel& channel,
                             const Ipv4Endpoint& peer,
                             const string& media_name)
    : peer_(peer),
      media_name_(media_name),
      sender_(channel, peer),
      stream_sender_(sender_),
      source_(NULL),
      last_activity_(Time::Now()),
      frames_sent_(0),
      eos_sent_(false),
      done_(false),
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
}

//============================================================================
StreamSession::~StreamSession()
{
  Stop();

  if (source_ != NULL)
  {
    delete source_;
    source_ = NULL;
  }

  pthread_cond_destroy(&cond_);
  pthread_mutex_destroy(&mutex_);
}

//============================================================================
bool StreamSession::Configure(const SessionConfig& config)
{
  if (!sender_.Configure(config.window_size, Time(config.rto_sec)))
  {
    return false;
  }

  if (!sender_.ConfigureLoss(config.loss_random_rate, config.loss_burst_rate,
                             config.loss_burst_duration_ms,
                             config.loss_burst_interval_ms))
  {
    return false;
  }

  if (config.loss_seed != 0)
  {
    sender_.SetLossSeed(config.loss_seed);
  }

  return stream_sender_.Configure(config.max_packet_size, config.fps);
}

//============================================================================
bool StreamSession::Start(FrameSource* source)
{
  if (source == NULL)
  {
    LogE(kClassName, __func__, "NULL frame source.\n");
    return false;
  }

  {
    ScopedLock  lock(&mutex_);

    if (started_)
    {
      LogE(kClassName, __func__, "Session for %s already started.\n",
           peer_.ToString().c_str());
      delete source;
      return false;
    }

    started_       = true;
    source_        = source;
    last_activity_ = Time::Now();
  }

  if (!sender_.Start())
  {
    return false;
  }

  if (!thread_.StartThread(this))
  {
    LogE(kClassName, __func__, "Unable to start the streaming thread.\n");
    sender_.Stop();
    return false;
  }

  LogI(kClassName, __func__, "Streaming %s to %s.\n", media_name_.c_str(),
       peer_.ToString().c_str());

  return true;
}

//============================================================================
void StreamSession::Stop()
{
  {
    ScopedLock  lock(&mutex_);

    stop_requested_ = true;
    pthread_cond_broadcast(&cond_);
  }

  // Releases a Send() blocked on a full window.
  sender_.Stop();

  if (thread_.IsRunning())
  {
    thread_.JoinThread();

    LogI(kClassName, __func__, "Session for %s stopped: %s\n",
         peer_.ToString().c_str(), sender_.StatsToString().c_str());
  }
}

//============================================================================
bool StreamSession::ProcessAckDatagram(const uint8_t* buf, size_t len)
{
  Touch();

  return sender_.ProcessAckDatagram(buf, len);
}

//============================================================================
bool StreamSession::IsFinished() const
{
  {
    ScopedLock  lock(&mutex_);

    if (!done_ || !eos_sent_)
    {
      return false;
    }
  }

  return (sender_.InFlight() == 0);
}

//============================================================================
bool StreamSession::IsIdle(const Time& now, const Time& idle_timeout) const
{
  ScopedLock  lock(&mutex_);

  return ((now - last_activity_) >= idle_timeout);
}

//============================================================================
uint32_t StreamSession::FramesSent() const
{
  ScopedLock  lock(&mutex_);

  return frames_sent_;
}

//============================================================================
void StreamSession::Run()
{
  Time             next_send_time = Time::Now();
  vector<uint8_t>  frame;

  while (WaitUntil(next_send_time))
  {
    if (!source_->NextFrame(frame))
    {
      if (stream_sender_.SendEndOfStream() == SEND_OK)
      {
        ScopedLock  lock(&mutex_);
        eos_sent_ = true;
      }
      break;
    }

    SendStatus  rv = stream_sender_.SendFrame(frame);

    if (rv == SEND_STOPPED)
    {
      break;
    }

    if (rv == SEND_OK)
    {
      ScopedLock  lock(&mutex_);
      ++frames_sent_;
    }

    // A send blocked on the window delays the schedule instead of causing
    // a burst.
    next_send_time += stream_sender_.frame_interval();

    Time  now = Time::Now();

    if (next_send_time < now)
    {
      next_send_time = now;
    }
  }

  ScopedLock  lock(&mutex_);

  done_ = true;

  LogD(kClassName, __func__, "Streaming loop for %s exiting after %" PRIu32
       " frames.\n", peer_.ToString().c_str(), frames_sent_);
}

//============================================================================
bool StreamSession::WaitUntil(const Time& t)
{
  ScopedLock  lock(&mutex_);

  while (!stop_requested_)
  {
    Time  now = Time::Now();

    if (now >= t)
    {
      return true;
    }

    timespec  deadline = t.ToTspec();
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
void StreamSession::Touch()
{
  ScopedLock  lock(&mutex_);

  last_activity_ = Time::Now();
}
