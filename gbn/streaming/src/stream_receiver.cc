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

/// \brief The GbnStream stream receiver source file.

#include "stream_receiver.h"

#include "chunk_header.h"
#include "log.h"
#include "unused.h"

#include <new>
#include <vector>

#include <inttypes.h>

using ::gbn::ChunkHeader;
using ::gbn::ConfigInfo;
using ::gbn::FrameDisplayIf;
using ::gbn::PlaybackBuffer;
using ::gbn::PlaybackScheduler;
using ::gbn::StreamReceiver;
using ::gbn::Time;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*     UNUSED(kClassName)       = "StreamReceiver";

  /// The default playback buffer capacity, in frames.
  const uint32_t  kDefaultCapacity         = 120;

  /// The default playback frame rate.
  const double    kDefaultFps              = 30.0;

  /// The default first frame id.
  const uint32_t  kDefaultStartFrameId     = 0;

  /// The default eviction lag, in frames.
  const uint32_t  kDefaultEvictLag         = 10;

  /// The default age at which partial frames are evicted.
  const double    kDefaultRetentionSec     = 5.0;

  /// The interval between expiration checks.
  const int64_t   kExpireCheckIntervalMs   = 1000;
}

//============================================================================
StreamReceiver::StreamReceiver(FrameDisplayIf* display)
    : display_(display),
      metrics_(),
      reassembly_(),
      playback_(NULL),
      scheduler_(NULL),
      retention_(kDefaultRetentionSec),
      last_expire_check_()
{
}

//============================================================================
StreamReceiver::~StreamReceiver()
{
  Stop();

  if (scheduler_ != NULL)
  {
    delete scheduler_;
    scheduler_ = NULL;
  }

  if (playback_ != NULL)
  {
    delete playback_;
    playback_ = NULL;
  }
}

//============================================================================
bool StreamReceiver::Initialize(const ConfigInfo& ci)
{
  uint32_t  capacity  = ci.GetUint("Stream.BufferCapacityFrames",
                                   kDefaultCapacity);
  double    fps       = ci.GetDouble("Stream.Fps", kDefaultFps);
  uint32_t  start_id  = ci.GetUint("Stream.StartFrameId",
                                   kDefaultStartFrameId);
  uint32_t  evict_lag = ci.GetUint("Stream.EvictLagFrames", kDefaultEvictLag);
  double    retention = ci.GetDouble("Stream.ReassemblyRetentionSec",
                                     kDefaultRetentionSec);

  if (capacity == 0)
  {
    LogE(kClassName, __func__, "Stream.BufferCapacityFrames must be "
         "positive.\n");
    return false;
  }

  if (!(retention > 0.0))
  {
    LogE(kClassName, __func__, "Stream.ReassemblyRetentionSec must be "
         "positive.\n");
    return false;
  }

  return Configure(capacity, fps, start_id, evict_lag, Time(retention));
}

//============================================================================
bool StreamReceiver::Configure(size_t capacity, double fps,
                               uint32_t start_frame_id, uint32_t evict_lag,
                               const Time& retention)
{
  if (scheduler_ != NULL)
  {
    LogE(kClassName, __func__, "Stream receiver already configured.\n");
    return false;
  }

  playback_ = new (std::nothrow) PlaybackBuffer(capacity);

  if (playback_ == NULL)
  {
    LogF(kClassName, __func__, "Error allocating playback buffer.\n");
    return false;
  }

  scheduler_ = new (std::nothrow) PlaybackScheduler(*playback_, reassembly_,
                                                    metrics_, display_);

  if (scheduler_ == NULL)
  {
    LogF(kClassName, __func__, "Error allocating playback scheduler.\n");
    return false;
  }

  if (!scheduler_->Configure(fps, start_frame_id, evict_lag))
  {
    delete scheduler_;
    scheduler_ = NULL;
    delete playback_;
    playback_  = NULL;
    return false;
  }

  retention_         = retention;
  last_expire_check_ = Time::Now();

  LogC(kClassName, __func__, "Stream receiver: capacity %zu frames, %.2f "
       "fps, retention %s.\n", capacity, fps, retention_.ToString().c_str());

  return true;
}

//============================================================================
bool StreamReceiver::Start()
{
  if (scheduler_ == NULL)
  {
    LogE(kClassName, __func__, "Stream receiver not configured.\n");
    return false;
  }

  return scheduler_->Start();
}

//============================================================================
void StreamReceiver::Stop()
{
  if (scheduler_ != NULL)
  {
    scheduler_->Stop();
  }
}

//============================================================================
bool StreamReceiver::ProcessPayload(const uint8_t* buf, size_t len)
{
  if (scheduler_ == NULL)
  {
    LogE(kClassName, __func__, "Stream receiver not configured.\n");
    return false;
  }

  ChunkHeader  hdr;
  size_t       data_off = 0;

  if (!hdr.Parse(buf, len, data_off))
  {
    LogW(kClassName, __func__, "Ignoring %zu byte payload, not a chunk.\n",
         len);
    return false;
  }

  metrics_.IncrementChunksReceived();

  if (hdr.IsEndOfStream())
  {
    LogI(kClassName, __func__, "Received end of stream.\n");

    metrics_.SetEosReceived();
    scheduler_->NotifyEndOfStream();
    return true;
  }

  Time  now = Time::Now();

  MaybeEvictExpired(now);

  // Frames the playback loop has passed can never be displayed.
  if (hdr.frame_id < scheduler_->expected_frame_id())
  {
    LogD(kClassName, __func__, "Discarding late chunk %s.\n",
         hdr.ToString().c_str());
    return true;
  }

  if (!reassembly_.AddChunk(hdr.frame_id, hdr.chunk_idx, hdr.total_chunks,
                            (buf + data_off), (len - data_off), now))
  {
    return true;
  }

  if (!reassembly_.IsComplete(hdr.frame_id))
  {
    return true;
  }

  vector<uint8_t>  frame;

  if (!reassembly_.Assemble(hdr.frame_id, frame))
  {
    return true;
  }

  PlaybackBuffer::InsertResult  rv = playback_->Insert(hdr.frame_id, frame);

  if (rv == PlaybackBuffer::INSERT_REFUSED)
  {
    metrics_.IncrementOverflowDrops();
    return true;
  }

  if (rv == PlaybackBuffer::INSERT_DUPLICATE)
  {
    return true;
  }

  metrics_.IncrementFramesReassembled();

  LogD(kClassName, __func__, "Frame %" PRIu32 " ready for playback, %zu "
       "frames buffered.\n", hdr.frame_id, playback_->Size());

  return true;
}

//============================================================================
bool StreamReceiver::IsEndOfStream() const
{
  return metrics_.IsEosReceived();
}

//============================================================================
bool StreamReceiver::WaitForPlaybackEnd(const Time& max_wait)
{
  if (scheduler_ == NULL)
  {
    return true;
  }

  return scheduler_->WaitUntilStopped(max_wait);
}

//============================================================================
void StreamReceiver::MaybeEvictExpired(const Time& now)
{
  if ((now - last_expire_check_) < Time::FromMsec(kExpireCheckIntervalMs))
  {
    return;
  }

  last_expire_check_ = now;

  size_t  num_evicted = reassembly_.EvictExpired(now, retention_);

  if (num_evicted > 0)
  {
    LogD(kClassName, __func__, "Evicted %zu expired partial frames.\n",
         num_evicted);
  }
}
