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

/// \brief The GbnStream quality of experience metrics source file.

#include "qoe_metrics.h"

#include "scoped_lock.h"
#include "string_utils.h"

#include <cmath>

#include <inttypes.h>

using ::gbn::QoeMetrics;
using ::gbn::QoeStats;
using ::gbn::ScopedLock;
using ::gbn::StringUtils;
using ::gbn::Time;
using ::rapidjson::StringBuffer;
using ::rapidjson::Writer;
using ::std::string;

//============================================================================
QoeMetrics::QoeMetrics()
    : stats_(), stall_time_(), mutex_()
{
  pthread_mutex_init(&mutex_, NULL);
}

//============================================================================
QoeMetrics::~QoeMetrics()
{
  pthread_mutex_destroy(&mutex_);
}

//============================================================================
void QoeMetrics::IncrementChunksReceived()
{
  ScopedLock  lock(&mutex_);

  ++stats_.received_chunks_total;
}

//============================================================================
void QoeMetrics::IncrementFramesReassembled()
{
  ScopedLock  lock(&mutex_);

  ++stats_.frames_reassembled_total;
}

//============================================================================
void QoeMetrics::IncrementDroppedFrames()
{
  ScopedLock  lock(&mutex_);

  ++stats_.dropped_frames;
}

//============================================================================
void QoeMetrics::IncrementFramesDisplayed()
{
  ScopedLock  lock(&mutex_);

  ++stats_.frames_displayed;
}

//============================================================================
void QoeMetrics::IncrementOverflowDrops()
{
  ScopedLock  lock(&mutex_);

  ++stats_.playback_overflow_drops;
  ++stats_.dropped_frames;
}

//============================================================================
void QoeMetrics::IncrementStallCount()
{
  ScopedLock  lock(&mutex_);

  ++stats_.stall_count;
}

//============================================================================
void QoeMetrics::AddStallTime(const Time& duration)
{
  ScopedLock  lock(&mutex_);

  stall_time_ += duration;
}

//============================================================================
void QoeMetrics::SetEosReceived()
{
  ScopedLock  lock(&mutex_);

  stats_.eos_received = true;
}

//============================================================================
bool QoeMetrics::IsEosReceived() const
{
  ScopedLock  lock(&mutex_);

  return stats_.eos_received;
}

//============================================================================
QoeStats QoeMetrics::GetStats() const
{
  ScopedLock  lock(&mutex_);

  QoeStats  stats = stats_;

  // Reported to 0.1 ms.
  stats.stall_time_seconds = round(stall_time_.ToDouble() * 10000.0) /
    10000.0;

  return stats;
}

//============================================================================
void QoeMetrics::WriteStats(Writer<StringBuffer>* writer) const
{
  if (writer == NULL)
  {
    return;
  }

  QoeStats  stats = GetStats();

  writer->Key("received_chunks_total");
  writer->Uint64(stats.received_chunks_total);

  writer->Key("frames_reassembled_total");
  writer->Uint64(stats.frames_reassembled_total);

  writer->Key("dropped_frames");
  writer->Uint64(stats.dropped_frames);

  writer->Key("stall_time_seconds");
  writer->Double(stats.stall_time_seconds);

  writer->Key("eos_received");
  writer->Bool(stats.eos_received);

  writer->Key("frames_displayed");
  writer->Uint64(stats.frames_displayed);

  writer->Key("stall_count");
  writer->Uint64(stats.stall_count);

  writer->Key("playback_overflow_drops");
  writer->Uint64(stats.playback_overflow_drops);
}

//============================================================================
string QoeMetrics::ToString() const
{
  QoeStats  stats = GetStats();

  return StringUtils::FormatString(
    256, "chunks=%" PRIu64 " reassembled=%" PRIu64 " displayed=%" PRIu64
    " dropped=%" PRIu64 " overflow=%" PRIu64 " stalls=%" PRIu64
    " stall_time=%.4fs eos=%s", stats.received_chunks_total,
    stats.frames_reassembled_total, stats.frames_displayed,
    stats.dropped_frames, stats.playback_overflow_drops, stats.stall_count,
    stats.stall_time_seconds, (stats.eos_received ? "true" : "false"));
}

//============================================================================
void QoeMetrics::Reset()
{
  ScopedLock  lock(&mutex_);

  stats_      = QoeStats();
  stall_time_ = Time();
}
