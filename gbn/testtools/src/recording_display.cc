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

/// \brief The GbnStream recording display source file.

#include "recording_display.h"

#include "scoped_lock.h"

#include <cerrno>

using ::gbn::RecordingDisplay;
using ::gbn::ScopedLock;
using ::gbn::Time;
using ::std::vector;

//============================================================================
RecordingDisplay::RecordingDisplay()
    : records_(), mutex_(), cond_()
{
  pthread_mutex_init(&mutex_, NULL);

  pthread_condattr_t  attr;
  pthread_condattr_init(&attr);
  pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
  pthread_cond_init(&cond_, &attr);
  pthread_condattr_destroy(&attr);
}

//============================================================================
RecordingDisplay::~RecordingDisplay()
{
  pthread_cond_destroy(&cond_);
  pthread_mutex_destroy(&mutex_);
}

//============================================================================
void RecordingDisplay::DisplayFrame(uint32_t frame_id,
                                    const vector<uint8_t>& frame)
{
  Record  rec;

  rec.frame_id     = frame_id;
  rec.frame        = frame;
  rec.display_time = Time::Now();

  ScopedLock  lock(&mutex_);

  records_.push_back(rec);
  pthread_cond_broadcast(&cond_);
}

//============================================================================
bool RecordingDisplay::WaitForFrames(size_t num_frames, const Time& max_wait)
{
  ScopedLock  lock(&mutex_);

  timespec  deadline = (Time::Now() + max_wait).ToTspec();

  while (records_.size() < num_frames)
  {
    if (pthread_cond_timedwait(&cond_, &mutex_, &deadline) == ETIMEDOUT)
    {
      break;
    }
  }

  return (records_.size() >= num_frames);
}

//============================================================================
size_t RecordingDisplay::NumFrames() const
{
  ScopedLock  lock(&mutex_);

  return records_.size();
}

//============================================================================
vector<uint32_t> RecordingDisplay::GetFrameIds() const
{
  ScopedLock  lock(&mutex_);

  vector<uint32_t>  ids;

  for (size_t i = 0; i < records_.size(); ++i)
  {
    ids.push_back(records_[i].frame_id);
  }

  return ids;
}

//============================================================================
vector<RecordingDisplay::Record> RecordingDisplay::GetRecords() const
{
  ScopedLock  lock(&mutex_);

  return records_;
}
