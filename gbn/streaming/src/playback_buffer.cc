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

/// \brief The GbnStream playback buffer source file.

#include "playback_buffer.h"

#include "log.h"
#include "scoped_lock.h"
#include "unused.h"

#include <cerrno>
#include <cstring>

#include <inttypes.h>

using ::gbn::PlaybackBuffer;
using ::gbn::ScopedLock;
using ::gbn::Time;
using ::std::map;
using ::std::set;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "PlaybackBuffer";
}

//============================================================================
PlaybackBuffer::PlaybackBuffer(size_t capacity)
    : capacity_(capacity),
      frames_(),
      skipped_(),
      wakeup_count_(0),
      mutex_(),
      cond_()
{
  if (capacity_ == 0)
  {
    LogW(kClassName, __func__, "Zero capacity, using 1.\n");
    capacity_ = 1;
  }

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
PlaybackBuffer::~PlaybackBuffer()
{
  pthread_cond_destroy(&cond_);
  pthread_mutex_destroy(&mutex_);
}

//============================================================================
PlaybackBuffer::InsertResult PlaybackBuffer::Insert(uint32_t frame_id,
                                                  vector<uint8_t>& frame)
{
  ScopedLock  lock(&mutex_);

  map< uint32_t, vector<uint8_t> >::iterator  it = frames_.find(frame_id);

  if (it != frames_.end())
  {
    LogW(kClassName, __func__, "Frame %" PRIu32 " is already buffered, "
         "keeping the first copy.\n", frame_id);
    return INSERT_DUPLICATE;
  }

  if (frames_.size() >= capacity_)
  {
    skipped_.insert(frame_id);
    pthread_cond_broadcast(&cond_);

    LogI(kClassName, __func__, "Playback buffer full, dropping frame %"
         PRIu32 ".\n", frame_id);
    return INSERT_REFUSED;
  }

  frames_[frame_id].swap(frame);
  pthread_cond_broadcast(&cond_);

  return INSERT_OK;
}

//============================================================================
PlaybackBuffer::PopResult PlaybackBuffer::Pop(uint32_t frame_id,
                                              vector<uint8_t>& frame)
{
  ScopedLock  lock(&mutex_);

  return PopLocked(frame_id, frame);
}

//============================================================================
PlaybackBuffer::PopResult PlaybackBuffer::WaitAndPop(uint32_t frame_id,
                                                     vector<uint8_t>& frame,
                                                     const Time& max_wait)
{
  ScopedLock  lock(&mutex_);

  timespec  deadline     = (Time::Now() + max_wait).ToTspec();
  uint32_t  wakeup_count = wakeup_count_;

  while (true)
  {
    PopResult  rv = PopLocked(frame_id, frame);

    if ((rv != POP_ABSENT) || (wakeup_count != wakeup_count_))
    {
      return rv;
    }

    int  err = pthread_cond_timedwait(&cond_, &mutex_, &deadline);

    if (err == ETIMEDOUT)
    {
      return PopLocked(frame_id, frame);
    }

    if (err != 0)
    {
      LogW(kClassName, __func__, "pthread_cond_timedwait() error: %s\n",
           strerror(err));
      return POP_ABSENT;
    }
  }
}

//============================================================================
void PlaybackBuffer::Wakeup()
{
  ScopedLock  lock(&mutex_);

  ++wakeup_count_;
  pthread_cond_broadcast(&cond_);
}

//============================================================================
size_t PlaybackBuffer::DiscardBefore(uint32_t min_frame_id)
{
  ScopedLock  lock(&mutex_);

  size_t  num_discarded = 0;

  while ((!frames_.empty()) && (frames_.begin()->first < min_frame_id))
  {
    LogD(kClassName, __func__, "Discarding late frame %" PRIu32 ".\n",
         frames_.begin()->first);

    frames_.erase(frames_.begin());
    ++num_discarded;
  }

  skipped_.erase(skipped_.begin(), skipped_.lower_bound(min_frame_id));

  return num_discarded;
}

//============================================================================
size_t PlaybackBuffer::Size() const
{
  ScopedLock  lock(&mutex_);

  return frames_.size();
}

//============================================================================
bool PlaybackBuffer::IsEmpty() const
{
  ScopedLock  lock(&mutex_);

  return frames_.empty();
}

//============================================================================
bool PlaybackBuffer::IsFull() const
{
  ScopedLock  lock(&mutex_);

  return (frames_.size() >= capacity_);
}

//============================================================================
PlaybackBuffer::PopResult PlaybackBuffer::PopLocked(uint32_t frame_id,
                                                    vector<uint8_t>& frame)
{
  map< uint32_t, vector<uint8_t> >::iterator  it = frames_.find(frame_id);

  if (it != frames_.end())
  {
    frame.swap(it->second);
    frames_.erase(it);
    return POP_OK;
  }

  set<uint32_t>::iterator  sit = skipped_.find(frame_id);

  if (sit != skipped_.end())
  {
    skipped_.erase(sit);
    return POP_SKIPPED;
  }

  return POP_ABSENT;
}
