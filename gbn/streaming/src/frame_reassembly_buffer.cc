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

/// \brief The GbnStream frame reassembly buffer source file.

#include "frame_reassembly_buffer.h"

#include "log.h"
#include "scoped_lock.h"
#include "unused.h"

#include <inttypes.h>

using ::gbn::FrameReassemblyBuffer;
using ::gbn::ScopedLock;
using ::gbn::Time;
using ::std::map;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "FrameReassemblyBuffer";
}

//============================================================================
FrameReassemblyBuffer::FrameReassemblyBuffer()
    : frames_(), assembled_(), mutex_()
{
  pthread_mutex_init(&mutex_, NULL);
}

//============================================================================
FrameReassemblyBuffer::~FrameReassemblyBuffer()
{
  pthread_mutex_destroy(&mutex_);
}

//============================================================================
bool FrameReassemblyBuffer::AddChunk(uint32_t frame_id, uint16_t chunk_idx,
                                     uint16_t total_chunks,
                                     const uint8_t* data, size_t len,
                                     const Time& now)
{
  if (chunk_idx >= total_chunks)
  {
    LogW(kClassName, __func__, "Frame %" PRIu32 " chunk index %" PRIu16
         " is not below its chunk count %" PRIu16 ", ignored.\n", frame_id,
         chunk_idx, total_chunks);
    return false;
  }

  if ((data == NULL) && (len > 0))
  {
    LogE(kClassName, __func__, "NULL data of length %zu.\n", len);
    return false;
  }

  ScopedLock  lock(&mutex_);

  if (assembled_.find(frame_id) != assembled_.end())
  {
    LogD(kClassName, __func__, "Frame %" PRIu32 " already assembled, chunk %"
         PRIu16 " ignored.\n", frame_id, chunk_idx);
    return false;
  }

  map<uint32_t, FrameEntry>::iterator  it = frames_.find(frame_id);

  if (it == frames_.end())
  {
    it = frames_.insert(std::make_pair(frame_id, FrameEntry())).first;
    it->second.total_chunks  = total_chunks;
    it->second.first_arrival = now;
  }

  FrameEntry&  entry = it->second;

  if (total_chunks > entry.total_chunks)
  {
    LogD(kClassName, __func__, "Frame %" PRIu32 " chunk count grows from %"
         PRIu16 " to %" PRIu16 ".\n", frame_id, entry.total_chunks,
         total_chunks);
    entry.total_chunks = total_chunks;
  }

  if (entry.chunks.find(chunk_idx) != entry.chunks.end())
  {
    LogD(kClassName, __func__, "Duplicate frame %" PRIu32 " chunk %" PRIu16
         ".\n", frame_id, chunk_idx);
    return false;
  }

  vector<uint8_t>&  stored = entry.chunks[chunk_idx];

  if (len > 0)
  {
    stored.assign(data, data + len);
  }

  return true;
}

//============================================================================
bool FrameReassemblyBuffer::IsComplete(uint32_t frame_id) const
{
  ScopedLock  lock(&mutex_);

  map<uint32_t, FrameEntry>::const_iterator  it = frames_.find(frame_id);

  return ((it != frames_.end()) && EntryComplete(it->second));
}

//============================================================================
bool FrameReassemblyBuffer::Assemble(uint32_t frame_id, vector<uint8_t>& frame)
{
  ScopedLock  lock(&mutex_);

  map<uint32_t, FrameEntry>::iterator  it = frames_.find(frame_id);

  if (it == frames_.end())
  {
    LogE(kClassName, __func__, "Frame %" PRIu32 " is unknown.\n", frame_id);
    return false;
  }

  if (!EntryComplete(it->second))
  {
    LogE(kClassName, __func__, "Frame %" PRIu32 " is incomplete, %zu of %"
         PRIu16 " chunks.\n", frame_id, it->second.chunks.size(),
         it->second.total_chunks);
    return false;
  }

  // Chunk indices are always below the chunk count, so a complete entry
  // holds exactly the indices 0 to total_chunks - 1 and the map iterates
  // them in order.
  size_t  total_len = 0;

  for (map< uint16_t, vector<uint8_t> >::const_iterator cit =
         it->second.chunks.begin(); cit != it->second.chunks.end(); ++cit)
  {
    total_len += cit->second.size();
  }

  frame.clear();
  frame.reserve(total_len);

  for (map< uint16_t, vector<uint8_t> >::const_iterator cit =
         it->second.chunks.begin(); cit != it->second.chunks.end(); ++cit)
  {
    frame.insert(frame.end(), cit->second.begin(), cit->second.end());
  }

  frames_.erase(it);
  assembled_.insert(frame_id);

  return true;
}

//============================================================================
size_t FrameReassemblyBuffer::EvictBefore(uint32_t min_frame_id)
{
  ScopedLock  lock(&mutex_);

  size_t  num_evicted = 0;

  while ((!frames_.empty()) && (frames_.begin()->first < min_frame_id))
  {
    LogD(kClassName, __func__, "Evicting incomplete frame %" PRIu32 ".\n",
         frames_.begin()->first);

    frames_.erase(frames_.begin());
    ++num_evicted;
  }

  assembled_.erase(assembled_.begin(), assembled_.lower_bound(min_frame_id));

  return num_evicted;
}

//============================================================================
size_t FrameReassemblyBuffer::EvictExpired(const Time& now,
                                           const Time& retention)
{
  ScopedLock  lock(&mutex_);

  size_t  num_evicted = 0;

  map<uint32_t, FrameEntry>::iterator  it = frames_.begin();

  while (it != frames_.end())
  {
    if ((now - it->second.first_arrival) > retention)
    {
      LogD(kClassName, __func__, "Evicting expired frame %" PRIu32 ".\n",
           it->first);

      frames_.erase(it++);
      ++num_evicted;
    }
    else
    {
      ++it;
    }
  }

  return num_evicted;
}

//============================================================================
size_t FrameReassemblyBuffer::NumFrames() const
{
  ScopedLock  lock(&mutex_);

  return frames_.size();
}

//============================================================================
bool FrameReassemblyBuffer::EntryComplete(const FrameEntry& entry)
{
  return ((entry.total_chunks > 0) &&
          (entry.chunks.size() >= entry.total_chunks));
}
