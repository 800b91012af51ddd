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

/// \brief The GbnStream frame reassembly buffer header file.

#ifndef GBN_STREAMING_FRAME_REASSEMBLY_BUFFER_H
#define GBN_STREAMING_FRAME_REASSEMBLY_BUFFER_H

#include "itime.h"

#include <map>
#include <set>
#include <vector>

#include <pthread.h>
#include <stddef.h>
#include <stdint.h>

namespace gbn
{

  /// \brief Collects the chunks of frames until each frame is complete.
  ///
  /// An entry is created by the first chunk seen for a frame id.  Later
  /// chunks for the same frame are stored once per chunk index, the first
  /// copy wins.  If chunks disagree on the chunk count, the larger count is
  /// kept.  A frame is complete once it holds as many distinct chunks as its
  /// chunk count, and a complete frame may be assembled exactly once, which
  /// removes its entry.  The ids of assembled frames are remembered until
  /// EvictBefore() passes them, and chunks for them are refused.  Frames
  /// that never complete are removed by EvictBefore() or EvictExpired().
  ///
  /// All methods are thread-safe.  No other lock is acquired while the
  /// internal lock is held, apart from the logger's.
  class FrameReassemblyBuffer
  {

   public:

    /// \brief Constructor.
    FrameReassemblyBuffer();

    /// \brief Destructor.
    virtual ~FrameReassemblyBuffer();

    /// \brief Add a chunk.
    ///
    /// \param  frame_id      The frame id.
    /// \param  chunk_idx     The chunk index, less than total_chunks.
    /// \param  total_chunks  The chunk count stated by this chunk.
    /// \param  data          The chunk bytes.  May be NULL if len is 0.
    /// \param  len           The chunk length.
    /// \param  now           The arrival time.
    ///
    /// \return  True if the chunk was stored, false if it was a duplicate,
    ///          invalid, or for a frame that has already been assembled.
    bool AddChunk(uint32_t frame_id, uint16_t chunk_idx,
                  uint16_t total_chunks, const uint8_t* data, size_t len,
                  const Time& now);

    /// \brief Add a chunk arriving now.
    inline bool AddChunk(uint32_t frame_id, uint16_t chunk_idx,
                         uint16_t total_chunks, const uint8_t* data,
                         size_t len)
    {
      return AddChunk(frame_id, chunk_idx, total_chunks, data, len,
                      Time::Now());
    }

    /// \brief Check if a frame has all of its chunks.
    ///
    /// \param  frame_id  The frame id.
    ///
    /// \return  True if the frame is known and complete.
    bool IsComplete(uint32_t frame_id) const;

    /// \brief Assemble and remove a complete frame.
    ///
    /// \param  frame_id  The frame id.
    /// \param  frame     The chunks concatenated in index order.  Replaced.
    ///
    /// \return  True on success.  False, with an error logged, if the frame
    ///          is unknown or incomplete, in which case nothing changes.
    bool Assemble(uint32_t frame_id, std::vector<uint8_t>& frame);

    /// \brief Remove all frames with an id below a bound.
    ///
    /// The assembled frame ids below the bound are forgotten as well.
    ///
    /// \param  min_frame_id  The lowest frame id to keep.
    ///
    /// \return  The number of frames removed.
    size_t EvictBefore(uint32_t min_frame_id);

    /// \brief Remove all frames whose first chunk arrived too long ago.
    ///
    /// \param  now        The current time.
    /// \param  retention  The maximum age.
    ///
    /// \return  The number of frames removed.
    size_t EvictExpired(const Time& now, const Time& retention);

    /// \brief Get the number of frames being reassembled.
    size_t NumFrames() const;

   private:

    /// \brief Copy constructor.
    FrameReassemblyBuffer(const FrameReassemblyBuffer& other);

    /// \brief Copy operator.
    FrameReassemblyBuffer& operator=(const FrameReassemblyBuffer& other);

    /// \brief The reassembly state of one frame.
    struct FrameEntry
    {
      FrameEntry() : chunks(), total_chunks(0), first_arrival()
      { }

      /// The chunks received, by index.
      std::map< uint16_t, std::vector<uint8_t> >  chunks;

      /// The largest chunk count seen.
      uint16_t                                    total_chunks;

      /// The arrival time of the first chunk.
      Time                                        first_arrival;
    };

    /// \brief Check if an entry is complete.
    static bool EntryComplete(const FrameEntry& entry);

    /// The frames being reassembled, by frame id.
    std::map<uint32_t, FrameEntry>  frames_;

    /// The ids of frames already assembled.
    std::set<uint32_t>              assembled_;

    /// Protects frames_ and assembled_.
    mutable pthread_mutex_t         mutex_;

  }; // end class FrameReassemblyBuffer

} // namespace gbn

#endif // GBN_STREAMING_FRAME_REASSEMBLY_BUFFER_H
