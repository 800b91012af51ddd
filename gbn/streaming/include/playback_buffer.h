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

/// \brief The GbnStream playback buffer header file.

#ifndef GBN_STREAMING_PLAYBACK_BUFFER_H
#define GBN_STREAMING_PLAYBACK_BUFFER_H

#include "itime.h"

#include <map>
#include <set>
#include <vector>

#include <pthread.h>
#include <stddef.h>
#include <stdint.h>

namespace gbn
{

  /// \brief A bounded store of assembled frames waiting to be displayed.
  ///
  /// Frames are inserted by the receive path and removed by the playback
  /// path.  When the buffer is full a new frame is refused and its id is
  /// remembered as skipped, so that the playback path can pass over it
  /// instead of waiting for a frame that will never be inserted.
  ///
  /// All methods are thread-safe.  No other lock is acquired while the
  /// internal lock is held, apart from the logger's.
  class PlaybackBuffer
  {

   public:

    /// \brief The result of inserting a frame.
    enum InsertResult
    {
      INSERT_OK = 0,      ///< The frame was added.
      INSERT_DUPLICATE,   ///< A frame with the same id is already buffered.
      INSERT_REFUSED      ///< The buffer was full and the frame was refused.
    };

    /// \brief The result of removing a frame.
    enum PopResult
    {
      POP_OK = 0,     ///< The frame was removed.
      POP_ABSENT,     ///< The frame is not in the buffer.
      POP_SKIPPED     ///< The frame was refused by a full buffer.
    };

    /// \brief Constructor.
    ///
    /// \param  capacity  The maximum number of frames.  At least 1.
    explicit PlaybackBuffer(size_t capacity);

    /// \brief Destructor.
    virtual ~PlaybackBuffer();

    /// \brief Insert a frame.
    ///
    /// A duplicate leaves the buffered copy in place.
    ///
    /// \param  frame_id  The frame id.
    /// \param  frame     The frame bytes.  Swapped out on INSERT_OK.
    ///
    /// \return  The result.
    InsertResult Insert(uint32_t frame_id, std::vector<uint8_t>& frame);

    /// \brief Remove a frame if it is present.
    ///
    /// \param  frame_id  The frame id.
    /// \param  frame     The frame bytes, on POP_OK.
    ///
    /// \return  The result.
    PopResult Pop(uint32_t frame_id, std::vector<uint8_t>& frame);

    /// \brief Remove a frame, waiting for it for at most a given time.
    ///
    /// Returns early with POP_ABSENT if Wakeup() is called.
    ///
    /// \param  frame_id  The frame id.
    /// \param  frame     The frame bytes, on POP_OK.
    /// \param  max_wait  The maximum time to wait.
    ///
    /// \return  The result.
    PopResult WaitAndPop(uint32_t frame_id, std::vector<uint8_t>& frame,
                         const Time& max_wait);

    /// \brief Wake up all waiters.
    void Wakeup();

    /// \brief Discard all frames, and skip marks, with an id below a bound.
    ///
    /// \param  min_frame_id  The lowest frame id to keep.
    ///
    /// \return  The number of frames discarded.
    size_t DiscardBefore(uint32_t min_frame_id);

    /// \brief Get the number of frames in the buffer.
    size_t Size() const;

    /// \brief Check if the buffer is empty.
    bool IsEmpty() const;

    /// \brief Check if the buffer is full.
    bool IsFull() const;

    inline size_t capacity() const
    {
      return capacity_;
    }

   private:

    /// \brief Copy constructor.
    PlaybackBuffer(const PlaybackBuffer& other);

    /// \brief Copy operator.
    PlaybackBuffer& operator=(const PlaybackBuffer& other);

    /// \brief Remove a frame.  Called with the lock held.
    PopResult PopLocked(uint32_t frame_id, std::vector<uint8_t>& frame);

    /// The maximum number of frames.
    size_t                                      capacity_;

    /// The frames, by frame id.
    std::map< uint32_t, std::vector<uint8_t> >  frames_;

    /// The ids of frames refused while the buffer was full.
    std::set<uint32_t>                          skipped_;

    /// Incremented by Wakeup().
    uint32_t                                    wakeup_count_;

    /// Protects the members above.
    mutable pthread_mutex_t                     mutex_;

    /// Signaled when a frame is inserted or on Wakeup().
    pthread_cond_t                              cond_;

  }; // end class PlaybackBuffer

} // namespace gbn

#endif // GBN_STREAMING_PLAYBACK_BUFFER_H
