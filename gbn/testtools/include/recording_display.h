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

/// \brief The GbnStream recording display header file.
///
/// Provides a frame display that records every frame it is given, for
/// checking the output of the playback path.

#ifndef GBN_TESTTOOLS_RECORDING_DISPLAY_H
#define GBN_TESTTOOLS_RECORDING_DISPLAY_H

#include "frame_display_if.h"
#include "itime.h"

#include <vector>

#include <pthread.h>
#include <stddef.h>
#include <stdint.h>

namespace gbn
{

  class RecordingDisplay : public FrameDisplayIf
  {

   public:

    /// \brief A displayed frame.
    struct Record
    {
      Record() : frame_id(0), frame(), display_time()
      { }

      uint32_t              frame_id;
      std::vector<uint8_t>  frame;
      Time                  display_time;
    };

    RecordingDisplay();

    virtual ~RecordingDisplay();

    virtual void DisplayFrame(uint32_t frame_id,
                              const std::vector<uint8_t>& frame);

    /// \brief Wait until at least a number of frames have been displayed.
    ///
    /// \param  num_frames  The number of frames.
    /// \param  max_wait    The maximum time to wait.
    ///
    /// \return  True if the frames were displayed in time.
    bool WaitForFrames(size_t num_frames, const Time& max_wait);

    /// \brief Get the number of frames displayed.
    size_t NumFrames() const;

    /// \brief Get the ids of the displayed frames, in display order.
    std::vector<uint32_t> GetFrameIds() const;

    /// \brief Get a copy of the displayed frames, in display order.
    std::vector<Record> GetRecords() const;

   private:

    RecordingDisplay(const RecordingDisplay& other);

    RecordingDisplay& operator=(const RecordingDisplay& other);

    std::vector<Record>      records_;

    mutable pthread_mutex_t  mutex_;

    pthread_cond_t           cond_;

  }; // end class RecordingDisplay

} // namespace gbn

#endif // GBN_TESTTOOLS_RECORDING_DISPLAY_H
