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

/// \brief The GbnStream stream sender header file.

#ifndef GBN_STREAMING_STREAM_SENDER_H
#define GBN_STREAMING_STREAM_SENDER_H

#include "config_info.h"
#include "gbn_sender.h"
#include "gbn_types.h"
#include "itime.h"

#include <vector>

#include <stddef.h>
#include <stdint.h>

namespace gbn
{

  /// \brief Splits encoded frames into chunks and sends them over a GBN
  /// sender.
  ///
  /// Every chunk is one GBN payload: the 8 byte chunk header followed by at
  /// most max_packet_size - 8 frame bytes.  Frame ids are assigned in
  /// sending order starting at 0.
  class StreamSender
  {

   public:

    /// \brief Constructor.
    ///
    /// \param  sender  The started GBN sender.
    explicit StreamSender(GbnSender& sender);

    /// \brief Destructor.
    virtual ~StreamSender();

    /// \brief Configure from Stream.MaxPacketSize and Stream.Fps.
    ///
    /// \param  ci  The configuration.
    ///
    /// \return  True on success.
    bool Initialize(const ConfigInfo& ci);

    /// \brief Configure the sender.
    ///
    /// \param  max_packet_size  The largest GBN payload, chunk header
    ///                          included.
    /// \param  fps              The frame rate used for pacing.
    ///
    /// \return  True on success.
    bool Configure(size_t max_packet_size, double fps);

    /// \brief Send a frame.  Blocks while the GBN window is full.
    ///
    /// An empty frame is skipped without using a frame id.
    ///
    /// \param  frame  The encoded frame.
    ///
    /// \return  SEND_OK on success.  SEND_ERROR if the frame needs more than
    ///          65535 chunks, otherwise the status of the failed send.
    SendStatus SendFrame(const std::vector<uint8_t>& frame);

    /// \brief Send the end-of-stream sentinel.
    SendStatus SendEndOfStream();

    inline uint32_t next_frame_id() const
    {
      return next_frame_id_;
    }

    inline uint64_t chunks_sent() const
    {
      return chunks_sent_;
    }

    inline size_t max_chunk_data_size() const
    {
      return max_chunk_data_size_;
    }

    /// \brief The interval between frames at the configured frame rate.
    inline const Time& frame_interval() const
    {
      return frame_interval_;
    }

   private:

    /// \brief Copy constructor.
    StreamSender(const StreamSender& other);

    /// \brief Copy operator.
    StreamSender& operator=(const StreamSender& other);

    /// The GBN sender.
    GbnSender&            sender_;

    /// The largest number of frame bytes per chunk.
    size_t                max_chunk_data_size_;

    /// The interval between frames.
    Time                  frame_interval_;

    /// The id of the next frame.
    uint32_t              next_frame_id_;

    /// The number of chunks sent.
    uint64_t              chunks_sent_;

    /// The chunk being built.  Reused.
    std::vector<uint8_t>  chunk_;

  }; // end class StreamSender

} // namespace gbn

#endif // GBN_STREAMING_STREAM_SENDER_H
