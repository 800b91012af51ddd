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

/// \brief The GbnStream stream receiver header file.

#ifndef GBN_STREAMING_STREAM_RECEIVER_H
#define GBN_STREAMING_STREAM_RECEIVER_H

#include "config_info.h"
#include "frame_display_if.h"
#include "frame_reassembly_buffer.h"
#include "itime.h"
#include "playback_buffer.h"
#include "playback_scheduler.h"
#include "qoe_metrics.h"

#include <stddef.h>
#include <stdint.h>

namespace gbn
{

  /// \brief The receive path of a stream.
  ///
  /// Payloads delivered in order by the GBN receiver are parsed as chunks
  /// and reassembled into frames.  Complete frames are moved into the
  /// playback buffer, from which the owned playback scheduler displays them.
  ///
  /// ProcessPayload() must be called from a single thread.
  class StreamReceiver
  {

   public:

    /// \brief Constructor.
    ///
    /// \param  display  The display.  May be NULL.
    explicit StreamReceiver(FrameDisplayIf* display);

    /// \brief Destructor.  Stops playback.
    virtual ~StreamReceiver();

    /// \brief Configure from Stream.BufferCapacityFrames,
    /// Stream.ReassemblyRetentionSec and the playback scheduler keys.
    ///
    /// \param  ci  The configuration.
    ///
    /// \return  True on success.
    bool Initialize(const ConfigInfo& ci);

    /// \brief Configure the receiver.  Must be called once, before Start().
    ///
    /// \param  capacity        The playback buffer capacity, in frames.
    /// \param  fps             The playback frame rate.
    /// \param  start_frame_id  The first frame id to display.
    /// \param  evict_lag       The eviction lag, in frames.
    /// \param  retention       The age at which partial frames are evicted.
    ///
    /// \return  True on success.
    bool Configure(size_t capacity, double fps, uint32_t start_frame_id,
                   uint32_t evict_lag, const Time& retention);

    /// \brief Start playback.
    ///
    /// \return  True on success.
    bool Start();

    /// \brief Stop playback.
    void Stop();

    /// \brief Process one payload delivered by the GBN receiver.
    ///
    /// \param  buf  The payload.
    /// \param  len  The payload length.
    ///
    /// \return  False if the payload is not a valid chunk.
    bool ProcessPayload(const uint8_t* buf, size_t len);

    /// \brief Check if the end-of-stream sentinel arrived.
    bool IsEndOfStream() const;

    /// \brief Wait for playback to stop.
    ///
    /// \param  max_wait  The maximum time to wait.
    ///
    /// \return  True if playback stopped.
    bool WaitForPlaybackEnd(const Time& max_wait);

    inline QoeMetrics& metrics()
    {
      return metrics_;
    }

    inline const QoeMetrics& metrics() const
    {
      return metrics_;
    }

    inline PlaybackScheduler* scheduler()
    {
      return scheduler_;
    }

    inline PlaybackBuffer* playback_buffer()
    {
      return playback_;
    }

    inline FrameReassemblyBuffer& reassembly_buffer()
    {
      return reassembly_;
    }

   private:

    /// \brief Copy constructor.
    StreamReceiver(const StreamReceiver& other);

    /// \brief Copy operator.
    StreamReceiver& operator=(const StreamReceiver& other);

    /// \brief Evict expired partial frames, at most once per second.
    void MaybeEvictExpired(const Time& now);

    /// The display.
    FrameDisplayIf*         display_;

    /// The QoE metrics.
    QoeMetrics              metrics_;

    /// The reassembly buffer.
    FrameReassemblyBuffer   reassembly_;

    /// The playback buffer.
    PlaybackBuffer*         playback_;

    /// The playback scheduler.
    PlaybackScheduler*      scheduler_;

    /// The age at which partial frames are evicted.
    Time                    retention_;

    /// The time of the last expiration check.
    Time                    last_expire_check_;

  }; // end class StreamReceiver

} // namespace gbn

#endif // GBN_STREAMING_STREAM_RECEIVER_H
