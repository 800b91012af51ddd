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

/// \brief The GbnStream stream session header file.

#ifndef GBN_SESSION_STREAM_SESSION_H
#define GBN_SESSION_STREAM_SESSION_H

#include "config_info.h"
#include "datagram_channel.h"
#include "frame_source.h"
#include "gbn_sender.h"
#include "ipv4_endpoint.h"
#include "itime.h"
#include "runnable_if.h"
#include "stream_sender.h"
#include "thread.h"

#include <string>

#include <pthread.h>
#include <stddef.h>
#include <stdint.h>

namespace gbn
{

  /// \brief The parameters of the sessions created by a server.
  struct SessionConfig
  {
    SessionConfig();

    /// \brief Read the Gbn and Stream keys used by a session.
    ///
    /// \param  ci  The configuration.
    ///
    /// \return  True on success.
    bool Initialize(const ConfigInfo& ci);

    /// The GBN window size.
    uint16_t  window_size;

    /// The retransmission timeout.
    double    rto_sec;

    /// The uniform loss probability.
    double    loss_random_rate;

    /// The loss probability inside a burst.
    double    loss_burst_rate;

    /// The burst length.
    uint32_t  loss_burst_duration_ms;

    /// The burst period.
    uint32_t  loss_burst_interval_ms;

    /// The loss model seed, or 0 for a time based seed.
    uint32_t  loss_seed;

    /// The largest GBN payload.
    uint32_t  max_packet_size;

    /// The frame rate.
    double    fps;

  }; // end struct SessionConfig

  /// \brief One stream to one peer.
  ///
  /// A session owns a GBN sender bound to the peer and a streaming thread
  /// that paces frames from a frame source at the configured frame rate,
  /// ending with the end-of-stream sentinel.  ACKs from the peer are passed
  /// in by the server's dispatch loop.
  class StreamSession : public RunnableIf
  {

   public:

    /// \brief Constructor.
    ///
    /// \param  channel     The server channel.  Shared with other sessions.
    /// \param  peer        The peer.
    /// \param  media_name  The name of the streamed media.
    StreamSession(DatagramChannel& channel, const Ipv4Endpoint& peer,
                  const std::string& media_name);

    /// \brief Destructor.  Stops the session.
    virtual ~StreamSession();

    /// \brief Configure the session.
    ///
    /// \param  config  The session parameters.
    ///
    /// \return  True on success.
    bool Configure(const SessionConfig& config);

    /// \brief Start streaming.
    ///
    /// \param  source  The frame source.  Ownership is transferred, also on
    ///                 failure.
    ///
    /// \return  True on success.
    bool Start(FrameSource* source);

    /// \brief Stop streaming and join the streaming thread.  Unacknowledged
    /// packets are abandoned.
    void Stop();

    /// \brief Process an ACK datagram from the peer.
    ///
    /// \param  buf  The datagram.
    /// \param  len  The datagram length.
    ///
    /// \return  True if the ACK was valid.
    bool ProcessAckDatagram(const uint8_t* buf, size_t len);

    /// \brief Check if the stream has been sent in full, end of stream
    /// included, and acknowledged.
    bool IsFinished() const;

    /// \brief Check if the session has been idle for at least a given time.
    ///
    /// \param  now           The current time.
    /// \param  idle_timeout  The idle timeout.
    bool IsIdle(const Time& now, const Time& idle_timeout) const;

    inline const Ipv4Endpoint& peer() const
    {
      return peer_;
    }

    inline const std::string& media_name() const
    {
      return media_name_;
    }

    inline GbnSender& sender()
    {
      return sender_;
    }

    /// \brief Get the number of frames sent.
    uint32_t FramesSent() const;

    /// \brief The streaming loop.
    virtual void Run();

   private:

    /// \brief Copy constructor.
    StreamSession(const StreamSession& other);

    /// \brief Copy operator.
    StreamSession& operator=(const StreamSession& other);

    /// \brief Sleep until a time.
    ///
    /// \return  False if Stop() was called.
    bool WaitUntil(const Time& t);

    /// \brief Record activity.
    void Touch();

    /// The peer.
    Ipv4Endpoint             peer_;

    /// The media name.
    std::string              media_name_;

    /// The GBN sender.
    GbnSender                sender_;

    /// The chunking glue.
    StreamSender             stream_sender_;

    /// The frame source.  Owned.
    FrameSource*             source_;

    /// The time of the last ACK, or of the start.
    Time                     last_activity_;

    /// The number of frames sent.
    uint32_t                 frames_sent_;

    /// Whether the end-of-stream sentinel was sent.
    bool                     eos_sent_;

    /// Whether the streaming loop has exited.
    bool                     done_;

    /// Whether the session was started.
    bool                     started_;

    /// Whether Stop() was called.
    bool                     stop_requested_;

    /// The streaming thread.
    Thread                   thread_;

    /// Protects the members above, apart from the sender, which has its
    /// own lock.
    mutable pthread_mutex_t  mutex_;

    /// Signaled on Stop().
    pthread_cond_t           cond_;

  }; // end class StreamSession

} // namespace gbn

#endif // GBN_SESSION_STREAM_SESSION_H
