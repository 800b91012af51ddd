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

/// \brief The GbnStream video client header file.

#ifndef GBN_SESSION_VIDEO_CLIENT_H
#define GBN_SESSION_VIDEO_CLIENT_H

#include "config_info.h"
#include "control_message.h"
#include "frame_display_if.h"
#include "gbn_receiver.h"
#include "ipv4_endpoint.h"
#include "itime.h"
#include "qoe_metrics.h"
#include "runnable_if.h"
#include "stream_receiver.h"
#include "thread.h"
#include "udp_channel.h"

#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <string>

#include <pthread.h>
#include <stddef.h>
#include <stdint.h>

namespace gbn
{

  /// \brief The video client.
  ///
  /// Play() starts the receive path, then sends PLAY requests until the
  /// server replies or the retries run out.  GBN data and control replies
  /// share the client socket: a datagram that does not verify as a GBN
  /// packet and matches the reply grammar is a control reply.
  class VideoClient : public RunnableIf, public NonGbnDatagramHandlerIf
  {

   public:

    /// \brief Constructor.
    ///
    /// \param  display  The display.  May be NULL.
    explicit VideoClient(FrameDisplayIf* display);

    /// \brief Destructor.  Stops the client.
    virtual ~VideoClient();

    /// \brief Configure from the Client keys, the GBN receiver keys and the
    /// stream receiver keys.  Must be called once, before Play().
    ///
    /// \param  ci  The configuration.
    ///
    /// \return  True on success.
    bool Initialize(const ConfigInfo& ci);

    /// \brief Request a stream and start receiving it.
    ///
    /// \param  media_name  The media name.
    ///
    /// \return  The server's reply status, CONTROL_NO_REPLY if the server
    ///          never replied, or CONTROL_INTERNAL_ERROR on a local failure.
    ///          The client keeps receiving only on CONTROL_OK.
    ControlStatus Play(const std::string& media_name);

    /// \brief Wait for playback to end.
    ///
    /// \param  max_wait  The maximum time to wait.
    ///
    /// \return  True if playback ended.
    bool WaitForEnd(const Time& max_wait);

    /// \brief Send STOP if playing, and shut down the receive and playback
    /// paths.
    void Stop();

    /// \brief Get the QoE metrics.
    QoeStats GetQoeStats() const;

    /// \brief Write the QoE metrics and the GBN receiver statistics as JSON
    /// object members.
    ///
    /// \param  writer  The writer.
    void WriteStats(rapidjson::Writer<rapidjson::StringBuffer>* writer) const;

    inline const Ipv4Endpoint& server() const
    {
      return server_;
    }

    inline StreamReceiver& stream_receiver()
    {
      return stream_receiver_;
    }

    /// \brief Consume control replies from the server.
    virtual bool HandleNonGbnDatagram(const uint8_t* buf, size_t len,
                                      const Ipv4Endpoint& src);

    /// \brief The receive loop.
    virtual void Run();

   private:

    /// \brief Copy constructor.
    VideoClient(const VideoClient& other);

    /// \brief Copy operator.
    VideoClient& operator=(const VideoClient& other);

    /// \brief Send a request and wait for a reply, retrying on timeout.
    ControlStatus SendRequest(const std::string& request);

    /// \brief Stop the receive and playback paths.
    void Shutdown();

    /// The client socket.
    UdpChannel               channel_;

    /// The GBN receiver.
    GbnReceiver*             receiver_;

    /// The receive path of the stream.
    StreamReceiver           stream_receiver_;

    /// The server.
    Ipv4Endpoint             server_;

    /// The number of times a request is sent.
    uint32_t                 control_retries_;

    /// The wait for a reply to each request.
    Time                     control_timeout_;

    /// Whether a stream is playing.
    bool                     playing_;

    /// The last reply.
    ControlReply             reply_;

    /// The number of replies received.
    uint32_t                 reply_count_;

    /// The receive thread.
    Thread                   thread_;

    /// Protects the reply.
    mutable pthread_mutex_t  mutex_;

    /// Signaled when a reply arrives.
    pthread_cond_t           cond_;

  }; // end class VideoClient

} // namespace gbn

#endif // GBN_SESSION_VIDEO_CLIENT_H
