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

/// \brief The GbnStream stream server header file.

#ifndef GBN_SESSION_STREAM_SERVER_H
#define GBN_SESSION_STREAM_SERVER_H

#include "config_info.h"
#include "control_message.h"
#include "ipv4_endpoint.h"
#include "itime.h"
#include "runnable_if.h"
#include "session_registry.h"
#include "stream_session.h"
#include "thread.h"
#include "udp_channel.h"

#include <string>
#include <vector>

#include <pthread.h>
#include <stddef.h>
#include <stdint.h>

namespace gbn
{

  /// \brief The stream server.
  ///
  /// The server owns one UDP socket, shared by all sessions.  Its dispatch
  /// thread routes ACK datagrams to the session of their peer and answers
  /// control requests.  A PLAY request for a file in the media directory
  /// creates a session streaming that file to the requesting peer.
  class StreamServer : public RunnableIf
  {

   public:

    /// \brief Constructor.
    StreamServer();

    /// \brief Destructor.  Stops the server.
    virtual ~StreamServer();

    /// \brief Configure from the Server keys and the session keys.
    ///
    /// \param  ci  The configuration.
    ///
    /// \return  True on success.
    bool Initialize(const ConfigInfo& ci);

    /// \brief Open the socket and start the dispatch thread.
    ///
    /// \return  True on success.
    bool Start();

    /// \brief Stop the dispatch thread and all sessions, and close the
    /// socket.
    void Stop();

    /// \brief Get the bound socket endpoint.
    Ipv4Endpoint GetLocalEndpoint() const;

    inline SessionRegistry& registry()
    {
      return registry_;
    }

    /// \brief The dispatch loop.
    virtual void Run();

   private:

    /// \brief Copy constructor.
    StreamServer(const StreamServer& other);

    /// \brief Copy operator.
    StreamServer& operator=(const StreamServer& other);

    /// \brief Handle a received datagram.
    void HandleDatagram(const uint8_t* buf, size_t len,
                        const Ipv4Endpoint& src);

    /// \brief Handle a PLAY request.
    ControlStatus HandlePlay(const std::string& name,
                             const Ipv4Endpoint& src);

    /// \brief Send a control reply.
    void Reply(const Ipv4Endpoint& dst, ControlStatus status,
               const std::string& detail = "");

    bool IsStopRequested() const;

    /// The server socket.
    UdpChannel               channel_;

    /// The sessions.
    SessionRegistry          registry_;

    /// The parameters of new sessions.
    SessionConfig            session_config_;

    /// The UDP port.
    uint16_t                 port_;

    /// The directory of streamable media.
    std::string              media_dir_;

    /// The session idle timeout.
    Time                     idle_timeout_;

    /// Whether Stop() was called.
    bool                     stop_requested_;

    /// The dispatch thread.
    Thread                   thread_;

    /// Protects stop_requested_.
    mutable pthread_mutex_t  mutex_;

  }; // end class StreamServer

} // namespace gbn

#endif // GBN_SESSION_STREAM_SERVER_H
