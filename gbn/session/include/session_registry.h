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

/// \brief The GbnStream session registry header file.

#ifndef GBN_SESSION_SESSION_REGISTRY_H
#define GBN_SESSION_SESSION_REGISTRY_H

#include "ipv4_endpoint.h"
#include "itime.h"
#include "stream_session.h"

#include <map>
#include <string>
#include <vector>

#include <pthread.h>
#include <stddef.h>
#include <stdint.h>

namespace gbn
{

  /// \brief The active stream sessions of a server, keyed by peer.
  ///
  /// The registry owns its sessions and stops them when they are removed.
  /// All methods are thread-safe.
  class SessionRegistry
  {

   public:

    /// \brief Constructor.
    SessionRegistry();

    /// \brief Destructor.  Stops and deletes all sessions.
    virtual ~SessionRegistry();

    /// \brief Add a session, replacing any session for the same peer.
    ///
    /// \param  session  The started session.  Ownership is transferred.
    ///
    /// \return  True if a session was replaced.
    bool Add(StreamSession* session);

    /// \brief Stop and delete the session for a peer.
    ///
    /// \param  peer  The peer.
    ///
    /// \return  True if there was a session.
    bool Remove(const Ipv4Endpoint& peer);

    /// \brief Check if a peer has a session.
    bool Contains(const Ipv4Endpoint& peer) const;

    /// \brief Check if a peer has an unfinished session for a media name.
    ///
    /// \param  peer        The peer.
    /// \param  media_name  The media name.
    bool IsStreaming(const Ipv4Endpoint& peer,
                     const std::string& media_name) const;

    /// \brief Pass an ACK datagram to the session for a peer.
    ///
    /// \param  peer  The peer.
    /// \param  buf   The datagram.
    /// \param  len   The datagram length.
    ///
    /// \return  False if the peer has no session or the ACK is invalid.
    bool ProcessAckDatagram(const Ipv4Endpoint& peer, const uint8_t* buf,
                            size_t len);

    /// \brief Stop and delete sessions that are finished, or idle for at
    /// least a given time.
    ///
    /// \param  now           The current time.
    /// \param  idle_timeout  The idle timeout.
    ///
    /// \return  The number of sessions removed.
    size_t Reap(const Time& now, const Time& idle_timeout);

    /// \brief Stop and delete all sessions.
    void Clear();

    /// \brief Get the number of sessions.
    size_t NumSessions() const;

    /// \brief Get the peers with sessions.
    std::vector<Ipv4Endpoint> GetPeers() const;

   private:

    /// \brief Copy constructor.
    SessionRegistry(const SessionRegistry& other);

    /// \brief Copy operator.
    SessionRegistry& operator=(const SessionRegistry& other);

    /// The sessions.
    std::map<Ipv4Endpoint, StreamSession*>  sessions_;

    /// Protects the sessions.
    mutable pthread_mutex_t                 mutex_;

  }; // end class SessionRegistry

} // namespace gbn

#endif // GBN_SESSION_SESSION_REGISTRY_H
