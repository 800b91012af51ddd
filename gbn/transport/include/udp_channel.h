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

/// \brief The GbnStream UDP channel header file.

#ifndef GBN_TRANSPORT_UDP_CHANNEL_H
#define GBN_TRANSPORT_UDP_CHANNEL_H

#include "datagram_channel.h"

#include <pthread.h>

namespace gbn
{

  /// \brief A datagram channel over a bound UDP socket.
  ///
  /// Receives wait in select() for at most the requested time.  Close() only
  /// marks the channel closed, so that a concurrent select() never sees a
  /// reused descriptor.  The socket is released in the destructor.
  class UdpChannel : public DatagramChannel
  {

   public:

    /// \brief Constructor.
    UdpChannel();

    /// \brief Destructor.
    virtual ~UdpChannel();

    /// \brief Create the socket and bind it.
    ///
    /// \param  local  The local endpoint.  A zero port binds an ephemeral
    ///                port and a zero address binds all interfaces.
    ///
    /// \return  True on success, false otherwise.
    bool Open(const Ipv4Endpoint& local);

    virtual ssize_t SendTo(const uint8_t* buf, size_t len,
                           const Ipv4Endpoint& dst);

    virtual ssize_t RecvFrom(uint8_t* buf, size_t max_len, Ipv4Endpoint& src,
                             const Time& max_wait);

    virtual void Close();

    virtual bool IsOpen() const;

    virtual Ipv4Endpoint GetLocalEndpoint() const;

   private:

    /// \brief Copy constructor.
    UdpChannel(const UdpChannel& other);

    /// \brief Copy operator.
    UdpChannel& operator=(const UdpChannel& other);

    /// The socket file descriptor, or -1.
    int                      sock_fd_;

    /// Whether the channel is open.
    bool                     is_open_;

    /// The bound local endpoint.
    Ipv4Endpoint             local_;

    /// Protects is_open_.
    mutable pthread_mutex_t  mutex_;

  }; // end class UdpChannel

} // namespace gbn

#endif // GBN_TRANSPORT_UDP_CHANNEL_H
