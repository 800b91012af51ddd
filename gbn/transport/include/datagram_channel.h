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

/// \brief The GbnStream datagram channel header file.
///
/// Defines the unreliable, unordered datagram service that the GBN sender
/// and receiver run over.

#ifndef GBN_TRANSPORT_DATAGRAM_CHANNEL_H
#define GBN_TRANSPORT_DATAGRAM_CHANNEL_H

#include "ipv4_endpoint.h"
#include "itime.h"

#include <stddef.h>
#include <stdint.h>
#include <sys/types.h>

namespace gbn
{

  /// \brief The interface for a connectionless datagram channel.
  ///
  /// Implementations must allow SendTo() to be called from several threads
  /// concurrently with a RecvFrom() call in one other thread.  Close() may be
  /// called from any thread, and a blocked RecvFrom() must notice it no later
  /// than at the end of its maximum wait.
  class DatagramChannel
  {

   public:

    /// \brief Destructor.
    virtual ~DatagramChannel()
    { }

    /// \brief Send a datagram.
    ///
    /// \param  buf  The datagram bytes.
    /// \param  len  The datagram length.
    /// \param  dst  The destination endpoint.
    ///
    /// \return  The number of bytes sent, or -1 on error or if the channel
    ///          is closed.
    virtual ssize_t SendTo(const uint8_t* buf, size_t len,
                           const Ipv4Endpoint& dst) = 0;

    /// \brief Receive a datagram, waiting at most a given time.
    ///
    /// \param  buf       The buffer for the datagram bytes.
    /// \param  max_len   The size of the buffer.  Longer datagrams are
    ///                   truncated.
    /// \param  src       The source endpoint of the datagram.
    /// \param  max_wait  The maximum time to wait for a datagram.
    ///
    /// \return  The number of bytes received, 0 if no datagram arrived in
    ///          time, or -1 if the channel is closed or failed.
    virtual ssize_t RecvFrom(uint8_t* buf, size_t max_len, Ipv4Endpoint& src,
                             const Time& max_wait) = 0;

    /// \brief Close the channel.
    virtual void Close() = 0;

    /// \brief Check if the channel is open.
    ///
    /// \return  True if the channel is open.
    virtual bool IsOpen() const = 0;

    /// \brief Get the local endpoint of the channel.
    ///
    /// \return  The local endpoint.
    virtual Ipv4Endpoint GetLocalEndpoint() const = 0;

  }; // end class DatagramChannel

} // namespace gbn

#endif // GBN_TRANSPORT_DATAGRAM_CHANNEL_H
