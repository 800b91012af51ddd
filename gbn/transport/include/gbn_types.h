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

/// \brief The GbnStream transport types header file.
///
/// Constants, status codes and modular sequence number helpers shared by
/// the Go-Back-N sender and receiver.

#ifndef GBN_TRANSPORT_GBN_TYPES_H
#define GBN_TRANSPORT_GBN_TYPES_H

#include <stddef.h>
#include <stdint.h>

namespace gbn
{

  /// The size of the GBN header: a 16-bit sequence number followed by a
  /// 16-bit checksum, both in network byte order.
  const size_t    kGbnHeaderSize    = 4;

  /// The size of the sequence number space.
  const uint32_t  kSeqNumSpace      = 65536;

  /// The largest usable window size.  A window must be smaller than half of
  /// the sequence number space for modular comparisons to be unambiguous.
  const uint16_t  kMaxWindowSize    = 32767;

  /// The default window size.
  const uint16_t  kDefaultWindowSize = 5;

  /// The default fixed retransmission timeout, in seconds.
  const double    kDefaultRtoSec    = 0.5;

  /// The default receive polling interval, in milliseconds.  This bounds how
  /// long a blocked receive takes to notice cancellation.
  const uint32_t  kDefaultRecvPollMs = 10;

  /// The default maximum datagram size.
  const size_t    kDefaultMaxDatagramSize = 65536;

  /// The largest GBN packet that fits in one UDP datagram over IPv4.
  const size_t    kMaxGbnPacketSize = 65507;

  /// The largest payload that can be carried by one GBN packet.
  const size_t    kMaxGbnPayloadSize = (kMaxGbnPacketSize - kGbnHeaderSize);

  /// The result of a sender Send() or TrySend() call.
  enum SendStatus
  {
    SEND_OK = 0,        ///< The payload was accepted into the window.
    SEND_WINDOW_FULL,   ///< The window is full, nothing was sent.
    SEND_STOPPED,       ///< The sender has been stopped.
    SEND_ERROR          ///< The payload could not be sent.
  };

  /// The result of a receiver Recv() call.
  enum RecvStatus
  {
    RECV_OK = 0,        ///< An in-order payload was delivered.
    RECV_CLOSED         ///< The receiver or its channel is closed.
  };

  /// \brief Add an offset to a sequence number, modulo the sequence number
  /// space.
  ///
  /// \param  seq     The sequence number.
  /// \param  offset  The offset to add.
  ///
  /// \return  The resulting sequence number.
  inline uint16_t SeqAdd(uint16_t seq, uint32_t offset)
  {
    return static_cast<uint16_t>((static_cast<uint32_t>(seq) + offset) %
                                 kSeqNumSpace);
  }

  /// \brief Compute the forward distance from one sequence number to
  /// another, modulo the sequence number space.
  ///
  /// \param  to    The later sequence number.
  /// \param  from  The earlier sequence number.
  ///
  /// \return  (to - from) mod 65536.
  inline uint16_t SeqDiff(uint16_t to, uint16_t from)
  {
    return static_cast<uint16_t>(to - from);
  }

  /// \brief Get the name of a SendStatus value.
  ///
  /// \param  status  The status.
  ///
  /// \return  The status name.
  const char* SendStatusToString(SendStatus status);

} // namespace gbn

#endif // GBN_TRANSPORT_GBN_TYPES_H
