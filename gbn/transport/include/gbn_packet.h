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

/// \brief The GbnStream GBN packet header file.
///
/// Provides the wire codec for Go-Back-N data packets and acknowledgments.

#ifndef GBN_TRANSPORT_GBN_PACKET_H
#define GBN_TRANSPORT_GBN_PACKET_H

#include "gbn_types.h"

#include <string>
#include <vector>

#include <stdint.h>

namespace gbn
{

  /// \brief A decoded GBN packet.
  ///
  /// The wire layout is the 16-bit sequence number and the 16-bit checksum,
  /// both big-endian, followed by the payload bytes.  An acknowledgment uses
  /// the same layout with an empty payload, and its sequence number field
  /// carries the cumulative acknowledgment number.
  struct GbnPacket
  {
    GbnPacket() : seq_num(0), checksum(0), payload()
    { }

    /// The sequence number, or the acknowledgment number for an ACK.
    uint16_t              seq_num;

    /// The checksum as stated on the wire.
    uint16_t              checksum;

    /// The payload bytes.
    std::vector<uint8_t>  payload;

  }; // end struct GbnPacket

  /// \brief Static methods for checksumming, serializing and deserializing
  /// GBN packets.
  ///
  /// The checksum is the 16-bit one's-complement sum, with end-around
  /// carry, of the big-endian 16-bit words of the checksummed region, bit
  /// inverted.  An odd trailing byte is the high byte of a final word.  For a
  /// data packet the region is the sequence number followed by the payload.
  /// For an ACK the region is the acknowledgment number alone, which is the
  /// same value as the checksum of an empty data packet.
  class PacketCodec
  {

   public:

    /// \brief Compute the checksum of a byte region.
    ///
    /// \param  data  The bytes to checksum.  May be NULL if len is 0.
    /// \param  len   The number of bytes.
    ///
    /// \return  The checksum.
    static uint16_t Checksum(const uint8_t* data, size_t len);

    /// \brief Compute the checksum of a data packet.
    ///
    /// \param  seq_num      The sequence number.
    /// \param  payload      The payload bytes.  May be NULL if payload_len
    ///                      is 0.
    /// \param  payload_len  The payload length.
    ///
    /// \return  The checksum over the sequence number and the payload.
    static uint16_t ComputeChecksum(uint16_t seq_num, const uint8_t* payload,
                                    size_t payload_len);

    /// \brief Verify a decoded packet's stated checksum.
    ///
    /// \param  pkt  The decoded packet.
    ///
    /// \return  True if the recomputed checksum matches.
    static bool Verify(const GbnPacket& pkt);

    /// \brief Serialize a header and payload.
    ///
    /// This is a pure concatenation, no checksum is computed.
    ///
    /// \param  seq_num      The sequence number.
    /// \param  checksum     The checksum.
    /// \param  payload      The payload bytes.
    /// \param  payload_len  The payload length.
    /// \param  out          The serialized bytes.  Replaced.
    static void Serialize(uint16_t seq_num, uint16_t checksum,
                          const uint8_t* payload, size_t payload_len,
                          std::vector<uint8_t>& out);

    /// \brief Deserialize a datagram.
    ///
    /// No validation other than the length check is done.
    ///
    /// \param  buf  The datagram bytes.
    /// \param  len  The datagram length.
    /// \param  pkt  The decoded packet.
    ///
    /// \return  True on success, false if the datagram is shorter than the
    ///          header.
    static bool Deserialize(const uint8_t* buf, size_t len, GbnPacket& pkt);

    /// \brief Build a checksummed data packet.
    ///
    /// \param  seq_num      The sequence number.
    /// \param  payload      The payload bytes.
    /// \param  payload_len  The payload length.
    /// \param  out          The serialized packet.  Replaced.
    static void MakeDataPacket(uint16_t seq_num, const uint8_t* payload,
                               size_t payload_len,
                               std::vector<uint8_t>& out);

    /// \brief Build a checksummed cumulative acknowledgment.
    ///
    /// \param  ack_num  The acknowledgment number.
    /// \param  out      The serialized acknowledgment.  Replaced.
    static void MakeAck(uint16_t ack_num, std::vector<uint8_t>& out);

   private:

    /// \brief Constructor, not used.
    PacketCodec();

    /// \brief Add the big-endian words of a region to a running sum.
    ///
    /// \param  sum   The running sum, folded to 16 bits.
    /// \param  data  The bytes.
    /// \param  len   The number of bytes.
    ///
    /// \return  The updated, folded sum.
    static uint32_t AddWords(uint32_t sum, const uint8_t* data, size_t len);

  }; // end class PacketCodec

} // namespace gbn

#endif // GBN_TRANSPORT_GBN_PACKET_H
