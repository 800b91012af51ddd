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

/// \brief The GbnStream GBN packet source file.

#include "gbn_packet.h"

#include "log.h"
#include "unused.h"

#include <cstring>

using ::gbn::GbnPacket;
using ::gbn::PacketCodec;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "PacketCodec";
}

//============================================================================
uint32_t PacketCodec::AddWords(uint32_t sum, const uint8_t* data, size_t len)
{
  for (size_t i = 0; i < len; i += 2)
  {
    uint32_t  word = (static_cast<uint32_t>(data[i]) << 8);

    if ((i + 1) < len)
    {
      word |= data[i + 1];
    }

    sum += word;
    sum  = ((sum & 0xffff) + (sum >> 16));
  }

  return sum;
}

//============================================================================
uint16_t PacketCodec::Checksum(const uint8_t* data, size_t len)
{
  uint32_t  sum = 0;

  if ((data != NULL) && (len > 0))
  {
    sum = AddWords(sum, data, len);
  }

  return static_cast<uint16_t>(~sum & 0xffff);
}

//============================================================================
uint16_t PacketCodec::ComputeChecksum(uint16_t seq_num,
                                      const uint8_t* payload,
                                      size_t payload_len)
{
  // The sequence number is a whole word, so the payload words stay aligned
  // and the two regions can be summed separately.
  uint8_t   seq_bytes[2];
  uint32_t  sum = 0;

  seq_bytes[0] = static_cast<uint8_t>(seq_num >> 8);
  seq_bytes[1] = static_cast<uint8_t>(seq_num & 0xff);

  sum = AddWords(sum, seq_bytes, sizeof(seq_bytes));

  if ((payload != NULL) && (payload_len > 0))
  {
    sum = AddWords(sum, payload, payload_len);
  }

  return static_cast<uint16_t>(~sum & 0xffff);
}

//============================================================================
bool PacketCodec::Verify(const GbnPacket& pkt)
{
  const uint8_t*  payload = (pkt.payload.empty() ? NULL : &pkt.payload[0]);

  return (ComputeChecksum(pkt.seq_num, payload, pkt.payload.size()) ==
          pkt.checksum);
}

//============================================================================
void PacketCodec::Serialize(uint16_t seq_num, uint16_t checksum,
                            const uint8_t* payload, size_t payload_len,
                            vector<uint8_t>& out)
{
  out.resize(kGbnHeaderSize + payload_len);

  out[0] = static_cast<uint8_t>(seq_num >> 8);
  out[1] = static_cast<uint8_t>(seq_num & 0xff);
  out[2] = static_cast<uint8_t>(checksum >> 8);
  out[3] = static_cast<uint8_t>(checksum & 0xff);

  if ((payload != NULL) && (payload_len > 0))
  {
    ::memcpy(&out[kGbnHeaderSize], payload, payload_len);
  }
}

//============================================================================
bool PacketCodec::Deserialize(const uint8_t* buf, size_t len, GbnPacket& pkt)
{
  if ((buf == NULL) || (len < kGbnHeaderSize))
  {
    return false;
  }

  pkt.seq_num  = static_cast<uint16_t>((static_cast<uint16_t>(buf[0]) << 8) |
                                       buf[1]);
  pkt.checksum = static_cast<uint16_t>((static_cast<uint16_t>(buf[2]) << 8) |
                                       buf[3]);
  pkt.payload.assign(buf + kGbnHeaderSize, buf + len);

  return true;
}

//============================================================================
void PacketCodec::MakeDataPacket(uint16_t seq_num, const uint8_t* payload,
                                 size_t payload_len, vector<uint8_t>& out)
{
  Serialize(seq_num, ComputeChecksum(seq_num, payload, payload_len), payload,
            payload_len, out);
}

//============================================================================
void PacketCodec::MakeAck(uint16_t ack_num, vector<uint8_t>& out)
{
  Serialize(ack_num, ComputeChecksum(ack_num, NULL, 0), NULL, 0, out);
}
