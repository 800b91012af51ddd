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

#include <cppunit/extensions/HelperMacros.h>

#include "gbn_packet.h"
#include "log.h"

#include <cstring>
#include <vector>

using ::gbn::GbnPacket;
using ::gbn::Log;
using ::gbn::PacketCodec;
using ::std::vector;

//============================================================================
class GbnPacketTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(GbnPacketTest);

  CPPUNIT_TEST(TestChecksumKnownValues);
  CPPUNIT_TEST(TestChecksumOddLength);
  CPPUNIT_TEST(TestWireLayout);
  CPPUNIT_TEST(TestVerifyDetectsBitFlips);
  CPPUNIT_TEST(TestAckChecksum);
  CPPUNIT_TEST(TestDeserializeTooShort);
  CPPUNIT_TEST(TestDeserializeHeaderOnly);

  CPPUNIT_TEST_SUITE_END();

 public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");
  }

  //==========================================================================
  void tearDown()
  {
    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void TestChecksumKnownValues()
  {
    // 0x0001 + 0xf203 + 0xf4f5 + 0xf6f7 = 0x2ddf0, folded 0xddf2.
    uint8_t  data[] = { 0x00, 0x01, 0xf2, 0x03, 0xf4, 0xf5, 0xf6, 0xf7 };

    CPPUNIT_ASSERT(PacketCodec::Checksum(data, sizeof(data)) == 0x220d);

    // The empty region sums to zero.
    CPPUNIT_ASSERT(PacketCodec::Checksum(NULL, 0) == 0xffff);

    // The checksum over the sequence number and payload matches the
    // checksum over the same bytes laid out contiguously.
    uint8_t  payload[] = { 0xf2, 0x03, 0xf4, 0xf5, 0xf6, 0xf7 };

    CPPUNIT_ASSERT(PacketCodec::ComputeChecksum(0x0001, payload,
                                                sizeof(payload)) == 0x220d);
  }

  //==========================================================================
  void TestChecksumOddLength()
  {
    // A trailing byte is the high byte of the final word.
    uint8_t  one[] = { 0x01 };

    CPPUNIT_ASSERT(PacketCodec::Checksum(one, sizeof(one)) == 0xfeff);

    uint8_t  three[] = { 0x12, 0x34, 0x56 };

    // 0x1234 + 0x5600 = 0x6834.
    CPPUNIT_ASSERT(PacketCodec::Checksum(three, sizeof(three)) == 0x97cb);
  }

  //==========================================================================
  void TestWireLayout()
  {
    uint8_t          payload[] = { 'a', 'b', 'c' };
    vector<uint8_t>  out;

    PacketCodec::Serialize(0x1234, 0xabcd, payload, sizeof(payload), out);

    CPPUNIT_ASSERT(out.size() == 7);
    CPPUNIT_ASSERT(out[0] == 0x12);
    CPPUNIT_ASSERT(out[1] == 0x34);
    CPPUNIT_ASSERT(out[2] == 0xab);
    CPPUNIT_ASSERT(out[3] == 0xcd);
    CPPUNIT_ASSERT(memcmp(&out[4], payload, sizeof(payload)) == 0);

    GbnPacket  pkt;

    CPPUNIT_ASSERT(PacketCodec::Deserialize(&out[0], out.size(), pkt));
    CPPUNIT_ASSERT(pkt.seq_num == 0x1234);
    CPPUNIT_ASSERT(pkt.checksum == 0xabcd);
    CPPUNIT_ASSERT(pkt.payload.size() == 3);
    CPPUNIT_ASSERT(pkt.payload[2] == 'c');

    // Serialization computes no checksum, so this packet does not verify.
    CPPUNIT_ASSERT(!PacketCodec::Verify(pkt));
  }

  //==========================================================================
  void TestVerifyDetectsBitFlips()
  {
    vector<uint8_t>  payload;

    for (int i = 0; i < 101; ++i)
    {
      payload.push_back(static_cast<uint8_t>((i * 37) & 0xff));
    }

    vector<uint8_t>  out;

    PacketCodec::MakeDataPacket(65535, &payload[0], payload.size(), out);

    GbnPacket  pkt;

    CPPUNIT_ASSERT(PacketCodec::Deserialize(&out[0], out.size(), pkt));
    CPPUNIT_ASSERT(pkt.seq_num == 65535);
    CPPUNIT_ASSERT(PacketCodec::Verify(pkt));

    // Every single bit flip, in the header or the payload, is detected.
    for (size_t byte = 0; byte < out.size(); ++byte)
    {
      for (int bit = 0; bit < 8; ++bit)
      {
        vector<uint8_t>  bad = out;

        bad[byte] ^= static_cast<uint8_t>(1 << bit);

        GbnPacket  bad_pkt;

        CPPUNIT_ASSERT(PacketCodec::Deserialize(&bad[0], bad.size(),
                                                bad_pkt));
        CPPUNIT_ASSERT(!PacketCodec::Verify(bad_pkt));
      }
    }
  }

  //==========================================================================
  void TestAckChecksum()
  {
    vector<uint8_t>  ack;

    PacketCodec::MakeAck(5, ack);

    CPPUNIT_ASSERT(ack.size() == 4);

    GbnPacket  pkt;

    CPPUNIT_ASSERT(PacketCodec::Deserialize(&ack[0], ack.size(), pkt));
    CPPUNIT_ASSERT(pkt.seq_num == 5);
    CPPUNIT_ASSERT(pkt.checksum == 0xfffa);
    CPPUNIT_ASSERT(pkt.payload.empty());
    CPPUNIT_ASSERT(PacketCodec::Verify(pkt));
  }

  //==========================================================================
  void TestDeserializeTooShort()
  {
    uint8_t    buf[] = { 0x00, 0x01, 0x02 };
    GbnPacket  pkt;

    CPPUNIT_ASSERT(!PacketCodec::Deserialize(buf, 0, pkt));
    CPPUNIT_ASSERT(!PacketCodec::Deserialize(buf, sizeof(buf), pkt));
    CPPUNIT_ASSERT(!PacketCodec::Deserialize(NULL, 4, pkt));
  }

  //==========================================================================
  void TestDeserializeHeaderOnly()
  {
    uint8_t    buf[] = { 0x00, 0x07, 0xff, 0xf8 };
    GbnPacket  pkt;

    CPPUNIT_ASSERT(PacketCodec::Deserialize(buf, sizeof(buf), pkt));
    CPPUNIT_ASSERT(pkt.seq_num == 7);
    CPPUNIT_ASSERT(pkt.payload.empty());
    CPPUNIT_ASSERT(PacketCodec::Verify(pkt));
  }

}; // end class GbnPacketTest

CPPUNIT_TEST_SUITE_REGISTRATION(GbnPacketTest);
