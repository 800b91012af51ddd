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

#include "chunk_header.h"
#include "config_info.h"
#include "gbn_packet.h"
#include "gbn_sender.h"
#include "ipv4_endpoint.h"
#include "itime.h"
#include "log.h"
#include "pseudo_channel.h"
#include "stream_sender.h"

#include <string>
#include <vector>

using ::gbn::ChunkHeader;
using ::gbn::ConfigInfo;
using ::gbn::GbnPacket;
using ::gbn::GbnSender;
using ::gbn::Ipv4Endpoint;
using ::gbn::Log;
using ::gbn::PacketCodec;
using ::gbn::PseudoChannel;
using ::gbn::StreamSender;
using ::gbn::Time;
using ::std::string;
using ::std::vector;

//============================================================================
class StreamSenderTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(StreamSenderTest);

  CPPUNIT_TEST(TestChunking);
  CPPUNIT_TEST(TestEmptyFrameSkipped);
  CPPUNIT_TEST(TestTooManyChunks);
  CPPUNIT_TEST(TestEndOfStream);
  CPPUNIT_TEST(TestConfiguration);

  CPPUNIT_TEST_SUITE_END();

  PseudoChannel*  channel;
  GbnSender*      gbn_sender;
  StreamSender*   sender;

  //==========================================================================
  string PopChunk(ChunkHeader& hdr)
  {
    PseudoChannel::Datagram  dgram;
    GbnPacket                pkt;
    size_t                   data_off = 0;

    CPPUNIT_ASSERT(channel->PopSentDatagram(dgram));
    CPPUNIT_ASSERT(PacketCodec::Deserialize(&dgram.data[0],
                                            dgram.data.size(), pkt));
    CPPUNIT_ASSERT(PacketCodec::Verify(pkt));
    CPPUNIT_ASSERT(hdr.Parse(&pkt.payload[0], pkt.payload.size(), data_off));

    return string(pkt.payload.begin() + data_off, pkt.payload.end());
  }

 public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");

    channel    = new PseudoChannel(Ipv4Endpoint("127.0.0.1:5004"));
    gbn_sender = new GbnSender(*channel, Ipv4Endpoint("127.0.0.1:6000"));
    sender     = new StreamSender(*gbn_sender);

    CPPUNIT_ASSERT(gbn_sender->Configure(1000, Time(30.0)));
    CPPUNIT_ASSERT(gbn_sender->Start());
  }

  //==========================================================================
  void tearDown()
  {
    gbn_sender->Stop();

    delete sender;
    delete gbn_sender;
    delete channel;

    sender     = NULL;
    gbn_sender = NULL;
    channel    = NULL;

    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void TestChunking()
  {
    CPPUNIT_ASSERT(sender->Configure(12, 30.0));
    CPPUNIT_ASSERT(sender->max_chunk_data_size() == 4);

    string           text = "0123456789";
    vector<uint8_t>  frame(text.begin(), text.end());

    CPPUNIT_ASSERT(sender->SendFrame(frame) == gbn::SEND_OK);
    CPPUNIT_ASSERT(channel->NumSentDatagrams() == 3);

    ChunkHeader  hdr;

    CPPUNIT_ASSERT(PopChunk(hdr) == "0123");
    CPPUNIT_ASSERT((hdr.frame_id == 0) && (hdr.chunk_idx == 0) &&
                   (hdr.total_chunks == 3));
    CPPUNIT_ASSERT(PopChunk(hdr) == "4567");
    CPPUNIT_ASSERT(hdr.chunk_idx == 1);
    CPPUNIT_ASSERT(PopChunk(hdr) == "89");
    CPPUNIT_ASSERT(hdr.chunk_idx == 2);

    // Exactly one chunk.
    frame.resize(4);
    CPPUNIT_ASSERT(sender->SendFrame(frame) == gbn::SEND_OK);
    CPPUNIT_ASSERT(PopChunk(hdr) == "0123");
    CPPUNIT_ASSERT((hdr.frame_id == 1) && (hdr.total_chunks == 1));

    CPPUNIT_ASSERT(sender->next_frame_id() == 2);
    CPPUNIT_ASSERT(sender->chunks_sent() == 4);
    CPPUNIT_ASSERT(gbn_sender->InFlight() == 4);
  }

  //==========================================================================
  void TestEmptyFrameSkipped()
  {
    vector<uint8_t>  frame;

    CPPUNIT_ASSERT(sender->SendFrame(frame) == gbn::SEND_OK);
    CPPUNIT_ASSERT(channel->NumSentDatagrams() == 0);
    CPPUNIT_ASSERT(sender->next_frame_id() == 0);
  }

  //==========================================================================
  void TestTooManyChunks()
  {
    CPPUNIT_ASSERT(sender->Configure(9, 30.0));

    vector<uint8_t>  frame(65536, 0x55);

    CPPUNIT_ASSERT(sender->SendFrame(frame) == gbn::SEND_ERROR);
    CPPUNIT_ASSERT(channel->NumSentDatagrams() == 0);
    CPPUNIT_ASSERT(sender->next_frame_id() == 0);
  }

  //==========================================================================
  void TestEndOfStream()
  {
    CPPUNIT_ASSERT(sender->SendEndOfStream() == gbn::SEND_OK);

    ChunkHeader  hdr;

    CPPUNIT_ASSERT(PopChunk(hdr).empty());
    CPPUNIT_ASSERT(hdr.IsEndOfStream());
    CPPUNIT_ASSERT(hdr.chunk_idx == 0);

    gbn_sender->Stop();

    CPPUNIT_ASSERT(sender->SendEndOfStream() == gbn::SEND_STOPPED);
  }

  //==========================================================================
  void TestConfiguration()
  {
    CPPUNIT_ASSERT(!sender->Configure(8, 30.0));
    CPPUNIT_ASSERT(!sender->Configure(70000, 30.0));
    CPPUNIT_ASSERT(!sender->Configure(1400, 0.0));
    CPPUNIT_ASSERT(sender->max_chunk_data_size() == 1392);

    ConfigInfo  ci;

    ci.Add("Stream.MaxPacketSize", "508");
    ci.Add("Stream.Fps", "20");

    CPPUNIT_ASSERT(sender->Initialize(ci));
    CPPUNIT_ASSERT(sender->max_chunk_data_size() == 500);
    CPPUNIT_ASSERT(sender->frame_interval() == Time::FromMsec(50));
  }
};

CPPUNIT_TEST_SUITE_REGISTRATION(StreamSenderTest);
