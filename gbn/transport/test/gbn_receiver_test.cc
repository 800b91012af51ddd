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
#include "gbn_receiver.h"
#include "ipv4_endpoint.h"
#include "itime.h"
#include "log.h"
#include "pseudo_channel.h"
#include "runnable_if.h"
#include "thread.h"

#include <cstring>
#include <string>
#include <vector>

#include <unistd.h>

using ::gbn::GbnPacket;
using ::gbn::GbnReceiver;
using ::gbn::Ipv4Endpoint;
using ::gbn::Log;
using ::gbn::NonGbnDatagramHandlerIf;
using ::gbn::PacketCodec;
using ::gbn::PseudoChannel;
using ::gbn::ReceiverStats;
using ::gbn::RecvStatus;
using ::gbn::RunnableIf;
using ::gbn::Thread;
using ::gbn::Time;
using ::std::string;
using ::std::vector;

namespace
{
  const char*  kPeer  = "10.0.0.1:5004";
  const char*  kOther = "10.0.0.2:5004";

  /// Calls Recv() in its own thread.
  class BlockedRecv : public RunnableIf
  {

   public:

    BlockedRecv(GbnReceiver& r)
        : receiver(r), status(gbn::RECV_OK), payload(), done(false)
    { }

    virtual ~BlockedRecv()
    { }

    virtual void Run()
    {
      status = receiver.Recv(payload);
      done   = true;
    }

    GbnReceiver&          receiver;
    volatile RecvStatus   status;
    vector<uint8_t>       payload;
    volatile bool         done;
  };

  /// Consumes datagrams that start with "200".
  class ReplyHandler : public NonGbnDatagramHandlerIf
  {

   public:

    ReplyHandler() : replies(0)
    { }

    virtual ~ReplyHandler()
    { }

    virtual bool HandleNonGbnDatagram(const uint8_t* buf, size_t len,
                                      const Ipv4Endpoint& src)
    {
      if ((len >= 3) && (memcmp(buf, "200", 3) == 0))
      {
        ++replies;
        return true;
      }

      return false;
    }

    int  replies;
  };
}

//============================================================================
class GbnReceiverTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(GbnReceiverTest);

  CPPUNIT_TEST(TestInOrderDelivery);
  CPPUNIT_TEST(TestOutOfOrderArrival);
  CPPUNIT_TEST(TestDuplicate);
  CPPUNIT_TEST(TestFutureBeforeFirst);
  CPPUNIT_TEST(TestCorruptAndMalformed);
  CPPUNIT_TEST(TestSequenceWraparound);
  CPPUNIT_TEST(TestCloseUnblocksRecv);
  CPPUNIT_TEST(TestChannelClosed);
  CPPUNIT_TEST(TestPeerLearning);
  CPPUNIT_TEST(TestNonGbnHandler);

  CPPUNIT_TEST_SUITE_END();

  PseudoChannel*  channel;

  //==========================================================================
  void Inject(uint16_t seq, const string& data,
              const char* src = kPeer)
  {
    vector<uint8_t>  pkt;

    PacketCodec::MakeDataPacket(
      seq, reinterpret_cast<const uint8_t*>(data.data()), data.size(), pkt);
    channel->InjectDatagram(&pkt[0], pkt.size(), Ipv4Endpoint(src));
  }

  //==========================================================================
  string RecvString(GbnReceiver& receiver)
  {
    vector<uint8_t>  payload;

    CPPUNIT_ASSERT(receiver.Recv(payload) == gbn::RECV_OK);

    return string(payload.begin(), payload.end());
  }

  //==========================================================================
  uint16_t PopAck()
  {
    PseudoChannel::Datagram  dgram;
    GbnPacket                pkt;

    CPPUNIT_ASSERT(channel->PopSentDatagram(dgram));
    CPPUNIT_ASSERT(dgram.endpoint == Ipv4Endpoint(kPeer));
    CPPUNIT_ASSERT(PacketCodec::Deserialize(&dgram.data[0],
                                            dgram.data.size(), pkt));
    CPPUNIT_ASSERT(pkt.payload.empty());
    CPPUNIT_ASSERT(PacketCodec::Verify(pkt));

    return pkt.seq_num;
  }

 public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");

    channel = new PseudoChannel(Ipv4Endpoint("10.0.0.9:6000"));
  }

  //==========================================================================
  void tearDown()
  {
    delete channel;
    channel = NULL;

    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void TestInOrderDelivery()
  {
    GbnReceiver  receiver(*channel, Ipv4Endpoint(kPeer));

    Inject(0, "zero");
    Inject(1, "one");

    CPPUNIT_ASSERT(RecvString(receiver) == "zero");
    CPPUNIT_ASSERT(RecvString(receiver) == "one");
    CPPUNIT_ASSERT(receiver.Expected() == 2);

    CPPUNIT_ASSERT(PopAck() == 0);
    CPPUNIT_ASSERT(PopAck() == 1);

    ReceiverStats  stats = receiver.GetStats();

    CPPUNIT_ASSERT(stats.packets_received == 2);
    CPPUNIT_ASSERT(stats.packets_delivered == 2);
    CPPUNIT_ASSERT(stats.acks_sent == 2);
  }

  //==========================================================================
  void TestOutOfOrderArrival()
  {
    GbnReceiver  receiver(*channel, Ipv4Endpoint(kPeer));

    // 3 arrives before 2.
    Inject(0, "0");
    Inject(1, "1");
    Inject(3, "3");
    Inject(2, "2");

    CPPUNIT_ASSERT(RecvString(receiver) == "0");
    CPPUNIT_ASSERT(RecvString(receiver) == "1");

    // 3 is dropped with a re-ack of the last in-order packet, then 2 is
    // delivered.
    CPPUNIT_ASSERT(RecvString(receiver) == "2");

    CPPUNIT_ASSERT(PopAck() == 0);
    CPPUNIT_ASSERT(PopAck() == 1);
    CPPUNIT_ASSERT(PopAck() == 1);
    CPPUNIT_ASSERT(PopAck() == 2);

    // The resent 3 is delivered.
    Inject(3, "3");

    CPPUNIT_ASSERT(RecvString(receiver) == "3");
    CPPUNIT_ASSERT(PopAck() == 3);

    ReceiverStats  stats = receiver.GetStats();

    CPPUNIT_ASSERT(stats.packets_out_of_order == 1);
    CPPUNIT_ASSERT(stats.packets_duplicate == 0);
    CPPUNIT_ASSERT(stats.packets_delivered == 4);
  }

  //==========================================================================
  void TestDuplicate()
  {
    GbnReceiver  receiver(*channel, Ipv4Endpoint(kPeer));

    Inject(0, "a");
    Inject(1, "b");
    Inject(0, "a");
    Inject(2, "c");

    CPPUNIT_ASSERT(RecvString(receiver) == "a");
    CPPUNIT_ASSERT(RecvString(receiver) == "b");
    CPPUNIT_ASSERT(RecvString(receiver) == "c");

    CPPUNIT_ASSERT(PopAck() == 0);
    CPPUNIT_ASSERT(PopAck() == 1);
    CPPUNIT_ASSERT(PopAck() == 1);
    CPPUNIT_ASSERT(PopAck() == 2);

    CPPUNIT_ASSERT(receiver.GetStats().packets_duplicate == 1);
  }

  //==========================================================================
  void TestFutureBeforeFirst()
  {
    GbnReceiver  receiver(*channel, Ipv4Endpoint(kPeer));
    vector<uint8_t>  payload;

    Inject(5, "five");

    CPPUNIT_ASSERT(!receiver.ProcessDatagram(NULL, 0, Ipv4Endpoint(kPeer),
                                             payload));

    Inject(0, "zero");

    CPPUNIT_ASSERT(RecvString(receiver) == "zero");

    // Nothing has been delivered, so the re-ack wraps to 65535.
    CPPUNIT_ASSERT(PopAck() == 65535);
    CPPUNIT_ASSERT(PopAck() == 0);

    ReceiverStats  stats = receiver.GetStats();

    CPPUNIT_ASSERT(stats.packets_out_of_order == 1);
    CPPUNIT_ASSERT(stats.packets_malformed == 1);
  }

  //==========================================================================
  void TestCorruptAndMalformed()
  {
    GbnReceiver      receiver(*channel, Ipv4Endpoint(kPeer));
    vector<uint8_t>  pkt;
    uint8_t          data[] = { 'o', 'k' };

    PacketCodec::MakeDataPacket(0, data, sizeof(data), pkt);

    vector<uint8_t>  bad = pkt;
    bad[5] ^= 0x40;

    channel->InjectDatagram(&bad[0], bad.size(), Ipv4Endpoint(kPeer));
    channel->InjectDatagram(&pkt[0], 3, Ipv4Endpoint(kPeer));
    channel->InjectDatagram(&pkt[0], pkt.size(), Ipv4Endpoint(kPeer));

    CPPUNIT_ASSERT(RecvString(receiver) == "ok");

    // Only the valid packet is acknowledged.
    CPPUNIT_ASSERT(PopAck() == 0);
    CPPUNIT_ASSERT(channel->NumSentDatagrams() == 0);

    ReceiverStats  stats = receiver.GetStats();

    CPPUNIT_ASSERT(stats.packets_corrupt == 1);
    CPPUNIT_ASSERT(stats.packets_malformed == 1);
    CPPUNIT_ASSERT(stats.packets_received == 3);
  }

  //==========================================================================
  void TestSequenceWraparound()
  {
    GbnReceiver      receiver(*channel, Ipv4Endpoint(kPeer));
    vector<uint8_t>  pkt;
    vector<uint8_t>  payload;
    uint8_t          data[] = { 'w' };

    channel->set_record_sent(false);

    for (uint32_t i = 0; i < 65538; ++i)
    {
      uint16_t  seq = static_cast<uint16_t>(i);

      PacketCodec::MakeDataPacket(seq, data, sizeof(data), pkt);
      CPPUNIT_ASSERT(receiver.ProcessDatagram(&pkt[0], pkt.size(),
                                              Ipv4Endpoint(kPeer), payload));
    }

    CPPUNIT_ASSERT(receiver.Expected() == 2);

    channel->set_record_sent(true);

    // 65535 and 1 are recent duplicates across the wrap, 3 is ahead.
    PacketCodec::MakeDataPacket(65535, data, sizeof(data), pkt);
    CPPUNIT_ASSERT(!receiver.ProcessDatagram(&pkt[0], pkt.size(),
                                             Ipv4Endpoint(kPeer), payload));

    PacketCodec::MakeDataPacket(1, data, sizeof(data), pkt);
    CPPUNIT_ASSERT(!receiver.ProcessDatagram(&pkt[0], pkt.size(),
                                             Ipv4Endpoint(kPeer), payload));

    PacketCodec::MakeDataPacket(3, data, sizeof(data), pkt);
    CPPUNIT_ASSERT(!receiver.ProcessDatagram(&pkt[0], pkt.size(),
                                             Ipv4Endpoint(kPeer), payload));

    CPPUNIT_ASSERT(PopAck() == 1);
    CPPUNIT_ASSERT(PopAck() == 1);
    CPPUNIT_ASSERT(PopAck() == 1);

    ReceiverStats  stats = receiver.GetStats();

    CPPUNIT_ASSERT(stats.packets_duplicate == 2);
    CPPUNIT_ASSERT(stats.packets_out_of_order == 1);
    CPPUNIT_ASSERT(stats.packets_delivered == 65538);
  }

  //==========================================================================
  void TestCloseUnblocksRecv()
  {
    GbnReceiver  receiver(*channel, Ipv4Endpoint(kPeer));
    BlockedRecv  blocked(receiver);
    Thread       thread;

    CPPUNIT_ASSERT(thread.StartThread(&blocked));

    usleep(30000);

    CPPUNIT_ASSERT(!blocked.done);

    Time  start = Time::Now();

    receiver.Close();

    CPPUNIT_ASSERT(thread.JoinThread());
    CPPUNIT_ASSERT(blocked.status == gbn::RECV_CLOSED);
    CPPUNIT_ASSERT((Time::Now() - start) < Time::FromMsec(500));
    CPPUNIT_ASSERT(receiver.IsClosed());

    // Closed is final.
    vector<uint8_t>  payload;

    Inject(0, "late");
    CPPUNIT_ASSERT(receiver.Recv(payload) == gbn::RECV_CLOSED);
  }

  //==========================================================================
  void TestChannelClosed()
  {
    GbnReceiver      receiver(*channel, Ipv4Endpoint(kPeer));
    vector<uint8_t>  payload;

    channel->Close();

    CPPUNIT_ASSERT(receiver.Recv(payload) == gbn::RECV_CLOSED);
    CPPUNIT_ASSERT(receiver.IsClosed());
  }

  //==========================================================================
  void TestPeerLearning()
  {
    GbnReceiver   receiver(*channel);
    Ipv4Endpoint  peer;

    CPPUNIT_ASSERT(!receiver.GetPeer(peer));

    Inject(0, "first");
    Inject(1, "intruder", kOther);
    Inject(1, "second");

    CPPUNIT_ASSERT(RecvString(receiver) == "first");
    CPPUNIT_ASSERT(receiver.GetPeer(peer));
    CPPUNIT_ASSERT(peer == Ipv4Endpoint(kPeer));

    CPPUNIT_ASSERT(RecvString(receiver) == "second");

    CPPUNIT_ASSERT(PopAck() == 0);
    CPPUNIT_ASSERT(PopAck() == 1);
    CPPUNIT_ASSERT(receiver.GetStats().packets_received == 2);
  }

  //==========================================================================
  void TestNonGbnHandler()
  {
    GbnReceiver   receiver(*channel, Ipv4Endpoint(kPeer));
    ReplyHandler  handler;
    string        reply = "200 OK movie.mjpeg\n";
    string        junk  = "garbage";

    receiver.SetNonGbnHandler(&handler);

    channel->InjectDatagram(reinterpret_cast<const uint8_t*>(reply.data()),
                            reply.size(), Ipv4Endpoint(kPeer));
    channel->InjectDatagram(reinterpret_cast<const uint8_t*>(junk.data()),
                            junk.size(), Ipv4Endpoint(kPeer));
    Inject(0, "data");

    CPPUNIT_ASSERT(RecvString(receiver) == "data");
    CPPUNIT_ASSERT(handler.replies == 1);

    ReceiverStats  stats = receiver.GetStats();

    CPPUNIT_ASSERT(stats.packets_received == 2);
    CPPUNIT_ASSERT(stats.packets_corrupt == 1);
  }

}; // end class GbnReceiverTest

CPPUNIT_TEST_SUITE_REGISTRATION(GbnReceiverTest);
