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
#include "ipv4_endpoint.h"
#include "itime.h"
#include "log.h"
#include "pseudo_channel.h"
#include "session_registry.h"
#include "stream_session.h"
#include "vector_frame_source.h"

#include <vector>

#include <unistd.h>

using ::gbn::Ipv4Endpoint;
using ::gbn::Log;
using ::gbn::PacketCodec;
using ::gbn::PseudoChannel;
using ::gbn::SessionConfig;
using ::gbn::SessionRegistry;
using ::gbn::StreamSession;
using ::gbn::Time;
using ::gbn::VectorFrameSource;
using ::std::vector;

//============================================================================
class SessionRegistryTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(SessionRegistryTest);

  CPPUNIT_TEST(TestAddRemove);
  CPPUNIT_TEST(TestIsStreaming);
  CPPUNIT_TEST(TestAckRoutingAndReapFinished);
  CPPUNIT_TEST(TestReapIdle);

  CPPUNIT_TEST_SUITE_END();

  PseudoChannel*    channel;
  SessionRegistry*  registry;
  Ipv4Endpoint      peer_a;
  Ipv4Endpoint      peer_b;

  //==========================================================================
  StreamSession* MakeSession(const Ipv4Endpoint& peer, const char* name)
  {
    StreamSession*  session = new StreamSession(*channel, peer, name);
    SessionConfig   config;

    config.rto_sec = 10.0;
    config.fps     = 100.0;

    CPPUNIT_ASSERT(session->Configure(config));

    return session;
  }

 public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");

    channel  = new PseudoChannel(Ipv4Endpoint("10.0.0.1:5004"));
    registry = new SessionRegistry();
    peer_a   = Ipv4Endpoint("10.0.0.2:6000");
    peer_b   = Ipv4Endpoint("10.0.0.3:6000");
  }

  //==========================================================================
  void tearDown()
  {
    // Sessions send through the channel, so they go first.
    delete registry;
    delete channel;

    registry = NULL;
    channel  = NULL;

    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void TestAddRemove()
  {
    CPPUNIT_ASSERT(!registry->Add(NULL));

    CPPUNIT_ASSERT(!registry->Add(MakeSession(peer_a, "a.mjpeg")));
    CPPUNIT_ASSERT(registry->Contains(peer_a));
    CPPUNIT_ASSERT(!registry->Contains(peer_b));
    CPPUNIT_ASSERT(registry->NumSessions() == 1);

    // A second session for the same peer replaces the first.
    CPPUNIT_ASSERT(registry->Add(MakeSession(peer_a, "b.mjpeg")));
    CPPUNIT_ASSERT(registry->NumSessions() == 1);

    CPPUNIT_ASSERT(!registry->Add(MakeSession(peer_b, "a.mjpeg")));
    CPPUNIT_ASSERT(registry->NumSessions() == 2);

    vector<Ipv4Endpoint>  peers = registry->GetPeers();

    CPPUNIT_ASSERT(peers.size() == 2);

    CPPUNIT_ASSERT(registry->Remove(peer_a));
    CPPUNIT_ASSERT(!registry->Remove(peer_a));
    CPPUNIT_ASSERT(!registry->Contains(peer_a));
    CPPUNIT_ASSERT(registry->NumSessions() == 1);

    registry->Clear();
    CPPUNIT_ASSERT(registry->NumSessions() == 0);
  }

  //==========================================================================
  void TestIsStreaming()
  {
    StreamSession*  session = MakeSession(peer_a, "a.mjpeg");

    CPPUNIT_ASSERT(session->Start(new VectorFrameSource(50, 10, 0)));
    CPPUNIT_ASSERT(!registry->Add(session));

    CPPUNIT_ASSERT(registry->IsStreaming(peer_a, "a.mjpeg"));
    CPPUNIT_ASSERT(!registry->IsStreaming(peer_a, "b.mjpeg"));
    CPPUNIT_ASSERT(!registry->IsStreaming(peer_b, "a.mjpeg"));
  }

  //==========================================================================
  void TestAckRoutingAndReapFinished()
  {
    StreamSession*  session = MakeSession(peer_a, "a.mjpeg");

    CPPUNIT_ASSERT(session->Start(new VectorFrameSource(1, 10, 0)));
    CPPUNIT_ASSERT(!registry->Add(session));

    // One chunk for the frame and one end-of-stream chunk.
    Time  end_time = Time::Now() + Time(5.0);

    while (session->sender().NextSeqNum() < 2)
    {
      CPPUNIT_ASSERT(Time::Now() < end_time);
      usleep(1000);
    }

    vector<uint8_t>  ack;

    PacketCodec::MakeAck(1, ack);

    CPPUNIT_ASSERT(!registry->ProcessAckDatagram(peer_b, &ack[0],
                                                 ack.size()));
    CPPUNIT_ASSERT(session->sender().InFlight() == 2);

    CPPUNIT_ASSERT(registry->ProcessAckDatagram(peer_a, &ack[0],
                                                ack.size()));
    CPPUNIT_ASSERT(session->sender().InFlight() == 0);

    while (!session->IsFinished())
    {
      CPPUNIT_ASSERT(Time::Now() < end_time);
      usleep(1000);
    }

    CPPUNIT_ASSERT(!registry->IsStreaming(peer_a, "a.mjpeg"));
    CPPUNIT_ASSERT(registry->Reap(Time::Now(), Time(30.0)) == 1);
    CPPUNIT_ASSERT(registry->NumSessions() == 0);
  }

  //==========================================================================
  void TestReapIdle()
  {
    CPPUNIT_ASSERT(!registry->Add(MakeSession(peer_a, "a.mjpeg")));
    CPPUNIT_ASSERT(!registry->Add(MakeSession(peer_b, "b.mjpeg")));

    CPPUNIT_ASSERT(registry->Reap(Time::Now(), Time(30.0)) == 0);
    CPPUNIT_ASSERT(registry->NumSessions() == 2);

    CPPUNIT_ASSERT(registry->Reap(Time::Now() + Time(60.0), Time(30.0)) == 2);
    CPPUNIT_ASSERT(registry->NumSessions() == 0);
  }

}; // end class SessionRegistryTest

CPPUNIT_TEST_SUITE_REGISTRATION(SessionRegistryTest);
