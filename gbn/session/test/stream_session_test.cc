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

#include "datagram_channel.h"
#include "gbn_receiver.h"
#include "ipv4_endpoint.h"
#include "itime.h"
#include "log.h"
#include "pseudo_channel.h"
#include "recording_display.h"
#include "runnable_if.h"
#include "stream_receiver.h"
#include "stream_session.h"
#include "thread.h"
#include "vector_frame_source.h"

#include <vector>

#include <unistd.h>

using ::gbn::DatagramChannel;
using ::gbn::GbnReceiver;
using ::gbn::Ipv4Endpoint;
using ::gbn::Log;
using ::gbn::PseudoChannel;
using ::gbn::RecordingDisplay;
using ::gbn::RunnableIf;
using ::gbn::SessionConfig;
using ::gbn::StreamReceiver;
using ::gbn::StreamSession;
using ::gbn::Thread;
using ::gbn::Time;
using ::gbn::VectorFrameSource;
using ::std::vector;

namespace
{
  /// Feeds acknowledgments read from the server channel to a session.
  class AckPump : public RunnableIf
  {

   public:

    AckPump(DatagramChannel& c, StreamSession& s)
        : channel(c), session(s), stop(false)
    { }

    virtual ~AckPump()
    { }

    virtual void Run()
    {
      uint8_t       buf[64];
      Ipv4Endpoint  src;

      while (!stop)
      {
        ssize_t  len = channel.RecvFrom(buf, sizeof(buf), src,
                                        Time::FromMsec(10));

        if (len < 0)
        {
          break;
        }

        if (len > 0)
        {
          session.ProcessAckDatagram(buf, static_cast<size_t>(len));
        }
      }
    }

    DatagramChannel&  channel;
    StreamSession&    session;
    volatile bool     stop;
  };

  /// Hands received payloads to the stream receiver until end of stream.
  class PayloadPump : public RunnableIf
  {

   public:

    PayloadPump(GbnReceiver& r, StreamReceiver& s)
        : receiver(r), stream_receiver(s)
    { }

    virtual ~PayloadPump()
    { }

    virtual void Run()
    {
      while (!stream_receiver.IsEndOfStream())
      {
        vector<uint8_t>  payload;

        if (receiver.Recv(payload) != gbn::RECV_OK)
        {
          break;
        }

        stream_receiver.ProcessPayload(&payload[0], payload.size());
      }
    }

    GbnReceiver&     receiver;
    StreamReceiver&  stream_receiver;
  };

  /// Polls a session until it reports that it has finished.
  bool WaitForFinished(StreamSession& session, const Time& max_wait)
  {
    Time  end_time = Time::Now() + max_wait;

    while (!session.IsFinished())
    {
      if (Time::Now() >= end_time)
      {
        return false;
      }

      usleep(5000);
    }

    return true;
  }
}

//============================================================================
class StreamSessionTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(StreamSessionTest);

  CPPUNIT_TEST(TestStreamsAllFrames);
  CPPUNIT_TEST(TestLossyStream);
  CPPUNIT_TEST(TestStopReleasesBlockedSession);
  CPPUNIT_TEST(TestIdle);
  CPPUNIT_TEST(TestStartTwice);

  CPPUNIT_TEST_SUITE_END();

  PseudoChannel*  server_channel;
  PseudoChannel*  client_channel;

  //==========================================================================
  void RunStream(const SessionConfig& config, size_t num_frames)
  {
    VectorFrameSource*  source = new VectorFrameSource(num_frames, 200, 150);
    StreamSession       session(*server_channel,
                                client_channel->GetLocalEndpoint(),
                                "clip.mjpeg");
    GbnReceiver         receiver(*client_channel,
                                 server_channel->GetLocalEndpoint());
    RecordingDisplay    display;
    StreamReceiver      stream_receiver(&display);
    AckPump             ack_pump(*server_channel, session);
    PayloadPump         payload_pump(receiver, stream_receiver);
    Thread              ack_thread;
    Thread              payload_thread;

    // The source is owned by the session once started.
    vector< vector<uint8_t> >  expected = source->frames();

    CPPUNIT_ASSERT(receiver.Configure(config.window_size, 10, 2048));
    CPPUNIT_ASSERT(stream_receiver.Configure(64, config.fps, 0, 5,
                                             Time(5.0)));
    CPPUNIT_ASSERT(stream_receiver.Start());
    CPPUNIT_ASSERT(ack_thread.StartThread(&ack_pump));
    CPPUNIT_ASSERT(payload_thread.StartThread(&payload_pump));

    CPPUNIT_ASSERT(session.Configure(config));
    CPPUNIT_ASSERT(session.Start(source));

    CPPUNIT_ASSERT(display.WaitForFrames(num_frames, Time(20.0)));
    CPPUNIT_ASSERT(stream_receiver.WaitForPlaybackEnd(Time(10.0)));
    CPPUNIT_ASSERT(WaitForFinished(session, Time(10.0)));
    CPPUNIT_ASSERT(session.FramesSent() == num_frames);

    vector<RecordingDisplay::Record>  records = display.GetRecords();

    CPPUNIT_ASSERT(records.size() == num_frames);

    for (size_t i = 0; i < records.size(); ++i)
    {
      CPPUNIT_ASSERT(records[i].frame_id == static_cast<uint32_t>(i));
      CPPUNIT_ASSERT(records[i].frame == expected[i]);
    }

    gbn::QoeStats  stats = stream_receiver.metrics().GetStats();

    CPPUNIT_ASSERT(stats.eos_received);
    // The cycle after the last frame may begin before the end of stream
    // arrives, and then counts as a drop.
    CPPUNIT_ASSERT(stats.dropped_frames <= 1);
    CPPUNIT_ASSERT(stats.frames_reassembled_total == num_frames);

    receiver.Close();
    CPPUNIT_ASSERT(payload_thread.JoinThread());

    ack_pump.stop = true;
    CPPUNIT_ASSERT(ack_thread.JoinThread());

    session.Stop();
    stream_receiver.Stop();
  }

 public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");

    server_channel = new PseudoChannel(Ipv4Endpoint("10.0.0.1:5004"));
    client_channel = new PseudoChannel(Ipv4Endpoint("10.0.0.2:6000"));

    server_channel->set_record_sent(false);
    client_channel->set_record_sent(false);
  }

  //==========================================================================
  void tearDown()
  {
    delete server_channel;
    delete client_channel;

    server_channel = NULL;
    client_channel = NULL;

    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void TestStreamsAllFrames()
  {
    server_channel->Link(client_channel);
    client_channel->Link(server_channel);

    SessionConfig  config;

    config.window_size     = 8;
    config.rto_sec         = 0.05;
    config.max_packet_size = 500;
    config.fps             = 100.0;

    RunStream(config, 20);
  }

  //==========================================================================
  void TestLossyStream()
  {
    server_channel->Link(client_channel);
    client_channel->Link(server_channel);

    SessionConfig  config;

    config.window_size      = 8;
    config.rto_sec          = 0.02;
    config.loss_random_rate = 0.2;
    config.loss_seed        = 7;
    config.max_packet_size  = 500;
    config.fps              = 100.0;

    RunStream(config, 20);
  }

  //==========================================================================
  void TestStopReleasesBlockedSession()
  {
    // Nothing is linked, so no acknowledgment ever arrives.
    server_channel->set_record_sent(true);

    StreamSession  session(*server_channel, Ipv4Endpoint("10.0.0.2:6000"),
                           "clip.mjpeg");
    SessionConfig  config;

    config.window_size     = 2;
    config.rto_sec         = 10.0;
    config.max_packet_size = 100;
    config.fps             = 1000.0;

    CPPUNIT_ASSERT(session.Configure(config));
    CPPUNIT_ASSERT(session.Start(new VectorFrameSource(50, 50, 0)));

    Time  end_time = Time::Now() + Time(5.0);

    while (session.sender().InFlight() < 2)
    {
      CPPUNIT_ASSERT(Time::Now() < end_time);
      usleep(1000);
    }

    session.Stop();

    CPPUNIT_ASSERT(!session.IsFinished());
    CPPUNIT_ASSERT(session.FramesSent() < 50);
    CPPUNIT_ASSERT(session.sender().IsStopped());
    CPPUNIT_ASSERT(server_channel->NumSentDatagrams() == 2);
  }

  //==========================================================================
  void TestIdle()
  {
    StreamSession  session(*server_channel, Ipv4Endpoint("10.0.0.2:6000"),
                           "clip.mjpeg");
    Time           now = Time::Now();

    CPPUNIT_ASSERT(!session.IsIdle(now, Time(30.0)));
    CPPUNIT_ASSERT(session.IsIdle(now + Time(31.0), Time(30.0)));
    CPPUNIT_ASSERT(!session.IsFinished());

    CPPUNIT_ASSERT(session.peer() == Ipv4Endpoint("10.0.0.2:6000"));
    CPPUNIT_ASSERT(session.media_name() == "clip.mjpeg");
  }

  //==========================================================================
  void TestStartTwice()
  {
    StreamSession  session(*server_channel, Ipv4Endpoint("10.0.0.2:6000"),
                           "clip.mjpeg");

    CPPUNIT_ASSERT(!session.Start(NULL));
    CPPUNIT_ASSERT(session.Configure(SessionConfig()));
    CPPUNIT_ASSERT(session.Start(new VectorFrameSource()));
    CPPUNIT_ASSERT(!session.Start(new VectorFrameSource()));

    session.Stop();
  }

}; // end class StreamSessionTest

CPPUNIT_TEST_SUITE_REGISTRATION(StreamSessionTest);
