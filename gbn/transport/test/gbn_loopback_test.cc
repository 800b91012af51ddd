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
#include "gbn_sender.h"
#include "ipv4_endpoint.h"
#include "itime.h"
#include "log.h"
#include "pseudo_channel.h"
#include "runnable_if.h"
#include "string_utils.h"
#include "thread.h"
#include "udp_channel.h"

#include <string>
#include <vector>

using ::gbn::DatagramChannel;
using ::gbn::GbnReceiver;
using ::gbn::GbnSender;
using ::gbn::Ipv4Endpoint;
using ::gbn::Log;
using ::gbn::PseudoChannel;
using ::gbn::RunnableIf;
using ::gbn::SenderStats;
using ::gbn::StringUtils;
using ::gbn::Thread;
using ::gbn::Time;
using ::gbn::UdpChannel;
using ::std::string;
using ::std::vector;

namespace
{
  /// Reads acknowledgments from the sender's channel.
  class AckReader : public RunnableIf
  {

   public:

    AckReader(DatagramChannel& c, GbnSender& s)
        : channel(c), sender(s), stop(false)
    { }

    virtual ~AckReader()
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
          sender.ProcessAckDatagram(buf, static_cast<size_t>(len));
        }
      }
    }

    DatagramChannel&  channel;
    GbnSender&        sender;
    volatile bool     stop;
  };

  /// Receives a number of payloads.
  class PayloadReader : public RunnableIf
  {

   public:

    PayloadReader(GbnReceiver& r, size_t n)
        : receiver(r), count(n), payloads(), closed(false)
    { }

    virtual ~PayloadReader()
    { }

    virtual void Run()
    {
      while (payloads.size() < count)
      {
        vector<uint8_t>  payload;

        if (receiver.Recv(payload) != gbn::RECV_OK)
        {
          closed = true;
          break;
        }

        payloads.push_back(string(payload.begin(), payload.end()));
      }
    }

    GbnReceiver&     receiver;
    size_t           count;
    vector<string>   payloads;
    volatile bool    closed;
  };

  /// Sends n numbered payloads and checks they all arrive in order.
  void RunTransfer(DatagramChannel& send_channel,
                   DatagramChannel& recv_channel, GbnSender& sender,
                   size_t n)
  {
    GbnReceiver    receiver(recv_channel);
    AckReader      ack_reader(send_channel, sender);
    PayloadReader  payload_reader(receiver, n);
    Thread         ack_thread;
    Thread         payload_thread;

    CPPUNIT_ASSERT(receiver.Configure(sender.window_size(), 10, 2048));
    CPPUNIT_ASSERT(sender.Start());
    CPPUNIT_ASSERT(ack_thread.StartThread(&ack_reader));
    CPPUNIT_ASSERT(payload_thread.StartThread(&payload_reader));

    for (size_t i = 0; i < n; ++i)
    {
      string  payload = StringUtils::FormatString(32, "payload-%zu", i);

      CPPUNIT_ASSERT(sender.Send(
                       reinterpret_cast<const uint8_t*>(payload.data()),
                       payload.size()) == gbn::SEND_OK);
    }

    CPPUNIT_ASSERT(sender.WaitForAllAcked(Time(20.0)));

    CPPUNIT_ASSERT(payload_thread.JoinThread());

    ack_reader.stop = true;
    CPPUNIT_ASSERT(ack_thread.JoinThread());

    sender.Stop();

    CPPUNIT_ASSERT(!payload_reader.closed);
    CPPUNIT_ASSERT(payload_reader.payloads.size() == n);

    for (size_t i = 0; i < n; ++i)
    {
      CPPUNIT_ASSERT(payload_reader.payloads[i] ==
                     StringUtils::FormatString(32, "payload-%zu", i));
    }

    CPPUNIT_ASSERT(receiver.GetStats().packets_delivered == n);
  }
}

//============================================================================
class GbnLoopbackTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(GbnLoopbackTest);

  CPPUNIT_TEST(TestLosslessTransfer);
  CPPUNIT_TEST(TestLossyTransfer);
  CPPUNIT_TEST(TestUdpTransfer);

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
  void TestLosslessTransfer()
  {
    PseudoChannel  a(Ipv4Endpoint("127.0.0.1:7001"));
    PseudoChannel  b(Ipv4Endpoint("127.0.0.1:7002"));

    a.set_record_sent(false);
    b.set_record_sent(false);
    a.Link(&b);
    b.Link(&a);

    GbnSender  sender(a, b.GetLocalEndpoint());

    CPPUNIT_ASSERT(sender.Configure(8, Time::FromMsec(100)));

    RunTransfer(a, b, sender, 500);

    CPPUNIT_ASSERT(sender.GetStats().timeouts == 0);
  }

  //==========================================================================
  void TestLossyTransfer()
  {
    PseudoChannel  a(Ipv4Endpoint("127.0.0.1:7001"));
    PseudoChannel  b(Ipv4Endpoint("127.0.0.1:7002"));

    a.set_record_sent(false);
    b.set_record_sent(false);
    a.Link(&b);
    b.Link(&a);

    GbnSender  sender(a, b.GetLocalEndpoint());

    CPPUNIT_ASSERT(sender.Configure(8, Time::FromMsec(20)));
    CPPUNIT_ASSERT(sender.ConfigureLoss(0.2, 0.0, 0, 0));
    sender.SetLossSeed(42);

    RunTransfer(a, b, sender, 200);

    SenderStats  stats = sender.GetStats();

    CPPUNIT_ASSERT(stats.packets_lost > 0);
    CPPUNIT_ASSERT(stats.retransmissions > 0);
    CPPUNIT_ASSERT(stats.packets_sent ==
                   (stats.packets_delivered + stats.packets_lost));
  }

  //==========================================================================
  void TestUdpTransfer()
  {
    UdpChannel  a;
    UdpChannel  b;

    CPPUNIT_ASSERT(a.Open(Ipv4Endpoint("127.0.0.1", 0)));
    CPPUNIT_ASSERT(b.Open(Ipv4Endpoint("127.0.0.1", 0)));
    CPPUNIT_ASSERT(b.GetLocalEndpoint().port() != 0);

    GbnSender  sender(a, b.GetLocalEndpoint());

    CPPUNIT_ASSERT(sender.Configure(5, Time::FromMsec(100)));

    RunTransfer(a, b, sender, 100);

    a.Close();
    CPPUNIT_ASSERT(!a.IsOpen());

    uint8_t       buf[16];
    Ipv4Endpoint  src;

    CPPUNIT_ASSERT(a.RecvFrom(buf, sizeof(buf), src, Time::FromMsec(1)) < 0);
    CPPUNIT_ASSERT(a.SendTo(buf, sizeof(buf), b.GetLocalEndpoint()) < 0);
  }

}; // end class GbnLoopbackTest

CPPUNIT_TEST_SUITE_REGISTRATION(GbnLoopbackTest);
