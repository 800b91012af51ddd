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

#include "config_info.h"
#include "control_message.h"
#include "ipv4_endpoint.h"
#include "itime.h"
#include "log.h"
#include "qoe_metrics.h"
#include "recording_display.h"
#include "stream_server.h"
#include "string_utils.h"
#include "udp_channel.h"
#include "video_client.h"

#include <string>
#include <vector>

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

using ::gbn::ConfigInfo;
using ::gbn::ControlStatus;
using ::gbn::Ipv4Endpoint;
using ::gbn::Log;
using ::gbn::QoeStats;
using ::gbn::RecordingDisplay;
using ::gbn::StreamServer;
using ::gbn::StringUtils;
using ::gbn::Time;
using ::gbn::UdpChannel;
using ::gbn::VideoClient;
using ::std::string;
using ::std::vector;

namespace
{
  /// The number of frames in the test clip.
  const size_t  kNumFrames = 10;
}

//============================================================================
class StreamServerTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(StreamServerTest);

  CPPUNIT_TEST(TestPlayToEnd);
  CPPUNIT_TEST(TestUnknownMedia);
  CPPUNIT_TEST(TestBadMediaName);
  CPPUNIT_TEST(TestNoServer);

  CPPUNIT_TEST_SUITE_END();

  string                     media_dir;
  string                     clip_path;
  vector< vector<uint8_t> >  frames;
  StreamServer*              server;

  //==========================================================================
  void WriteClip()
  {
    FILE*  fp = fopen(clip_path.c_str(), "wb");

    CPPUNIT_ASSERT(fp != NULL);

    for (size_t i = 0; i < kNumFrames; ++i)
    {
      vector<uint8_t>  frame;

      frame.push_back(0xff);
      frame.push_back(0xd8);

      for (size_t j = 0; j < (500 + (i * 300)); ++j)
      {
        frame.push_back(static_cast<uint8_t>(((i + j) % 200) + 1));
      }

      frame.push_back(0xff);
      frame.push_back(0xd9);

      CPPUNIT_ASSERT(fwrite(&frame[0], 1, frame.size(), fp) == frame.size());
      frames.push_back(frame);
    }

    CPPUNIT_ASSERT(fclose(fp) == 0);
  }

  //==========================================================================
  void ConfigureClient(ConfigInfo& ci, const Ipv4Endpoint& server_ep)
  {
    ci.Add("Client.ServerAddr", StringUtils::FormatString(
             32, "127.0.0.1:%u",
             static_cast<unsigned int>(server_ep.port_hbo())));
    ci.Add("Client.ControlRetries", "3");
    ci.Add("Client.ControlTimeoutMs", "500");
    ci.Add("Stream.Fps", "100");
  }

 public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");

    char  tmpl[] = "/tmp/gbn_media_XXXXXX";

    CPPUNIT_ASSERT(mkdtemp(tmpl) != NULL);

    media_dir = tmpl;
    clip_path = media_dir + "/clip.mjpeg";
    frames.clear();

    WriteClip();

    ConfigInfo  ci;

    ci.Add("Server.Port", "0");
    ci.Add("Server.MediaDir", media_dir);
    ci.Add("Stream.Fps", "100");
    ci.Add("Gbn.RtoSec", "0.1");

    server = new StreamServer();

    CPPUNIT_ASSERT(server->Initialize(ci));
    CPPUNIT_ASSERT(server->Start());
  }

  //==========================================================================
  void tearDown()
  {
    server->Stop();
    delete server;
    server = NULL;

    unlink(clip_path.c_str());
    rmdir(media_dir.c_str());

    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void TestPlayToEnd()
  {
    RecordingDisplay  display;
    VideoClient       client(&display);
    ConfigInfo        ci;

    ConfigureClient(ci, server->GetLocalEndpoint());

    CPPUNIT_ASSERT(client.Initialize(ci));
    CPPUNIT_ASSERT(client.Play("clip.mjpeg") == gbn::CONTROL_OK);
    CPPUNIT_ASSERT(client.WaitForEnd(Time(20.0)));

    vector<RecordingDisplay::Record>  records = display.GetRecords();

    CPPUNIT_ASSERT(records.size() == kNumFrames);

    for (size_t i = 0; i < records.size(); ++i)
    {
      CPPUNIT_ASSERT(records[i].frame_id == static_cast<uint32_t>(i));
      CPPUNIT_ASSERT(records[i].frame == frames[i]);
    }

    QoeStats  stats = client.GetQoeStats();

    CPPUNIT_ASSERT(stats.eos_received);
    CPPUNIT_ASSERT(stats.frames_displayed == kNumFrames);
    // The cycle after the last frame may begin before the end of stream
    // arrives, and then counts as a drop.
    CPPUNIT_ASSERT(stats.dropped_frames <= 1);

    client.Stop();

    CPPUNIT_ASSERT(server->registry().NumSessions() == 0);
  }

  //==========================================================================
  void TestUnknownMedia()
  {
    RecordingDisplay  display;
    VideoClient       client(&display);
    ConfigInfo        ci;

    ConfigureClient(ci, server->GetLocalEndpoint());

    CPPUNIT_ASSERT(client.Initialize(ci));
    CPPUNIT_ASSERT(client.Play("missing.mjpeg") == gbn::CONTROL_NOT_FOUND);
    CPPUNIT_ASSERT(server->registry().NumSessions() == 0);
    CPPUNIT_ASSERT(display.NumFrames() == 0);
  }

  //==========================================================================
  void TestBadMediaName()
  {
    RecordingDisplay  display;
    VideoClient       client(&display);
    ConfigInfo        ci;

    ConfigureClient(ci, server->GetLocalEndpoint());

    CPPUNIT_ASSERT(client.Initialize(ci));
    CPPUNIT_ASSERT(client.Play("../clip.mjpeg") == gbn::CONTROL_BAD_REQUEST);
    CPPUNIT_ASSERT(server->registry().NumSessions() == 0);
  }

  //==========================================================================
  void TestNoServer()
  {
    // A bound socket that never answers.
    UdpChannel  silent;

    CPPUNIT_ASSERT(silent.Open(Ipv4Endpoint("127.0.0.1", 0)));

    RecordingDisplay  display;
    VideoClient       client(&display);
    ConfigInfo        ci;

    ConfigureClient(ci, silent.GetLocalEndpoint());
    ci.Add("Client.ControlRetries", "2");
    ci.Add("Client.ControlTimeoutMs", "100");

    Time  start = Time::Now();

    CPPUNIT_ASSERT(client.Initialize(ci));
    CPPUNIT_ASSERT(client.Play("clip.mjpeg") == gbn::CONTROL_NO_REPLY);
    CPPUNIT_ASSERT((Time::Now() - start) >= Time::FromMsec(200));

    silent.Close();
  }

}; // end class StreamServerTest

CPPUNIT_TEST_SUITE_REGISTRATION(StreamServerTest);
