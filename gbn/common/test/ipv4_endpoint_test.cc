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

#include "ipv4_endpoint.h"
#include "log.h"

#include <map>
#include <string>

#include <arpa/inet.h>

using ::gbn::Ipv4Endpoint;
using ::gbn::Log;
using ::std::map;
using ::std::string;


//============================================================================
class Ipv4EndpointTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(Ipv4EndpointTest);

  CPPUNIT_TEST(TestConstructors);
  CPPUNIT_TEST(TestSetEndpoint);
  CPPUNIT_TEST(TestSockAddr);
  CPPUNIT_TEST(TestOrdering);

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
  void TestConstructors()
  {
    Ipv4Endpoint  ep1("192.168.10.1:5555");

    CPPUNIT_ASSERT(ep1.address() == inet_addr("192.168.10.1"));
    CPPUNIT_ASSERT(ep1.port() == htons(5555));
    CPPUNIT_ASSERT(ep1.port_hbo() == 5555);
    CPPUNIT_ASSERT(ep1.ToString() == "192.168.10.1:5555");

    Ipv4Endpoint  ep2("192.168.10.1", 5555);
    CPPUNIT_ASSERT(ep1 == ep2);

    Ipv4Endpoint  ep3(inet_addr("192.168.10.1"), htons(5555));
    CPPUNIT_ASSERT(ep1 == ep3);

    Ipv4Endpoint  ep4(ep1);
    CPPUNIT_ASSERT(ep4 == ep1);

    Ipv4Endpoint  ep5;
    CPPUNIT_ASSERT(ep5.ToString() == "0.0.0.0:0");
    ep5 = ep1;
    CPPUNIT_ASSERT(ep5 == ep1);

    Ipv4Endpoint  bad("not-an-endpoint");
    CPPUNIT_ASSERT(bad.address() == 0);
    CPPUNIT_ASSERT(bad.port() == 0);
  }

  //==========================================================================
  void TestSetEndpoint()
  {
    Ipv4Endpoint  ep("10.0.0.1:80");

    CPPUNIT_ASSERT(ep.SetEndpoint("127.0.0.1:5004"));
    CPPUNIT_ASSERT(ep.ToString() == "127.0.0.1:5004");

    // Failures leave the endpoint unchanged.
    CPPUNIT_ASSERT(!ep.SetEndpoint("127.0.0.1"));
    CPPUNIT_ASSERT(!ep.SetEndpoint("127.0.0.1:70000"));
    CPPUNIT_ASSERT(!ep.SetEndpoint("127.0.0.1:port"));
    CPPUNIT_ASSERT(!ep.SetEndpoint("300.0.0.1:5004"));
    CPPUNIT_ASSERT(!ep.SetEndpoint("1:2:3"));
    CPPUNIT_ASSERT(ep.ToString() == "127.0.0.1:5004");
  }

  //==========================================================================
  void TestSockAddr()
  {
    Ipv4Endpoint        ep("127.0.0.1:6000");
    struct sockaddr_in  addr;

    ep.ToSockAddr(&addr);

    CPPUNIT_ASSERT(addr.sin_family == AF_INET);
    CPPUNIT_ASSERT(addr.sin_port == htons(6000));
    CPPUNIT_ASSERT(addr.sin_addr.s_addr == htonl(INADDR_LOOPBACK));

    Ipv4Endpoint  back(addr);
    CPPUNIT_ASSERT(back == ep);
  }

  //==========================================================================
  void TestOrdering()
  {
    Ipv4Endpoint  a("10.0.0.1:9000");
    Ipv4Endpoint  b("10.0.0.1:10000");
    Ipv4Endpoint  c("10.0.0.2:1");

    CPPUNIT_ASSERT(a < b);
    CPPUNIT_ASSERT(b < c);
    CPPUNIT_ASSERT(!(b < a));
    CPPUNIT_ASSERT(!(a < a));
    CPPUNIT_ASSERT(a != b);

    map<Ipv4Endpoint, int>  registry;
    registry[c] = 3;
    registry[a] = 1;
    registry[b] = 2;
    registry[Ipv4Endpoint("10.0.0.1:9000")] = 4;

    CPPUNIT_ASSERT(registry.size() == 3);
    CPPUNIT_ASSERT(registry[a] == 4);
    CPPUNIT_ASSERT(registry.begin()->first == a);
  }

}; // end class Ipv4EndpointTest

CPPUNIT_TEST_SUITE_REGISTRATION(Ipv4EndpointTest);
