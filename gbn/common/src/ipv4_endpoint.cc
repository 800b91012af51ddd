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

#include "ipv4_endpoint.h"
#include "log.h"
#include "string_utils.h"
#include "unused.h"

#include <cstring>
#include <vector>

#include <arpa/inet.h>

using ::gbn::Ipv4Endpoint;
using ::gbn::StringUtils;
using ::std::string;
using ::std::vector;

namespace
{
  const char*  UNUSED(kClassName) = "Ipv4Endpoint";
}

//============================================================================
Ipv4Endpoint::Ipv4Endpoint()
    : address_nbo_(0), port_nbo_(0)
{
}

//============================================================================
Ipv4Endpoint::Ipv4Endpoint(const std::string& ep_str)
    : address_nbo_(0), port_nbo_(0)
{
  if (!SetEndpoint(ep_str))
  {
    LogE(kClassName, __func__, "Invalid Ipv4Endpoint string provided: %s\n",
         ep_str.c_str());
  }
}

//============================================================================
Ipv4Endpoint::Ipv4Endpoint(const std::string& addr, uint16_t port_hbo)
    : address_nbo_(0), port_nbo_(htons(port_hbo))
{
  struct in_addr  in;

  if (inet_pton(AF_INET, addr.c_str(), &in) != 1)
  {
    LogE(kClassName, __func__, "Invalid IPv4 address provided: %s\n",
         addr.c_str());
    return;
  }

  address_nbo_ = in.s_addr;
}

//============================================================================
Ipv4Endpoint::Ipv4Endpoint(uint32_t addr_nbo, uint16_t port_nbo)
    : address_nbo_(addr_nbo), port_nbo_(port_nbo)
{
}

//============================================================================
Ipv4Endpoint::Ipv4Endpoint(const struct sockaddr_in& addr)
    : address_nbo_(addr.sin_addr.s_addr), port_nbo_(addr.sin_port)
{
}

//============================================================================
Ipv4Endpoint::Ipv4Endpoint(const Ipv4Endpoint& ep)
    : address_nbo_(ep.address_nbo_), port_nbo_(ep.port_nbo_)
{
}

//============================================================================
Ipv4Endpoint::~Ipv4Endpoint()
{
  // Nothing to destroy.
}

//============================================================================
bool Ipv4Endpoint::SetEndpoint(const string& ep_str)
{
  vector<string>  tokens;
  StringUtils::Tokenize(ep_str, ":", tokens);

  if (tokens.size() != 2)
  {
    return false;
  }

  struct in_addr  in;

  if (inet_pton(AF_INET, tokens[0].c_str(), &in) != 1)
  {
    return false;
  }

  unsigned int  port_hbo = StringUtils::GetUint(tokens[1]);

  if (port_hbo > 65535)
  {
    return false;
  }

  address_nbo_ = in.s_addr;
  port_nbo_    = htons(static_cast<uint16_t>(port_hbo));

  return true;
}

//============================================================================
string Ipv4Endpoint::ToString() const
{
  char            addr_str[INET_ADDRSTRLEN];
  struct in_addr  in;

  in.s_addr = address_nbo_;

  if (inet_ntop(AF_INET, &in, addr_str, sizeof(addr_str)) == NULL)
  {
    return "?:" + StringUtils::ToString(static_cast<uint32_t>(port_hbo()));
  }

  return string(addr_str) + ":" +
    StringUtils::ToString(static_cast<uint32_t>(port_hbo()));
}

//============================================================================
void Ipv4Endpoint::ToSockAddr(struct sockaddr_in* address) const
{
  ::memset(address, 0, sizeof(struct sockaddr_in));
  address->sin_family      = AF_INET;
  address->sin_port        = port_nbo_;
  address->sin_addr.s_addr = address_nbo_;
}

//============================================================================
Ipv4Endpoint& Ipv4Endpoint::operator=(const Ipv4Endpoint& ep)
{
  address_nbo_ = ep.address_nbo_;
  port_nbo_    = ep.port_nbo_;
  return *this;
}

namespace gbn
{

//============================================================================
bool operator==(const Ipv4Endpoint& left, const Ipv4Endpoint& right)
{
  return ((left.address_nbo_ == right.address_nbo_) &&
          (left.port_nbo_ == right.port_nbo_));
}

//============================================================================
bool operator!=(const Ipv4Endpoint& left, const Ipv4Endpoint& right)
{
  return !(left == right);
}

//============================================================================
bool operator<(const Ipv4Endpoint& left, const Ipv4Endpoint& right)
{
  uint32_t  left_addr  = ntohl(left.address_nbo_);
  uint32_t  right_addr = ntohl(right.address_nbo_);

  if (left_addr != right_addr)
  {
    return (left_addr < right_addr);
  }

  return (ntohs(left.port_nbo_) < ntohs(right.port_nbo_));
}

} // namespace gbn
