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

/// \brief The GbnStream UDP channel source file.

#include "udp_channel.h"

#include "log.h"
#include "scoped_lock.h"
#include "unused.h"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

using ::gbn::Ipv4Endpoint;
using ::gbn::ScopedLock;
using ::gbn::Time;
using ::gbn::UdpChannel;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "UdpChannel";
}

//============================================================================
UdpChannel::UdpChannel()
    : sock_fd_(-1),
      is_open_(false),
      local_(),
      mutex_()
{
  pthread_mutex_init(&mutex_, NULL);
}

//============================================================================
UdpChannel::~UdpChannel()
{
  Close();

  if (sock_fd_ >= 0)
  {
    close(sock_fd_);
    sock_fd_ = -1;
  }

  pthread_mutex_destroy(&mutex_);
}

//============================================================================
bool UdpChannel::Open(const Ipv4Endpoint& local)
{
  if (sock_fd_ >= 0)
  {
    LogE(kClassName, __func__, "Channel is already open.\n");
    return false;
  }

  int  fd = socket(PF_INET, SOCK_DGRAM, 0);

  if (fd < 0)
  {
    LogE(kClassName, __func__, "socket() error: %s\n", strerror(errno));
    return false;
  }

  int  reuse = 1;

  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0)
  {
    LogW(kClassName, __func__, "setsockopt(SO_REUSEADDR) error: %s\n",
         strerror(errno));
  }

  struct sockaddr_in  addr;
  local.ToSockAddr(&addr);

  if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0)
  {
    LogE(kClassName, __func__, "bind() to %s error: %s\n",
         local.ToString().c_str(), strerror(errno));
    close(fd);
    return false;
  }

  struct sockaddr_in  bound;
  socklen_t           bound_len = sizeof(bound);

  memset(&bound, 0, sizeof(bound));

  if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound),
                  &bound_len) < 0)
  {
    LogE(kClassName, __func__, "getsockname() error: %s\n", strerror(errno));
    close(fd);
    return false;
  }

  ScopedLock  lock(&mutex_);

  sock_fd_ = fd;
  is_open_ = true;
  local_   = Ipv4Endpoint(bound);

  LogI(kClassName, __func__, "UDP channel bound to %s.\n",
       local_.ToString().c_str());

  return true;
}

//============================================================================
ssize_t UdpChannel::SendTo(const uint8_t* buf, size_t len,
                           const Ipv4Endpoint& dst)
{
  if (!IsOpen())
  {
    return -1;
  }

  struct sockaddr_in  addr;
  dst.ToSockAddr(&addr);

  ssize_t  rv = sendto(sock_fd_, buf, len, 0,
                       reinterpret_cast<struct sockaddr*>(&addr),
                       sizeof(addr));

  if (rv < 0)
  {
    LogW(kClassName, __func__, "sendto() %s error: %s\n",
         dst.ToString().c_str(), strerror(errno));
    return -1;
  }

  return rv;
}

//============================================================================
ssize_t UdpChannel::RecvFrom(uint8_t* buf, size_t max_len, Ipv4Endpoint& src,
                             const Time& max_wait)
{
  if (!IsOpen())
  {
    return -1;
  }

  fd_set  read_fds;

  FD_ZERO(&read_fds);
  FD_SET(sock_fd_, &read_fds);

  struct timeval  tv = max_wait.ToTval();

  int  num_fds = select(sock_fd_ + 1, &read_fds, NULL, NULL, &tv);

  if (!IsOpen())
  {
    return -1;
  }

  if (num_fds < 0)
  {
    if (errno == EINTR)
    {
      return 0;
    }

    LogE(kClassName, __func__, "select() error: %s\n", strerror(errno));
    return -1;
  }

  if ((num_fds == 0) || (!FD_ISSET(sock_fd_, &read_fds)))
  {
    return 0;
  }

  struct sockaddr_in  addr;
  socklen_t           addr_len = sizeof(addr);

  memset(&addr, 0, sizeof(addr));

  ssize_t  rv = recvfrom(sock_fd_, buf, max_len, 0,
                         reinterpret_cast<struct sockaddr*>(&addr),
                         &addr_len);

  if (rv < 0)
  {
    // An ICMP port unreachable from an earlier send surfaces here on Linux.
    if ((errno == EAGAIN) || (errno == EWOULDBLOCK) || (errno == EINTR) ||
        (errno == ECONNREFUSED))
    {
      return 0;
    }

    LogE(kClassName, __func__, "recvfrom() error: %s\n", strerror(errno));
    return -1;
  }

  // A zero length datagram is legal UDP but never valid here.
  if (rv == 0)
  {
    return 0;
  }

  src = Ipv4Endpoint(addr);

  return rv;
}

//============================================================================
void UdpChannel::Close()
{
  ScopedLock  lock(&mutex_);

  if (is_open_)
  {
    LogD(kClassName, __func__, "Closing UDP channel %s.\n",
         local_.ToString().c_str());
  }

  is_open_ = false;
}

//============================================================================
bool UdpChannel::IsOpen() const
{
  ScopedLock  lock(&mutex_);

  return is_open_;
}

//============================================================================
Ipv4Endpoint UdpChannel::GetLocalEndpoint() const
{
  ScopedLock  lock(&mutex_);

  return local_;
}
