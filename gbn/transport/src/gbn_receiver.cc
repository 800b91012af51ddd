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

/// \brief The GbnStream Go-Back-N receiver source file.

#include "gbn_receiver.h"

#include "gbn_packet.h"
#include "log.h"
#include "scoped_lock.h"
#include "string_utils.h"
#include "unused.h"

#include <inttypes.h>

using ::gbn::ConfigInfo;
using ::gbn::DatagramChannel;
using ::gbn::GbnPacket;
using ::gbn::GbnReceiver;
using ::gbn::Ipv4Endpoint;
using ::gbn::NonGbnDatagramHandlerIf;
using ::gbn::PacketCodec;
using ::gbn::ReceiverStats;
using ::gbn::RecvStatus;
using ::gbn::ScopedLock;
using ::gbn::StringUtils;
using ::gbn::Time;
using ::rapidjson::StringBuffer;
using ::rapidjson::Writer;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "GbnReceiver";
}

//============================================================================
GbnReceiver::GbnReceiver(DatagramChannel& channel)
    : channel_(channel),
      peer_(),
      has_peer_(false),
      window_size_(kDefaultWindowSize),
      poll_interval_(Time::FromMsec(kDefaultRecvPollMs)),
      recv_buf_(kDefaultMaxDatagramSize),
      expected_(0),
      closed_(false),
      non_gbn_handler_(NULL),
      stats_(),
      mutex_()
{
  pthread_mutex_init(&mutex_, NULL);
}

//============================================================================
GbnReceiver::GbnReceiver(DatagramChannel& channel, const Ipv4Endpoint& peer)
    : channel_(channel),
      peer_(peer),
      has_peer_(true),
      window_size_(kDefaultWindowSize),
      poll_interval_(Time::FromMsec(kDefaultRecvPollMs)),
      recv_buf_(kDefaultMaxDatagramSize),
      expected_(0),
      closed_(false),
      non_gbn_handler_(NULL),
      stats_(),
      mutex_()
{
  pthread_mutex_init(&mutex_, NULL);
}

//============================================================================
GbnReceiver::~GbnReceiver()
{
  pthread_mutex_destroy(&mutex_);
}

//============================================================================
bool GbnReceiver::Initialize(const ConfigInfo& ci)
{
  uint32_t  window_size = ci.GetUint("Gbn.WindowSize", kDefaultWindowSize);
  uint32_t  poll_ms     = ci.GetUint("Gbn.RecvPollMs", kDefaultRecvPollMs);
  uint32_t  max_size    = ci.GetUint(
    "Gbn.MaxDatagramSize", static_cast<uint32_t>(kDefaultMaxDatagramSize));

  if ((window_size == 0) || (window_size > kMaxWindowSize))
  {
    LogE(kClassName, __func__, "Invalid Gbn.WindowSize %" PRIu32 ".\n",
         window_size);
    return false;
  }

  if (!Configure(static_cast<uint16_t>(window_size), poll_ms, max_size))
  {
    return false;
  }

  LogC(kClassName, __func__, "Gbn.WindowSize            : %" PRIu32 "\n",
       window_size);
  LogC(kClassName, __func__, "Gbn.RecvPollMs            : %" PRIu32 "\n",
       poll_ms);
  LogC(kClassName, __func__, "Gbn.MaxDatagramSize       : %" PRIu32 "\n",
       max_size);

  return true;
}

//============================================================================
bool GbnReceiver::Configure(uint16_t window_size, uint32_t poll_ms,
                            size_t max_datagram_size)
{
  if ((window_size == 0) || (window_size > kMaxWindowSize))
  {
    LogE(kClassName, __func__, "Invalid window size %" PRIu16 ".\n",
         window_size);
    return false;
  }

  if (poll_ms == 0)
  {
    LogE(kClassName, __func__, "Polling interval must be positive.\n");
    return false;
  }

  if (max_datagram_size <= kGbnHeaderSize)
  {
    LogE(kClassName, __func__, "Maximum datagram size %zu cannot hold a GBN "
         "header.\n", max_datagram_size);
    return false;
  }

  ScopedLock  lock(&mutex_);

  window_size_   = window_size;
  poll_interval_ = Time::FromMsec(poll_ms);
  recv_buf_.resize(max_datagram_size);

  return true;
}

//============================================================================
void GbnReceiver::SetNonGbnHandler(NonGbnDatagramHandlerIf* handler)
{
  ScopedLock  lock(&mutex_);

  non_gbn_handler_ = handler;
}

//============================================================================
RecvStatus GbnReceiver::Recv(vector<uint8_t>& payload)
{
  Time  poll_interval;

  {
    ScopedLock  lock(&mutex_);
    poll_interval = poll_interval_;
  }

  while (!IsClosed())
  {
    Ipv4Endpoint  src;
    ssize_t       len = channel_.RecvFrom(&(recv_buf_[0]), recv_buf_.size(),
                                          src, poll_interval);

    if (len < 0)
    {
      LogD(kClassName, __func__, "Channel closed.\n");

      ScopedLock  lock(&mutex_);
      closed_ = true;
      break;
    }

    if (len == 0)
    {
      continue;
    }

    if (ProcessDatagram(&(recv_buf_[0]), static_cast<size_t>(len), src,
                        payload))
    {
      return RECV_OK;
    }
  }

  return RECV_CLOSED;
}

//============================================================================
bool GbnReceiver::ProcessDatagram(const uint8_t* buf, size_t len,
                                  const Ipv4Endpoint& src,
                                  vector<uint8_t>& payload)
{
  GbnPacket  pkt;
  bool       decoded = PacketCodec::Deserialize(buf, len, pkt);
  bool       valid   = (decoded && PacketCodec::Verify(pkt));

  NonGbnDatagramHandlerIf*  handler = NULL;

  {
    ScopedLock  lock(&mutex_);

    if (has_peer_ && (src != peer_))
    {
      LogD(kClassName, __func__, "Ignoring datagram from %s, peer is %s.\n",
           src.ToString().c_str(), peer_.ToString().c_str());
      return false;
    }

    handler = non_gbn_handler_;
  }

  // The handler is called without the lock, since it may block.
  if ((!valid) && (handler != NULL) &&
      handler->HandleNonGbnDatagram(buf, len, src))
  {
    return false;
  }

  ScopedLock  lock(&mutex_);

  ++stats_.packets_received;

  if (!decoded)
  {
    ++stats_.packets_malformed;

    LogD(kClassName, __func__, "Dropping malformed %zu byte datagram.\n",
         len);
    return false;
  }

  if (!valid)
  {
    ++stats_.packets_corrupt;

    LogD(kClassName, __func__, "Dropping corrupt packet, seq %" PRIu16
         ".\n", pkt.seq_num);
    return false;
  }

  if (!has_peer_)
  {
    peer_     = src;
    has_peer_ = true;

    LogI(kClassName, __func__, "Receiving from peer %s.\n",
         peer_.ToString().c_str());
  }

  if (pkt.seq_num == expected_)
  {
    SendAck(expected_);

    expected_ = SeqAdd(expected_, 1);
    ++stats_.packets_delivered;

    payload.swap(pkt.payload);
    return true;
  }

  uint16_t  last_delivered = SeqDiff(expected_, 1);

  if (SeqDiff(last_delivered, pkt.seq_num) < window_size_)
  {
    ++stats_.packets_duplicate;

    LogD(kClassName, __func__, "Duplicate seq %" PRIu16 ", expected %"
         PRIu16 ".\n", pkt.seq_num, expected_);
  }
  else
  {
    ++stats_.packets_out_of_order;

    LogD(kClassName, __func__, "Out of order seq %" PRIu16 ", expected %"
         PRIu16 ".\n", pkt.seq_num, expected_);
  }

  SendAck(last_delivered);

  return false;
}

//============================================================================
void GbnReceiver::Close()
{
  ScopedLock  lock(&mutex_);

  if (!closed_)
  {
    LogD(kClassName, __func__, "Closing receiver.\n");
  }

  closed_ = true;
}

//============================================================================
bool GbnReceiver::IsClosed() const
{
  ScopedLock  lock(&mutex_);

  return closed_;
}

//============================================================================
uint16_t GbnReceiver::Expected() const
{
  ScopedLock  lock(&mutex_);

  return expected_;
}

//============================================================================
bool GbnReceiver::GetPeer(Ipv4Endpoint& peer) const
{
  ScopedLock  lock(&mutex_);

  if (has_peer_)
  {
    peer = peer_;
  }

  return has_peer_;
}

//============================================================================
ReceiverStats GbnReceiver::GetStats() const
{
  ScopedLock  lock(&mutex_);

  return stats_;
}

//============================================================================
void GbnReceiver::WriteStats(Writer<StringBuffer>* writer) const
{
  if (writer == NULL)
  {
    return;
  }

  ReceiverStats  stats = GetStats();

  writer->Key("packets_received");
  writer->Uint64(stats.packets_received);

  writer->Key("packets_delivered");
  writer->Uint64(stats.packets_delivered);

  writer->Key("packets_corrupt");
  writer->Uint64(stats.packets_corrupt);

  writer->Key("packets_malformed");
  writer->Uint64(stats.packets_malformed);

  writer->Key("packets_duplicate");
  writer->Uint64(stats.packets_duplicate);

  writer->Key("packets_out_of_order");
  writer->Uint64(stats.packets_out_of_order);

  writer->Key("acks_sent");
  writer->Uint64(stats.acks_sent);
}

//============================================================================
string GbnReceiver::StatsToString() const
{
  ReceiverStats  stats = GetStats();

  return StringUtils::FormatString(
    256, "rcvd=%" PRIu64 " delivered=%" PRIu64 " corrupt=%" PRIu64
    " malformed=%" PRIu64 " dup=%" PRIu64 " ooo=%" PRIu64 " acks=%" PRIu64,
    stats.packets_received, stats.packets_delivered, stats.packets_corrupt,
    stats.packets_malformed, stats.packets_duplicate,
    stats.packets_out_of_order, stats.acks_sent);
}

//============================================================================
void GbnReceiver::SendAck(uint16_t ack_num)
{
  vector<uint8_t>  ack;

  PacketCodec::MakeAck(ack_num, ack);

  if (channel_.SendTo(&(ack[0]), ack.size(), peer_) ==
      static_cast<ssize_t>(ack.size()))
  {
    ++stats_.acks_sent;
  }
  else
  {
    LogD(kClassName, __func__, "Unable to send ack %" PRIu16 " to %s.\n",
         ack_num, peer_.ToString().c_str());
  }
}
