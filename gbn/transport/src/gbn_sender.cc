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

/// \brief The GbnStream Go-Back-N sender source file.

#include "gbn_sender.h"

#include "callback.h"
#include "gbn_packet.h"
#include "log.h"
#include "scoped_lock.h"
#include "string_utils.h"
#include "unused.h"

#include <cerrno>
#include <cstring>

#include <inttypes.h>

using ::gbn::CallbackNoArg;
using ::gbn::ConfigInfo;
using ::gbn::DatagramChannel;
using ::gbn::GbnPacket;
using ::gbn::GbnSender;
using ::gbn::Ipv4Endpoint;
using ::gbn::PacketCodec;
using ::gbn::ScopedLock;
using ::gbn::SendStatus;
using ::gbn::SenderStats;
using ::gbn::StringUtils;
using ::gbn::Time;
using ::rapidjson::StringBuffer;
using ::rapidjson::Writer;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*     UNUSED(kClassName) = "GbnSender";

  /// The longest the timer thread sleeps without rechecking its state.
  const int64_t   kMaxTimerWaitMs    = 100;

  /// \brief Initialize a condition variable that waits on the monotonic
  /// clock, matching Time::Now().
  ///
  /// \param  cond  The condition variable.
  void InitMonotonicCond(pthread_cond_t* cond)
  {
    pthread_condattr_t  attr;

    pthread_condattr_init(&attr);

    if (pthread_condattr_setclock(&attr, CLOCK_MONOTONIC) != 0)
    {
      LogF(kClassName, __func__, "Unable to use the monotonic clock for "
           "condition variables.\n");
    }

    pthread_cond_init(cond, &attr);
    pthread_condattr_destroy(&attr);
  }
}

//============================================================================
GbnSender::GbnSender(DatagramChannel& channel, const Ipv4Endpoint& peer)
    : channel_(channel),
      peer_(peer),
      window_size_(kDefaultWindowSize),
      rto_(kDefaultRtoSec),
      loss_model_(),
      send_base_(0),
      next_seq_num_(0),
      unacked_(),
      timer_(),
      rto_handle_(),
      stats_(),
      start_time_(),
      started_(false),
      stopped_(false),
      thread_(),
      mutex_(),
      timer_cond_(),
      window_cond_()
{
  pthread_mutex_init(&mutex_, NULL);
  InitMonotonicCond(&timer_cond_);
  InitMonotonicCond(&window_cond_);
}

//============================================================================
GbnSender::~GbnSender()
{
  Stop();

  pthread_cond_destroy(&window_cond_);
  pthread_cond_destroy(&timer_cond_);
  pthread_mutex_destroy(&mutex_);
}

//============================================================================
bool GbnSender::Initialize(const ConfigInfo& ci)
{
  uint32_t  window_size = ci.GetUint("Gbn.WindowSize", kDefaultWindowSize);
  double    rto_sec     = ci.GetDouble("Gbn.RtoSec", kDefaultRtoSec);

  if ((window_size == 0) || (window_size > kMaxWindowSize))
  {
    LogE(kClassName, __func__, "Invalid Gbn.WindowSize %" PRIu32 ", must be "
         "1 to %" PRIu16 ".\n", window_size, kMaxWindowSize);
    return false;
  }

  if (rto_sec <= 0.0)
  {
    LogE(kClassName, __func__, "Invalid Gbn.RtoSec %f.\n", rto_sec);
    return false;
  }

  if (!Configure(static_cast<uint16_t>(window_size), Time(rto_sec)))
  {
    return false;
  }

  ScopedLock  lock(&mutex_);

  if (!loss_model_.Initialize(ci))
  {
    return false;
  }

  LogC(kClassName, __func__, "Gbn.WindowSize            : %" PRIu16 "\n",
       window_size_);
  LogC(kClassName, __func__, "Gbn.RtoSec                : %s\n",
       rto_.ToString().c_str());

  return true;
}

//============================================================================
bool GbnSender::Configure(uint16_t window_size, const Time& rto)
{
  if ((window_size == 0) || (window_size > kMaxWindowSize))
  {
    LogE(kClassName, __func__, "Invalid window size %" PRIu16 ".\n",
         window_size);
    return false;
  }

  if (rto <= Time())
  {
    LogE(kClassName, __func__, "Invalid retransmission timeout %s.\n",
         rto.ToString().c_str());
    return false;
  }

  ScopedLock  lock(&mutex_);

  if (started_)
  {
    LogE(kClassName, __func__, "Cannot reconfigure a started sender.\n");
    return false;
  }

  window_size_ = window_size;
  rto_         = rto;

  return true;
}

//============================================================================
bool GbnSender::ConfigureLoss(double random_rate, double burst_rate,
                              uint32_t burst_duration_ms,
                              uint32_t burst_interval_ms)
{
  ScopedLock  lock(&mutex_);

  return loss_model_.Configure(random_rate, burst_rate, burst_duration_ms,
                               burst_interval_ms);
}

//============================================================================
void GbnSender::SetLossSeed(uint32_t seed)
{
  ScopedLock  lock(&mutex_);

  loss_model_.SetSeed(seed);
}

//============================================================================
bool GbnSender::Start()
{
  {
    ScopedLock  lock(&mutex_);

    if (started_ || stopped_)
    {
      LogE(kClassName, __func__, "Sender to %s cannot be started twice.\n",
           peer_.ToString().c_str());
      return false;
    }

    start_time_ = Time::Now();
    started_    = true;
  }

  if (!thread_.StartThread(this))
  {
    LogE(kClassName, __func__, "Unable to start the timer thread.\n");

    ScopedLock  lock(&mutex_);
    started_ = false;
    return false;
  }

  LogI(kClassName, __func__, "Sender to %s started, window %" PRIu16
       ", rto %s, loss %s.\n", peer_.ToString().c_str(), window_size_,
       rto_.ToString().c_str(), loss_model_.ToString().c_str());

  return true;
}

//============================================================================
void GbnSender::Stop()
{
  {
    ScopedLock  lock(&mutex_);

    if (!stopped_)
    {
      stopped_ = true;

      timer_.CancelTimer(rto_handle_);

      if (!unacked_.empty())
      {
        LogD(kClassName, __func__, "Abandoning %zu unacknowledged "
             "packets.\n", unacked_.size());
      }
    }

    pthread_cond_broadcast(&timer_cond_);
    pthread_cond_broadcast(&window_cond_);
  }

  if (thread_.IsRunning())
  {
    thread_.JoinThread();
  }
}

//============================================================================
SendStatus GbnSender::Send(const uint8_t* payload, size_t len)
{
  return DoSend(payload, len, true);
}

//============================================================================
SendStatus GbnSender::TrySend(const uint8_t* payload, size_t len)
{
  return DoSend(payload, len, false);
}

//============================================================================
void GbnSender::OnAck(uint16_t ack_num)
{
  ScopedLock  lock(&mutex_);

  HandleAck(ack_num);
}

//============================================================================
bool GbnSender::ProcessAckDatagram(const uint8_t* buf, size_t len)
{
  GbnPacket  pkt;

  bool  valid = (PacketCodec::Deserialize(buf, len, pkt) &&
                 pkt.payload.empty() && PacketCodec::Verify(pkt));

  ScopedLock  lock(&mutex_);

  if (!valid)
  {
    ++stats_.acks_corrupt;

    LogD(kClassName, __func__, "Dropping invalid acknowledgment datagram of "
         "%zu bytes.\n", len);
    return false;
  }

  HandleAck(pkt.seq_num);

  return true;
}

//============================================================================
bool GbnSender::WaitForAllAcked(const Time& max_wait)
{
  ScopedLock  lock(&mutex_);

  timespec  deadline = (Time::Now() + max_wait).ToTspec();

  while ((!unacked_.empty()) && (!stopped_))
  {
    int  rv = pthread_cond_timedwait(&window_cond_, &mutex_, &deadline);

    if (rv == ETIMEDOUT)
    {
      break;
    }

    if (rv != 0)
    {
      LogW(kClassName, __func__, "pthread_cond_timedwait() error: %s\n",
           strerror(rv));
      break;
    }
  }

  return unacked_.empty();
}

//============================================================================
size_t GbnSender::InFlight() const
{
  ScopedLock  lock(&mutex_);

  return unacked_.size();
}

//============================================================================
uint16_t GbnSender::SendBase() const
{
  ScopedLock  lock(&mutex_);

  return send_base_;
}

//============================================================================
uint16_t GbnSender::NextSeqNum() const
{
  ScopedLock  lock(&mutex_);

  return next_seq_num_;
}

//============================================================================
bool GbnSender::IsStopped() const
{
  ScopedLock  lock(&mutex_);

  return stopped_;
}

//============================================================================
SenderStats GbnSender::GetStats() const
{
  SenderStats  stats;
  ScopedLock   lock(&mutex_);

  FillStats(stats);

  return stats;
}

//============================================================================
void GbnSender::WriteStats(Writer<StringBuffer>* writer) const
{
  if (writer == NULL)
  {
    return;
  }

  SenderStats  stats = GetStats();

  writer->Key("packets_sent");
  writer->Uint64(stats.packets_sent);

  writer->Key("packets_delivered");
  writer->Uint64(stats.packets_delivered);

  writer->Key("packets_lost");
  writer->Uint64(stats.packets_lost);

  writer->Key("retransmissions");
  writer->Uint64(stats.retransmissions);

  writer->Key("timeouts");
  writer->Uint64(stats.timeouts);

  writer->Key("acks_received");
  writer->Uint64(stats.acks_received);

  writer->Key("acks_ignored");
  writer->Uint64(stats.acks_ignored);

  writer->Key("acks_corrupt");
  writer->Uint64(stats.acks_corrupt);

  writer->Key("elapsed_time");
  writer->Double(stats.elapsed_time);
}

//============================================================================
string GbnSender::StatsToString() const
{
  SenderStats  stats = GetStats();

  return StringUtils::FormatString(
    256, "peer=%s sent=%" PRIu64 " delivered=%" PRIu64 " lost=%" PRIu64
    " retx=%" PRIu64 " timeouts=%" PRIu64 " acks=%" PRIu64 " ignored=%"
    PRIu64 " corrupt=%" PRIu64 " elapsed=%.3fs", peer_.ToString().c_str(),
    stats.packets_sent, stats.packets_delivered, stats.packets_lost,
    stats.retransmissions, stats.timeouts, stats.acks_received,
    stats.acks_ignored, stats.acks_corrupt, stats.elapsed_time);
}

//============================================================================
void GbnSender::Run()
{
  ScopedLock  lock(&mutex_);

  LogD(kClassName, __func__, "Timer thread running.\n");

  while (!stopped_)
  {
    Time  wait = timer_.GetNextExpirationTime(
      Time::FromMsec(kMaxTimerWaitMs));

    if (!wait.IsZero())
    {
      timespec  deadline = (Time::Now() + wait).ToTspec();
      int       rv       = pthread_cond_timedwait(&timer_cond_, &mutex_,
                                                  &deadline);

      if ((rv != 0) && (rv != ETIMEDOUT))
      {
        LogW(kClassName, __func__, "pthread_cond_timedwait() error: %s\n",
             strerror(rv));
      }
    }

    if (stopped_)
    {
      break;
    }

    timer_.DoCallbacks();
  }

  LogD(kClassName, __func__, "Timer thread exiting.\n");
}

//============================================================================
SendStatus GbnSender::DoSend(const uint8_t* payload, size_t len, bool block)
{
  if ((payload == NULL) && (len > 0))
  {
    LogE(kClassName, __func__, "NULL payload of length %zu.\n", len);
    return SEND_ERROR;
  }

  if (len > kMaxGbnPayloadSize)
  {
    LogE(kClassName, __func__, "Payload of %zu bytes exceeds the maximum of "
         "%zu bytes.\n", len, kMaxGbnPayloadSize);
    return SEND_ERROR;
  }

  ScopedLock  lock(&mutex_);

  while (true)
  {
    if (stopped_)
    {
      return SEND_STOPPED;
    }

    if (!started_)
    {
      LogE(kClassName, __func__, "Sender to %s has not been started.\n",
           peer_.ToString().c_str());
      return SEND_ERROR;
    }

    if (SeqDiff(next_seq_num_, send_base_) < window_size_)
    {
      break;
    }

    if (!block)
    {
      return SEND_WINDOW_FULL;
    }

    int  rv = pthread_cond_wait(&window_cond_, &mutex_);

    if (rv != 0)
    {
      LogE(kClassName, __func__, "pthread_cond_wait() error: %s\n",
           strerror(rv));
      return SEND_ERROR;
    }
  }

  bool  was_empty = unacked_.empty();

  unacked_.push_back(vector<uint8_t>());
  PacketCodec::MakeDataPacket(next_seq_num_, payload, len, unacked_.back());

  LogD(kClassName, __func__, "Sending seq %" PRIu16 " with %zu payload "
       "bytes.\n", next_seq_num_, len);

  Transmit(unacked_.back());

  if (was_empty)
  {
    RestartTimer();
  }

  next_seq_num_ = SeqAdd(next_seq_num_, 1);

  return SEND_OK;
}

//============================================================================
void GbnSender::HandleAck(uint16_t ack_num)
{
  ++stats_.acks_received;

  uint16_t  offset = SeqDiff(ack_num, send_base_);

  if (offset >= unacked_.size())
  {
    ++stats_.acks_ignored;

    LogD(kClassName, __func__, "Ignoring ack %" PRIu16 " outside window "
         "[%" PRIu16 ", %" PRIu16 ").\n", ack_num, send_base_,
         next_seq_num_);
    return;
  }

  size_t  num_acked = static_cast<size_t>(offset) + 1;

  unacked_.erase(unacked_.begin(), unacked_.begin() + num_acked);
  send_base_ = SeqAdd(send_base_, static_cast<uint32_t>(num_acked));

  LogD(kClassName, __func__, "Ack %" PRIu16 " released %zu packets, send "
       "base now %" PRIu16 ".\n", ack_num, num_acked, send_base_);

  if (unacked_.empty())
  {
    timer_.CancelTimer(rto_handle_);
    pthread_cond_signal(&timer_cond_);
  }
  else
  {
    RestartTimer();
  }

  pthread_cond_broadcast(&window_cond_);
}

//============================================================================
void GbnSender::OnTimeout()
{
  if (stopped_ || unacked_.empty())
  {
    return;
  }

  ++stats_.timeouts;

  LogD(kClassName, __func__, "Timeout, resending %zu packets from seq %"
       PRIu16 ".\n", unacked_.size(), send_base_);

  for (std::deque< vector<uint8_t> >::const_iterator it = unacked_.begin();
       it != unacked_.end(); ++it)
  {
    ++stats_.retransmissions;
    Transmit(*it);
  }

  RestartTimer();
}

//============================================================================
void GbnSender::Transmit(const vector<uint8_t>& pkt)
{
  ++stats_.packets_sent;

  if (!loss_model_.Allow())
  {
    ++stats_.packets_lost;
    return;
  }

  if (channel_.SendTo(&(pkt[0]), pkt.size(), peer_) !=
      static_cast<ssize_t>(pkt.size()))
  {
    ++stats_.packets_lost;

    LogW(kClassName, __func__, "Channel refused a %zu byte packet to %s.\n",
         pkt.size(), peer_.ToString().c_str());
    return;
  }

  ++stats_.packets_delivered;
}

//============================================================================
void GbnSender::RestartTimer()
{
  timer_.CancelTimer(rto_handle_);

  CallbackNoArg<GbnSender>  cb(this, &GbnSender::OnTimeout);

  if (!timer_.StartTimer(rto_, &cb, rto_handle_))
  {
    LogF(kClassName, __func__, "Unable to start the retransmission "
         "timer.\n");
  }

  pthread_cond_signal(&timer_cond_);
}

//============================================================================
void GbnSender::FillStats(SenderStats& stats) const
{
  stats = stats_;

  if (started_)
  {
    stats.elapsed_time = (Time::Now() - start_time_).ToDouble();
  }
}
