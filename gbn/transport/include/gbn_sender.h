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

/// \brief The GbnStream Go-Back-N sender header file.
///
/// Provides the sending side of the Go-Back-N reliability layer.

#ifndef GBN_TRANSPORT_GBN_SENDER_H
#define GBN_TRANSPORT_GBN_SENDER_H

#include "config_info.h"
#include "datagram_channel.h"
#include "gbn_types.h"
#include "ipv4_endpoint.h"
#include "itime.h"
#include "loss_model.h"
#include "runnable_if.h"
#include "thread.h"
#include "timer.h"

#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <deque>
#include <string>
#include <vector>

#include <pthread.h>
#include <stdint.h>

namespace gbn
{

  /// \brief A point-in-time snapshot of the sender statistics.
  struct SenderStats
  {
    SenderStats()
        : packets_sent(0), packets_delivered(0), packets_lost(0),
          retransmissions(0), timeouts(0), acks_received(0), acks_ignored(0),
          acks_corrupt(0), elapsed_time(0.0)
    { }

    /// Transmission attempts, first sends and retransmissions.
    uint64_t  packets_sent;

    /// Transmissions admitted by the loss model and handed to the channel.
    uint64_t  packets_delivered;

    /// Transmissions dropped by the loss model or refused by the channel.
    uint64_t  packets_lost;

    /// Packets resent because of a timeout.
    uint64_t  retransmissions;

    /// Retransmission timer expirations.
    uint64_t  timeouts;

    /// Valid acknowledgments received.
    uint64_t  acks_received;

    /// Valid acknowledgments outside the window.
    uint64_t  acks_ignored;

    /// Malformed or corrupt acknowledgment datagrams.
    uint64_t  acks_corrupt;

    /// Seconds since the sender was started.
    double    elapsed_time;

  }; // end struct SenderStats

  /// \brief The Go-Back-N sender.
  ///
  /// The sender assigns consecutive 16-bit sequence numbers to payloads,
  /// keeps every unacknowledged packet in send order, and runs a single
  /// fixed retransmission timer.  Each transmission, first send or
  /// retransmission, passes through the loss model.  A packet dropped by the
  /// loss model is still kept for retransmission.
  ///
  /// Cumulative acknowledgments are fed in through OnAck() or
  /// ProcessAckDatagram(), typically from the thread that reads the channel.
  /// On a timeout the whole window is resent in sequence order and the timer
  /// is restarted.
  ///
  /// All window state, the timer and the loss model are protected by one
  /// mutex.  The timer runs in a dedicated thread that performs the timeout
  /// callback with the mutex held, and a timer that has been canceled or
  /// restarted invalidates its handle, so a stale expiration never acts.
  /// No other lock is acquired while the sender mutex is held, except the
  /// channel's and the logger's.
  ///
  /// \code
  ///   UdpChannel  channel;
  ///   channel.Open(Ipv4Endpoint("0.0.0.0", 0));
  ///
  ///   GbnSender  sender(channel, Ipv4Endpoint("127.0.0.1:5004"));
  ///   sender.Initialize(ci);
  ///   sender.Start();
  ///   sender.Send(data, len);
  ///   ...
  ///   sender.Stop();
  /// \endcode
  class GbnSender : public RunnableIf
  {

   public:

    /// \brief Constructor.
    ///
    /// \param  channel  The channel used for transmission.  Not owned.
    /// \param  peer     The receiver endpoint.
    GbnSender(DatagramChannel& channel, const Ipv4Endpoint& peer);

    /// \brief Destructor.
    ///
    /// Stops the sender if it is still running.
    virtual ~GbnSender();

    /// \brief Configure the sender from the "Gbn." configuration keys.
    ///
    /// Must be called before Start().
    ///
    /// \param  ci  The configuration information.
    ///
    /// \return  True on success, false if a value is invalid.
    bool Initialize(const ConfigInfo& ci);

    /// \brief Set the window size and retransmission timeout.
    ///
    /// Must be called before Start().
    ///
    /// \param  window_size  The window size, 1 to kMaxWindowSize.
    /// \param  rto          The fixed retransmission timeout.
    ///
    /// \return  True on success, false if a value is invalid.
    bool Configure(uint16_t window_size, const Time& rto);

    /// \brief Reconfigure the loss model.
    ///
    /// May be called at any time.
    ///
    /// \param  random_rate        The uniform loss probability.
    /// \param  burst_rate         The drop probability inside a burst.
    /// \param  burst_duration_ms  The burst window length.
    /// \param  burst_interval_ms  The burst period.
    ///
    /// \return  True on success, false if a value is invalid.
    bool ConfigureLoss(double random_rate, double burst_rate,
                       uint32_t burst_duration_ms,
                       uint32_t burst_interval_ms);

    /// \brief Seed the loss model.
    ///
    /// \param  seed  The seed.
    void SetLossSeed(uint32_t seed);

    /// \brief Start the retransmission timer thread.
    ///
    /// \return  True on success, false otherwise.
    bool Start();

    /// \brief Stop the sender.
    ///
    /// Cancels the retransmission timer, releases any blocked Send() or
    /// WaitForAllAcked() call, and joins the timer thread.  Unacknowledged
    /// packets are abandoned.
    void Stop();

    /// \brief Send a payload, blocking while the window is full.
    ///
    /// \param  payload  The payload bytes.
    /// \param  len      The payload length, at most kMaxGbnPayloadSize.
    ///
    /// \return  SEND_OK if the payload was accepted into the window,
    ///          SEND_STOPPED if the sender was stopped, or SEND_ERROR.
    SendStatus Send(const uint8_t* payload, size_t len);

    /// \brief Send a payload without blocking.
    ///
    /// \param  payload  The payload bytes.
    /// \param  len      The payload length, at most kMaxGbnPayloadSize.
    ///
    /// \return  SEND_OK if the payload was accepted into the window,
    ///          SEND_WINDOW_FULL if the window is full, SEND_STOPPED if the
    ///          sender was stopped, or SEND_ERROR.
    SendStatus TrySend(const uint8_t* payload, size_t len);

    /// \brief Process a cumulative acknowledgment.
    ///
    /// Every unacknowledged packet from the send base up to and including
    /// ack_num is released.  An ack_num outside the window is ignored.
    ///
    /// \param  ack_num  The acknowledgment number.
    void OnAck(uint16_t ack_num);

    /// \brief Decode and verify an acknowledgment datagram, then process it.
    ///
    /// \param  buf  The datagram bytes.
    /// \param  len  The datagram length.
    ///
    /// \return  True if the datagram was a valid acknowledgment, false if it
    ///          was malformed or corrupt and has been dropped.
    bool ProcessAckDatagram(const uint8_t* buf, size_t len);

    /// \brief Wait until every sent packet has been acknowledged.
    ///
    /// \param  max_wait  The maximum time to wait.
    ///
    /// \return  True if nothing is left unacknowledged.
    bool WaitForAllAcked(const Time& max_wait);

    /// \brief Get the number of unacknowledged packets.
    size_t InFlight() const;

    /// \brief Get the oldest unacknowledged sequence number.
    uint16_t SendBase() const;

    /// \brief Get the next sequence number to be assigned.
    uint16_t NextSeqNum() const;

    /// \brief Check if the sender has been stopped.
    bool IsStopped() const;

    /// \brief Get a snapshot of the statistics.
    ///
    /// \return  The statistics.
    SenderStats GetStats() const;

    /// \brief Write the statistics as a JSON object.
    ///
    /// \param  writer  The writer.  The object's members are appended, the
    ///                 caller starts and ends the object.
    void WriteStats(rapidjson::Writer<rapidjson::StringBuffer>* writer) const;

    /// \brief Get the statistics as a one line string.
    std::string StatsToString() const;

    inline uint16_t window_size() const
    {
      return window_size_;
    }

    inline const Ipv4Endpoint& peer() const
    {
      return peer_;
    }

    /// \brief The timer thread main loop.
    virtual void Run();

   private:

    /// \brief Copy constructor.
    GbnSender(const GbnSender& other);

    /// \brief Copy operator.
    GbnSender& operator=(const GbnSender& other);

    /// \brief Accept a payload into the window.
    ///
    /// \param  payload  The payload bytes.
    /// \param  len      The payload length.
    /// \param  block    Whether to wait for window space.
    ///
    /// \return  The send status.
    SendStatus DoSend(const uint8_t* payload, size_t len, bool block);

    /// \brief Process a cumulative acknowledgment.  Called with the mutex
    /// held.
    ///
    /// \param  ack_num  The acknowledgment number.
    void HandleAck(uint16_t ack_num);

    /// \brief Resend the whole window.  Called by the timer with the mutex
    /// held.
    void OnTimeout();

    /// \brief Transmit one serialized packet through the loss model.  Called
    /// with the mutex held.
    ///
    /// \param  pkt  The serialized packet.
    void Transmit(const std::vector<uint8_t>& pkt);

    /// \brief Cancel any pending timeout and start a new one.  Called with
    /// the mutex held.
    void RestartTimer();

    /// \brief Fill in a statistics snapshot.  Called with the mutex held.
    ///
    /// \param  stats  The snapshot.
    void FillStats(SenderStats& stats) const;

    /// The channel.
    DatagramChannel&                   channel_;

    /// The receiver endpoint.
    Ipv4Endpoint                       peer_;

    /// The maximum number of unacknowledged packets.
    uint16_t                           window_size_;

    /// The fixed retransmission timeout.
    Time                               rto_;

    /// The loss model.
    LossModel                          loss_model_;

    /// The oldest unacknowledged sequence number.
    uint16_t                           send_base_;

    /// The next sequence number to assign.
    uint16_t                           next_seq_num_;

    /// The serialized unacknowledged packets, in send order.  The packet at
    /// index i has sequence number send_base_ + i.
    std::deque< std::vector<uint8_t> >  unacked_;

    /// The timer.
    Timer                              timer_;

    /// The retransmission timer handle.
    Timer::Handle                      rto_handle_;

    /// The statistics.
    SenderStats                        stats_;

    /// The time at which the sender was started.
    Time                               start_time_;

    /// Whether Start() succeeded.
    bool                               started_;

    /// Whether Stop() was called.
    bool                               stopped_;

    /// The timer thread.
    Thread                             thread_;

    /// Protects everything above.
    mutable pthread_mutex_t            mutex_;

    /// Signaled when the timer state changes or the sender stops.
    pthread_cond_t                     timer_cond_;

    /// Signaled when packets are acknowledged or the sender stops.
    pthread_cond_t                     window_cond_;

  }; // end class GbnSender

} // namespace gbn

#endif // GBN_TRANSPORT_GBN_SENDER_H
