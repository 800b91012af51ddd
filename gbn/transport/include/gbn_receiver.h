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

/// \brief The GbnStream Go-Back-N receiver header file.
///
/// Provides the receiving side of the Go-Back-N reliability layer.

#ifndef GBN_TRANSPORT_GBN_RECEIVER_H
#define GBN_TRANSPORT_GBN_RECEIVER_H

#include "config_info.h"
#include "datagram_channel.h"
#include "gbn_types.h"
#include "ipv4_endpoint.h"
#include "itime.h"

#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <string>
#include <vector>

#include <pthread.h>
#include <stdint.h>

namespace gbn
{

  /// \brief A point-in-time snapshot of the receiver statistics.
  struct ReceiverStats
  {
    ReceiverStats()
        : packets_received(0), packets_delivered(0), packets_corrupt(0),
          packets_malformed(0), packets_duplicate(0), packets_out_of_order(0),
          acks_sent(0)
    { }

    /// Datagrams read from the peer.
    uint64_t  packets_received;

    /// In-order payloads handed to the caller.
    uint64_t  packets_delivered;

    /// Datagrams that failed checksum verification.
    uint64_t  packets_corrupt;

    /// Datagrams too short to hold a GBN header.
    uint64_t  packets_malformed;

    /// Packets that were already delivered.
    uint64_t  packets_duplicate;

    /// Packets ahead of the expected sequence number.
    uint64_t  packets_out_of_order;

    /// Acknowledgments sent.
    uint64_t  acks_sent;

  }; // end struct ReceiverStats

  /// \brief The interface for a handler of datagrams that are not valid GBN
  /// packets, such as session control replies sharing the channel.
  class NonGbnDatagramHandlerIf
  {

   public:

    /// \brief Destructor.
    virtual ~NonGbnDatagramHandlerIf()
    { }

    /// \brief Offer a datagram that failed GBN decoding or verification.
    ///
    /// \param  buf  The datagram bytes.
    /// \param  len  The datagram length.
    /// \param  src  The source endpoint.
    ///
    /// \return  True if the handler consumed the datagram, false if it is to
    ///          be counted as malformed or corrupt.
    virtual bool HandleNonGbnDatagram(const uint8_t* buf, size_t len,
                                      const Ipv4Endpoint& src) = 0;

  }; // end class NonGbnDatagramHandlerIf

  /// \brief The Go-Back-N receiver.
  ///
  /// The receiver accepts only the packet carrying the expected sequence
  /// number.  For it, a cumulative acknowledgment of that sequence number is
  /// sent, the expected sequence number advances by one, and the payload is
  /// returned to the caller.  Any other valid packet is dropped and the last
  /// in-order sequence number is acknowledged again.  Nothing is buffered out
  /// of order.
  ///
  /// Malformed and corrupt datagrams are silently dropped.  If no peer was
  /// given, the source of the first valid packet becomes the peer, and
  /// datagrams from any other source are ignored afterwards.
  ///
  /// Recv() is meant to be called by a single thread.  Close() and the
  /// accessors may be called from any thread.
  class GbnReceiver
  {

   public:

    /// \brief Constructor for a receiver that learns its peer.
    ///
    /// \param  channel  The channel.  Not owned.
    explicit GbnReceiver(DatagramChannel& channel);

    /// \brief Constructor for a receiver with a known peer.
    ///
    /// \param  channel  The channel.  Not owned.
    /// \param  peer     The sender endpoint.
    GbnReceiver(DatagramChannel& channel, const Ipv4Endpoint& peer);

    /// \brief Destructor.
    virtual ~GbnReceiver();

    /// \brief Configure the receiver from the "Gbn." configuration keys.
    ///
    /// \param  ci  The configuration information.
    ///
    /// \return  True on success, false if a value is invalid.
    bool Initialize(const ConfigInfo& ci);

    /// \brief Configure the receiver.
    ///
    /// \param  window_size        The sender's window size, used to tell
    ///                            duplicates from out-of-order packets.
    /// \param  poll_ms            The receive polling interval.
    /// \param  max_datagram_size  The receive buffer size.
    ///
    /// \return  True on success, false if a value is invalid.
    bool Configure(uint16_t window_size, uint32_t poll_ms,
                   size_t max_datagram_size);

    /// \brief Set the handler for datagrams that are not valid GBN packets.
    ///
    /// \param  handler  The handler, or NULL.  Not owned.
    void SetNonGbnHandler(NonGbnDatagramHandlerIf* handler);

    /// \brief Receive the next in-order payload.
    ///
    /// Blocks until a payload is delivered or the receiver or channel is
    /// closed.  A Close() is noticed within one polling interval.
    ///
    /// \param  payload  The delivered payload.  Replaced.
    ///
    /// \return  RECV_OK or RECV_CLOSED.
    RecvStatus Recv(std::vector<uint8_t>& payload);

    /// \brief Process one datagram.
    ///
    /// \param  buf      The datagram bytes.
    /// \param  len      The datagram length.
    /// \param  src      The source endpoint.
    /// \param  payload  The delivered payload, when true is returned.
    ///
    /// \return  True if the datagram delivered a payload.
    bool ProcessDatagram(const uint8_t* buf, size_t len,
                         const Ipv4Endpoint& src,
                         std::vector<uint8_t>& payload);

    /// \brief Close the receiver.
    ///
    /// Any blocked Recv() returns RECV_CLOSED promptly.  The channel is not
    /// closed.
    void Close();

    /// \brief Check if the receiver is closed.
    bool IsClosed() const;

    /// \brief Get the next sequence number that will be accepted.
    uint16_t Expected() const;

    /// \brief Check if the peer is known.
    ///
    /// \param  peer  Set to the peer endpoint if known.
    ///
    /// \return  True if the peer is known.
    bool GetPeer(Ipv4Endpoint& peer) const;

    /// \brief Get a snapshot of the statistics.
    ReceiverStats GetStats() const;

    /// \brief Write the statistics as JSON object members.
    ///
    /// \param  writer  The writer.
    void WriteStats(rapidjson::Writer<rapidjson::StringBuffer>* writer) const;

    /// \brief Get the statistics as a one line string.
    std::string StatsToString() const;

   private:

    /// \brief Copy constructor.
    GbnReceiver(const GbnReceiver& other);

    /// \brief Copy operator.
    GbnReceiver& operator=(const GbnReceiver& other);

    /// \brief Send a cumulative acknowledgment to the peer.  Called with the
    /// mutex held.
    ///
    /// \param  ack_num  The acknowledgment number.
    void SendAck(uint16_t ack_num);

    /// The channel.
    DatagramChannel&          channel_;

    /// The peer endpoint, valid if has_peer_ is true.
    Ipv4Endpoint              peer_;

    /// Whether the peer is known.
    bool                      has_peer_;

    /// The sender's window size.
    uint16_t                  window_size_;

    /// The receive polling interval.
    Time                      poll_interval_;

    /// The receive buffer.
    std::vector<uint8_t>      recv_buf_;

    /// The only sequence number that will be accepted.
    uint16_t                  expected_;

    /// Whether the receiver is closed.
    bool                      closed_;

    /// The handler for datagrams that are not GBN packets.
    NonGbnDatagramHandlerIf*  non_gbn_handler_;

    /// The statistics.
    ReceiverStats             stats_;

    /// Protects the members above, except recv_buf_, which only Recv()
    /// uses.
    mutable pthread_mutex_t   mutex_;

  }; // end class GbnReceiver

} // namespace gbn

#endif // GBN_TRANSPORT_GBN_RECEIVER_H
