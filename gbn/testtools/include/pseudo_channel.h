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

/// \brief The GbnStream pseudo datagram channel header file.
///
/// Provides an in-memory datagram channel that can be seeded with datagrams
/// to receive, tracks datagrams that have been sent, and can be linked to a
/// second pseudo channel to form a loopback network.

#ifndef GBN_TESTTOOLS_PSEUDO_CHANNEL_H
#define GBN_TESTTOOLS_PSEUDO_CHANNEL_H

#include "datagram_channel.h"

#include <deque>
#include <vector>

#include <pthread.h>

namespace gbn
{

  class PseudoChannel : public DatagramChannel
  {

   public:

    /// \brief A datagram and its source or destination endpoint.
    struct Datagram
    {
      Datagram() : data(), endpoint()
      { }

      std::vector<uint8_t>  data;
      Ipv4Endpoint          endpoint;
    };

    /// \brief Constructor.
    ///
    /// \param  local  The endpoint reported as the source of datagrams sent
    ///                to a linked channel.
    explicit PseudoChannel(const Ipv4Endpoint& local);

    /// \brief Destructor.
    virtual ~PseudoChannel();

    /// \brief Link this channel to another one.
    ///
    /// Datagrams sent on this channel are then queued for receipt on the
    /// other channel, whatever their destination.  Call on both channels for
    /// a two way link.
    ///
    /// \param  other  The other channel, or NULL to unlink.  Not owned.
    void Link(PseudoChannel* other);

    /// \brief Queue a datagram to be returned by RecvFrom().
    ///
    /// \param  buf  The datagram bytes.
    /// \param  len  The datagram length.
    /// \param  src  The source endpoint to report.
    void InjectDatagram(const uint8_t* buf, size_t len,
                        const Ipv4Endpoint& src);

    /// \brief Remove the oldest recorded sent datagram.
    ///
    /// \param  dgram  The datagram and its destination.
    ///
    /// \return  True if a datagram was available.
    bool PopSentDatagram(Datagram& dgram);

    /// \brief Get the number of recorded sent datagrams.
    size_t NumSentDatagrams() const;

    /// \brief Discard the recorded sent datagrams.
    void ClearSentDatagrams();

    /// \brief Control whether sent datagrams are recorded.
    ///
    /// \param  record  True to record sent datagrams.
    void set_record_sent(bool record);

    virtual ssize_t SendTo(const uint8_t* buf, size_t len,
                           const Ipv4Endpoint& dst);

    virtual ssize_t RecvFrom(uint8_t* buf, size_t max_len, Ipv4Endpoint& src,
                             const Time& max_wait);

    virtual void Close();

    virtual bool IsOpen() const;

    virtual Ipv4Endpoint GetLocalEndpoint() const;

   private:

    /// \brief Copy constructor.
    PseudoChannel(const PseudoChannel& other);

    /// \brief Copy operator.
    PseudoChannel& operator=(const PseudoChannel& other);

    /// The local endpoint.
    Ipv4Endpoint             local_;

    /// Whether the channel is open.
    bool                     open_;

    /// Whether sent datagrams are recorded.
    bool                     record_sent_;

    /// The linked channel, or NULL.
    PseudoChannel*           link_;

    /// Datagrams to return from RecvFrom().
    std::deque<Datagram>     to_recv_;

    /// Datagrams passed to SendTo().
    std::deque<Datagram>     sent_;

    /// Protects the members above.
    mutable pthread_mutex_t  mutex_;

    /// Signaled when a datagram is queued or the channel closes.
    pthread_cond_t           cond_;

  }; // end class PseudoChannel

} // namespace gbn

#endif // GBN_TESTTOOLS_PSEUDO_CHANNEL_H
