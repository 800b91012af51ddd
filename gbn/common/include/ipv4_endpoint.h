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

/// \brief The GbnStream IPv4 Endpoint header file.
///
/// Provides the GbnStream software with an efficient way to encapsulate the
/// information for an IPv4 Endpoint, consisting of an IPv4 Address and a
/// port.

#ifndef GBN_COMMON_IPV4_ENDPOINT_H
#define GBN_COMMON_IPV4_ENDPOINT_H

#include <string>

#include <netinet/in.h>
#include <stdint.h>
#include <sys/socket.h>

namespace gbn
{

  /// A class to encapsulate the information for an IPv4 Endpoint, consisting
  /// of an IPv4 Address and a port. All addresses and ports are stored and
  /// accessed in Network Byte Order.
  ///
  /// Endpoints are ordered, so they may be used as map keys.
  class Ipv4Endpoint
  {
    public:

    /// Default no-arg constructor.  The endpoint is 0.0.0.0:0.
    Ipv4Endpoint();

    /// Constructor.
    ///
    /// \param  ep_str  String representation of an Endpoint,
    ///                 (e.g. 192.168.10.1:5555).  An invalid string results
    ///                 in 0.0.0.0:0.
    explicit Ipv4Endpoint(const std::string& ep_str);

    /// Constructor.
    ///
    /// \param  addr      The IPv4 address in dot decimal format
    ///                   (e.g. 192.168.10.1).
    /// \param  port_hbo  The port number, in Host Byte Order.
    Ipv4Endpoint(const std::string& addr, uint16_t port_hbo);

    /// Constructor.
    ///
    /// \param  addr_nbo  The IPv4 address represeted as an integer, in
    ///                   Network Byte Order.
    /// \param  port_nbo  The port number, in Network Byte Order.
    Ipv4Endpoint(uint32_t addr_nbo, uint16_t port_nbo);

    /// Constructor.
    ///
    /// \param  addr  The socket address to copy the address and port from.
    explicit Ipv4Endpoint(const struct sockaddr_in& addr);

    /// Copy constructor.
    ///
    /// \param  ep  A reference to the Ipv4Endpoint object to copy.
    Ipv4Endpoint(const Ipv4Endpoint& ep);

    /// \brief Destructor.
    virtual ~Ipv4Endpoint();

    /// Get the IPv4 address, in Network Byte Order.
    inline uint32_t address() const { return address_nbo_; }

    /// Get the IPv4 Endpoint port, in Network Byte Order.
    inline uint16_t port() const { return port_nbo_; }

    /// Get the IPv4 Endpoint port, in Host Byte Order.
    inline uint16_t port_hbo() const { return ntohs(port_nbo_); }

    /// Set the IPv4 Endpoint port.
    ///
    /// \param  port_nbo  The IPv4 Endpoint port, in Network Byte Order.
    inline void set_port(uint16_t port_nbo) { port_nbo_ = port_nbo; }

    /// Set the endpoint address and port number from a string.
    ///
    /// \param  ep_str  String representation of an Endpoint,
    ///                 (e.g. 192.168.10.1:5555).
    ///
    /// \return Returns true on success, or false on error.  If false is
    ///         returned, the Endpoint object is not modified.
    bool SetEndpoint(const std::string& ep_str);

    /// Get string representation of the IPv4 Endpoint.
    ///
    /// \return String representatation of the IPv4 Endpoint.
    std::string ToString() const;

    /// Get the contents of the Endpoint as a struct sockaddr_in.
    ///
    /// \param  address  The struct sockaddr_in to be filled in.
    void ToSockAddr(struct sockaddr_in* address) const;

    /// Equality operator.
    friend bool operator==(const Ipv4Endpoint& left,
                           const Ipv4Endpoint& right);

    /// Inequality operator.
    friend bool operator!=(const Ipv4Endpoint& left,
                           const Ipv4Endpoint& right);

    /// Less than operator, ordering by address and then by port.
    friend bool operator<(const Ipv4Endpoint& left,
                          const Ipv4Endpoint& right);

    /// Copy operator.
    ///
    /// \param  ep  A reference to the Ipv4Endpoint object to copy.
    ///
    /// \return A reference to the updated Ipv4Endpoint object.
    Ipv4Endpoint& operator=(const Ipv4Endpoint& ep);

    private:

    /// The address, in Network Byte Order.
    uint32_t  address_nbo_;

    /// The port, in Network Byte Order.
    uint16_t  port_nbo_;

  }; // end class Ipv4Endpoint

} // namespace gbn

#endif // GBN_COMMON_IPV4_ENDPOINT_H
