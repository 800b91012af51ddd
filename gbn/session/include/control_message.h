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

/// \brief The GbnStream session control message header file.
///
/// Session control uses short text datagrams sent over the same UDP socket
/// as the GBN traffic:
///
/// \verbatim
/// request = "PLAY " name "\n" | "STOP\n"
/// reply   = "200 OK" [" " detail] "\n" | "400 BAD_REQUEST\n" |
///           "404 NOT_FOUND\n" | "500 INTERNAL_ERROR\n"
/// \endverbatim

#ifndef GBN_SESSION_CONTROL_MESSAGE_H
#define GBN_SESSION_CONTROL_MESSAGE_H

#include <string>

#include <stddef.h>
#include <stdint.h>

namespace gbn
{

  /// \brief The control request commands.
  enum ControlCommand
  {
    CONTROL_CMD_INVALID = 0,
    CONTROL_CMD_PLAY,
    CONTROL_CMD_STOP
  };

  /// \brief The control reply status codes.
  enum ControlStatus
  {
    CONTROL_NO_REPLY       = 0,
    CONTROL_OK             = 200,
    CONTROL_BAD_REQUEST    = 400,
    CONTROL_NOT_FOUND      = 404,
    CONTROL_INTERNAL_ERROR = 500
  };

  /// \brief A parsed control request.
  struct ControlRequest
  {
    ControlRequest() : command(CONTROL_CMD_INVALID), name()
    { }

    ControlCommand  command;
    std::string     name;
  };

  /// \brief A parsed control reply.
  struct ControlReply
  {
    ControlReply() : status(CONTROL_NO_REPLY), detail()
    { }

    ControlStatus  status;
    std::string    detail;
  };

  /// \brief Encoding, parsing and classification of control messages.
  class ControlMessage
  {

   public:

    /// \brief Encode a PLAY request.
    static std::string EncodePlay(const std::string& name);

    /// \brief Encode a STOP request.
    static std::string EncodeStop();

    /// \brief Encode a reply.
    ///
    /// \param  status  The status.
    /// \param  detail  Text following "200 OK".  Ignored for other statuses.
    static std::string EncodeReply(ControlStatus status,
                                   const std::string& detail = "");

    /// \brief Parse a request.
    ///
    /// \param  buf      The datagram.
    /// \param  len      The datagram length.
    /// \param  request  The request.  The command is CONTROL_CMD_INVALID if
    ///                  the datagram is not a valid request.
    ///
    /// \return  True if the datagram is a valid request.
    static bool ParseRequest(const uint8_t* buf, size_t len,
                             ControlRequest& request);

    /// \brief Parse a reply.
    ///
    /// \param  buf    The datagram.
    /// \param  len    The datagram length.
    /// \param  reply  The reply.
    ///
    /// \return  True if the datagram matches the reply grammar.
    static bool ParseReply(const uint8_t* buf, size_t len,
                           ControlReply& reply);

    /// \brief Check if a media name is safe to look up in the media
    /// directory.  Names that are empty, contain a path separator or "..",
    /// or contain control characters are not.
    static bool IsValidMediaName(const std::string& name);

    /// \brief Check if a datagram received by the server is a GBN ACK.
    /// ACKs are exactly one GBN header long, and no control request is.
    static bool IsAckDatagram(size_t len);

    /// \brief Get the reason phrase of a status.
    static const char* StatusToString(ControlStatus status);

   private:

    ControlMessage();
    ControlMessage(const ControlMessage& other);
    ControlMessage& operator=(const ControlMessage& other);

  }; // end class ControlMessage

} // namespace gbn

#endif // GBN_SESSION_CONTROL_MESSAGE_H
