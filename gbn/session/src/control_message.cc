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

/// \brief The GbnStream session control message source file.

#include "control_message.h"

#include "gbn_types.h"
#include "log.h"
#include "unused.h"

using ::gbn::ControlMessage;
using ::gbn::ControlReply;
using ::gbn::ControlRequest;
using ::gbn::ControlStatus;
using ::std::string;

namespace
{
  /// Class name for logging.
  const char*   UNUSED(kClassName)  = "ControlMessage";

  /// The PLAY request prefix.
  const char*   kPlayPrefix         = "PLAY ";

  /// The STOP request.
  const char*   kStopRequest        = "STOP";

  /// The longest control message.
  const size_t  kMaxControlLen      = 1024;

  /// \brief Convert a datagram to a line, without its single trailing
  /// newline.
  ///
  /// \return  False if the datagram is too long, lacks the newline, or holds
  ///          a NUL, a carriage return or a second newline.
  bool ToLine(const uint8_t* buf, size_t len, string& line)
  {
    if ((buf == NULL) || (len < 2) || (len > kMaxControlLen) ||
        (buf[len - 1] != '\n'))
    {
      return false;
    }

    line.assign(reinterpret_cast<const char*>(buf), len - 1);

    return (line.find_first_of(string("\0\r\n", 3)) == string::npos);
  }
}

//============================================================================
string ControlMessage::EncodePlay(const string& name)
{
  return string(kPlayPrefix) + name + "\n";
}

//============================================================================
string ControlMessage::EncodeStop()
{
  return string(kStopRequest) + "\n";
}

//============================================================================
string ControlMessage::EncodeReply(ControlStatus status, const string& detail)
{
  string  reply;

  switch (status)
  {
    case CONTROL_OK:
      reply = "200 OK";
      if (!detail.empty())
      {
        reply += " " + detail;
      }
      break;

    case CONTROL_BAD_REQUEST:
      reply = "400 BAD_REQUEST";
      break;

    case CONTROL_NOT_FOUND:
      reply = "404 NOT_FOUND";
      break;

    case CONTROL_NO_REPLY:
    case CONTROL_INTERNAL_ERROR:
      reply = "500 INTERNAL_ERROR";
      break;
  }

  return reply + "\n";
}

//============================================================================
bool ControlMessage::ParseRequest(const uint8_t* buf, size_t len,
                                  ControlRequest& request)
{
  request = ControlRequest();

  string  line;

  if (!ToLine(buf, len, line))
  {
    return false;
  }

  if (line == kStopRequest)
  {
    request.command = CONTROL_CMD_STOP;
    return true;
  }

  string  prefix(kPlayPrefix);

  if ((line.size() > prefix.size()) &&
      (line.compare(0, prefix.size(), prefix) == 0))
  {
    request.command = CONTROL_CMD_PLAY;
    request.name    = line.substr(prefix.size());
    return true;
  }

  LogD(kClassName, __func__, "Unrecognized request: %s\n", line.c_str());

  return false;
}

//============================================================================
bool ControlMessage::ParseReply(const uint8_t* buf, size_t len,
                                ControlReply& reply)
{
  reply = ControlReply();

  string  line;

  if (!ToLine(buf, len, line))
  {
    return false;
  }

  if ((line.compare(0, 6, "200 OK") == 0) &&
      ((line.size() == 6) || (line[6] == ' ')))
  {
    reply.status = CONTROL_OK;
    reply.detail = ((line.size() > 7) ? line.substr(7) : "");
    return true;
  }

  if (line == "400 BAD_REQUEST")
  {
    reply.status = CONTROL_BAD_REQUEST;
    return true;
  }

  if (line == "404 NOT_FOUND")
  {
    reply.status = CONTROL_NOT_FOUND;
    return true;
  }

  if (line == "500 INTERNAL_ERROR")
  {
    reply.status = CONTROL_INTERNAL_ERROR;
    return true;
  }

  return false;
}

//============================================================================
bool ControlMessage::IsValidMediaName(const string& name)
{
  if (name.empty() || (name.find('/') != string::npos) ||
      (name.find('\\') != string::npos) ||
      (name.find("..") != string::npos))
  {
    return false;
  }

  for (size_t i = 0; i < name.size(); ++i)
  {
    if (static_cast<unsigned char>(name[i]) < 0x20)
    {
      return false;
    }
  }

  return true;
}

//============================================================================
bool ControlMessage::IsAckDatagram(size_t len)
{
  return (len == kGbnHeaderSize);
}

//============================================================================
const char* ControlMessage::StatusToString(ControlStatus status)
{
  switch (status)
  {
    case CONTROL_NO_REPLY:
      return "NO_REPLY";

    case CONTROL_OK:
      return "OK";

    case CONTROL_BAD_REQUEST:
      return "BAD_REQUEST";

    case CONTROL_NOT_FOUND:
      return "NOT_FOUND";

    case CONTROL_INTERNAL_ERROR:
      return "INTERNAL_ERROR";
  }

  return "UNKNOWN";
}
