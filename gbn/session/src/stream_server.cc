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

/// \brief The GbnStream stream server source file.

#include "stream_server.h"

#include "gbn_types.h"
#include "log.h"
#include "mjpeg_file_source.h"
#include "scoped_lock.h"
#include "unused.h"

#include <new>

#include <inttypes.h>

using ::gbn::ConfigInfo;
using ::gbn::ControlMessage;
using ::gbn::ControlRequest;
using ::gbn::ControlStatus;
using ::gbn::Ipv4Endpoint;
using ::gbn::MjpegFileSource;
using ::gbn::ScopedLock;
using ::gbn::StreamServer;
using ::gbn::StreamSession;
using ::gbn::Time;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*     UNUSED(kClassName)         = "StreamServer";

  /// The default UDP port.
  const uint16_t  kDefaultPort               = 5004;

  /// The default media directory.
  const char*     kDefaultMediaDir           = ".";

  /// The default session idle timeout.
  const double    kDefaultIdleTimeoutSec     = 30.0;

  /// The longest the dispatch thread blocks without checking for Stop().
  const int64_t   kDispatchPollMs            = 100;

  /// The interval between session reaping passes.
  const int64_t   kReapIntervalMs            = 1000;
}

//============================================================================
StreamServer::StreamServer()
    : channel_(),
      registry_(),
      session_config_(),
      port_(kDefaultPort),
      media_dir_(kDefaultMediaDir),
      idle_timeout_(kDefaultIdleTimeoutSec),
      stop_requested_(false),
      thread_(),
      mutex_()
{
  pthread_mutex_init(&mutex_, NULL);
}

//============================================================================
StreamServer::~StreamServer()
{
  Stop();

  pthread_mutex_destroy(&mutex_);
}

//============================================================================
bool StreamServer::Initialize(const ConfigInfo& ci)
{
  uint32_t  port = ci.GetUint("Server.Port", kDefaultPort);

  if (port > 65535)
  {
    LogE(kClassName, __func__, "Invalid Server.Port %" PRIu32 ".\n", port);
    return false;
  }

  double  idle_sec = ci.GetDouble("Server.SessionIdleTimeoutSec",
                                  kDefaultIdleTimeoutSec);

  if (!(idle_sec > 0.0))
  {
    LogE(kClassName, __func__, "Server.SessionIdleTimeoutSec must be "
         "positive.\n");
    return false;
  }

  port_         = static_cast<uint16_t>(port);
  media_dir_    = ci.Get("Server.MediaDir", kDefaultMediaDir);
  idle_timeout_ = Time(idle_sec);

  return session_config_.Initialize(ci);
}

//============================================================================
bool StreamServer::Start()
{
  if (thread_.IsRunning())
  {
    LogE(kClassName, __func__, "Server already started.\n");
    return false;
  }

  if (!channel_.Open(Ipv4Endpoint("0.0.0.0", port_)))
  {
    return false;
  }

  {
    ScopedLock  lock(&mutex_);
    stop_requested_ = false;
  }

  if (!thread_.StartThread(this))
  {
    LogE(kClassName, __func__, "Unable to start the dispatch thread.\n");
    channel_.Close();
    return false;
  }

  LogI(kClassName, __func__, "Serving %s on %s.\n", media_dir_.c_str(),
       channel_.GetLocalEndpoint().ToString().c_str());

  return true;
}

//============================================================================
void StreamServer::Stop()
{
  {
    ScopedLock  lock(&mutex_);
    stop_requested_ = true;
  }

  if (thread_.IsRunning())
  {
    thread_.JoinThread();
  }

  registry_.Clear();

  if (channel_.IsOpen())
  {
    channel_.Close();
    LogI(kClassName, __func__, "Server stopped.\n");
  }
}

//============================================================================
Ipv4Endpoint StreamServer::GetLocalEndpoint() const
{
  return channel_.GetLocalEndpoint();
}

//============================================================================
void StreamServer::Run()
{
  vector<uint8_t>  buf(kDefaultMaxDatagramSize);
  Time             last_reap = Time::Now();

  while (!IsStopRequested())
  {
    Ipv4Endpoint  src;
    ssize_t       len = channel_.RecvFrom(&buf[0], buf.size(), src,
                                          Time::FromMsec(kDispatchPollMs));

    if (len < 0)
    {
      if (!IsStopRequested())
      {
        LogE(kClassName, __func__, "Server socket failed, dispatch "
             "stopping.\n");
      }
      break;
    }

    if (len > 0)
    {
      HandleDatagram(&buf[0], static_cast<size_t>(len), src);
    }

    Time  now = Time::Now();

    if ((now - last_reap) >= Time::FromMsec(kReapIntervalMs))
    {
      last_reap = now;
      registry_.Reap(now, idle_timeout_);
    }
  }

  LogD(kClassName, __func__, "Dispatch thread exiting.\n");
}

//============================================================================
void StreamServer::HandleDatagram(const uint8_t* buf, size_t len,
                                  const Ipv4Endpoint& src)
{
  if (ControlMessage::IsAckDatagram(len))
  {
    registry_.ProcessAckDatagram(src, buf, len);
    return;
  }

  ControlRequest  request;

  if (!ControlMessage::ParseRequest(buf, len, request))
  {
    LogW(kClassName, __func__, "Bad request of %zu bytes from %s.\n", len,
         src.ToString().c_str());
    Reply(src, CONTROL_BAD_REQUEST);
    return;
  }

  if (request.command == CONTROL_CMD_STOP)
  {
    LogI(kClassName, __func__, "STOP from %s.\n", src.ToString().c_str());

    registry_.Remove(src);
    Reply(src, CONTROL_OK, "STOPPED");
    return;
  }

  LogI(kClassName, __func__, "PLAY %s from %s.\n", request.name.c_str(),
       src.ToString().c_str());

  ControlStatus  status = HandlePlay(request.name, src);

  Reply(src, status, ((status == CONTROL_OK) ? request.name : ""));
}

//============================================================================
ControlStatus StreamServer::HandlePlay(const string& name,
                                       const Ipv4Endpoint& src)
{
  if (!ControlMessage::IsValidMediaName(name))
  {
    LogW(kClassName, __func__, "Rejecting media name %s.\n", name.c_str());
    return CONTROL_BAD_REQUEST;
  }

  // A repeated PLAY whose reply was lost must not restart the stream.
  if (registry_.IsStreaming(src, name))
  {
    LogD(kClassName, __func__, "Repeated PLAY from %s.\n",
         src.ToString().c_str());
    return CONTROL_OK;
  }

  MjpegFileSource*  source = new (std::nothrow) MjpegFileSource();

  if (source == NULL)
  {
    LogE(kClassName, __func__, "Error allocating frame source.\n");
    return CONTROL_INTERNAL_ERROR;
  }

  if (!source->Open(media_dir_ + "/" + name))
  {
    delete source;
    return CONTROL_NOT_FOUND;
  }

  StreamSession*  session = new (std::nothrow) StreamSession(channel_, src,
                                                             name);

  if (session == NULL)
  {
    LogE(kClassName, __func__, "Error allocating session.\n");
    delete source;
    return CONTROL_INTERNAL_ERROR;
  }

  if (!session->Configure(session_config_))
  {
    delete source;
    delete session;
    return CONTROL_INTERNAL_ERROR;
  }

  if (!session->Start(source))
  {
    LogE(kClassName, __func__, "Unable to start session for %s.\n",
         src.ToString().c_str());
    delete session;
    return CONTROL_INTERNAL_ERROR;
  }

  registry_.Add(session);

  return CONTROL_OK;
}

//============================================================================
void StreamServer::Reply(const Ipv4Endpoint& dst, ControlStatus status,
                         const string& detail)
{
  string  reply = ControlMessage::EncodeReply(status, detail);

  if (channel_.SendTo(reinterpret_cast<const uint8_t*>(reply.data()),
                      reply.size(), dst) < 0)
  {
    LogW(kClassName, __func__, "Unable to send reply to %s.\n",
         dst.ToString().c_str());
  }
}

//============================================================================
bool StreamServer::IsStopRequested() const
{
  ScopedLock  lock(&mutex_);

  return stop_requested_;
}
