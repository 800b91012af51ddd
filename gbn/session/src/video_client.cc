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

/// \brief The GbnStream video client source file.

#include "video_client.h"

#include "log.h"
#include "scoped_lock.h"
#include "unused.h"

#include <cerrno>
#include <cstring>
#include <new>
#include <vector>

#include <inttypes.h>

using ::gbn::ConfigInfo;
using ::gbn::ControlMessage;
using ::gbn::ControlReply;
using ::gbn::ControlStatus;
using ::gbn::FrameDisplayIf;
using ::gbn::GbnReceiver;
using ::gbn::Ipv4Endpoint;
using ::gbn::QoeStats;
using ::gbn::ScopedLock;
using ::gbn::Time;
using ::gbn::VideoClient;
using ::rapidjson::StringBuffer;
using ::rapidjson::Writer;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*     UNUSED(kClassName)        = "VideoClient";

  /// The default server endpoint.
  const char*     kDefaultServerAddr        = "127.0.0.1:5004";

  /// The default number of times a request is sent.
  const uint32_t  kDefaultControlRetries    = 5;

  /// The default wait for a reply, in milliseconds.
  const uint32_t  kDefaultControlTimeoutMs  = 500;
}

//============================================================================
VideoClient::VideoClient(FrameDisplayIf* display)
    : channel_(),
      receiver_(NULL),
      stream_receiver_(display),
      server_(kDefaultServerAddr),
      control_retries_(kDefaultControlRetries),
      control_timeout_(Time::FromMsec(kDefaultControlTimeoutMs)),
      playing_(false),
      reply_(),
      reply_count_(0),
      thread_(),
      mutex_(),
      cond_()
{
  pthread_mutex_init(&mutex_, NULL);

  pthread_condattr_t  attr;
  pthread_condattr_init(&attr);

  if (pthread_condattr_setclock(&attr, CLOCK_MONOTONIC) != 0)
  {
    LogF(kClassName, __func__, "Unable to use the monotonic clock for "
         "condition variables.\n");
  }

  pthread_cond_init(&cond_, &attr);
  pthread_condattr_destroy(&attr);
}

//============================================================================
VideoClient::~VideoClient()
{
  Stop();

  if (receiver_ != NULL)
  {
    delete receiver_;
    receiver_ = NULL;
  }

  pthread_cond_destroy(&cond_);
  pthread_mutex_destroy(&mutex_);
}

//============================================================================
bool VideoClient::Initialize(const ConfigInfo& ci)
{
  if (receiver_ != NULL)
  {
    LogE(kClassName, __func__, "Client already initialized.\n");
    return false;
  }

  string  server_str = ci.Get("Client.ServerAddr", kDefaultServerAddr);

  server_ = Ipv4Endpoint(server_str);

  if (server_.port() == 0)
  {
    LogE(kClassName, __func__, "Invalid Client.ServerAddr %s.\n",
         server_str.c_str());
    return false;
  }

  control_retries_ = ci.GetUint("Client.ControlRetries",
                                kDefaultControlRetries);
  control_timeout_ = Time::FromMsec(ci.GetUint("Client.ControlTimeoutMs",
                                               kDefaultControlTimeoutMs));

  if (control_retries_ == 0)
  {
    LogE(kClassName, __func__, "Client.ControlRetries must be positive.\n");
    return false;
  }

  receiver_ = new (std::nothrow) GbnReceiver(channel_, server_);

  if (receiver_ == NULL)
  {
    LogF(kClassName, __func__, "Error allocating GBN receiver.\n");
    return false;
  }

  receiver_->SetNonGbnHandler(this);

  return (receiver_->Initialize(ci) && stream_receiver_.Initialize(ci));
}

//============================================================================
ControlStatus VideoClient::Play(const string& media_name)
{
  if (receiver_ == NULL)
  {
    LogE(kClassName, __func__, "Client not initialized.\n");
    return CONTROL_INTERNAL_ERROR;
  }

  if (thread_.IsRunning() || receiver_->IsClosed())
  {
    LogE(kClassName, __func__, "Client can play once only.\n");
    return CONTROL_INTERNAL_ERROR;
  }

  if (!channel_.Open(Ipv4Endpoint("0.0.0.0", 0)))
  {
    return CONTROL_INTERNAL_ERROR;
  }

  if (!stream_receiver_.Start())
  {
    channel_.Close();
    return CONTROL_INTERNAL_ERROR;
  }

  if (!thread_.StartThread(this))
  {
    LogE(kClassName, __func__, "Unable to start the receive thread.\n");
    stream_receiver_.Stop();
    channel_.Close();
    return CONTROL_INTERNAL_ERROR;
  }

  LogI(kClassName, __func__, "Requesting %s from %s.\n", media_name.c_str(),
       server_.ToString().c_str());

  ControlStatus  status = SendRequest(ControlMessage::EncodePlay(media_name));

  if (status != CONTROL_OK)
  {
    LogW(kClassName, __func__, "PLAY %s failed: %d %s\n",
         media_name.c_str(), static_cast<int>(status),
         ControlMessage::StatusToString(status));
    Shutdown();
    return status;
  }

  playing_ = true;

  return CONTROL_OK;
}

//============================================================================
bool VideoClient::WaitForEnd(const Time& max_wait)
{
  return stream_receiver_.WaitForPlaybackEnd(max_wait);
}

//============================================================================
void VideoClient::Stop()
{
  if (playing_)
  {
    playing_ = false;

    ControlStatus  status = SendRequest(ControlMessage::EncodeStop());

    if (status != CONTROL_OK)
    {
      LogW(kClassName, __func__, "STOP failed: %s\n",
           ControlMessage::StatusToString(status));
    }
  }

  Shutdown();
}

//============================================================================
QoeStats VideoClient::GetQoeStats() const
{
  return stream_receiver_.metrics().GetStats();
}

//============================================================================
void VideoClient::WriteStats(Writer<StringBuffer>* writer) const
{
  if (writer == NULL)
  {
    return;
  }

  stream_receiver_.metrics().WriteStats(writer);

  if (receiver_ != NULL)
  {
    writer->Key("gbn_receiver");
    writer->StartObject();
    receiver_->WriteStats(writer);
    writer->EndObject();
  }
}

//============================================================================
bool VideoClient::HandleNonGbnDatagram(const uint8_t* buf, size_t len,
                                       const Ipv4Endpoint& src)
{
  ControlReply  reply;

  if ((src != server_) || (!ControlMessage::ParseReply(buf, len, reply)))
  {
    return false;
  }

  LogD(kClassName, __func__, "Reply %d %s from %s.\n",
       static_cast<int>(reply.status), reply.detail.c_str(),
       src.ToString().c_str());

  ScopedLock  lock(&mutex_);

  reply_ = reply;
  ++reply_count_;
  pthread_cond_broadcast(&cond_);

  return true;
}

//============================================================================
void VideoClient::Run()
{
  vector<uint8_t>  payload;

  while (receiver_->Recv(payload) == RECV_OK)
  {
    stream_receiver_.ProcessPayload((payload.empty() ? NULL : &payload[0]),
                                    payload.size());
  }

  LogD(kClassName, __func__, "Receive loop exiting: %s\n",
       receiver_->StatsToString().c_str());
}

//============================================================================
ControlStatus VideoClient::SendRequest(const string& request)
{
  if (!channel_.IsOpen())
  {
    return CONTROL_INTERNAL_ERROR;
  }

  for (uint32_t attempt = 0; attempt < control_retries_; ++attempt)
  {
    uint32_t  reply_count;

    {
      ScopedLock  lock(&mutex_);
      reply_count = reply_count_;
    }

    if (channel_.SendTo(reinterpret_cast<const uint8_t*>(request.data()),
                        request.size(), server_) < 0)
    {
      return CONTROL_INTERNAL_ERROR;
    }

    ScopedLock  lock(&mutex_);

    timespec  deadline = (Time::Now() + control_timeout_).ToTspec();

    while (reply_count_ == reply_count)
    {
      int  rv = pthread_cond_timedwait(&cond_, &mutex_, &deadline);

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

    if (reply_count_ != reply_count)
    {
      return reply_.status;
    }

    LogI(kClassName, __func__, "No reply from %s, attempt %" PRIu32 " of %"
         PRIu32 ".\n", server_.ToString().c_str(), (attempt + 1),
         control_retries_);
  }

  return CONTROL_NO_REPLY;
}

//============================================================================
void VideoClient::Shutdown()
{
  if (receiver_ != NULL)
  {
    receiver_->Close();
  }

  if (thread_.IsRunning())
  {
    thread_.JoinThread();
  }

  stream_receiver_.Stop();

  if (channel_.IsOpen())
  {
    channel_.Close();
  }
}
