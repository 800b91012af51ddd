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

/// \brief The GbnStream pseudo datagram channel source file.

#include "pseudo_channel.h"

#include "log.h"
#include "scoped_lock.h"
#include "unused.h"

#include <cerrno>
#include <cstring>

using ::gbn::Ipv4Endpoint;
using ::gbn::PseudoChannel;
using ::gbn::ScopedLock;
using ::gbn::Time;

namespace
{
  const char*  UNUSED(kClassName) = "PseudoChannel";
}

//============================================================================
PseudoChannel::PseudoChannel(const Ipv4Endpoint& local)
    : local_(local),
      open_(true),
      record_sent_(true),
      link_(NULL),
      to_recv_(),
      sent_(),
      mutex_(),
      cond_()
{
  pthread_mutex_init(&mutex_, NULL);

  pthread_condattr_t  attr;
  pthread_condattr_init(&attr);
  pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
  pthread_cond_init(&cond_, &attr);
  pthread_condattr_destroy(&attr);
}

//============================================================================
PseudoChannel::~PseudoChannel()
{
  pthread_cond_destroy(&cond_);
  pthread_mutex_destroy(&mutex_);
}

//============================================================================
void PseudoChannel::Link(PseudoChannel* other)
{
  ScopedLock  lock(&mutex_);

  link_ = other;
}

//============================================================================
void PseudoChannel::InjectDatagram(const uint8_t* buf, size_t len,
                                   const Ipv4Endpoint& src)
{
  ScopedLock  lock(&mutex_);

  if (!open_)
  {
    return;
  }

  to_recv_.push_back(Datagram());
  to_recv_.back().data.assign(buf, buf + len);
  to_recv_.back().endpoint = src;

  pthread_cond_signal(&cond_);
}

//============================================================================
bool PseudoChannel::PopSentDatagram(Datagram& dgram)
{
  ScopedLock  lock(&mutex_);

  if (sent_.empty())
  {
    return false;
  }

  dgram = sent_.front();
  sent_.pop_front();

  return true;
}

//============================================================================
size_t PseudoChannel::NumSentDatagrams() const
{
  ScopedLock  lock(&mutex_);

  return sent_.size();
}

//============================================================================
void PseudoChannel::ClearSentDatagrams()
{
  ScopedLock  lock(&mutex_);

  sent_.clear();
}

//============================================================================
void PseudoChannel::set_record_sent(bool record)
{
  ScopedLock  lock(&mutex_);

  record_sent_ = record;
}

//============================================================================
ssize_t PseudoChannel::SendTo(const uint8_t* buf, size_t len,
                              const Ipv4Endpoint& dst)
{
  PseudoChannel*  link = NULL;

  {
    ScopedLock  lock(&mutex_);

    if (!open_)
    {
      return -1;
    }

    if (record_sent_)
    {
      sent_.push_back(Datagram());
      sent_.back().data.assign(buf, buf + len);
      sent_.back().endpoint = dst;
    }

    link = link_;
  }

  // The linked channel's lock is taken without holding this one.
  if (link != NULL)
  {
    link->InjectDatagram(buf, len, local_);
  }

  return static_cast<ssize_t>(len);
}

//============================================================================
ssize_t PseudoChannel::RecvFrom(uint8_t* buf, size_t max_len,
                                Ipv4Endpoint& src, const Time& max_wait)
{
  ScopedLock  lock(&mutex_);

  timespec  deadline = (Time::Now() + max_wait).ToTspec();

  while (open_ && to_recv_.empty())
  {
    int  rv = pthread_cond_timedwait(&cond_, &mutex_, &deadline);

    if (rv == ETIMEDOUT)
    {
      break;
    }

    if (rv != 0)
    {
      LogE(kClassName, __func__, "pthread_cond_timedwait() error: %s\n",
           strerror(rv));
      return -1;
    }
  }

  if (!open_)
  {
    return -1;
  }

  if (to_recv_.empty())
  {
    return 0;
  }

  Datagram&  dgram = to_recv_.front();
  size_t     len   = dgram.data.size();

  if (len > max_len)
  {
    LogW(kClassName, __func__, "Truncating %zu byte datagram to %zu "
         "bytes.\n", len, max_len);
    len = max_len;
  }

  if (len > 0)
  {
    memcpy(buf, &(dgram.data[0]), len);
  }

  src = dgram.endpoint;
  to_recv_.pop_front();

  return static_cast<ssize_t>(len);
}

//============================================================================
void PseudoChannel::Close()
{
  ScopedLock  lock(&mutex_);

  open_ = false;
  pthread_cond_broadcast(&cond_);
}

//============================================================================
bool PseudoChannel::IsOpen() const
{
  ScopedLock  lock(&mutex_);

  return open_;
}

//============================================================================
Ipv4Endpoint PseudoChannel::GetLocalEndpoint() const
{
  return local_;
}
