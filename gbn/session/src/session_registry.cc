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

/// \brief The GbnStream session registry source file.

#include "session_registry.h"

#include "log.h"
#include "scoped_lock.h"
#include "unused.h"

using ::gbn::Ipv4Endpoint;
using ::gbn::ScopedLock;
using ::gbn::SessionRegistry;
using ::gbn::StreamSession;
using ::gbn::Time;
using ::std::map;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "SessionRegistry";
}

//============================================================================
SessionRegistry::SessionRegistry()
    : sessions_(), mutex_()
{
  pthread_mutex_init(&mutex_, NULL);
}

//============================================================================
SessionRegistry::~SessionRegistry()
{
  Clear();

  pthread_mutex_destroy(&mutex_);
}

//============================================================================
bool SessionRegistry::Add(StreamSession* session)
{
  if (session == NULL)
  {
    LogE(kClassName, __func__, "NULL session.\n");
    return false;
  }

  StreamSession*  old_session = NULL;

  {
    ScopedLock  lock(&mutex_);

    map<Ipv4Endpoint, StreamSession*>::iterator  it =
      sessions_.find(session->peer());

    if (it != sessions_.end())
    {
      old_session = it->second;
      it->second  = session;
    }
    else
    {
      sessions_[session->peer()] = session;
    }
  }

  if (old_session != NULL)
  {
    LogI(kClassName, __func__, "Replacing session for %s.\n",
         old_session->peer().ToString().c_str());
    delete old_session;
    return true;
  }

  return false;
}

//============================================================================
bool SessionRegistry::Remove(const Ipv4Endpoint& peer)
{
  StreamSession*  session = NULL;

  {
    ScopedLock  lock(&mutex_);

    map<Ipv4Endpoint, StreamSession*>::iterator  it = sessions_.find(peer);

    if (it == sessions_.end())
    {
      return false;
    }

    session = it->second;
    sessions_.erase(it);
  }

  LogI(kClassName, __func__, "Removing session for %s.\n",
       peer.ToString().c_str());

  delete session;

  return true;
}

//============================================================================
bool SessionRegistry::Contains(const Ipv4Endpoint& peer) const
{
  ScopedLock  lock(&mutex_);

  return (sessions_.find(peer) != sessions_.end());
}

//============================================================================
bool SessionRegistry::IsStreaming(const Ipv4Endpoint& peer,
                                  const string& media_name) const
{
  ScopedLock  lock(&mutex_);

  map<Ipv4Endpoint, StreamSession*>::const_iterator  it =
    sessions_.find(peer);

  return ((it != sessions_.end()) &&
          (it->second->media_name() == media_name) &&
          (!it->second->IsFinished()));
}

//============================================================================
bool SessionRegistry::ProcessAckDatagram(const Ipv4Endpoint& peer,
                                         const uint8_t* buf, size_t len)
{
  ScopedLock  lock(&mutex_);

  map<Ipv4Endpoint, StreamSession*>::iterator  it = sessions_.find(peer);

  if (it == sessions_.end())
  {
    LogD(kClassName, __func__, "ACK from %s without a session, ignored.\n",
         peer.ToString().c_str());
    return false;
  }

  return it->second->ProcessAckDatagram(buf, len);
}

//============================================================================
size_t SessionRegistry::Reap(const Time& now, const Time& idle_timeout)
{
  vector<StreamSession*>  reaped;

  {
    ScopedLock  lock(&mutex_);

    map<Ipv4Endpoint, StreamSession*>::iterator  it = sessions_.begin();

    while (it != sessions_.end())
    {
      StreamSession*  session = it->second;

      if (session->IsFinished() || session->IsIdle(now, idle_timeout))
      {
        LogI(kClassName, __func__, "Reaping %s session for %s.\n",
             (session->IsFinished() ? "finished" : "idle"),
             it->first.ToString().c_str());

        reaped.push_back(session);
        sessions_.erase(it++);
      }
      else
      {
        ++it;
      }
    }
  }

  for (size_t i = 0; i < reaped.size(); ++i)
  {
    delete reaped[i];
  }

  return reaped.size();
}

//============================================================================
void SessionRegistry::Clear()
{
  vector<StreamSession*>  sessions;

  {
    ScopedLock  lock(&mutex_);

    for (map<Ipv4Endpoint, StreamSession*>::iterator it = sessions_.begin();
         it != sessions_.end(); ++it)
    {
      sessions.push_back(it->second);
    }

    sessions_.clear();
  }

  for (size_t i = 0; i < sessions.size(); ++i)
  {
    delete sessions[i];
  }
}

//============================================================================
size_t SessionRegistry::NumSessions() const
{
  ScopedLock  lock(&mutex_);

  return sessions_.size();
}

//============================================================================
vector<Ipv4Endpoint> SessionRegistry::GetPeers() const
{
  ScopedLock  lock(&mutex_);

  vector<Ipv4Endpoint>  peers;

  for (map<Ipv4Endpoint, StreamSession*>::const_iterator it =
         sessions_.begin(); it != sessions_.end(); ++it)
  {
    peers.push_back(it->first);
  }

  return peers;
}
