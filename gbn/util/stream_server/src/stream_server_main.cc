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

/// \brief The GbnStream server application.

#include "log.h"
#include "stream_server.h"
#include "stream_server_opts.h"

#include <new>
#include <string>

#include <signal.h>
#include <stdlib.h>
#include <unistd.h>

using ::gbn::Log;
using ::gbn::StreamServer;
using ::std::string;

static const char cn[] = "stream_server_main";

static StreamServerOpts options;

namespace
{
  StreamServer*  server = NULL;
}

//============================================================================
/// \brief Clean up everything.
void CleanUp()
{
  LogI(cn, __func__, "Cleaning up for shutdown...\n");

  if (server != NULL)
  {
    delete server;
    server = NULL;
  }

  LogI(cn, __func__, "Cleanup complete.\n");

  Log::Flush();
  Log::Destroy();
}

//============================================================================
/// \brief Cleanly shutdown.
///
/// \param  junk  Ignored.
void Finalize(int junk)
{
  Log::OnSignal();

  LogI(cn, __func__, "Terminating stream server.\n");

  if (server != NULL)
  {
    server->Stop();
  }

  CleanUp();

  exit(0);
}

//============================================================================
/// \brief Set up handlers for various signals.
void SetSigHandler()
{
  LogI(cn, __func__, "Initializing signal handler...\n");

  if (signal(SIGINT, Finalize) == SIG_ERR)
  {
    LogW(cn, __func__, "Problem setting signal handler for SIGINT\n");
  }
  if (signal(SIGQUIT, Finalize) == SIG_ERR)
  {
    LogW(cn, __func__, "Problem setting signal handler for SIGQUIT\n");
  }
  if (signal(SIGTERM, Finalize) == SIG_ERR)
  {
    LogW(cn, __func__, "Problem setting signal handler for SIGTERM\n");
  }
}

//============================================================================
/// \brief Stream server main application.
///
/// \param  argc  The command line argument count, including the program
///               name.
/// \param  argv  An array of character arrays that contain the command line
///               arguments.
///
/// \return Zero on success, or non-zero on failure.
int main(int argc, char** argv)
{
  if (options.ParseArgs(argc, argv))
  {
    return -1;
  }

  string  log_file = options.config_info_.Get("Log.File", "", false);

  if (!log_file.empty() && !Log::SetOutputFile(log_file, false))
  {
    LogW(cn, __func__, "Unable to open log file %s.\n", log_file.c_str());
  }

  Log::SetDefaultLevel(options.config_info_.Get("Log.DefaultLevel", "FEWI",
                                                false));
  Log::SetClassLevels(options.config_info_.Get("Log.ClassLevels", "",
                                               false));

  LogI(cn, __func__, "Starting stream server.\n");

  SetSigHandler();

  server = new (std::nothrow) StreamServer();

  if (server == NULL)
  {
    LogF(cn, __func__, "Error allocating new StreamServer.\n");
    return -1;
  }

  if (!server->Initialize(options.config_info_) || !server->Start())
  {
    LogE(cn, __func__, "Stream server initialization failed. Shutting "
         "down.\n");
    CleanUp();
    return -1;
  }

  // The server runs on its own thread until a signal arrives.
  while (true)
  {
    pause();
  }

  return 0;
}
