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

/// \brief The GbnStream client application.

#include "control_message.h"
#include "file_display.h"
#include "itime.h"
#include "log.h"
#include "stream_client_opts.h"
#include "video_client.h"

#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <new>
#include <string>

#include <inttypes.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>

using ::gbn::ControlMessage;
using ::gbn::ControlStatus;
using ::gbn::Log;
using ::gbn::Time;
using ::gbn::VideoClient;
using ::rapidjson::StringBuffer;
using ::rapidjson::Writer;
using ::std::string;

static const char cn[] = "stream_client_main";

static StreamClientOpts options;

namespace
{
  VideoClient*  client  = NULL;
  FileDisplay*  display = NULL;
}

//============================================================================
/// \brief Print the final quality of experience statistics to stdout.
void PrintStats()
{
  if (client == NULL)
  {
    return;
  }

  StringBuffer          str_buf;
  Writer<StringBuffer>  writer(str_buf);

  writer.StartObject();
  client->WriteStats(&writer);
  writer.EndObject();

  fprintf(stdout, "%s\n", str_buf.GetString());
  fflush(stdout);
}

//============================================================================
/// \brief Clean up everything.
void CleanUp()
{
  LogI(cn, __func__, "Cleaning up for shutdown...\n");

  if (client != NULL)
  {
    delete client;
    client = NULL;
  }

  if (display != NULL)
  {
    delete display;
    display = NULL;
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

  LogI(cn, __func__, "Terminating stream client.\n");

  if (client != NULL)
  {
    client->Stop();
    PrintStats();
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
/// \brief Stream client main application.
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

  LogI(cn, __func__, "Starting stream client.\n");

  SetSigHandler();

  display = new (std::nothrow) FileDisplay(options.output_dir_);

  if (display == NULL)
  {
    LogF(cn, __func__, "Error allocating new FileDisplay.\n");
    return -1;
  }

  client = new (std::nothrow) VideoClient(display);

  if (client == NULL)
  {
    LogF(cn, __func__, "Error allocating new VideoClient.\n");
    return -1;
  }

  if (!client->Initialize(options.config_info_))
  {
    LogE(cn, __func__, "Stream client initialization failed. Shutting "
         "down.\n");
    CleanUp();
    return -1;
  }

  ControlStatus  status = client->Play(options.media_name_);

  if (status != gbn::CONTROL_OK)
  {
    fprintf(stderr, "Unable to play %s: %s\n", options.media_name_.c_str(),
            ControlMessage::StatusToString(status));
    CleanUp();
    return 1;
  }

  while (!client->WaitForEnd(Time(1.0)))
  {
    LogD(cn, __func__, "Playing %s...\n", options.media_name_.c_str());
  }

  LogI(cn, __func__, "Playback of %s complete, %" PRIu32 " frames "
       "written.\n",
       options.media_name_.c_str(), display->frames_written());

  client->Stop();
  PrintStats();
  CleanUp();

  return 0;
}
