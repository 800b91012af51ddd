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

/// \brief The GbnStream server command line options source file.

#include "stream_server_opts.h"

#include "log.h"
#include "unused.h"

#include <stdio.h>
#include <string.h>

using ::std::string;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "StreamServerOpts";
}

//============================================================================
StreamServerOpts::StreamServerOpts()
    : config_info_()
{
}

//============================================================================
StreamServerOpts::~StreamServerOpts()
{
  // Nothing to destroy.
}

//============================================================================
int StreamServerOpts::ParseArgs(int argc, char** argv)
{
  argc--;
  int     mark     = 1;
  bool    debug    = false;
  string  log_file = "";
  string  port     = "";
  string  dir      = "";

  while (argc)
  {
    if (strcmp(argv[mark], "-d") == 0)
    {
      // Applied after all options have been processed.
      debug = true;
      argc--; mark++;
    }
    else if ((strcmp(argv[mark], "-h") == 0) ||
             (strcmp(argv[mark], "-H") == 0))
    {
      Usage(argv[0]);
      return 1;
    }
    else if (strcmp(argv[mark], "-c") == 0)
    {
      argc--; mark++;
      if (argc < 1)
      {
        fprintf(stderr, "Config filename must follow -c\n");
        Usage(argv[0]);
        return -1;
      }

      if (!config_info_.LoadFromFile(argv[mark]))
      {
        LogE(kClassName, __func__, "Error loading config file %s.\n",
             argv[mark]);
        Usage(argv[0]);
        return -1;
      }

      argc--; mark++;
    }
    else if (strcmp(argv[mark], "-l") == 0)
    {
      argc--; mark++;
      if (argc < 1)
      {
        fprintf(stderr, "Log filename must follow -l\n");
        Usage(argv[0]);
        return -1;
      }
      log_file = argv[mark];
      argc--; mark++;
    }
    else if (strcmp(argv[mark], "-p") == 0)
    {
      argc--; mark++;
      if (argc < 1)
      {
        fprintf(stderr, "UDP port number must follow -p\n");
        Usage(argv[0]);
        return -1;
      }
      port = argv[mark];
      argc--; mark++;
    }
    else if (strcmp(argv[mark], "-m") == 0)
    {
      argc--; mark++;
      if (argc < 1)
      {
        fprintf(stderr, "Media directory must follow -m\n");
        Usage(argv[0]);
        return -1;
      }
      dir = argv[mark];
      argc--; mark++;
    }
    else if (argv[mark][0] == '-')
    {
      fprintf(stderr, "Unrecognized flag %s\n", argv[mark]);
      Usage(argv[0]);
      return -1;
    }
    else
    {
      fprintf(stderr, "Illegal parameter %s\n", argv[mark]);
      Usage(argv[0]);
      return -1;
    }
  }

  // The command line overrides the config file.
  if (debug)
  {
    config_info_.Add("Log.DefaultLevel", "FEWIAD");
  }

  if (!log_file.empty())
  {
    config_info_.Add("Log.File", log_file);
  }

  if (!port.empty())
  {
    config_info_.Add("Server.Port", port);
  }

  if (!dir.empty())
  {
    config_info_.Add("Server.MediaDir", dir);
  }

  return 0;
}

//============================================================================
void StreamServerOpts::Usage(const char* progname)
{
  fprintf(stderr, "\n");
  fprintf(stderr, "Usage:\n");
  fprintf(stderr, "  %s [options]\n", progname);
  fprintf(stderr, "\n");
  fprintf(stderr, "Options\n");
  fprintf(stderr, "   -h                 Help.\n");
  fprintf(stderr, "   -d                 Turn debug logging on.\n");
  fprintf(stderr, "   -c <cfg file>      Configuration file to load.\n");
  fprintf(stderr, "   -l <log_file>      Name of the file to write log.\n");
  fprintf(stderr, "   -p <port>          UDP port to serve on "
          "(default 5004).\n");
  fprintf(stderr, "   -m <dir>           Directory of MJPEG media files "
          "(default .).\n");
  fprintf(stderr, "\n");
}
