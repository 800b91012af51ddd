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

/// \brief The GbnStream client command line options header file.

#ifndef GBN_UTIL_STREAM_CLIENT_OPTS_H
#define GBN_UTIL_STREAM_CLIENT_OPTS_H

#include "config_info.h"

#include <string>

/// \brief Command line option processing for the stream client.
class StreamClientOpts
{

 public:

  StreamClientOpts();

  virtual ~StreamClientOpts();

  /// \brief Parse the command line arguments.
  ///
  /// \param  argc  The command line argument count.
  /// \param  argv  The command line arguments.
  ///
  /// \return Zero on success, non-zero if the program should exit.
  int ParseArgs(int argc, char** argv);

  /// \brief Print the usage message.
  ///
  /// \param  progname  The program name.
  void Usage(const char* progname);

  /// The configuration built from the file and the command line.
  gbn::ConfigInfo  config_info_;

  /// The name of the media to play.
  std::string      media_name_;

  /// The directory displayed frames are written to, if any.
  std::string      output_dir_;

 private:

  StreamClientOpts(const StreamClientOpts& other);

  StreamClientOpts& operator=(const StreamClientOpts& other);

}; // end class StreamClientOpts

#endif // GBN_UTIL_STREAM_CLIENT_OPTS_H
