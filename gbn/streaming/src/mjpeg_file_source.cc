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

/// \brief The GbnStream Motion JPEG file source source file.

#include "mjpeg_file_source.h"

#include "log.h"
#include "unused.h"

#include <cerrno>
#include <cstring>

#include <inttypes.h>

using ::gbn::MjpegFileSource;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "MjpegFileSource";

  /// The JPEG marker prefix.
  const int    kMarker            = 0xFF;

  /// The start-of-image marker code.
  const int    kSoi               = 0xD8;

  /// The end-of-image marker code.
  const int    kEoi               = 0xD9;
}

//============================================================================
MjpegFileSource::MjpegFileSource()
    : file_(NULL), path_(), num_frames_(0)
{
}

//============================================================================
MjpegFileSource::~MjpegFileSource()
{
  Close();
}

//============================================================================
bool MjpegFileSource::Open(const string& path)
{
  Close();

  file_ = fopen(path.c_str(), "rb");

  if (file_ == NULL)
  {
    LogW(kClassName, __func__, "Unable to open %s: %s\n", path.c_str(),
         strerror(errno));
    return false;
  }

  path_       = path;
  num_frames_ = 0;

  LogD(kClassName, __func__, "Opened %s.\n", path_.c_str());

  return true;
}

//============================================================================
void MjpegFileSource::Close()
{
  if (file_ != NULL)
  {
    fclose(file_);
    file_ = NULL;
  }
}

//============================================================================
bool MjpegFileSource::NextFrame(vector<uint8_t>& frame)
{
  frame.clear();

  if (file_ == NULL)
  {
    return false;
  }

  bool  in_image = false;
  int   prev     = -1;
  int   c;

  while ((c = getc(file_)) != EOF)
  {
    if (!in_image)
    {
      if ((prev == kMarker) && (c == kSoi))
      {
        in_image = true;
        frame.push_back(static_cast<uint8_t>(kMarker));
        frame.push_back(static_cast<uint8_t>(kSoi));
      }

      prev = c;
      continue;
    }

    frame.push_back(static_cast<uint8_t>(c));

    if ((prev == kMarker) && (c == kEoi))
    {
      ++num_frames_;
      return true;
    }

    prev = c;
  }

  if (ferror(file_))
  {
    LogW(kClassName, __func__, "Error reading %s.\n", path_.c_str());
  }
  else if (in_image)
  {
    LogW(kClassName, __func__, "Ignoring truncated image of %zu bytes at "
         "the end of %s.\n", frame.size(), path_.c_str());
  }

  LogD(kClassName, __func__, "End of %s after %" PRIu32 " frames.\n",
       path_.c_str(), num_frames_);

  frame.clear();

  return false;
}
