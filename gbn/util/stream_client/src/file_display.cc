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

/// \brief The GbnStream client frame writer source file.

#include "file_display.h"

#include "log.h"
#include "string_utils.h"
#include "unused.h"

#include <cerrno>
#include <cstring>

#include <inttypes.h>
#include <stdio.h>

using ::gbn::StringUtils;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "FileDisplay";
}

//============================================================================
FileDisplay::FileDisplay(const string& dir)
    : dir_(dir), frames_written_(0)
{
}

//============================================================================
FileDisplay::~FileDisplay()
{
}

//============================================================================
void FileDisplay::DisplayFrame(uint32_t frame_id, const vector<uint8_t>& frame)
{
  LogD(kClassName, __func__, "Frame %" PRIu32 " (%zu bytes).\n", frame_id,
       frame.size());

  if (dir_.empty() || frame.empty())
  {
    return;
  }

  string  path = dir_ + StringUtils::FormatString(
    32, "/frame_%06" PRIu32 ".jpg", frame_id);
  FILE*   fp   = fopen(path.c_str(), "wb");

  if (fp == NULL)
  {
    LogW(kClassName, __func__, "Unable to open %s: %s\n", path.c_str(),
         strerror(errno));
    return;
  }

  if (fwrite(&frame[0], 1, frame.size(), fp) != frame.size())
  {
    LogW(kClassName, __func__, "Short write to %s.\n", path.c_str());
  }
  else
  {
    ++frames_written_;
  }

  if (fclose(fp) != 0)
  {
    LogW(kClassName, __func__, "Error closing %s: %s\n", path.c_str(),
         strerror(errno));
  }
}
