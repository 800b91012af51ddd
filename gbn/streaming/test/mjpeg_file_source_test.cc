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

#include <cppunit/extensions/HelperMacros.h>

#include "log.h"
#include "mjpeg_file_source.h"

#include <string>
#include <vector>

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

using ::gbn::Log;
using ::gbn::MjpegFileSource;
using ::std::string;
using ::std::vector;

//============================================================================
class MjpegFileSourceTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(MjpegFileSourceTest);

  CPPUNIT_TEST(TestSplitFrames);
  CPPUNIT_TEST(TestMissingFile);

  CPPUNIT_TEST_SUITE_END();

  string  path;

  //==========================================================================
  void WriteFile(const vector<uint8_t>& bytes)
  {
    char  tmpl[] = "/tmp/mjpeg_file_source_test_XXXXXX";
    int   fd     = mkstemp(tmpl);

    CPPUNIT_ASSERT(fd >= 0);
    CPPUNIT_ASSERT(write(fd, &bytes[0], bytes.size()) ==
                   static_cast<ssize_t>(bytes.size()));
    close(fd);

    path = tmpl;
  }

 public:

  //==========================================================================
  void setUp()
  {
    Log::SetDefaultLevel("F");
  }

  //==========================================================================
  void tearDown()
  {
    if (!path.empty())
    {
      unlink(path.c_str());
      path.clear();
    }

    Log::SetDefaultLevel("FEWI");
  }

  //==========================================================================
  void TestSplitFrames()
  {
    uint8_t  bytes[] = {
      // Leading garbage.
      0x00, 0xff, 0x12,
      // First image.
      0xff, 0xd8, 0x01, 0xff, 0x02, 0xff, 0xd9,
      // Gap.
      0x33,
      // Second image, minimal.
      0xff, 0xd8, 0xff, 0xd9,
      // Truncated third image.
      0xff, 0xd8, 0x44, 0x55
    };

    WriteFile(vector<uint8_t>(bytes, bytes + sizeof(bytes)));

    MjpegFileSource  source;
    vector<uint8_t>  frame;

    CPPUNIT_ASSERT(!source.NextFrame(frame));
    CPPUNIT_ASSERT(source.Open(path));
    CPPUNIT_ASSERT(source.IsOpen());

    CPPUNIT_ASSERT(source.NextFrame(frame));
    CPPUNIT_ASSERT(frame == vector<uint8_t>(bytes + 3, bytes + 10));

    CPPUNIT_ASSERT(source.NextFrame(frame));
    CPPUNIT_ASSERT(frame == vector<uint8_t>(bytes + 11, bytes + 15));

    CPPUNIT_ASSERT(!source.NextFrame(frame));
    CPPUNIT_ASSERT(frame.empty());
    CPPUNIT_ASSERT(source.num_frames() == 2);

    source.Close();
    CPPUNIT_ASSERT(!source.IsOpen());
  }

  //==========================================================================
  void TestMissingFile()
  {
    MjpegFileSource  source;

    CPPUNIT_ASSERT(!source.Open("/nonexistent/dir/video.mjpeg"));
    CPPUNIT_ASSERT(!source.IsOpen());
  }
};

CPPUNIT_TEST_SUITE_REGISTRATION(MjpegFileSourceTest);
